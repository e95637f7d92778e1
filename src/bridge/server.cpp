#include "bridge/server.hpp"

#include <sys/utsname.h>

#include <cctype>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include "bridge/jsonrpc.hpp"

namespace omni_supervisor::bridge {

Server::Server(BridgeServices services, sinks::StdoutEventSink& channel) : services_(services), channel_(channel) {}

Server::~Server() {
  std::unordered_map<std::string, std::unique_ptr<RelaySession>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& [_, session] : sessions) {
    session->task.request_stop();
  }
}

int Server::run(std::istream& in, std::ostream& err) {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    try {
      const auto request = nlohmann::json::parse(line, nullptr, false);
      const auto response = request.is_discarded()
                                ? make_error_response(nullptr, kParseError, "request is not valid JSON")
                                : handle_request(request);
      if (!response.is_null()) {
        (void)channel_.write_message(response);
      }
    } catch (const std::exception& ex) {
      err << "omni-supervisor: failed to process request: " << ex.what() << '\n';
      (void)channel_.write_message(make_error_response(nullptr, kInternalError, "internal error"));
    }
  }

  return 0;
}

nlohmann::json Server::handle_request(const nlohmann::json& request) {
  nlohmann::json id = nullptr;
  bool notification = false;
  try {
    const auto parsed = parse_request(request);
    notification = parsed.is_notification();
    if (parsed.id.has_value()) {
      id = *parsed.id;
    }

    auto result = dispatch(parsed.method, parsed.params);
    if (notification) {
      return nullptr;
    }
    return make_result_response(id, result);
  } catch (const JsonRpcError& ex) {
    if (notification) {
      return nullptr;
    }
    return make_error_response(id, ex.code(), ex.what());
  } catch (const quotes::QuoteError& ex) {
    if (notification) {
      return nullptr;
    }
    return make_error_response(id, kUpstreamFailure, ex.what());
  }
}

std::size_t Server::active_sessions() {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  reap_finished_sessions();
  return sessions_.size();
}

void Server::wait_for_sessions() {
  std::unordered_map<std::string, std::unique_ptr<RelaySession>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& [_, session] : sessions) {
    session->task.join();
  }
}

nlohmann::json Server::dispatch(const std::string& method, const nlohmann::json& params) {
  if (method == "initialize") {
    return handle_initialize();
  }
  if (method == "relay/start") {
    return handle_relay_start(params);
  }
  if (method == "relay/cancel") {
    return handle_relay_cancel(params);
  }
  if (method == "quote/get") {
    return handle_quote_get(params);
  }
  if (method == "quote/raw") {
    return handle_quote_raw(params);
  }
  if (method == "system/info") {
    return handle_system_info();
  }

  throw JsonRpcError(kMethodNotFound, "method not found");
}

nlohmann::json Server::handle_initialize() const {
  return nlohmann::json{{"serverInfo", {{"name", "omni-supervisor"}, {"version", "0.1.0"}}},
                        {"methods", {"relay/start", "relay/cancel", "quote/get", "quote/raw", "system/info"}}};
}

nlohmann::json Server::handle_relay_start(const nlohmann::json& params) {
  const std::string prompt = require_string(params, "prompt");
  const auto prefix = optional_string(params, "prefix");
  const auto model = optional_string(params, "model");

  auto request = relay::make_generate_request(services_.relay_settings, prompt, model.value_or(std::string{}));
  if (prefix.has_value() && !prefix->empty()) {
    request.event_prefix = *prefix;
  }

  auto session = std::make_unique<RelaySession>();
  session->prefix = request.event_prefix;

  const relay::StreamRelay& relay = services_.relay;
  sinks::EventSink& events = services_.events;

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  reap_finished_sessions();
  const std::string session_id = "relay-" + std::to_string(next_session_id_++);

  session->task.start([&relay, &events, request = std::move(request)](const std::stop_token& st) {
    const auto result = relay.relay(request, events, st);
    if (!result.ok()) {
      (void)events.emit(sinks::OutboundEvent{
          request.event_prefix + "-error",
          {{"reason", relay::to_string(result.error)}, {"message", result.message}},
      });
    }
  });

  const std::string session_prefix = session->prefix;
  sessions_.emplace(session_id, std::move(session));
  return nlohmann::json{{"session", session_id}, {"prefix", session_prefix}};
}

nlohmann::json Server::handle_relay_cancel(const nlohmann::json& params) {
  const std::string session_id = require_string(params, "session");

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end() || it->second->task.finished()) {
    return nlohmann::json{{"cancelled", false}};
  }

  it->second->task.request_stop();
  return nlohmann::json{{"cancelled", true}};
}

nlohmann::json Server::handle_quote_get(const nlohmann::json& params) const {
  return quotes::to_json(services_.quotes.fetch_quote(require_string(params, "symbol")));
}

nlohmann::json Server::handle_quote_raw(const nlohmann::json& params) const {
  return services_.quotes.fetch_raw_quote(require_string(params, "symbol"));
}

nlohmann::json Server::handle_system_info() const {
  utsname info{};
  if (uname(&info) != 0) {
    throw JsonRpcError(kInternalError, "uname failed");
  }

  std::string platform = info.sysname;
  for (auto& c : platform) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return nlohmann::json{{"platform", platform}, {"arch", info.machine}};
}

void Server::reap_finished_sessions() {
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->second->task.finished()) {
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace omni_supervisor::bridge
