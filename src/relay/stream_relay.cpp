#include "relay/stream_relay.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "relay/ndjson_decoder.hpp"

namespace omni_supervisor::relay {
namespace {

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// Decoder cursor and terminal flag for one relay call.
class StreamSession {
 public:
  StreamSession(const RelayVocabulary& vocabulary, std::string prefix, const EventCallback& on_event)
      : vocabulary_(vocabulary), prefix_(std::move(prefix)), on_event_(on_event) {}

  bool on_chunk(const std::string_view chunk) {
    if (finished_) {
      return false;
    }
    if (!decoder_.feed(chunk, lines_)) {
      std::cerr << "[relay] " << prefix_ << ": skipped chunk with invalid UTF-8\n";
    }
    drain_lines();
    return !finished_;
  }

  void on_close() {
    if (finished_) {
      return;
    }
    decoder_.finish(lines_);
    drain_lines();
  }

  void emit(const char* suffix, nlohmann::json payload) const {
    try {
      on_event_(sinks::OutboundEvent{prefix_ + suffix, std::move(payload)});
    } catch (const std::exception& ex) {
      std::cerr << "[relay] " << prefix_ << suffix << " emit failed: " << ex.what() << '\n';
    }
  }

  [[nodiscard]] bool terminal() const noexcept { return terminal_; }
  [[nodiscard]] bool failed() const noexcept { return failed_; }
  [[nodiscard]] const std::string& failure_message() const noexcept { return failure_message_; }
  [[nodiscard]] std::size_t tokens() const noexcept { return tokens_; }

 private:
  void drain_lines() {
    for (const auto& line : lines_) {
      if (finished_) {
        break;
      }
      handle_line(line);
    }
    lines_.clear();
  }

  void handle_line(const std::string& line) {
    if (is_blank(line)) {
      return;
    }

    const auto record = nlohmann::json::parse(line, nullptr, false);
    if (record.is_discarded() || !record.is_object()) {
      return;
    }

    const auto error_it = record.find(vocabulary_.error_field);
    if (error_it != record.end() && error_it->is_string()) {
      failed_ = true;
      finished_ = true;
      failure_message_ = error_it->get<std::string>();
      return;
    }

    std::string fragment;
    for (const auto& field : vocabulary_.fragment_fields) {
      const auto it = record.find(field);
      if (it != record.end() && it->is_string()) {
        fragment = it->get<std::string>();
        break;
      }
    }

    const auto terminal_it = record.find(vocabulary_.terminal_field);
    const bool is_terminal = terminal_it != record.end() && terminal_it->is_boolean() && terminal_it->get<bool>();

    if (!fragment.empty()) {
      ++tokens_;
      emit("-token", std::move(fragment));
    }

    if (is_terminal) {
      terminal_ = true;
      finished_ = true;
      emit("-end", nullptr);
    }
  }

  const RelayVocabulary& vocabulary_;
  std::string prefix_;
  const EventCallback& on_event_;
  NdjsonDecoder decoder_{};
  std::vector<std::string> lines_{};
  bool finished_{false};
  bool terminal_{false};
  bool failed_{false};
  std::string failure_message_{};
  std::size_t tokens_{0};
};

std::string describe_status(const transport::HttpResponse& response) {
  std::string message = "upstream returned HTTP " + std::to_string(response.status);
  const auto body = nlohmann::json::parse(response.body, nullptr, false);
  if (!body.is_discarded() && body.is_object()) {
    const auto it = body.find("error");
    if (it != body.end() && it->is_string()) {
      message += ": " + it->get<std::string>();
    }
  }
  return message;
}

}  // namespace

const char* to_string(const relay_error error) noexcept {
  switch (error) {
    case relay_error::NONE:
      return "none";
    case relay_error::UPSTREAM_NOT_RESPONDING:
      return "upstream not responding";
    case relay_error::UPSTREAM_ERROR:
      return "upstream error";
    case relay_error::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

StreamRelay::StreamRelay(transport::HttpClient& client, RelayVocabulary vocabulary)
    : client_(client), vocabulary_(std::move(vocabulary)) {}

RelayResult StreamRelay::relay(const StreamRequest& request, const EventCallback& on_event,
                               const std::stop_token& stop) const {
  StreamSession session(vocabulary_, request.event_prefix, on_event);
  session.emit("-start", request.subject);

  const auto response =
      client_.stream(request.http, [&session](const std::string_view chunk) { return session.on_chunk(chunk); }, stop);

  RelayResult result{};
  if (!session.terminal() && !session.failed()) {
    if (response.transport == transport::transport_status::CANCELLED || stop.stop_requested()) {
      result.error = relay_error::CANCELLED;
      result.message = "relay cancelled";
    } else if (response.transport == transport::transport_status::OK && !response.success()) {
      result.error = relay_error::UPSTREAM_ERROR;
      result.message = describe_status(response);
    } else if (response.transport == transport::transport_status::OK) {
      session.on_close();
    } else {
      result.error = relay_error::UPSTREAM_NOT_RESPONDING;
      result.message = response.error.empty() ? "transport failure" : response.error;
    }
  }

  if (result.ok()) {
    if (session.failed()) {
      result.error = relay_error::UPSTREAM_ERROR;
      result.message = session.failure_message();
    } else if (!session.terminal()) {
      result.error = relay_error::UPSTREAM_NOT_RESPONDING;
      result.message = "stream closed without a terminal record";
    }
  }

  result.tokens = session.tokens();
  if (!result.ok()) {
    std::cerr << "[relay] " << request.event_prefix << ": " << to_string(result.error) << ": " << result.message
              << '\n';
  }
  return result;
}

RelayResult StreamRelay::relay(const StreamRequest& request, sinks::EventSink& sink,
                               const std::stop_token& stop) const {
  const EventCallback forward = [&sink](const sinks::OutboundEvent& event) { (void)sink.emit(event); };
  return relay(request, forward, stop);
}

StreamRequest make_generate_request(const core::RelaySettings& settings, const std::string& prompt,
                                    const std::string& model_override) {
  const nlohmann::json body{
      {"model", model_override.empty() ? settings.model : model_override},
      {"prompt", prompt},
      {"stream", true},
      {"options", {{"temperature", settings.temperature}, {"num_predict", settings.max_tokens}}},
  };

  StreamRequest request{};
  request.subject = prompt;
  request.event_prefix = settings.event_prefix;
  request.http.method = "POST";
  request.http.url = settings.base_url + "/api/generate";
  request.http.headers = {"Content-Type: application/json"};
  request.http.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  request.http.idle_timeout = settings.idle_timeout;
  return request;
}

bool check_available(transport::HttpClient& client, const core::RelaySettings& settings) {
  transport::HttpRequest request{};
  request.url = settings.base_url + "/api/tags";
  request.timeout = std::chrono::milliseconds(5000);
  return client.fetch(request).success();
}

}  // namespace omni_supervisor::relay
