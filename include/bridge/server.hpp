#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "core/background_task.hpp"
#include "core/config.hpp"
#include "quotes/quote_client.hpp"
#include "relay/stream_relay.hpp"
#include "sinks/event_sink.hpp"
#include "sinks/stdout_events.hpp"

namespace omni_supervisor::bridge {

struct BridgeServices {
  const relay::StreamRelay& relay;
  const quotes::QuoteClient& quotes;
  const core::RelaySettings& relay_settings;
  // Receives relay events; usually fans out to the channel and other sinks.
  sinks::EventSink& events;
};

// Line-delimited JSON-RPC front end used by the UI host. Relay sessions run in the
// background and report through events; every other method answers inline.
class Server {
 public:
  Server(BridgeServices services, sinks::StdoutEventSink& channel);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  int run(std::istream& in, std::ostream& err);

  // Returns the response to write, or null for notifications.
  nlohmann::json handle_request(const nlohmann::json& request);

  [[nodiscard]] std::size_t active_sessions();
  void wait_for_sessions();

 private:
  struct RelaySession {
    std::string prefix;
    core::BackgroundTask task{};
  };

  nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);
  nlohmann::json handle_initialize() const;
  nlohmann::json handle_relay_start(const nlohmann::json& params);
  nlohmann::json handle_relay_cancel(const nlohmann::json& params);
  nlohmann::json handle_quote_get(const nlohmann::json& params) const;
  nlohmann::json handle_quote_raw(const nlohmann::json& params) const;
  nlohmann::json handle_system_info() const;
  void reap_finished_sessions();

  BridgeServices services_;
  sinks::StdoutEventSink& channel_;
  std::mutex sessions_mutex_{};
  std::uint64_t next_session_id_{1};
  std::unordered_map<std::string, std::unique_ptr<RelaySession>> sessions_{};
};

}  // namespace omni_supervisor::bridge
