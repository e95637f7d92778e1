#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "sinks/event_sink.hpp"
#include "transport/http_client.hpp"

namespace omni_supervisor::relay {

enum class relay_error : std::uint8_t {
  NONE = 0,
  // Transport failure, idle timeout, or a body that ended without a terminal record.
  UPSTREAM_NOT_RESPONDING = 1,
  // Non-2xx status or an error record in the stream.
  UPSTREAM_ERROR = 2,
  CANCELLED = 3,
};

const char* to_string(relay_error error) noexcept;

struct RelayResult {
  relay_error error{relay_error::NONE};
  std::string message{};
  std::size_t tokens{0};

  [[nodiscard]] bool ok() const noexcept { return error == relay_error::NONE; }
};

struct StreamRequest {
  // Carried by the start event.
  std::string subject;
  std::string event_prefix{"ollama"};
  transport::HttpRequest http{};
};

// Field names recognised in each streamed record. Other fields are ignored.
struct RelayVocabulary {
  std::string terminal_field{"done"};
  std::vector<std::string> fragment_fields{"token", "response"};
  std::string error_field{"error"};
};

using EventCallback = std::function<void(const sinks::OutboundEvent&)>;

// Turns one streaming NDJSON response into <prefix>-start, <prefix>-token...,
// <prefix>-end. Each call owns its session state; concurrent calls share nothing.
class StreamRelay {
 public:
  explicit StreamRelay(transport::HttpClient& client, RelayVocabulary vocabulary = {});

  RelayResult relay(const StreamRequest& request, const EventCallback& on_event,
                    const std::stop_token& stop = {}) const;
  RelayResult relay(const StreamRequest& request, sinks::EventSink& sink, const std::stop_token& stop = {}) const;

 private:
  transport::HttpClient& client_;
  RelayVocabulary vocabulary_;
};

// POST <base_url>/api/generate with streaming enabled.
StreamRequest make_generate_request(const core::RelaySettings& settings, const std::string& prompt,
                                    const std::string& model_override = {});

// GET <base_url>/api/tags answered with 2xx.
bool check_available(transport::HttpClient& client, const core::RelaySettings& settings);

}  // namespace omni_supervisor::relay
