#pragma once

#include <iosfwd>
#include <mutex>

#include <nlohmann/json.hpp>

#include "sinks/event_sink.hpp"

namespace omni_supervisor::sinks {

// Writes events as JSON-RPC notifications, one per line. The same channel carries
// bridge responses, so every line goes through one lock.
class StdoutEventSink final : public EventSink {
 public:
  explicit StdoutEventSink(std::ostream& out);

  bool emit(const OutboundEvent& event) noexcept override;
  bool write_message(const nlohmann::json& message) noexcept;

 private:
  std::ostream& out_;
  std::mutex mutex_{};
};

}  // namespace omni_supervisor::sinks
