#include "sinks/stdout_events.hpp"

#include <exception>
#include <ostream>
#include <string>

#include "bridge/jsonrpc.hpp"

namespace omni_supervisor::sinks {

StdoutEventSink::StdoutEventSink(std::ostream& out) : out_(out) {}

bool StdoutEventSink::emit(const OutboundEvent& event) noexcept {
  try {
    return write_message(bridge::make_notification("event", {{"name", event.name}, {"payload", event.payload}}));
  } catch (const std::exception&) {
    return false;
  }
}

bool StdoutEventSink::write_message(const nlohmann::json& message) noexcept {
  try {
    const std::string line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
    return static_cast<bool>(out_);
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace omni_supervisor::sinks
