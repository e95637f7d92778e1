#include "sinks/event_sink.hpp"

namespace omni_supervisor::sinks {

void FanoutEventSink::add(EventSink& sink) { sinks_.push_back(&sink); }

std::size_t FanoutEventSink::size() const noexcept { return sinks_.size(); }

bool FanoutEventSink::emit(const OutboundEvent& event) noexcept {
  bool delivered = false;
  for (auto* sink : sinks_) {
    delivered = sink->emit(event) || delivered;
  }
  return delivered;
}

}  // namespace omni_supervisor::sinks
