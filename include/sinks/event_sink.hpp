#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace omni_supervisor::sinks {

struct OutboundEvent {
  std::string name;
  nlohmann::json payload;
};

// Write-only boundary towards the UI host. Emission is best effort: a false
// return reports a dropped event and must never abort the caller's loop.
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual bool emit(const OutboundEvent& event) noexcept = 0;
};

// Forwards every event to each registered sink. Sinks are not owned.
class FanoutEventSink final : public EventSink {
 public:
  void add(EventSink& sink);
  [[nodiscard]] std::size_t size() const noexcept;

  bool emit(const OutboundEvent& event) noexcept override;

 private:
  std::vector<EventSink*> sinks_{};
};

}  // namespace omni_supervisor::sinks
