#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>

#include "core/background_task.hpp"
#include "sinks/event_sink.hpp"

namespace omni_supervisor::monitor {

constexpr const char* kMemoryWarningEvent = "system:memory-warning";

enum class trigger_state : std::uint8_t {
  ARMED = 0,
  TRIGGERED = 1,
};

struct MonitorConfig {
  pid_t pid{0};
  std::chrono::milliseconds interval{15000};
  std::uint64_t high_watermark_bytes{0};
  std::uint64_t low_watermark_bytes{0};
};

// Polls a resident-memory reading and raises one warning per excursion above the
// high watermark. Re-arms only after a reading strictly below the low watermark.
class ThresholdMonitor {
 public:
  using SampleFn = std::function<std::optional<std::uint64_t>(pid_t)>;
  using ReloadFn = std::function<void(std::uint64_t)>;

  // Throws std::invalid_argument unless low < high and the interval is positive.
  ThresholdMonitor(MonitorConfig config, SampleFn sample, sinks::EventSink& sink, ReloadFn reload = {});
  ~ThresholdMonitor();

  ThresholdMonitor(const ThresholdMonitor&) = delete;
  ThresholdMonitor& operator=(const ThresholdMonitor&) = delete;

  void start();
  void stop();

  // One state-machine step. Returns true when this reading emitted a warning.
  bool observe(std::optional<std::uint64_t> sample);

  [[nodiscard]] trigger_state state() const noexcept;
  [[nodiscard]] std::uint64_t warnings_emitted() const noexcept;
  [[nodiscard]] std::uint64_t samples_skipped() const noexcept;

 private:
  void run(const std::stop_token& st);

  MonitorConfig config_;
  SampleFn sample_;
  sinks::EventSink& sink_;
  ReloadFn reload_;
  trigger_state state_{trigger_state::ARMED};
  std::uint64_t warnings_emitted_{0};
  std::uint64_t samples_skipped_{0};
  core::BackgroundTask task_{};
};

}  // namespace omni_supervisor::monitor
