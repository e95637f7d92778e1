#include "monitor/threshold_monitor.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace omni_supervisor::monitor {

ThresholdMonitor::ThresholdMonitor(MonitorConfig config, SampleFn sample, sinks::EventSink& sink, ReloadFn reload)
    : config_(config), sample_(std::move(sample)), sink_(sink), reload_(std::move(reload)) {
  if (config_.low_watermark_bytes >= config_.high_watermark_bytes) {
    throw std::invalid_argument("low watermark must be below high watermark");
  }
  if (config_.interval.count() <= 0) {
    throw std::invalid_argument("sample interval must be greater than 0");
  }
  if (!sample_) {
    throw std::invalid_argument("monitor requires a sample function");
  }
}

ThresholdMonitor::~ThresholdMonitor() { stop(); }

void ThresholdMonitor::start() {
  std::cerr << "[monitor] watching pid " << config_.pid << " every " << config_.interval.count()
            << "ms high=" << config_.high_watermark_bytes << " low=" << config_.low_watermark_bytes << '\n';
  task_.start([this](std::stop_token st) { run(st); });
}

void ThresholdMonitor::stop() { task_.stop(); }

bool ThresholdMonitor::observe(const std::optional<std::uint64_t> sample) {
  if (!sample.has_value()) {
    ++samples_skipped_;
    return false;
  }

  const std::uint64_t value = *sample;
  switch (state_) {
    case trigger_state::ARMED:
      if (value > config_.high_watermark_bytes) {
        state_ = trigger_state::TRIGGERED;
        ++warnings_emitted_;
        std::cerr << "[monitor] resident memory " << value << " bytes crossed high watermark "
                  << config_.high_watermark_bytes << '\n';
        if (!sink_.emit(sinks::OutboundEvent{kMemoryWarningEvent, value})) {
          std::cerr << "[monitor] memory warning event dropped\n";
        }
        if (reload_) {
          try {
            reload_(value);
          } catch (const std::exception& ex) {
            std::cerr << "[monitor] reload action failed: " << ex.what() << '\n';
          }
        }
        return true;
      }
      break;

    case trigger_state::TRIGGERED:
      if (value < config_.low_watermark_bytes) {
        state_ = trigger_state::ARMED;
        std::cerr << "[monitor] resident memory " << value << " bytes below low watermark; re-armed\n";
      }
      break;
  }

  return false;
}

trigger_state ThresholdMonitor::state() const noexcept { return state_; }

std::uint64_t ThresholdMonitor::warnings_emitted() const noexcept { return warnings_emitted_; }

std::uint64_t ThresholdMonitor::samples_skipped() const noexcept { return samples_skipped_; }

void ThresholdMonitor::run(const std::stop_token& st) {
  while (!st.stop_requested()) {
    std::optional<std::uint64_t> sample{};
    try {
      sample = sample_(config_.pid);
    } catch (const std::exception& ex) {
      std::cerr << "[monitor] sample failed: " << ex.what() << '\n';
    }
    observe(sample);

    if (!core::sleep_for(st, config_.interval)) {
      break;
    }
  }
}

}  // namespace omni_supervisor::monitor
