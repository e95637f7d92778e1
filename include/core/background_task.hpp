#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>

namespace omni_supervisor::core {

// Owns one worker thread whose body observes a stop token. Destruction requests
// stop and joins, so a task never outlives its owner.
class BackgroundTask {
 public:
  using Body = std::function<void(std::stop_token)>;

  BackgroundTask() = default;
  ~BackgroundTask();

  BackgroundTask(const BackgroundTask&) = delete;
  BackgroundTask& operator=(const BackgroundTask&) = delete;

  // Reaps a body that already returned and runs the new one. Ignored, with a log
  // line, while the previous body is still running.
  void start(Body body);
  void request_stop() noexcept;
  void stop();
  // Waits for the body to return on its own.
  void join();

  [[nodiscard]] bool started() const noexcept;
  [[nodiscard]] bool finished() const noexcept;

 private:
  std::jthread thread_{};
  std::atomic<bool> finished_{false};
};

// Sleeps for `duration` unless stop is requested first. Returns false when stopped.
bool sleep_for(const std::stop_token& token, std::chrono::milliseconds duration);

}  // namespace omni_supervisor::core
