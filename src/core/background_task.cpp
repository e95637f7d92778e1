#include "core/background_task.hpp"

#include <condition_variable>
#include <iostream>
#include <mutex>
#include <utility>

namespace omni_supervisor::core {

BackgroundTask::~BackgroundTask() { stop(); }

void BackgroundTask::start(Body body) {
  if (thread_.joinable()) {
    if (!finished_.load()) {
      std::cerr << "[task] start ignored: previous body still running\n";
      return;
    }
    thread_.join();
  }

  finished_.store(false);
  thread_ = std::jthread([this, body = std::move(body)](std::stop_token st) {
    body(st);
    finished_.store(true);
  });
}

void BackgroundTask::request_stop() noexcept {
  if (thread_.joinable()) {
    thread_.request_stop();
  }
}

void BackgroundTask::stop() {
  if (!thread_.joinable()) {
    return;
  }
  thread_.request_stop();
  thread_.join();
}

void BackgroundTask::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool BackgroundTask::started() const noexcept { return thread_.joinable(); }

bool BackgroundTask::finished() const noexcept { return finished_.load(); }

bool sleep_for(const std::stop_token& token, const std::chrono::milliseconds duration) {
  std::mutex mutex;
  std::condition_variable_any wakeup;
  std::unique_lock<std::mutex> lock(mutex);
  wakeup.wait_for(lock, token, duration, [] { return false; });
  return !token.stop_requested();
}

}  // namespace omni_supervisor::core
