#pragma once

#include <functional>
#include <string>
#include <vector>

#include "core/background_task.hpp"
#include "core/config.hpp"

namespace omni_supervisor::launcher {

struct LaunchSpec {
  std::string executable;
  std::vector<std::string> args{};
  std::string working_dir{};
};

// Alternatives are attempted in order until one of them starts.
struct LaunchTarget {
  std::string name;
  std::vector<LaunchSpec> alternatives{};
};

LaunchTarget make_launch_target(const core::LaunchConfig& config);

// Fire-and-forget spawner. Children are detached (double fork), run with stdio on
// /dev/null, and are never observed again.
class ProcessLauncher {
 public:
  using CompletionFn = std::function<void(const LaunchSpec&, bool started)>;

  explicit ProcessLauncher(CompletionFn on_complete = {});
  ~ProcessLauncher();

  ProcessLauncher(const ProcessLauncher&) = delete;
  ProcessLauncher& operator=(const ProcessLauncher&) = delete;

  // True once exec of the program succeeded.
  bool spawn(const LaunchSpec& spec) noexcept;

  // Every entry is attempted; failures are logged and skipped.
  void launch_all(const std::vector<LaunchSpec>& specs) noexcept;
  // Per target, stops at the first alternative that starts. Returns targets started.
  std::size_t launch_all(const std::vector<LaunchTarget>& targets) noexcept;

  void launch_all_async(std::vector<LaunchTarget> targets);
  void wait();

 private:
  void notify(const LaunchSpec& spec, bool started) noexcept;

  CompletionFn on_complete_;
  core::BackgroundTask task_{};
};

}  // namespace omni_supervisor::launcher
