#pragma once

#include <sys/types.h>

#include <cstdint>
#include <optional>
#include <string>

namespace omni_supervisor::sensors {

// Resident set size of a process, read from <proc_root>/<pid>/status (VmRSS).
class ProcessMemorySensor {
 public:
  explicit ProcessMemorySensor(std::string proc_root = "/proc");

  [[nodiscard]] std::optional<std::uint64_t> sample(pid_t pid) const noexcept;

  [[nodiscard]] static pid_t current_pid() noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 256;

  std::string proc_root_;
};

}  // namespace omni_supervisor::sensors
