#include "sensors/process_memory.hpp"

#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <utility>

namespace omni_supervisor::sensors {

ProcessMemorySensor::ProcessMemorySensor(std::string proc_root) : proc_root_(std::move(proc_root)) {}

std::optional<std::uint64_t> ProcessMemorySensor::sample(const pid_t pid) const noexcept {
  if (pid <= 0) {
    return std::nullopt;
  }

  char path[512]{};
  const int written = std::snprintf(path, sizeof(path), "%s/%d/status", proc_root_.c_str(), static_cast<int>(pid));
  if (written <= 0 || static_cast<std::size_t>(written) >= sizeof(path)) {
    return std::nullopt;
  }

  std::FILE* status = std::fopen(path, "r");
  if (status == nullptr) {
    return std::nullopt;
  }

  std::optional<std::uint64_t> rss_bytes{};
  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), status) != nullptr) {
    char key[64]{};
    unsigned long long value = 0;
    if (std::sscanf(buffer, "%63[^:]: %llu kB", key, &value) != 2) {
      continue;
    }

    if (std::strcmp(key, "VmRSS") == 0) {
      rss_bytes = static_cast<std::uint64_t>(value) * 1024ULL;
      break;
    }
  }

  if (std::ferror(status) != 0) {
    rss_bytes.reset();
  }
  std::fclose(status);
  return rss_bytes;
}

pid_t ProcessMemorySensor::current_pid() noexcept { return ::getpid(); }

}  // namespace omni_supervisor::sensors
