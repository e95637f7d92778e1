#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace omni_supervisor::core {

constexpr const char* kHighWatermarkEnv = "OMNI_SUPERVISOR_MEMORY_HIGH_BYTES";

struct MonitorSettings {
  bool enabled{true};
  std::chrono::milliseconds interval{15000};
  std::uint64_t high_watermark_bytes{130ULL * 1024ULL * 1024ULL};
  std::uint64_t low_watermark_bytes{120ULL * 1024ULL * 1024ULL};
};

struct RelaySettings {
  std::string base_url{"http://localhost:11434"};
  std::string model{"llama3.2"};
  float temperature{0.7F};
  std::uint32_t max_tokens{2048};
  std::chrono::milliseconds idle_timeout{120000};
  std::string event_prefix{"ollama"};
};

struct QuoteSettings {
  std::string origin{"https://api.coingecko.com"};
  std::string vs_currency{"usd"};
  double default_price{100.0};
  std::chrono::milliseconds timeout{5000};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string channel{"omni:events"};
  bool enabled{false};
};

// One auxiliary program. `executables` are alternatives tried in order.
struct LaunchConfig {
  std::string name;
  std::vector<std::string> executables{};
  std::vector<std::string> args{};
  std::string working_dir{};
};

struct SupervisorConfig {
  MonitorSettings monitor{};
  RelaySettings relay{};
  QuoteSettings quote{};
  bool stdout_events{true};
  RedisConfig redis{};
  std::vector<LaunchConfig> launch{};
};

using EnvLookup = std::function<const char*(const char*)>;

SupervisorConfig load_supervisor_config(const std::string& path);

void apply_environment_overrides(SupervisorConfig& config, const EnvLookup& lookup);

}  // namespace omni_supervisor::core
