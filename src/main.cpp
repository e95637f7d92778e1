#include <signal.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "bridge/server.hpp"
#include "core/config.hpp"
#include "launcher/process_launcher.hpp"
#include "monitor/threshold_monitor.hpp"
#include "quotes/quote_client.hpp"
#include "relay/stream_relay.hpp"
#include "sensors/process_memory.hpp"
#include "sinks/event_sink.hpp"
#include "sinks/redis_events.hpp"
#include "sinks/stdout_events.hpp"
#include "transport/curl_http_client.hpp"

namespace {

constexpr const char* kReloadRequestedEvent = "system:reload-requested";

void handle_shutdown_signal(int /*signal*/) {}

// Without SA_RESTART the blocking stdin read returns, so the bridge loop can end.
void install_shutdown_handlers() {
  struct sigaction action {};
  action.sa_handler = handle_shutdown_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

}  // namespace

std::string format_config_settings(const omni_supervisor::core::SupervisorConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[supervisor] loaded config from " << (config_path.empty() ? "<defaults>" : config_path)
         << " | monitor_enabled=" << (config.monitor.enabled ? "true" : "false")
         << " | monitor_interval_ms=" << config.monitor.interval.count()
         << " | high_watermark_bytes=" << config.monitor.high_watermark_bytes
         << " | low_watermark_bytes=" << config.monitor.low_watermark_bytes
         << " | relay_base_url=" << config.relay.base_url
         << " | relay_model=" << config.relay.model
         << " | quote_origin=" << config.quote.origin
         << " | launch_targets=" << config.launch.size()
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");

  if (config.redis.enabled) {
    output << " | redis_address=";
    if (!config.redis.unix_socket.empty()) {
      output << "unix://" << config.redis.unix_socket;
    } else {
      output << config.redis.host << ':' << config.redis.port;
    }
  }
  return output.str();
}

int main(int argc, char** argv) {
  namespace os = omni_supervisor;

  install_shutdown_handlers();

  const std::string config_path = argc > 1 ? argv[1] : "";

  os::core::SupervisorConfig config{};
  try {
    if (!config_path.empty()) {
      config = os::core::load_supervisor_config(config_path);
    }
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }
  os::core::apply_environment_overrides(config, [](const char* name) { return std::getenv(name); });

  std::cerr << format_config_settings(config, config_path) << '\n';

  os::sinks::StdoutEventSink channel{std::cout};
  os::sinks::FanoutEventSink events{};
  if (config.stdout_events) {
    events.add(channel);
  }

  std::unique_ptr<os::sinks::RedisEventSink> redis_sink{};
  if (config.redis.enabled) {
    os::sinks::RedisEventOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.channel = config.redis.channel;
    redis_sink = std::make_unique<os::sinks::RedisEventSink>(options);
    if (redis_sink->check_connectivity()) {
      std::cerr << "[supervisor] redis connectivity confirmed; publishing on " << options.channel << '\n';
    } else {
      std::cerr << "[supervisor] redis connectivity check failed; will retry on publish\n";
    }
    events.add(*redis_sink);
  }

  os::launcher::ProcessLauncher launcher{};
  if (!config.launch.empty()) {
    std::vector<os::launcher::LaunchTarget> targets;
    for (const auto& entry : config.launch) {
      targets.push_back(os::launcher::make_launch_target(entry));
    }
    launcher.launch_all_async(std::move(targets));
  }

  const os::sensors::ProcessMemorySensor memory_sensor{};
  std::unique_ptr<os::monitor::ThresholdMonitor> monitor{};
  if (config.monitor.enabled) {
    os::monitor::MonitorConfig monitor_config{};
    monitor_config.pid = os::sensors::ProcessMemorySensor::current_pid();
    monitor_config.interval = config.monitor.interval;
    monitor_config.high_watermark_bytes = config.monitor.high_watermark_bytes;
    monitor_config.low_watermark_bytes = config.monitor.low_watermark_bytes;

    monitor = std::make_unique<os::monitor::ThresholdMonitor>(
        monitor_config, [&memory_sensor](const pid_t pid) { return memory_sensor.sample(pid); }, events,
        [&events](const std::uint64_t sample) {
          (void)events.emit(os::sinks::OutboundEvent{kReloadRequestedEvent, sample});
        });
    monitor->start();
  }

  os::transport::CurlHttpClient http{};
  if (os::relay::check_available(http, config.relay)) {
    std::cerr << "[supervisor] streaming backend reachable at " << config.relay.base_url << '\n';
  } else {
    std::cerr << "[supervisor] streaming backend not reachable at " << config.relay.base_url
              << "; relay requests will fail until it starts\n";
  }

  const os::relay::StreamRelay relay{http};
  const os::quotes::QuoteClient quotes{http, config.quote};
  int rc = 0;
  {
    os::bridge::Server server{os::bridge::BridgeServices{relay, quotes, config.relay, events}, channel};
    rc = server.run(std::cin, std::cerr);
  }

  if (monitor != nullptr) {
    monitor->stop();
  }
  std::cerr << "[supervisor] input closed or shutdown signal received; exiting cleanly\n";

  return rc;
}
