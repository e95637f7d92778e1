#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace omni_supervisor::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::uint64_t parse_u64(const std::string& key, const std::string& value) {
  if (value.empty() || value.front() == '-') {
    throw std::runtime_error(key + " must be a non-negative integer");
  }
  std::size_t consumed = 0;
  const auto parsed = std::stoull(value, &consumed);
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be a non-negative integer");
  }
  return parsed;
}

std::chrono::milliseconds parse_positive_ms(const std::string& key, const std::string& value) {
  const auto parsed = parse_u64(key, value);
  if (parsed == 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(parsed));
}

std::vector<std::string> split_list(const std::string& value, const char separator) {
  std::vector<std::string> items;
  std::string item;
  std::istringstream input(value);
  while (std::getline(input, item, separator)) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

std::vector<std::string> split_words(const std::string& value) {
  std::vector<std::string> words;
  std::istringstream input(value);
  std::string word;
  while (input >> word) {
    words.push_back(word);
  }
  return words;
}

LaunchConfig& launch_entry(SupervisorConfig& config, const std::string& name) {
  for (auto& entry : config.launch) {
    if (entry.name == name) {
      return entry;
    }
  }
  config.launch.push_back(LaunchConfig{name});
  return config.launch.back();
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(SupervisorConfig& config, const std::string& key, const std::string& value) {
  if (key == "monitor.enabled") {
    config.monitor.enabled = parse_bool(value);
    return;
  }

  if (key == "monitor.interval_ms") {
    config.monitor.interval = parse_positive_ms(key, value);
    return;
  }

  if (key == "monitor.high_watermark_bytes") {
    config.monitor.high_watermark_bytes = parse_u64(key, value);
    return;
  }

  if (key == "monitor.low_watermark_bytes") {
    config.monitor.low_watermark_bytes = parse_u64(key, value);
    return;
  }

  if (key == "relay.base_url") {
    config.relay.base_url = value;
    while (!config.relay.base_url.empty() && config.relay.base_url.back() == '/') {
      config.relay.base_url.pop_back();
    }
    return;
  }

  if (key == "relay.model") {
    config.relay.model = value;
    return;
  }

  if (key == "relay.temperature") {
    config.relay.temperature = std::stof(value);
    if (config.relay.temperature < 0.0F) {
      throw std::runtime_error("relay.temperature must be greater than or equal to 0");
    }
    return;
  }

  if (key == "relay.max_tokens") {
    const auto parsed = parse_u64(key, value);
    if (parsed == 0 || parsed > 1'000'000ULL) {
      throw std::runtime_error("relay.max_tokens must be in range 1..1000000");
    }
    config.relay.max_tokens = static_cast<std::uint32_t>(parsed);
    return;
  }

  if (key == "relay.idle_timeout_ms") {
    config.relay.idle_timeout = parse_positive_ms(key, value);
    return;
  }

  if (key == "relay.event_prefix") {
    if (value.empty()) {
      throw std::runtime_error("relay.event_prefix must not be empty");
    }
    config.relay.event_prefix = value;
    return;
  }

  if (key == "quote.origin") {
    config.quote.origin = value;
    while (!config.quote.origin.empty() && config.quote.origin.back() == '/') {
      config.quote.origin.pop_back();
    }
    return;
  }

  if (key == "quote.vs_currency") {
    config.quote.vs_currency = value;
    return;
  }

  if (key == "quote.default_price") {
    config.quote.default_price = std::stod(value);
    return;
  }

  if (key == "quote.timeout_ms") {
    config.quote.timeout = parse_positive_ms(key, value);
    return;
  }

  if (key == "sinks.stdout") {
    config.stdout_events = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.channel") {
    config.redis.channel = value;
    return;
  }

  if (key.rfind("launch.", 0) == 0) {
    const std::string rest = key.substr(std::string("launch.").size());
    const auto dot = rest.rfind('.');
    if (dot == std::string::npos || dot == 0) {
      throw std::runtime_error("launch entries must be nested as launch.<name>.<field>: " + key);
    }

    const std::string name = rest.substr(0, dot);
    const std::string field = rest.substr(dot + 1);
    auto& entry = launch_entry(config, name);
    if (field == "executable") {
      entry.executables = split_list(value, ',');
    } else if (field == "args") {
      entry.args = split_words(value);
    } else if (field == "working_dir") {
      entry.working_dir = value;
    }
  }
}

}  // namespace

SupervisorConfig load_supervisor_config(const std::string& path) {
  SupervisorConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string raw_value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (raw_value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), unquote(raw_value));
  }

  if (config.monitor.low_watermark_bytes >= config.monitor.high_watermark_bytes) {
    throw std::runtime_error("monitor.low_watermark_bytes must be less than monitor.high_watermark_bytes");
  }

  for (const auto& entry : config.launch) {
    if (entry.executables.empty()) {
      throw std::runtime_error("launch." + entry.name + ".executable must name at least one program");
    }
  }

  return config;
}

void apply_environment_overrides(SupervisorConfig& config, const EnvLookup& lookup) {
  if (!lookup) {
    return;
  }

  const char* raw = lookup(kHighWatermarkEnv);
  if (raw == nullptr) {
    return;
  }

  const std::string value = trim(raw);
  std::uint64_t parsed = 0;
  try {
    parsed = parse_u64(kHighWatermarkEnv, value);
  } catch (const std::exception&) {
    std::cerr << "[config] ignoring unparseable " << kHighWatermarkEnv << "=" << value << '\n';
    return;
  }

  if (parsed <= config.monitor.low_watermark_bytes) {
    std::cerr << "[config] ignoring " << kHighWatermarkEnv << "=" << parsed
              << " (must exceed low watermark " << config.monitor.low_watermark_bytes << ")\n";
    return;
  }

  config.monitor.high_watermark_bytes = parsed;
}

}  // namespace omni_supervisor::core
