#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "sinks/event_sink.hpp"

struct redisContext;

namespace omni_supervisor::sinks {

struct RedisEventOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string channel{"omni:events"};
  std::uint32_t connect_timeout_ms{1000};
};

// Publishes each event as a JSON message on a Redis pub/sub channel.
class RedisEventSink final : public EventSink {
 public:
  explicit RedisEventSink(RedisEventOptions options = {});
  ~RedisEventSink() override;

  RedisEventSink(const RedisEventSink&) = delete;
  RedisEventSink& operator=(const RedisEventSink&) = delete;

  bool check_connectivity();
  bool emit(const OutboundEvent& event) noexcept override;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool publish_impl(const std::string& message);

  RedisEventOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::mutex mutex_{};
  bool was_ok_{true};
};

}  // namespace omni_supervisor::sinks
