#include "sinks/redis_events.hpp"

#include "core/timestamp.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include <hiredis/hiredis.h>

namespace omni_supervisor::sinks {

RedisEventSink::RedisEventSink(RedisEventOptions options) : options_(std::move(options)) {}

RedisEventSink::~RedisEventSink() = default;

void RedisEventSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisEventSink::check_connectivity() {
  std::lock_guard<std::mutex> lock(mutex_);
  return ensure_connected();
}

bool RedisEventSink::emit(const OutboundEvent& event) noexcept {
  std::string message;
  try {
    message = nlohmann::json{{"name", event.name}, {"payload", event.payload}, {"ts", core::unix_timestamp_now_ms()}}
                  .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  } catch (const std::exception&) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  bool ok = ensure_connected() && publish_impl(message);
  if (!ok && reconnect()) {
    ok = publish_impl(message);
  }

  if (!ok && was_ok_) {
    std::cerr << "[redis] publish failed on channel " << options_.channel << '\n';
  } else if (ok && !was_ok_) {
    std::cerr << "[redis] publish recovered\n";
  }
  was_ok_ = ok;
  return ok;
}

bool RedisEventSink::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisEventSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      if (was_ok_) {
        std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      }
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisEventSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisEventSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisEventSink::publish_impl(const std::string& message) {
  const char* argv[3] = {"PUBLISH", options_.channel.c_str(), message.c_str()};
  const std::size_t argv_len[3] = {7, options_.channel.size(), message.size()};

  redisReply* reply = static_cast<redisReply*>(redisCommandArgv(context_.get(), 3, argv, argv_len));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

}  // namespace omni_supervisor::sinks
