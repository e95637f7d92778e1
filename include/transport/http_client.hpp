#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace omni_supervisor::transport {

struct HttpRequest {
  std::string method{"GET"};
  std::string url;
  std::vector<std::string> headers{};
  std::string body{};
  // Zero disables the limit.
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds idle_timeout{0};
};

enum class transport_status : std::uint8_t {
  OK = 0,
  FAILED = 1,
  TIMED_OUT = 2,
  CANCELLED = 3,
  // The chunk handler asked to stop reading.
  ABORTED = 4,
};

struct HttpResponse {
  transport_status transport{transport_status::FAILED};
  long status{0};
  std::string body{};
  std::string error{};

  [[nodiscard]] bool success() const noexcept {
    return transport == transport_status::OK && status >= 200 && status < 300;
  }
};

// Returns false to stop reading the body.
using ChunkHandler = std::function<bool(std::string_view chunk)>;

class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse fetch(const HttpRequest& request) = 0;

  // 2xx bodies are handed to on_chunk in arrival order and never buffered; other
  // bodies are collected into HttpResponse::body. A stop request abandons the
  // transfer with transport_status::CANCELLED.
  virtual HttpResponse stream(const HttpRequest& request, const ChunkHandler& on_chunk,
                              const std::stop_token& stop) = 0;
};

}  // namespace omni_supervisor::transport
