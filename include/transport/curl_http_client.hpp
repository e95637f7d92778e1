#pragma once

#include <string>

#include "transport/http_client.hpp"

namespace omni_supervisor::transport {

class CurlHttpClient final : public HttpClient {
 public:
  explicit CurlHttpClient(std::string user_agent = "omni-supervisor/0.1");

  HttpResponse fetch(const HttpRequest& request) override;
  HttpResponse stream(const HttpRequest& request, const ChunkHandler& on_chunk, const std::stop_token& stop) override;

 private:
  std::string user_agent_;
};

}  // namespace omni_supervisor::transport
