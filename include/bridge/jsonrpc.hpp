#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace omni_supervisor::bridge {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
// Upstream provider or transport failure surfaced to the caller.
constexpr int kUpstreamFailure = -32000;

// Thrown while handling a request; becomes the error member of the response.
class JsonRpcError : public std::runtime_error {
 public:
  JsonRpcError(int code, const std::string& message) : std::runtime_error(message), code_(code) {}

  [[nodiscard]] int code() const noexcept { return code_; }

 private:
  int code_;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  [[nodiscard]] bool is_notification() const noexcept { return !id.has_value(); }
};

// Throws JsonRpcError(kInvalidRequest) for a malformed envelope.
JsonRpcRequest parse_request(const nlohmann::json& request);

// Named-parameter accessors. Both throw JsonRpcError(kInvalidParams) on a wrong type.
std::string require_string(const nlohmann::json& params, const char* name);
std::optional<std::string> optional_string(const nlohmann::json& params, const char* name);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, int code, const std::string& message);
nlohmann::json make_notification(const std::string& method, const nlohmann::json& params);

}  // namespace omni_supervisor::bridge
