#include "bridge/jsonrpc.hpp"

namespace omni_supervisor::bridge {

namespace {

bool is_valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

const nlohmann::json* find_param(const nlohmann::json& params, const char* name) {
  if (!params.is_object()) {
    throw JsonRpcError(kInvalidParams, "params must be an object");
  }
  const auto it = params.find(name);
  return it == params.end() ? nullptr : &*it;
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw JsonRpcError(kInvalidRequest, "request must be a JSON object");
  }

  const auto version = request.find("jsonrpc");
  if (version == request.end() || *version != kJsonRpcVersion) {
    throw JsonRpcError(kInvalidRequest, "jsonrpc must be \"2.0\"");
  }

  const auto method = request.find("method");
  if (method == request.end() || !method->is_string()) {
    throw JsonRpcError(kInvalidRequest, "method must be a string");
  }

  JsonRpcRequest parsed{.method = method->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  if (const auto id = request.find("id"); id != request.end()) {
    if (!is_valid_id(*id)) {
      throw JsonRpcError(kInvalidRequest, "id must be a string, an integer or null");
    }
    parsed.id = *id;
  }

  if (const auto params = request.find("params"); params != request.end()) {
    if (!params->is_object() && !params->is_array()) {
      throw JsonRpcError(kInvalidParams, "params must be an object or an array");
    }
    parsed.params = *params;
  }

  return parsed;
}

std::string require_string(const nlohmann::json& params, const char* name) {
  auto value = optional_string(params, name);
  if (!value.has_value() || value->empty()) {
    throw JsonRpcError(kInvalidParams, std::string(name) + " must be a non-empty string");
  }
  return *value;
}

std::optional<std::string> optional_string(const nlohmann::json& params, const char* name) {
  const auto* value = find_param(params, name);
  if (value == nullptr || value->is_null()) {
    return std::nullopt;
  }
  if (!value->is_string()) {
    throw JsonRpcError(kInvalidParams, std::string(name) + " must be a string");
  }
  return value->get<std::string>();
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const int code, const std::string& message) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

nlohmann::json make_notification(const std::string& method, const nlohmann::json& params) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"method", method}, {"params", params}};
}

}  // namespace omni_supervisor::bridge
