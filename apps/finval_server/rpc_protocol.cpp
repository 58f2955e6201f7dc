#include "rpc_protocol.h"

namespace finval::server {

std::optional<JsonRpcRequest> parse_request(const std::string& line) {
  nlohmann::json message = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
  if (message.is_discarded() || !message.is_object()) {
    return std::nullopt;
  }

  JsonRpcRequest request;
  if (message.contains("jsonrpc") && message["jsonrpc"].is_string()) {
    request.jsonrpc = message["jsonrpc"].get<std::string>();
  }
  if (message.contains("id") && (message["id"].is_string() || message["id"].is_number())) {
    request.id = message["id"];
  }
  if (message.contains("method") && message["method"].is_string()) {
    request.method = message["method"].get<std::string>();
  }
  request.params = message.contains("params") && message["params"].is_object()
                       ? message["params"]
                       : nlohmann::json::object();
  return request;
}

std::string make_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}.dump();
}

std::string make_error_response(const nlohmann::json& id, int code, const std::string& message,
                                const nlohmann::json& data) {
  nlohmann::json error = {{"code", code}, {"message", message}, {"data", data}};
  return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"error", error}}.dump();
}

}  // namespace finval::server
