#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace finval::server {

// JSON-RPC 2.0 request. id is kept as the JSON value the client sent
// (string, number, or null when absent) and echoed back unchanged.
struct JsonRpcRequest {
  std::string jsonrpc{"2.0"};  // NOLINT(readability-identifier-naming)
  nlohmann::json id;           // NOLINT(readability-identifier-naming)
  std::string method;          // NOLINT(readability-identifier-naming)
  nlohmann::json params;       // NOLINT(readability-identifier-naming)
};

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// std::nullopt when the line is not a JSON object.
[[nodiscard]] std::optional<JsonRpcRequest> parse_request(const std::string& line);

[[nodiscard]] std::string make_response(const nlohmann::json& id, const nlohmann::json& result);

[[nodiscard]] std::string make_error_response(const nlohmann::json& id, int code,
                                              const std::string& message,
                                              const nlohmann::json& data = nlohmann::json::object());

}  // namespace finval::server
