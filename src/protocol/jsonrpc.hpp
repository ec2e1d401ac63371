#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/orchestrator_errors.hpp"

namespace toolmux::protocol {

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kProtocolVersion = "2024-11-05";

constexpr int kMethodNotFound = -32601;

struct JsonRpcError {
    std::int64_t code = 0;
    std::string message;
    nlohmann::json data;
};

// Inbound line, classified. A response has an id and result or error; a
// request from the server has a method and an id; a notification has a
// method and no id.
struct JsonRpcMessage {
    enum class Kind { Response, Request, Notification };

    Kind kind = Kind::Response;
    std::optional<nlohmann::json> id;
    std::string method;
    nlohmann::json params;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    // Integer id of a response; empty for string/null ids.
    std::optional<std::int64_t> numeric_id() const;
};

nlohmann::json make_request(std::int64_t id, const std::string& method,
                            const nlohmann::json& params);
nlohmann::json make_notification(const std::string& method,
                                 const nlohmann::json& params = nlohmann::json::object());
nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

nlohmann::json make_initialize_params(const std::string& client_name,
                                      const std::string& client_version);
nlohmann::json make_tools_call_params(const std::string& tool_name,
                                      const nlohmann::json& arguments);

// ProtocolParse error for anything that is not a single JSON-RPC 2.0 object.
core::errors::Result<JsonRpcMessage> parse_message(const std::string& line);

std::string serialize_line(const nlohmann::json& message);

}  // namespace toolmux::protocol
