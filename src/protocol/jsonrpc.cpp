#include "protocol/jsonrpc.hpp"

#include <limits>

namespace toolmux::protocol {

using core::errors::ErrorCategory;
using core::errors::OrchestratorError;
using nlohmann::json;

namespace {

OrchestratorError parse_failure(const std::string& why) {
    return OrchestratorError{ErrorCategory::ProtocolParse, why, "malformed_message"};
}

bool is_valid_id(const json& id) {
    return id.is_null() || id.is_string() || id.is_number_integer() ||
           id.is_number_unsigned();
}

}  // namespace

std::optional<std::int64_t> JsonRpcMessage::numeric_id() const {
    if (!id.has_value()) {
        return std::nullopt;
    }
    if (id->is_number_integer() || id->is_number_unsigned()) {
        return id->get<std::int64_t>();
    }
    return std::nullopt;
}

json make_request(const std::int64_t id, const std::string& method, const json& params) {
    return json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"method", method}, {"params", params}};
}

json make_notification(const std::string& method, const json& params) {
    return json{{"jsonrpc", kJsonRpcVersion}, {"method", method}, {"params", params}};
}

json make_result_response(const json& id, const json& result) {
    return json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

json make_error_response(const json& id, const JsonRpcError& error) {
    json error_object{{"code", error.code}, {"message", error.message}};
    if (!error.data.is_null()) {
        error_object["data"] = error.data;
    }
    return json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", error_object}};
}

json make_initialize_params(const std::string& client_name, const std::string& client_version) {
    return json{{"protocolVersion", kProtocolVersion},
                {"capabilities", {{"tools", json::object()}}},
                {"clientInfo", {{"name", client_name}, {"version", client_version}}}};
}

json make_tools_call_params(const std::string& tool_name, const json& arguments) {
    return json{{"name", tool_name}, {"arguments", arguments}};
}

core::errors::Result<JsonRpcMessage> parse_message(const std::string& line) {
    json document;
    try {
        document = json::parse(line);
    } catch (const json::parse_error& e) {
        return parse_failure(std::string("Invalid JSON: ") + e.what());
    }

    if (!document.is_object()) {
        return parse_failure("Message must be a JSON object");
    }

    const auto version_it = document.find("jsonrpc");
    if (version_it == document.end() || !version_it->is_string() ||
        *version_it != kJsonRpcVersion) {
        return parse_failure("jsonrpc must be \"2.0\"");
    }

    JsonRpcMessage message;
    const auto id_it = document.find("id");
    if (id_it != document.end()) {
        if (!is_valid_id(*id_it)) {
            return parse_failure("id must be string, integer, or null");
        }
        message.id = *id_it;
    }

    const auto method_it = document.find("method");
    if (method_it != document.end()) {
        if (!method_it->is_string()) {
            return parse_failure("method must be a string");
        }
        message.method = method_it->get<std::string>();
        message.params = document.value("params", json::object());
        message.kind = message.id.has_value() ? JsonRpcMessage::Kind::Request
                                              : JsonRpcMessage::Kind::Notification;
        return message;
    }

    if (!message.id.has_value()) {
        return parse_failure("Response is missing id");
    }

    const auto result_it = document.find("result");
    const auto error_it = document.find("error");
    if (result_it != document.end() && error_it != document.end()) {
        return parse_failure("Response carries both result and error");
    }
    if (result_it != document.end()) {
        message.result = *result_it;
        return message;
    }
    if (error_it == document.end()) {
        return parse_failure("Response carries neither result nor error");
    }
    if (!error_it->is_object()) {
        return parse_failure("error must be an object");
    }

    JsonRpcError error;
    const auto code_it = error_it->find("code");
    if (code_it != error_it->end() && code_it->is_number_unsigned()) {
        // Above int64 range the code is clamped rather than wrapped.
        const auto raw = code_it->get<std::uint64_t>();
        error.code = raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())
                         ? std::numeric_limits<std::int64_t>::max()
                         : static_cast<std::int64_t>(raw);
    } else if (code_it != error_it->end() && code_it->is_number_integer()) {
        error.code = code_it->get<std::int64_t>();
    }
    const auto text_it = error_it->find("message");
    if (text_it != error_it->end() && text_it->is_string()) {
        error.message = text_it->get<std::string>();
    }
    error.data = error_it->value("data", json());
    message.error = std::move(error);
    return message;
}

std::string serialize_line(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

}  // namespace toolmux::protocol
