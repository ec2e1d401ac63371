#include "tools/tool_invoker.hpp"

#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc.hpp"

namespace toolmux::tools {

using core::errors::ErrorCategory;
using core::errors::OrchestratorError;
using nlohmann::json;
using protocol::ToolResult;

namespace {

constexpr std::size_t kMaxLoggedPayload = 300;

std::string clip(const std::string& text) {
    if (text.size() <= kMaxLoggedPayload) {
        return text;
    }
    return text.substr(0, kMaxLoggedPayload) + "...";
}

std::string dump(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

ToolInvoker::ToolInvoker(const ToolRegistry& registry, ClientResolver resolve_client)
    : registry_(registry), resolve_client_(std::move(resolve_client)) {}

core::errors::Result<ToolResult> ToolInvoker::call(const std::string& tool_name,
                                                   const json& arguments,
                                                   const std::chrono::milliseconds timeout) const {
    const auto descriptor = registry_.lookup(tool_name);
    if (!descriptor.has_value()) {
        return OrchestratorError{ErrorCategory::ToolNotFound,
                                 "Tool " + tool_name + " not found", "tool_not_found"};
    }
    if (!arguments.is_null() && !arguments.is_object()) {
        return OrchestratorError{ErrorCategory::Input,
                                 "Arguments for " + tool_name + " must be a JSON object",
                                 "invalid_arguments"};
    }

    const std::string& server_name = descriptor->server_name;
    auto client = resolve_client_ ? resolve_client_(server_name) : nullptr;
    if (!client) {
        return OrchestratorError{ErrorCategory::ServerUnavailable,
                                 "Server " + server_name + " not running", "server_unavailable"};
    }

    const std::string trace_id = core::config::generate_trace_id();
    const json effective_arguments = arguments.is_null() ? json::object() : arguments;
    LOG_INFO("[TRACE " + trace_id + "] Calling tool '" + tool_name + "' on server '" +
             server_name + "' with params: " + clip(dump(effective_arguments)));

    const auto started = std::chrono::steady_clock::now();
    auto response = client->call(
        "tools/call", protocol::make_tools_call_params(tool_name, effective_arguments), timeout);
    const auto ended = std::chrono::steady_clock::now();
    const double elapsed_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();

    if (core::errors::is_error(response)) {
        const auto& error = core::errors::get_error(response);
        LOG_ERROR("[TRACE " + trace_id + "] Failed to call tool " + tool_name + ": " +
                  error.message);
        return error;
    }

    const auto& message = core::errors::get_value(response);
    if (message.error.has_value()) {
        const auto& rpc = message.error.value();
        OrchestratorError error{ErrorCategory::Rpc,
                                "Tool call error from " + server_name + ": " + rpc.message,
                                "rpc_error"};
        error.rpc_code = rpc.code;
        json detail{{"code", rpc.code}, {"message", rpc.message}};
        if (!rpc.data.is_null()) {
            detail["data"] = rpc.data;
        }
        error.detail = dump(detail);
        LOG_ERROR("[TRACE " + trace_id + "] " + error.message);
        return error;
    }

    ToolResult result;
    result.payload = message.result.value_or(json());
    result.provenance.trace_id = trace_id;
    result.provenance.server_name = server_name;
    result.provenance.tool_name = tool_name;
    result.provenance.elapsed_ms = elapsed_ms;

    LOG_INFO("[TRACE " + trace_id + "] Response from '" + server_name + "/" + tool_name +
             "': " + clip(dump(result.payload)));
    return result;
}

}  // namespace toolmux::tools
