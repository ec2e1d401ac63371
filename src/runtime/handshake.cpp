#include "runtime/handshake.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace toolmux::runtime {

using core::errors::ErrorCategory;
using core::errors::OrchestratorError;
using nlohmann::json;
using protocol::JsonRpcMessage;
using protocol::ToolDescriptor;
using tools::RegistrationOutcome;
using tools::ToolRegistry;

namespace {

OrchestratorError handshake_error(const std::string& server_name, const std::string& step,
                                  const std::string& why, const std::string& code) {
    return OrchestratorError{ErrorCategory::Handshake,
                             "Handshake with " + server_name + " failed at " + step + ": " +
                                 why,
                             code};
}

// Transport-level failure of a handshake step, or the server's error object.
std::optional<OrchestratorError> step_failure(
    const std::string& server_name, const std::string& step,
    const core::errors::Result<JsonRpcMessage>& response) {
    if (core::errors::is_error(response)) {
        const auto& error = core::errors::get_error(response);
        const std::string code = error.category == ErrorCategory::Timeout
                                     ? "handshake_timeout"
                                     : "handshake_failed";
        return handshake_error(server_name, step, error.message, code);
    }
    const auto& message = core::errors::get_value(response);
    if (message.error.has_value()) {
        auto error = handshake_error(server_name, step,
                                     "server returned error " +
                                         std::to_string(message.error->code) + " " +
                                         message.error->message,
                                     "handshake_rejected");
        error.rpc_code = message.error->code;
        return error;
    }
    return std::nullopt;
}

}  // namespace

Handshake::Handshake(HandshakeOptions options) : options_(std::move(options)) {}

core::errors::Result<HandshakeReport> Handshake::run(ProtocolClient& client,
                                                     ToolRegistry& registry) const {
    auto initialized = initialize(client);
    if (core::errors::is_error(initialized)) {
        return core::errors::get_error(initialized);
    }
    HandshakeReport report = core::errors::get_value(initialized);

    auto discovered = discover_tools(client, registry, report);
    if (core::errors::is_error(discovered)) {
        static_cast<void>(registry.evict(client.server_name()));
        return core::errors::get_error(discovered);
    }
    report.registered = core::errors::get_value(discovered);

    LOG_INFO("Handshake with " + client.server_name() + " complete: " +
             std::to_string(report.registered) + " tool(s), " +
             std::to_string(report.conflicts) + " conflict(s)");
    return report;
}

core::errors::Result<HandshakeReport> Handshake::initialize(ProtocolClient& client) const {
    const auto& server_name = client.server_name();
    auto response = client.call(
        "initialize",
        protocol::make_initialize_params(options_.client_name, options_.client_version),
        options_.timeout);
    if (auto failure = step_failure(server_name, "initialize", response)) {
        return failure.value();
    }

    const auto& result = core::errors::get_value(response).result;
    if (!result.has_value() || !result->is_object()) {
        return handshake_error(server_name, "initialize", "result is not an object",
                               "handshake_malformed");
    }

    HandshakeReport report;
    report.server_info = result->value("serverInfo", json::object());
    const auto version = result->find("protocolVersion");
    if (version != result->end() && version->is_string()) {
        report.protocol_version = version->get<std::string>();
        if (report.protocol_version != protocol::kProtocolVersion) {
            LOG_INFO("Handshake: " + server_name + " negotiated protocol version " +
                     report.protocol_version);
        }
    }

    auto notified = client.notify("notifications/initialized", json::object(), options_.timeout);
    if (core::errors::is_error(notified)) {
        return handshake_error(server_name, "notifications/initialized",
                               core::errors::get_error(notified).message, "handshake_failed");
    }
    return report;
}

core::errors::Result<std::size_t> Handshake::discover_tools(ProtocolClient& client,
                                                            ToolRegistry& registry,
                                                            HandshakeReport& report) const {
    const auto& server_name = client.server_name();
    std::size_t registered = 0;
    std::optional<std::string> cursor;

    for (int page = 0; page < kMaxToolPages; ++page) {
        json params = json::object();
        if (cursor.has_value()) {
            params["cursor"] = cursor.value();
        }

        auto response = client.call("tools/list", params, options_.timeout);
        if (auto failure = step_failure(server_name, "tools/list", response)) {
            return failure.value();
        }

        const auto& result = core::errors::get_value(response).result;
        if (!result.has_value() || !result->is_object()) {
            return handshake_error(server_name, "tools/list", "result is not an object",
                                   "handshake_malformed");
        }
        const auto tools_it = result->find("tools");
        if (tools_it == result->end() || !tools_it->is_array()) {
            return handshake_error(server_name, "tools/list", "result.tools is not an array",
                                   "handshake_malformed");
        }

        for (const auto& tool : *tools_it) {
            if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string() ||
                tool["name"].get<std::string>().empty()) {
                LOG_WARN("Handshake: " + server_name + " listed a tool without a name; skipped");
                continue;
            }

            ToolDescriptor descriptor;
            descriptor.name = tool["name"].get<std::string>();
            descriptor.server_name = server_name;
            const auto description = tool.find("description");
            if (description != tool.end() && description->is_string()) {
                descriptor.description = description->get<std::string>();
            }
            const auto schema = tool.find("inputSchema");
            if (schema != tool.end() && schema->is_object()) {
                descriptor.input_schema = *schema;
            }

            if (registry.register_tool(std::move(descriptor)) == RegistrationOutcome::Registered) {
                ++registered;
            } else {
                ++report.conflicts;
            }
        }

        const auto next = result->find("nextCursor");
        if (next == result->end() || !next->is_string() || next->get<std::string>().empty()) {
            return registered;
        }
        cursor = next->get<std::string>();
    }

    LOG_WARN("Handshake: " + server_name + " tools/list still paging after " +
             std::to_string(kMaxToolPages) + " pages; stopping");
    return registered;
}

}  // namespace toolmux::runtime
