#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/orchestrator_config.hpp"
#include "core/errors/orchestrator_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/cli_request.hpp"
#include "protocol/tool_contract.hpp"
#include "session/orchestrator_service.hpp"

namespace {

nlohmann::json error_to_json(const toolmux::core::errors::OrchestratorError& err) {
    nlohmann::json payload{{"category", toolmux::core::errors::to_string(err.category)},
                           {"code", err.code},
                           {"message", err.message}};
    if (err.rpc_code.has_value()) {
        payload["rpc_code"] = err.rpc_code.value();
    }
    if (!err.detail.empty()) {
        payload["detail"] = nlohmann::json::parse(err.detail, nullptr, false);
    }
    return nlohmann::json{{"error", payload}};
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = toolmux::app::cli::parse_and_validate(argc, argv);
    if (toolmux::core::errors::is_error(parsed)) {
        const auto& err = toolmux::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = toolmux::core::errors::get_value(parsed);

    // 2. Load the server table
    auto loaded = toolmux::core::config::load_orchestrator_config(req.config_file);
    if (toolmux::core::errors::is_error(loaded)) {
        const auto& err = toolmux::core::errors::get_error(loaded);
        LOG_ERROR("Config error [" + err.code + "]: " + err.message);
        return 3;
    }
    auto config = toolmux::core::errors::get_value(loaded);
    if (req.journal_dir.has_value()) {
        config.options.journal_dir = req.journal_dir;
    }
    if (req.timeout.has_value()) {
        config.options.call_timeout = req.timeout.value();
    }

    auto& logger = toolmux::core::logging::Logger::get();
    logger.set_min_level(req.verbose ? toolmux::core::logging::LogLevel::DEBUG
                                     : config.options.log_level);

    // 3. Start servers; failures are contained per server
    toolmux::session::OrchestratorService service(config.options);
    logger.set_session_id(service.session_id());
    LOG_INFO("toolmux: starting " + std::to_string(config.servers.size()) + " server(s)");

    auto initialized = service.initialize(config.servers);
    if (toolmux::core::errors::is_error(initialized)) {
        const auto& err = toolmux::core::errors::get_error(initialized);
        LOG_ERROR("Initialization failed [" + err.code + "]: " + err.message);
        return 1;
    }
    for (const auto& status : service.server_statuses()) {
        LOG_INFO("Server " + status.name + ": " + toolmux::runtime::to_string(status.state) +
                 " (" + std::to_string(status.tool_count) + " tools)" +
                 (status.last_error.empty() ? "" : " - " + status.last_error));
    }
    for (const auto& conflict : service.conflicts()) {
        LOG_WARN("Tool " + conflict.tool_name + " from " + conflict.rejected_server +
                 " ignored; already provided by " + conflict.kept_server);
    }

    int exit_code = 0;
    if (req.command == toolmux::protocol::CliCommand::List) {
        std::cout << service.tools_for_function_calling().dump(2) << std::endl;
    } else {
        auto outcome = service.call_tool(req.tool_name.value(), req.arguments);
        if (toolmux::core::errors::is_error(outcome)) {
            std::cout << error_to_json(toolmux::core::errors::get_error(outcome))
                             .dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                      << std::endl;
            exit_code = 1;
        } else {
            std::cout << toolmux::protocol::to_json(toolmux::core::errors::get_value(outcome))
                             .dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                      << std::endl;
        }
    }

    // 4. Stop every server before exiting
    service.shutdown();
    return exit_code;
}
