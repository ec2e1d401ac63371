#include "session/orchestrator_service.hpp"

#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "runtime/handshake.hpp"

namespace toolmux::session {

using core::config::ServerConfig;
using core::errors::ErrorCategory;
using core::errors::OrchestratorError;
using nlohmann::json;
using protocol::ToolDescriptor;
using protocol::ToolResult;
using runtime::ProtocolClient;
using runtime::ServerState;

OrchestratorService::OrchestratorService(core::config::OrchestratorOptions options)
    : options_(std::move(options)),
      session_id_(core::config::generate_session_id()),
      supervisor_([this](const std::string& server_name, const int exit_code) {
          on_server_lost(server_name, "process exited with code " + std::to_string(exit_code));
      }),
      invoker_(registry_, [this](const std::string& server_name) {
          return ready_client(server_name);
      }) {
    if (options_.journal_dir.has_value()) {
        journal_.emplace(options_.journal_dir.value(), session_id_);
    }
}

OrchestratorService::~OrchestratorService() {
    shutdown();
}

core::errors::Result<InitializeReport> OrchestratorService::initialize(
    const std::vector<ServerConfig>& configs) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shut_down_.load()) {
        return OrchestratorError{ErrorCategory::ServerUnavailable,
                                 "Service has been shut down.", "service_shut_down"};
    }
    if (initialized_.load()) {
        LOG_DEBUG("Orchestrator service already initialized");
        return report_;
    }

    // Sequential so that first-wins conflict resolution follows config order.
    InitializeReport report;
    for (const auto& config : configs) {
        ++report.configured;
        if (bring_up(config)) {
            ++report.ready;
        } else {
            ++report.failed;
        }
    }

    report_ = report;
    initialized_.store(true);
    LOG_INFO("Orchestrator service initialized: " + std::to_string(report.ready) + "/" +
             std::to_string(report.configured) + " server(s) ready, " +
             std::to_string(registry_.size()) + " tool(s)");
    return report;
}

bool OrchestratorService::bring_up(const ServerConfig& config) {
    auto record_failure = [this, &config](const std::string& message, bool handshake) {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        auto& entry = servers_[config.name];
        if (entry.name.empty()) {
            entry.name = config.name;
            server_order_.push_back(config.name);
        }
        entry.handshake_failed = handshake;
        entry.last_error = message;
    };

    auto started = supervisor_.start(config);
    if (core::errors::is_error(started)) {
        const auto& error = core::errors::get_error(started);
        LOG_ERROR("Failed to start MCP server " + config.name + ": " + error.message);
        // A duplicate name must not clobber the running server's entry.
        if (error.code != "duplicate_server") {
            record_failure(error.message, false);
        }
        return false;
    }
    auto process = core::errors::get_value(started);

    auto client = std::make_shared<ProtocolClient>(
        config.name, std::make_unique<runtime::ProcessTransport>(process),
        [this](const std::string& server_name, const std::string& reason) {
            on_server_lost(server_name, reason);
        });
    {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        auto& entry = servers_[config.name];
        if (entry.name.empty()) {
            server_order_.push_back(config.name);
        }
        entry.name = config.name;
        entry.process = process;
        entry.client = client;
    }
    client->start();

    process->transition_to(ServerState::Initializing);
    runtime::Handshake handshake(runtime::HandshakeOptions{
        options_.client_name, options_.client_version, options_.handshake_timeout});
    auto report = handshake.run(*client, registry_);
    if (core::errors::is_error(report)) {
        const auto& error = core::errors::get_error(report);
        std::string message = error.message;
        const auto tail = process->stderr_tail();
        if (!tail.empty()) {
            message += " (last stderr: " + tail.back() + ")";
        }
        LOG_ERROR("Failed to initialize MCP server " + config.name + ": " + message);
        process->transition_to(ServerState::Failed);
        record_failure(message, true);
        supervisor_.begin_termination(*process);
        client->close();
        supervisor_.terminate(*process, options_.shutdown_grace);
        return false;
    }

    if (!process->transition_to(ServerState::Ready)) {
        // Lost between the handshake and now; the exit handler already ran.
        static_cast<void>(registry_.evict(config.name));
        return false;
    }
    return true;
}

void OrchestratorService::on_server_lost(const std::string& server_name,
                                         const std::string& reason) {
    std::shared_ptr<runtime::ServerProcess> process;
    {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        auto it = servers_.find(server_name);
        if (it != servers_.end()) {
            process = it->second.process;
            it->second.last_error = reason;
        }
    }
    if (process) {
        process->transition_to(ServerState::Failed);
    }
    const auto evicted = registry_.evict(server_name);
    LOG_WARN("Tool server " + server_name + " lost (" + reason + "); " +
             std::to_string(evicted) + " tool(s) withdrawn");
}

std::shared_ptr<ProtocolClient> OrchestratorService::ready_client(
    const std::string& server_name) const {
    std::lock_guard<std::mutex> lock(servers_mutex_);
    auto it = servers_.find(server_name);
    if (it == servers_.end() || !it->second.process || !it->second.client) {
        return nullptr;
    }
    if (it->second.process->state() != ServerState::Ready || !it->second.client->is_open()) {
        return nullptr;
    }
    return it->second.client;
}

std::vector<ToolDescriptor> OrchestratorService::list_tools() const {
    if (shut_down_.load()) {
        return {};
    }
    return registry_.list();
}

json OrchestratorService::tools_for_function_calling() const {
    json tools = json::array();
    for (const auto& tool : list_tools()) {
        tools.push_back(protocol::to_function_schema(tool));
    }
    return tools;
}

core::errors::Result<ToolResult> OrchestratorService::call_tool(const std::string& name,
                                                                const json& arguments) {
    return call_tool(name, arguments, options_.call_timeout);
}

core::errors::Result<ToolResult> OrchestratorService::call_tool(
    const std::string& name, const json& arguments, const std::chrono::milliseconds timeout) {
    core::errors::Result<ToolResult> outcome =
        OrchestratorError{ErrorCategory::ServerUnavailable, "Service is not running.",
                          "service_not_running"};
    if (shut_down_.load()) {
        outcome = OrchestratorError{ErrorCategory::ServerUnavailable,
                                    "Service has been shut down.", "service_shut_down"};
    } else if (initialized_.load()) {
        outcome = invoker_.call(name, arguments, timeout);
    }
    record_outcome(name, outcome);
    return outcome;
}

void OrchestratorService::record_outcome(
    const std::string& tool_name, const core::errors::Result<ToolResult>& outcome) const {
    if (!journal_.has_value()) {
        return;
    }

    core::errors::Result<std::filesystem::path> written = std::filesystem::path();
    if (core::errors::is_error(outcome)) {
        const auto descriptor = registry_.lookup(tool_name);
        std::optional<std::string> server_name;
        if (descriptor.has_value()) {
            server_name = descriptor->server_name;
        }
        written = journal_->record_failure(tool_name, server_name,
                                           core::errors::get_error(outcome));
    } else {
        written = journal_->record_success(core::errors::get_value(outcome));
    }
    if (core::errors::is_error(written)) {
        LOG_WARN("Failed to journal call to " + tool_name + ": " +
                 core::errors::get_error(written).message);
    }
}

void OrchestratorService::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shut_down_.exchange(true)) {
        LOG_DEBUG("Orchestrator service already shut down");
        return;
    }

    registry_.clear();

    std::vector<std::shared_ptr<ProtocolClient>> clients;
    {
        std::lock_guard<std::mutex> servers_lock(servers_mutex_);
        for (const auto& name : server_order_) {
            const auto& entry = servers_[name];
            if (entry.client) {
                clients.push_back(entry.client);
            }
        }
    }
    // Exits caused by closing stdin below are expected from here on.
    supervisor_.begin_shutdown();
    // Without holding servers_mutex_: closing joins threads that may be
    // waiting for it in on_server_lost.
    for (const auto& client : clients) {
        client->close();
    }
    supervisor_.shutdown_all(options_.shutdown_grace);
    LOG_INFO("Orchestrator service shut down");
}

std::vector<ServerStatus> OrchestratorService::server_statuses() const {
    std::lock_guard<std::mutex> lock(servers_mutex_);
    std::vector<ServerStatus> statuses;
    statuses.reserve(server_order_.size());
    for (const auto& name : server_order_) {
        const auto& entry = servers_.at(name);
        ServerStatus status;
        status.name = name;
        status.last_error = entry.last_error;
        if (!entry.process || entry.handshake_failed) {
            status.state = ServerState::Failed;
        } else {
            status.state = entry.process->state();
        }
        status.tool_count = registry_.count_for(name);
        statuses.push_back(std::move(status));
    }
    return statuses;
}

std::vector<tools::ToolConflict> OrchestratorService::conflicts() const {
    return registry_.conflicts();
}

}  // namespace toolmux::session
