#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/orchestrator_config.hpp"
#include "core/errors/orchestrator_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/process_supervisor.hpp"
#include "runtime/protocol_client.hpp"
#include "session/provenance_journal.hpp"
#include "tools/tool_invoker.hpp"
#include "tools/tool_registry.hpp"

namespace toolmux::session {

struct InitializeReport {
    std::size_t configured = 0;
    std::size_t ready = 0;
    std::size_t failed = 0;
};

struct ServerStatus {
    std::string name;
    runtime::ServerState state = runtime::ServerState::Starting;
    std::size_t tool_count = 0;
    std::string last_error;
};

// Entry point for the calling application: start servers, list their tools,
// route calls, shut everything down.
class OrchestratorService {
public:
    explicit OrchestratorService(core::config::OrchestratorOptions options = {});
    ~OrchestratorService();

    OrchestratorService(const OrchestratorService&) = delete;
    OrchestratorService& operator=(const OrchestratorService&) = delete;

    // Servers that fail to spawn or handshake are reported, never fatal.
    // A second call is a no-op returning the first report.
    core::errors::Result<InitializeReport> initialize(
        const std::vector<core::config::ServerConfig>& configs);

    std::vector<protocol::ToolDescriptor> list_tools() const;
    nlohmann::json tools_for_function_calling() const;

    core::errors::Result<protocol::ToolResult> call_tool(const std::string& name,
                                                         const nlohmann::json& arguments);
    core::errors::Result<protocol::ToolResult> call_tool(const std::string& name,
                                                         const nlohmann::json& arguments,
                                                         std::chrono::milliseconds timeout);

    // Idempotent.
    void shutdown();

    std::vector<ServerStatus> server_statuses() const;
    std::vector<tools::ToolConflict> conflicts() const;
    const std::string& session_id() const { return session_id_; }

private:
    struct ServerEntry {
        std::string name;
        std::shared_ptr<runtime::ServerProcess> process;
        std::shared_ptr<runtime::ProtocolClient> client;
        bool handshake_failed = false;
        std::string last_error;
    };

    bool bring_up(const core::config::ServerConfig& config);
    void on_server_lost(const std::string& server_name, const std::string& reason);
    std::shared_ptr<runtime::ProtocolClient> ready_client(const std::string& server_name) const;
    void record_outcome(const std::string& tool_name,
                        const core::errors::Result<protocol::ToolResult>& outcome) const;

    core::config::OrchestratorOptions options_;
    std::string session_id_;
    tools::ToolRegistry registry_;
    runtime::ProcessSupervisor supervisor_;
    tools::ToolInvoker invoker_;
    std::optional<ProvenanceJournal> journal_;

    std::mutex lifecycle_mutex_;
    std::atomic_bool initialized_{false};
    std::atomic_bool shut_down_{false};
    InitializeReport report_;

    mutable std::mutex servers_mutex_;
    std::vector<std::string> server_order_;
    std::unordered_map<std::string, ServerEntry> servers_;
};

}  // namespace toolmux::session
