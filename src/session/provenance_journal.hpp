#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/orchestrator_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace toolmux::session {

// Append-only JSONL audit trail of tool calls, one file per session.
class ProvenanceJournal {
public:
    ProvenanceJournal(std::filesystem::path journal_dir, std::string session_id);

    core::errors::Result<std::filesystem::path> record_success(
        const protocol::ToolResult& result) const;

    core::errors::Result<std::filesystem::path> record_failure(
        const std::string& tool_name, const std::optional<std::string>& server_name,
        const core::errors::OrchestratorError& error) const;

    core::errors::Result<std::filesystem::path> journal_path() const;

private:
    core::errors::Result<std::filesystem::path> append_event(const std::string& event_json) const;

    std::filesystem::path journal_dir_;
    std::string session_id_;
    mutable std::mutex mutex_;
};

}  // namespace toolmux::session
