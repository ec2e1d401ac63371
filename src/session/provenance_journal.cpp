#include "session/provenance_journal.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace toolmux::session {

using core::errors::ErrorCategory;
using core::errors::OrchestratorError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

}  // namespace

ProvenanceJournal::ProvenanceJournal(std::filesystem::path journal_dir, std::string session_id)
    : journal_dir_(std::move(journal_dir)), session_id_(std::move(session_id)) {}

core::errors::Result<std::filesystem::path> ProvenanceJournal::journal_path() const {
    if (session_id_.empty()) {
        return OrchestratorError{ErrorCategory::Input, "Session ID cannot be empty.",
                                 "invalid_session_id"};
    }

    std::error_code ec;
    std::filesystem::create_directories(journal_dir_, ec);
    if (ec) {
        return OrchestratorError{ErrorCategory::Internal,
                                 "Unable to create journal directory: " +
                                     journal_dir_.string(),
                                 "journal_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(journal_dir_, ec) || ec) {
        return OrchestratorError{ErrorCategory::Input,
                                 "Journal path is not a directory: " + journal_dir_.string(),
                                 "invalid_journal_dir"};
    }

    return journal_dir_ / (session_id_ + ".jsonl");
}

core::errors::Result<std::filesystem::path> ProvenanceJournal::append_event(
    const std::string& event_json) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path_result = journal_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return OrchestratorError{ErrorCategory::Internal,
                                 "Unable to open journal file: " + path.string(),
                                 "journal_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return OrchestratorError{ErrorCategory::Internal,
                                 "Unable to write journal event: " + path.string(),
                                 "journal_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> ProvenanceJournal::record_success(
    const protocol::ToolResult& result) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "tool_call";
    event["session_id"] = session_id_;
    event["ok"] = true;
    event["provenance"] = protocol::provenance_to_json(result.provenance);
    return append_event(event.dump(-1, ' ', false, json::error_handler_t::replace));
}

core::errors::Result<std::filesystem::path> ProvenanceJournal::record_failure(
    const std::string& tool_name, const std::optional<std::string>& server_name,
    const OrchestratorError& error) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "tool_call";
    event["session_id"] = session_id_;
    event["ok"] = false;
    event["tool"] = tool_name;
    event["server"] = server_name.has_value() ? json(server_name.value()) : json();
    event["error"] = {{"category", core::errors::to_string(error.category)},
                      {"code", error.code},
                      {"message", error.message}};
    return append_event(event.dump(-1, ' ', false, json::error_handler_t::replace));
}

}  // namespace toolmux::session
