#include "runtime/correlation_table.hpp"

#include <utility>
#include <vector>

namespace toolmux::runtime {

using core::errors::ErrorCategory;
using core::errors::OrchestratorError;

CorrelationTable::CorrelationTable(std::string server_name)
    : server_name_(std::move(server_name)) {}

core::errors::Result<std::future<CallOutcome>> CorrelationTable::open(
    const std::int64_t id, const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return OrchestratorError{ErrorCategory::ServerUnavailable,
                                 "Server " + server_name_ + " is not accepting calls.",
                                 "server_unavailable"};
    }
    if (pending_.count(id) != 0) {
        return OrchestratorError{ErrorCategory::Internal,
                                 "Request id " + std::to_string(id) +
                                     " is already outstanding on " + server_name_,
                                 "duplicate_request_id"};
    }

    PendingCall call;
    call.id = id;
    call.server_name = server_name_;
    call.method = method;
    call.submitted_at = std::chrono::steady_clock::now();
    auto future = call.completion.get_future();
    pending_.emplace(id, std::move(call));
    return std::move(future);
}

bool CorrelationTable::complete(const std::int64_t id, CallOutcome outcome) {
    PendingCall call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        call = std::move(it->second);
        pending_.erase(it);
    }
    call.completion.set_value(std::move(outcome));
    return true;
}

bool CorrelationTable::abandon(const std::int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.erase(id) != 0;
}

std::size_t CorrelationTable::close(const OrchestratorError& error) {
    std::vector<PendingCall> calls;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        calls.reserve(pending_.size());
        for (auto& [id, call] : pending_) {
            calls.push_back(std::move(call));
        }
        pending_.clear();
    }
    for (auto& call : calls) {
        call.completion.set_value(error);
    }
    return calls.size();
}

std::size_t CorrelationTable::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool CorrelationTable::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace toolmux::runtime
