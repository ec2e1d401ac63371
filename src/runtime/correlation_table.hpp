#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include "core/errors/orchestrator_errors.hpp"
#include "protocol/jsonrpc.hpp"

namespace toolmux::runtime {

using CallOutcome = core::errors::Result<protocol::JsonRpcMessage>;

struct PendingCall {
    std::int64_t id = 0;
    std::string server_name;
    std::string method;
    std::chrono::steady_clock::time_point submitted_at;
    std::promise<CallOutcome> completion;
};

// Outstanding requests of one server, keyed by request id. Whoever removes an
// entry (complete, abandon or fail_all) is the only one to resolve it, so
// every call ends exactly once.
class CorrelationTable {
public:
    explicit CorrelationTable(std::string server_name);

    // Empty future when the table has been closed.
    core::errors::Result<std::future<CallOutcome>> open(std::int64_t id,
                                                        const std::string& method);

    // False when no call with that id is outstanding (late or unknown).
    bool complete(std::int64_t id, CallOutcome outcome);

    // Drops the entry without resolving it. False if it was already resolved.
    bool abandon(std::int64_t id);

    // Resolves every outstanding call with `error` and refuses later opens.
    std::size_t close(const core::errors::OrchestratorError& error);

    std::size_t outstanding() const;
    bool closed() const;

private:
    std::string server_name_;
    mutable std::mutex mutex_;
    std::unordered_map<std::int64_t, PendingCall> pending_;
    bool closed_ = false;
};

}  // namespace toolmux::runtime
