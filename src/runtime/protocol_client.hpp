#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "core/errors/orchestrator_errors.hpp"
#include "protocol/jsonrpc.hpp"
#include "runtime/correlation_table.hpp"
#include "runtime/transport.hpp"

namespace toolmux::runtime {

// JSON-RPC endpoint for one tool server: serialized writes, one read loop
// dispatching responses to their pending calls by id.
class ProtocolClient {
public:
    // Runs on the read-loop thread when the stream ends without close().
    using ClosedHandler = std::function<void(const std::string& server_name,
                                             const std::string& reason)>;

    static constexpr std::chrono::milliseconds kDefaultWriteTimeout{5000};

    ProtocolClient(std::string server_name, std::unique_ptr<Transport> transport,
                   ClosedHandler on_closed = nullptr);
    ~ProtocolClient();

    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    const std::string& server_name() const { return server_name_; }

    // Starts the read loop. Calls made before start() are written but their
    // responses are not read until it runs.
    void start();

    // Sends a request and waits for the matching response, a transport
    // failure, or `timeout`, whichever comes first.
    core::errors::Result<protocol::JsonRpcMessage> call(const std::string& method,
                                                        const nlohmann::json& params,
                                                        std::chrono::milliseconds timeout);

    core::errors::Result<std::size_t> notify(
        const std::string& method, const nlohmann::json& params,
        std::chrono::milliseconds timeout = kDefaultWriteTimeout);

    // One message, one line; writers are serialized. Waiting for the write
    // lock counts against `deadline`.
    core::errors::Result<std::size_t> send(const nlohmann::json& message,
                                           std::chrono::steady_clock::time_point deadline);

    // Idempotent. Fails outstanding calls with ServerUnavailable.
    void close();

    bool is_open() const;
    std::size_t outstanding_calls() const;
    std::size_t discarded_responses() const { return discarded_responses_.load(); }

private:
    void read_loop();
    void handle_line(const std::string& line);
    void answer_server_request(const protocol::JsonRpcMessage& request);

    std::string server_name_;
    std::unique_ptr<Transport> transport_;
    ClosedHandler on_closed_;

    std::timed_mutex write_mutex_;
    std::atomic<std::int64_t> next_id_{1};
    CorrelationTable pending_;

    std::mutex lifecycle_mutex_;
    std::thread reader_;
    std::atomic_bool closing_{false};
    std::atomic_bool stream_ended_{false};
    std::atomic<std::size_t> discarded_responses_{0};
};

}  // namespace toolmux::runtime
