#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>
#include "core/errors/orchestrator_errors.hpp"
#include "runtime/pipe_io.hpp"
#include "runtime/transport.hpp"

namespace toolmux::runtime {

enum class ServerState {
    Starting,
    Initializing,
    Ready,
    Failed,
    Terminated
};

std::string to_string(ServerState state);

// A spawned tool server. Owned by ProcessSupervisor, which starts the stderr
// and monitor threads and is the only party that joins them.
class ServerProcess {
public:
    ServerProcess(std::string name, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);
    ~ServerProcess();

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    const std::string& name() const { return name_; }
    pid_t pid() const { return pid_; }

    ServerState state() const;

    // Terminated is final and Failed may only move to Terminated; returns
    // false when the transition is refused.
    bool transition_to(ServerState next);

    core::errors::Result<std::size_t> write_stdin(const std::string& data,
                                                  std::chrono::steady_clock::time_point deadline);
    std::optional<std::string> read_stdout_line();

    // Releases a write waiting on a full pipe, closes stdin and unblocks the
    // stdout reader. Idempotent.
    void close_pipes();

    bool has_exited() const;
    std::optional<int> exit_code() const;
    bool wait_for_exit(std::chrono::milliseconds timeout) const;

    std::vector<std::string> stderr_tail() const;

private:
    friend class ProcessSupervisor;

    static constexpr std::size_t kStderrTailLines = 50;

    void drain_stderr();
    void reap();
    void join_threads();

    std::string name_;
    pid_t pid_;

    mutable std::mutex state_mutex_;
    ServerState state_ = ServerState::Starting;

    std::mutex stdin_mutex_;
    LineWriter stdin_writer_;
    LineReader stdout_reader_;
    LineReader stderr_reader_;

    mutable std::mutex stderr_mutex_;
    std::deque<std::string> stderr_tail_;

    mutable std::mutex exit_mutex_;
    mutable std::condition_variable exit_cv_;
    bool exited_ = false;
    int exit_code_ = -1;

    std::atomic_bool terminating_{false};
    std::thread stderr_thread_;
    std::thread monitor_thread_;
};

// Transport over a ServerProcess's stdin/stdout.
class ProcessTransport : public Transport {
public:
    explicit ProcessTransport(std::shared_ptr<ServerProcess> process);

    core::errors::Result<std::size_t> write_line(
        const std::string& line, std::chrono::steady_clock::time_point deadline) override;
    std::optional<std::string> read_line() override;
    void close() override;

private:
    std::shared_ptr<ServerProcess> process_;
};

}  // namespace toolmux::runtime
