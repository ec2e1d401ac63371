#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "core/config/orchestrator_config.hpp"
#include "core/errors/orchestrator_errors.hpp"
#include "runtime/server_process.hpp"

namespace toolmux::runtime {

class ProcessSupervisor {
public:
    // Invoked on the monitor thread when a server exits without being asked to.
    using ExitHandler = std::function<void(const std::string& server_name, int exit_code)>;

    explicit ProcessSupervisor(ExitHandler on_unexpected_exit = nullptr);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    core::errors::Result<std::shared_ptr<ServerProcess>> start(
        const core::config::ServerConfig& config);

    // Marks the exit that follows as requested, so closing the server's pipes
    // first is not reported as a crash.
    void begin_termination(ServerProcess& process);
    void begin_shutdown();

    // SIGTERM, then SIGKILL after `grace`. Never fails.
    void terminate(ServerProcess& process, std::chrono::milliseconds grace);

    // Idempotent.
    void shutdown_all(std::chrono::milliseconds grace);

    std::shared_ptr<ServerProcess> find(const std::string& name) const;
    std::size_t process_count() const;

private:
    void monitor(ServerProcess& process);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ServerProcess>> processes_;
    ExitHandler on_unexpected_exit_;
};

}  // namespace toolmux::runtime
