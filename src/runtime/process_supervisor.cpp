#include "runtime/process_supervisor.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

extern char** environ;

namespace toolmux::runtime {

using core::config::ServerConfig;
using core::errors::ErrorCategory;
using core::errors::OrchestratorError;

namespace {

constexpr std::chrono::milliseconds kKillWait{5000};

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

// Parent environment with the overrides applied, built before fork so the
// child only calls async-signal-safe functions.
std::vector<std::string> merged_environment(const ServerConfig& config) {
    std::vector<std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string text(*entry);
        const auto eq = text.find('=');
        const std::string key = eq == std::string::npos ? text : text.substr(0, eq);
        if (config.env.count(key) != 0) {
            continue;
        }
        merged.push_back(text);
    }
    for (const auto& [key, value] : config.env) {
        merged.push_back(key + "=" + value);
    }
    return merged;
}

std::vector<char*> as_argv(std::vector<std::string>& storage) {
    std::vector<char*> pointers;
    pointers.reserve(storage.size() + 1);
    for (auto& item : storage) {
        pointers.push_back(item.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

void signal_group(const pid_t pid, const int signal) {
    if (kill(-pid, signal) != 0) {
        static_cast<void>(kill(pid, signal));
    }
}

}  // namespace

ProcessSupervisor::ProcessSupervisor(ExitHandler on_unexpected_exit)
    : on_unexpected_exit_(std::move(on_unexpected_exit)) {
    // A write to a dead server must come back as EPIPE, not kill us.
    static std::once_flag ignore_sigpipe;
    std::call_once(ignore_sigpipe, [] { std::signal(SIGPIPE, SIG_IGN); });
}

ProcessSupervisor::~ProcessSupervisor() {
    shutdown_all(std::chrono::milliseconds(2000));
}

core::errors::Result<std::shared_ptr<ServerProcess>> ProcessSupervisor::start(
    const ServerConfig& config) {
    if (config.name.empty()) {
        return OrchestratorError{ErrorCategory::ProcessSpawn,
                                 "Server name cannot be empty.", "invalid_server_name"};
    }
    if (config.command.empty()) {
        return OrchestratorError{ErrorCategory::ProcessSpawn,
                                 "Server " + config.name + " has an empty command.",
                                 "empty_command"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (processes_.count(config.name) != 0) {
        return OrchestratorError{ErrorCategory::ProcessSpawn,
                                 "Server " + config.name + " is already running.",
                                 "duplicate_server"};
    }

    std::vector<std::string> argv_storage;
    argv_storage.push_back(config.command);
    argv_storage.insert(argv_storage.end(), config.args.begin(), config.args.end());
    std::vector<char*> argv = as_argv(argv_storage);

    std::vector<std::string> env_storage = merged_environment(config);
    std::vector<char*> envp = as_argv(env_storage);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return OrchestratorError{ErrorCategory::ProcessSpawn,
                                 "Failed to create pipes for " + config.name + ": " + reason,
                                 "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return OrchestratorError{ErrorCategory::ProcessSpawn,
                                 "Failed to fork " + config.name + ": " + reason,
                                 "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execvpe(argv[0], argv.data(), envp.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    // The exec pipe is close-on-exec: EOF means exec succeeded, an int means
    // it failed with that errno.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        LOG_ERROR("Failed to start tool server " + config.name + ": " +
                  std::strerror(exec_errno));
        return OrchestratorError{ErrorCategory::ProcessSpawn,
                                 "Failed to execute '" + config.command + "' for " +
                                     config.name + ": " + std::strerror(exec_errno),
                                 "exec_failed",
                                 "Check that the command is installed and on PATH."};
    }

    auto process = std::make_shared<ServerProcess>(config.name, pid, stdin_pipe[1],
                                                   stdout_pipe[0], stderr_pipe[0]);
    ServerProcess* raw = process.get();
    process->stderr_thread_ = std::thread([raw] { raw->drain_stderr(); });
    process->monitor_thread_ = std::thread([this, raw] { monitor(*raw); });

    processes_.emplace(config.name, process);
    LOG_INFO("Started tool server: " + config.name + " (pid " + std::to_string(pid) + ")");
    return process;
}

void ProcessSupervisor::begin_termination(ServerProcess& process) {
    process.terminating_.store(true);
}

void ProcessSupervisor::begin_shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, process] : processes_) {
        process->terminating_.store(true);
    }
}

void ProcessSupervisor::monitor(ServerProcess& process) {
    process.reap();
    const int code = process.exit_code().value_or(-1);

    if (process.terminating_.load()) {
        LOG_DEBUG("Tool server " + process.name() + " exited with code " +
                  std::to_string(code) + " during termination");
        return;
    }

    LOG_WARN("Tool server " + process.name() + " exited unexpectedly with code " +
             std::to_string(code));
    process.transition_to(ServerState::Failed);
    process.close_pipes();
    if (on_unexpected_exit_) {
        on_unexpected_exit_(process.name(), code);
    }
}

void ProcessSupervisor::terminate(ServerProcess& process,
                                  const std::chrono::milliseconds grace) {
    process.terminating_.store(true);
    process.close_pipes();

    if (!process.has_exited()) {
        signal_group(process.pid(), SIGTERM);
        if (!process.wait_for_exit(grace)) {
            LOG_WARN("Tool server " + process.name() + " ignored SIGTERM for " +
                     std::to_string(grace.count()) + "ms; killing");
            signal_group(process.pid(), SIGKILL);
            if (!process.wait_for_exit(kKillWait)) {
                LOG_ERROR("Tool server " + process.name() + " (pid " +
                          std::to_string(process.pid()) + ") did not exit after SIGKILL");
            }
        }
    }

    process.stderr_reader_.interrupt();
    process.join_threads();
    process.transition_to(ServerState::Terminated);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(process.name());
        if (it != processes_.end() && it->second.get() == &process) {
            processes_.erase(it);
        }
    }
    LOG_INFO("Shutdown tool server: " + process.name());
}

void ProcessSupervisor::shutdown_all(const std::chrono::milliseconds grace) {
    std::unordered_map<std::string, std::shared_ptr<ServerProcess>> processes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        processes.swap(processes_);
    }
    for (auto& [name, process] : processes) {
        terminate(*process, grace);
    }
}

std::shared_ptr<ServerProcess> ProcessSupervisor::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(name);
    if (it == processes_.end()) {
        return nullptr;
    }
    return it->second;
}

std::size_t ProcessSupervisor::process_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
}

}  // namespace toolmux::runtime
