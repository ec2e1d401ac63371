#include "runtime/server_process.hpp"

#include <cerrno>
#include <csignal>
#include <sys/wait.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolmux::runtime {

std::string to_string(const ServerState state) {
    switch (state) {
        case ServerState::Starting:
            return "starting";
        case ServerState::Initializing:
            return "initializing";
        case ServerState::Ready:
            return "ready";
        case ServerState::Failed:
            return "failed";
        case ServerState::Terminated:
            return "terminated";
        default:
            return "unknown";
    }
}

ServerProcess::ServerProcess(std::string name, const pid_t pid, const int stdin_fd,
                             const int stdout_fd, const int stderr_fd)
    : name_(std::move(name)),
      pid_(pid),
      stdin_writer_(stdin_fd),
      stdout_reader_(stdout_fd),
      stderr_reader_(stderr_fd) {}

ServerProcess::~ServerProcess() {
    if (!has_exited()) {
        static_cast<void>(kill(-pid_, SIGKILL));
        static_cast<void>(kill(pid_, SIGKILL));
    }
    close_pipes();
    stderr_reader_.interrupt();
    join_threads();
}

ServerState ServerProcess::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool ServerProcess::transition_to(const ServerState next) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == next) {
        return true;
    }
    if (state_ == ServerState::Terminated ||
        (state_ == ServerState::Failed && next != ServerState::Terminated)) {
        return false;
    }
    LOG_INFO("ServerProcess: " + name_ + " transition " + to_string(state_) + " -> " +
             to_string(next));
    state_ = next;
    return true;
}

core::errors::Result<std::size_t> ServerProcess::write_stdin(
    const std::string& data, const std::chrono::steady_clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    return stdin_writer_.write_all(data, deadline);
}

std::optional<std::string> ServerProcess::read_stdout_line() {
    return stdout_reader_.read_line();
}

void ServerProcess::close_pipes() {
    // Interrupt first so a writer stuck on a full pipe lets go of the mutex.
    stdin_writer_.interrupt();
    {
        std::lock_guard<std::mutex> lock(stdin_mutex_);
        stdin_writer_.close();
    }
    stdout_reader_.interrupt();
}

bool ServerProcess::has_exited() const {
    std::lock_guard<std::mutex> lock(exit_mutex_);
    return exited_;
}

std::optional<int> ServerProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(exit_mutex_);
    if (!exited_) {
        return std::nullopt;
    }
    return exit_code_;
}

bool ServerProcess::wait_for_exit(const std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(exit_mutex_);
    return exit_cv_.wait_for(lock, timeout, [this] { return exited_; });
}

std::vector<std::string> ServerProcess::stderr_tail() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return std::vector<std::string>(stderr_tail_.begin(), stderr_tail_.end());
}

void ServerProcess::drain_stderr() {
    while (auto line = stderr_reader_.read_line()) {
        LOG_DEBUG("[" + name_ + "] stderr: " + *line);
        std::lock_guard<std::mutex> lock(stderr_mutex_);
        stderr_tail_.push_back(std::move(*line));
        if (stderr_tail_.size() > kStderrTailLines) {
            stderr_tail_.pop_front();
        }
    }
}

void ServerProcess::reap() {
    int status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(pid_, &status, 0);
    } while (waited < 0 && errno == EINTR);

    int code = -1;
    if (waited == pid_) {
        if (WIFEXITED(status)) {
            code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            code = 128 + WTERMSIG(status);
        }
    }

    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        exited_ = true;
        exit_code_ = code;
    }
    exit_cv_.notify_all();
}

void ServerProcess::join_threads() {
    for (std::thread* thread : {&monitor_thread_, &stderr_thread_}) {
        if (!thread->joinable()) {
            continue;
        }
        if (thread->get_id() == std::this_thread::get_id()) {
            thread->detach();
            continue;
        }
        thread->join();
    }
}

ProcessTransport::ProcessTransport(std::shared_ptr<ServerProcess> process)
    : process_(std::move(process)) {}

core::errors::Result<std::size_t> ProcessTransport::write_line(
    const std::string& line, const std::chrono::steady_clock::time_point deadline) {
    return process_->write_stdin(line, deadline);
}

std::optional<std::string> ProcessTransport::read_line() {
    return process_->read_stdout_line();
}

void ProcessTransport::close() {
    process_->close_pipes();
}

}  // namespace toolmux::runtime
