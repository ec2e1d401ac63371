#include "runtime/pipe_io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace toolmux::runtime {

using core::errors::ErrorCategory;
using core::errors::OrchestratorError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

}  // namespace

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

LineReader::LineReader(const int fd) : fd_(fd) {
    int wake[2] = {-1, -1};
    if (pipe2(wake, O_CLOEXEC | O_NONBLOCK) == 0) {
        wake_read_ = wake[0];
        wake_write_ = wake[1];
    }
    if (fd_ >= 0) {
        set_nonblocking(fd_);
    }
}

LineReader::~LineReader() {
    close_fd(fd_);
    close_fd(wake_read_);
    close_fd(wake_write_);
}

void LineReader::interrupt() {
    if (wake_write_ >= 0) {
        const char byte = 1;
        static_cast<void>(write(wake_write_, &byte, 1));
    }
}

std::optional<std::string> LineReader::read_line() {
    while (true) {
        const auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        if (eof_ || fd_ < 0) {
            if (!buffer_.empty()) {
                std::string line;
                line.swap(buffer_);
                return line;
            }
            return std::nullopt;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds].fd = fd_;
        fds[nfds].events = POLLIN;
        ++nfds;
        if (wake_read_ >= 0) {
            fds[nfds].fd = wake_read_;
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        const int ready = poll(fds, nfds, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::nullopt;
        }
        if (nfds > 1 && (fds[1].revents & POLLIN) != 0) {
            // Interrupted: stay interrupted for every later call as well.
            return std::nullopt;
        }

        char chunk[4096];
        while (true) {
            const ssize_t n = read(fd_, chunk, sizeof(chunk));
            if (n > 0) {
                buffer_.append(chunk, static_cast<std::size_t>(n));
                continue;
            }
            if (n == 0) {
                eof_ = true;
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                eof_ = true;
            }
            break;
        }
    }
}

LineWriter::LineWriter(const int fd) : fd_(fd) {
    int wake[2] = {-1, -1};
    if (pipe2(wake, O_CLOEXEC | O_NONBLOCK) == 0) {
        wake_read_ = wake[0];
        wake_write_ = wake[1];
    }
    if (fd_ >= 0) {
        set_nonblocking(fd_);
    }
}

LineWriter::~LineWriter() {
    close_fd(fd_);
    close_fd(wake_read_);
    close_fd(wake_write_);
}

void LineWriter::interrupt() {
    if (interrupted_.exchange(true)) {
        return;
    }
    if (wake_write_ >= 0) {
        const char byte = 1;
        static_cast<void>(write(wake_write_, &byte, 1));
    }
}

void LineWriter::close() {
    close_fd(fd_);
}

core::errors::Result<std::size_t> LineWriter::write_all(
    const std::string& data, const std::chrono::steady_clock::time_point deadline) {
    if (fd_ < 0 || interrupted_.load()) {
        return OrchestratorError{ErrorCategory::ServerUnavailable,
                                 "Pipe is already closed.", "pipe_closed"};
    }
    if (broken_) {
        return OrchestratorError{ErrorCategory::ServerUnavailable,
                                 "Pipe holds a partially written message.", "pipe_broken"};
    }

    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = write(fd_, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            broken_ = written > 0;
            return OrchestratorError{ErrorCategory::ServerUnavailable,
                                     std::string("Write to server failed: ") +
                                         std::strerror(errno),
                                     "pipe_write_failed"};
        }

        // Pipe full: wait for room, an interrupt, or the deadline.
        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            broken_ = written > 0;
            return OrchestratorError{ErrorCategory::Timeout,
                                     "Server did not accept input before the deadline.",
                                     "write_timeout"};
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds].fd = fd_;
        fds[nfds].events = POLLOUT;
        ++nfds;
        if (wake_read_ >= 0) {
            fds[nfds].fd = wake_read_;
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        const int wait_ms = static_cast<int>(
            std::min<std::chrono::milliseconds::rep>(remaining.count(), 60000));
        const int ready = poll(fds, nfds, wait_ms);
        if (ready < 0 && errno != EINTR) {
            broken_ = written > 0;
            return OrchestratorError{ErrorCategory::ServerUnavailable,
                                     std::string("Waiting on server input failed: ") +
                                         std::strerror(errno),
                                     "pipe_write_failed"};
        }
        if (interrupted_.load() || (nfds > 1 && (fds[1].revents & POLLIN) != 0)) {
            broken_ = written > 0;
            return OrchestratorError{ErrorCategory::ServerUnavailable,
                                     "Pipe was closed while writing.", "pipe_closed"};
        }
    }
    return written;
}

}  // namespace toolmux::runtime
