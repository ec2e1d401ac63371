#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include "core/errors/orchestrator_errors.hpp"

namespace toolmux::runtime {

// Blocking line reader over a pipe fd. read_line() waits on the fd and on an
// internal wake pipe, so interrupt() from any thread unblocks a reader even
// when another process still holds the write end.
class LineReader {
public:
    explicit LineReader(int fd);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // Next line without its terminator; empty optional on EOF, read error or
    // interrupt. A final unterminated line is returned before EOF.
    std::optional<std::string> read_line();

    void interrupt();

private:
    int fd_ = -1;
    int wake_read_ = -1;
    int wake_write_ = -1;
    std::string buffer_;
    bool eof_ = false;
};

// Non-blocking writer over a pipe fd. A write waits for POLLOUT on the fd and
// on an internal wake pipe until its deadline, so a peer that stops reading
// cannot hold the writer, and interrupt() from any thread releases it.
class LineWriter {
public:
    explicit LineWriter(int fd);
    ~LineWriter();

    LineWriter(const LineWriter&) = delete;
    LineWriter& operator=(const LineWriter&) = delete;

    // Writes the whole buffer or fails. Timeout when the deadline passes; a
    // timeout after a partial write leaves the stream unusable.
    core::errors::Result<std::size_t> write_all(const std::string& data,
                                                std::chrono::steady_clock::time_point deadline);

    // Sticky: releases a waiting write and refuses later ones. Needs no lock.
    void interrupt();

    // Closes the fd. Callers serialize this with write_all().
    void close();

private:
    int fd_ = -1;
    int wake_read_ = -1;
    int wake_write_ = -1;
    std::atomic_bool interrupted_{false};
    bool broken_ = false;
};

void close_fd(int& fd);

}  // namespace toolmux::runtime
