#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include "core/errors/orchestrator_errors.hpp"

namespace toolmux::runtime {

// Line-oriented byte channel to one tool server.
class Transport {
public:
    virtual ~Transport() = default;

    // `line` already carries its trailing newline. Fails with Timeout when the
    // peer does not take the whole line before `deadline`.
    virtual core::errors::Result<std::size_t> write_line(
        const std::string& line, std::chrono::steady_clock::time_point deadline) = 0;

    // Blocks for the next inbound line; empty optional once the channel is
    // closed or at end of stream.
    virtual std::optional<std::string> read_line() = 0;

    // Unblocks read_line() and refuses further writes. Idempotent.
    virtual void close() = 0;
};

}  // namespace toolmux::runtime
