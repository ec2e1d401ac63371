#pragma once
#include <atomic>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace toolmux::core::config {

    namespace detail {
        inline std::string random_hex(int digits) {
            thread_local std::mt19937 gen{std::random_device{}()};
            std::uniform_int_distribution<> dis(0, 15);

            std::stringstream ss;
            for (int i = 0; i < digits; ++i) {
                ss << std::hex << dis(gen);
            }
            return ss.str();
        }
    } // namespace detail

    // 8-character hex ID prefixed with "session-"
    inline std::string generate_session_id() {
        return "session-" + detail::random_hex(8);
    }

    // Random part for audit readability, counter part for guaranteed uniqueness.
    inline std::string generate_trace_id() {
        static std::atomic<std::uint64_t> counter{0};
        const std::uint64_t sequence = counter.fetch_add(1) + 1;
        return "trace-" + detail::random_hex(16) + "-" + std::to_string(sequence);
    }

} // namespace toolmux::core::config
