#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace toolmux::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,              // E.g., bad CLI flag, malformed config, non-object arguments
        ProcessSpawn,       // fork/exec of a tool server failed
        Handshake,          // initialize or tools/list did not complete
        ProtocolParse,      // a line from a server is not valid JSON-RPC
        ToolNotFound,       // no registered tool under that name
        ServerUnavailable,  // crashed, not started, or after shutdown
        Rpc,                // well-formed error response from the server
        Timeout,            // no response before the deadline
        Internal
    };

    // The standardized error payload
    struct OrchestratorError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        std::optional<std::int64_t> rpc_code;  // JSON-RPC error.code, Rpc only
        std::string detail;           // serialized server error object, Rpc only
    };

    // 2. Propagation strategy: a Result holds either a value of type T, OR an error.
    template <typename T>
    using Result = std::variant<T, OrchestratorError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<OrchestratorError>(result);
    }

    template <typename T>
    const OrchestratorError& get_error(const Result<T>& result) {
        return std::get<OrchestratorError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::ProcessSpawn: return "process_spawn";
            case ErrorCategory::Handshake: return "handshake";
            case ErrorCategory::ProtocolParse: return "protocol_parse";
            case ErrorCategory::ToolNotFound: return "tool_not_found";
            case ErrorCategory::ServerUnavailable: return "server_unavailable";
            case ErrorCategory::Rpc: return "rpc";
            case ErrorCategory::Timeout: return "timeout";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace toolmux::core::errors
