#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/orchestrator_errors.hpp"
#include "runtime/protocol_client.hpp"
#include "tools/tool_registry.hpp"

namespace toolmux::runtime {

struct HandshakeOptions {
    std::string client_name = "toolmux";
    std::string client_version = "1.0.0";
    std::chrono::milliseconds timeout{10000};
};

struct HandshakeReport {
    nlohmann::json server_info = nlohmann::json::object();
    std::string protocol_version;
    std::size_t registered = 0;
    std::size_t conflicts = 0;
};

// initialize -> notifications/initialized -> tools/list (paged), registering
// every discovered tool under the client's server name. On failure nothing
// from this server stays in the registry.
class Handshake {
public:
    explicit Handshake(HandshakeOptions options = {});

    core::errors::Result<HandshakeReport> run(ProtocolClient& client,
                                              tools::ToolRegistry& registry) const;

private:
    static constexpr int kMaxToolPages = 32;

    core::errors::Result<HandshakeReport> initialize(ProtocolClient& client) const;
    core::errors::Result<std::size_t> discover_tools(ProtocolClient& client,
                                                     tools::ToolRegistry& registry,
                                                     HandshakeReport& report) const;

    HandshakeOptions options_;
};

}  // namespace toolmux::runtime
