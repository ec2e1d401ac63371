#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/orchestrator_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/protocol_client.hpp"
#include "tools/tool_registry.hpp"

namespace toolmux::tools {

class ToolInvoker {
public:
    // Returns the live client of a Ready server, or nullptr.
    using ClientResolver =
        std::function<std::shared_ptr<runtime::ProtocolClient>(const std::string& server_name)>;

    ToolInvoker(const ToolRegistry& registry, ClientResolver resolve_client);

    core::errors::Result<protocol::ToolResult> call(const std::string& tool_name,
                                                    const nlohmann::json& arguments,
                                                    std::chrono::milliseconds timeout) const;

private:
    const ToolRegistry& registry_;
    ClientResolver resolve_client_;
};

}  // namespace toolmux::tools
