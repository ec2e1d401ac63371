#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orchestrator_errors.hpp"
#include "core/logging/logger.hpp"

namespace toolmux::core::config {

// One tool server to launch. Immutable once loaded.
struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

struct OrchestratorOptions {
    std::string client_name = "toolmux";
    std::string client_version = "1.0.0";
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds call_timeout{30000};
    std::chrono::milliseconds shutdown_grace{2000};
    logging::LogLevel log_level = logging::LogLevel::INFO;
    std::optional<std::filesystem::path> journal_dir;
};

struct OrchestratorConfig {
    std::vector<ServerConfig> servers;
    OrchestratorOptions options;
};

// Accepts {"mcpServers": {...}, "settings": {...}}; "servers" is an alias of
// "mcpServers". Server order follows the document.
errors::Result<OrchestratorConfig> parse_orchestrator_config(
    const nlohmann::ordered_json& document);

errors::Result<OrchestratorConfig> parse_orchestrator_config(const std::string& text);

errors::Result<OrchestratorConfig> load_orchestrator_config(
    const std::filesystem::path& path);

}  // namespace toolmux::core::config
