#include "core/config/orchestrator_config.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace toolmux::core::config {

using errors::ErrorCategory;
using errors::OrchestratorError;
using nlohmann::ordered_json;

namespace {

OrchestratorError invalid_server(const std::string& name, const std::string& why) {
    return OrchestratorError{ErrorCategory::Input,
                             "Invalid server '" + name + "': " + why,
                             "invalid_server_config"};
}

OrchestratorError invalid_setting(const std::string& key, const std::string& why) {
    return OrchestratorError{ErrorCategory::Input,
                             "Invalid setting '" + key + "': " + why,
                             "invalid_setting"};
}

errors::Result<ServerConfig> parse_server(const std::string& name,
                                          const ordered_json& entry) {
    if (name.empty()) {
        return invalid_server(name, "name cannot be empty");
    }
    if (!entry.is_object()) {
        return invalid_server(name, "entry must be an object");
    }

    ServerConfig server;
    server.name = name;

    const auto command_it = entry.find("command");
    if (command_it == entry.end() || !command_it->is_string() ||
        command_it->get<std::string>().empty()) {
        return invalid_server(name, "command must be a non-empty string");
    }
    server.command = command_it->get<std::string>();

    const auto args_it = entry.find("args");
    if (args_it != entry.end()) {
        if (!args_it->is_array()) {
            return invalid_server(name, "args must be an array of strings");
        }
        for (const auto& arg : *args_it) {
            if (!arg.is_string()) {
                return invalid_server(name, "args must be an array of strings");
            }
            server.args.push_back(arg.get<std::string>());
        }
    }

    const auto env_it = entry.find("env");
    if (env_it != entry.end()) {
        if (!env_it->is_object()) {
            return invalid_server(name, "env must be an object of strings");
        }
        for (auto it = env_it->begin(); it != env_it->end(); ++it) {
            if (!it.value().is_string()) {
                return invalid_server(name, "env value for " + it.key() +
                                                " must be a string");
            }
            server.env[it.key()] = it.value().get<std::string>();
        }
    }
    return server;
}

errors::Result<std::chrono::milliseconds> read_millis(const ordered_json& settings,
                                                      const std::string& key,
                                                      std::chrono::milliseconds fallback) {
    const auto it = settings.find(key);
    if (it == settings.end()) {
        return fallback;
    }
    if (!it->is_number_integer() && !it->is_number_unsigned()) {
        return invalid_setting(key, "must be an integer number of milliseconds");
    }
    const auto value = it->get<std::int64_t>();
    if (value <= 0) {
        return invalid_setting(key, "must be greater than zero");
    }
    return std::chrono::milliseconds(value);
}

std::optional<OrchestratorError> apply_settings(const ordered_json& settings,
                                                OrchestratorOptions& options) {
    if (!settings.is_object()) {
        return invalid_setting("settings", "must be an object");
    }

    auto handshake = read_millis(settings, "handshake_timeout_ms", options.handshake_timeout);
    if (errors::is_error(handshake)) {
        return errors::get_error(handshake);
    }
    options.handshake_timeout = errors::get_value(handshake);

    auto call = read_millis(settings, "call_timeout_ms", options.call_timeout);
    if (errors::is_error(call)) {
        return errors::get_error(call);
    }
    options.call_timeout = errors::get_value(call);

    auto grace = read_millis(settings, "shutdown_grace_ms", options.shutdown_grace);
    if (errors::is_error(grace)) {
        return errors::get_error(grace);
    }
    options.shutdown_grace = errors::get_value(grace);

    for (const char* key : {"client_name", "client_version", "log_level", "journal_dir"}) {
        const auto it = settings.find(key);
        if (it != settings.end() && !it->is_string()) {
            return invalid_setting(key, "must be a string");
        }
    }

    if (settings.contains("client_name")) {
        options.client_name = settings["client_name"].get<std::string>();
    }
    if (settings.contains("client_version")) {
        options.client_version = settings["client_version"].get<std::string>();
    }
    if (settings.contains("log_level")) {
        const auto level =
            logging::parse_log_level(settings["log_level"].get<std::string>());
        if (!level.has_value()) {
            return invalid_setting("log_level", "expected debug, info, warn or error");
        }
        options.log_level = level.value();
    }
    if (settings.contains("journal_dir")) {
        const auto dir = settings["journal_dir"].get<std::string>();
        if (!dir.empty()) {
            options.journal_dir = std::filesystem::path(dir);
        }
    }
    return std::nullopt;
}

}  // namespace

errors::Result<OrchestratorConfig> parse_orchestrator_config(
    const ordered_json& document) {
    if (!document.is_object()) {
        return OrchestratorError{ErrorCategory::Input,
                                 "Configuration root must be a JSON object.",
                                 "config_parse_failed"};
    }

    OrchestratorConfig config;

    const ordered_json* servers = nullptr;
    if (document.contains("mcpServers")) {
        servers = &document["mcpServers"];
    } else if (document.contains("servers")) {
        servers = &document["servers"];
    }

    if (servers != nullptr) {
        if (!servers->is_object()) {
            return OrchestratorError{ErrorCategory::Input,
                                     "mcpServers must be an object keyed by server name.",
                                     "invalid_server_config"};
        }
        std::unordered_set<std::string> seen;
        for (auto it = servers->begin(); it != servers->end(); ++it) {
            const auto& entry = it.value();
            if (entry.is_object()) {
                const auto disabled = entry.find("disabled");
                if (disabled != entry.end() && disabled->is_boolean() &&
                    disabled->get<bool>()) {
                    LOG_DEBUG("Config: skipping disabled server " + it.key());
                    continue;
                }
            }
            auto parsed = parse_server(it.key(), entry);
            if (errors::is_error(parsed)) {
                return errors::get_error(parsed);
            }
            if (!seen.insert(it.key()).second) {
                return invalid_server(it.key(), "duplicate server name");
            }
            config.servers.push_back(errors::get_value(parsed));
        }
    }

    if (document.contains("settings")) {
        if (auto error = apply_settings(document["settings"], config.options)) {
            return error.value();
        }
    }
    return config;
}

errors::Result<OrchestratorConfig> parse_orchestrator_config(const std::string& text) {
    ordered_json document;
    try {
        document = ordered_json::parse(text);
    } catch (const ordered_json::parse_error& e) {
        return OrchestratorError{ErrorCategory::Input,
                                 std::string("Configuration is not valid JSON: ") + e.what(),
                                 "config_parse_failed"};
    }
    return parse_orchestrator_config(document);
}

errors::Result<OrchestratorConfig> load_orchestrator_config(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return OrchestratorError{ErrorCategory::Input,
                                 "Configuration file does not exist: " + path.string(),
                                 "config_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return OrchestratorError{ErrorCategory::Input,
                                 "Failed to open configuration file: " + path.string(),
                                 "config_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_orchestrator_config(buffer.str());
}

}  // namespace toolmux::core::config
