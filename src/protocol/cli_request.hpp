#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace toolmux::protocol {

    enum class CliCommand {
        List,   // print the tool catalogue
        Call    // invoke one tool
    };

    // Validated command-line input
    struct CliRequest {
        CliCommand command = CliCommand::List;
        std::filesystem::path config_file;
        std::optional<std::string> tool_name;
        nlohmann::json arguments = nlohmann::json::object();
        std::optional<std::chrono::milliseconds> timeout;
        std::optional<std::filesystem::path> journal_dir;
        bool verbose = false;
    };

} // namespace toolmux::protocol
