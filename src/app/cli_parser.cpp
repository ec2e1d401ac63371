#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace toolmux::app::cli {

    using namespace toolmux::core::errors;
    using toolmux::protocol::CliCommand;
    using toolmux::protocol::CliRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> config;
        std::optional<std::string> tool;
        std::optional<std::string> args;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> journal_dir;
        bool verbose = false;
    };

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return OrchestratorError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: toolmux list|call --config servers.json"};
        }

        CliRequest req;
        std::string command = argv[1];
        if (command == "list") {
            req.command = CliCommand::List;
        } else if (command == "call") {
            req.command = CliCommand::Call;
        } else {
            return OrchestratorError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands are 'list' and 'call'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return OrchestratorError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--tool") {
                if (i + 1 < args.size()) raw.tool = args[++i];
                else return OrchestratorError{ErrorCategory::Input, "Missing value for --tool", "missing_value"};
            } else if (args[i] == "--args") {
                if (i + 1 < args.size()) raw.args = args[++i];
                else return OrchestratorError{ErrorCategory::Input, "Missing value for --args", "missing_value"};
            } else if (args[i] == "--timeout-ms") {
                if (i + 1 < args.size()) raw.timeout_ms = args[++i];
                else return OrchestratorError{ErrorCategory::Input, "Missing value for --timeout-ms", "missing_value"};
            } else if (args[i] == "--journal-dir") {
                if (i + 1 < args.size()) raw.journal_dir = args[++i];
                else return OrchestratorError{ErrorCategory::Input, "Missing value for --journal-dir", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return OrchestratorError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;

        if (!raw.config.has_value()) {
            return OrchestratorError{ErrorCategory::Input, "Must provide --config", "missing_required_flag"};
        }
        req.config_file = std::filesystem::path(raw.config.value());

        if (req.command == CliCommand::List) {
            if (raw.tool || raw.args || raw.timeout_ms) {
                return OrchestratorError{ErrorCategory::Input, "--tool, --args and --timeout-ms only apply to 'call'", "conflicting_flags"};
            }
        } else {
            if (!raw.tool.has_value() || raw.tool->empty()) {
                return OrchestratorError{ErrorCategory::Input, "'call' requires --tool", "missing_required_flag"};
            }
            req.tool_name = raw.tool.value();
        }

        if (raw.args) {
            nlohmann::json parsed = nlohmann::json::parse(raw.args.value(), nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) {
                return OrchestratorError{ErrorCategory::Input, "--args must be a JSON object", "invalid_arguments", "Example: --args '{\"q\":\"ramen\"}'"};
            }
            req.arguments = std::move(parsed);
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return OrchestratorError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout == 0 || timeout > 600000) {
                return OrchestratorError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error", "Must be between 1 and 600000."};
            }
            req.timeout = std::chrono::milliseconds(timeout);
        }

        if (raw.journal_dir) {
            if (raw.journal_dir->empty()) {
                return OrchestratorError{ErrorCategory::Input, "--journal-dir cannot be empty", "invalid_path"};
            }
            req.journal_dir = std::filesystem::path(raw.journal_dir.value());
        }

        return req;
    }

} // namespace toolmux::app::cli
