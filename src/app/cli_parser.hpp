#pragma once
#include "protocol/cli_request.hpp"
#include "core/errors/orchestrator_errors.hpp"

namespace toolmux::app::cli {
    toolmux::core::errors::Result<toolmux::protocol::CliRequest> parse_and_validate(int argc, char* argv[]);
}
