#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/client_errors.hpp"

namespace mcplink::app::cli {

    enum class Command {
        Call,
        ConnectAll
    };

    // Validated command line. `server`, `method` and `params` are only set
    // for Command::Call.
    struct CliRequest {
        Command command = Command::Call;
        std::filesystem::path config_path;
        std::string server;
        std::string method;
        nlohmann::json params = nlohmann::json::object();
        std::optional<std::chrono::milliseconds> timeout;
        bool verbose = false;
    };

    mcplink::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);

} // namespace mcplink::app::cli
