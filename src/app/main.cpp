#include <cstdlib>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/server_config.hpp"
#include "core/config/settings.hpp"
#include "core/errors/client_errors.hpp"
#include "core/logging/logger.hpp"
#include "registry/server_registry.hpp"

namespace {

nlohmann::json error_to_json(const mcplink::core::errors::ClientError& err) {
    nlohmann::json out{{"kind", mcplink::core::errors::to_string(err.kind)},
                       {"code", err.code},
                       {"message", err.message}};
    if (err.rpc_code != 0) {
        out["rpc_code"] = err.rpc_code;
    }
    if (!err.data.is_null()) {
        out["data"] = err.data;
    }
    return out;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto& logger = mcplink::core::logging::Logger::get();
    logger.set_scope("mcplink");

    // 1. Parse CLI input and return normalized input errors
    auto parsed = mcplink::app::cli::parse_and_validate(argc, argv);
    if (mcplink::core::errors::is_error(parsed)) {
        const auto& err = mcplink::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& req = mcplink::core::errors::get_value(parsed);
    if (const char* level_text = std::getenv("MCPLINK_LOG_LEVEL")) {
        const auto level = mcplink::core::logging::parse_level(level_text);
        if (level.has_value()) {
            logger.set_level(level.value());
        } else {
            LOG_WARN(std::string("Ignoring unknown MCPLINK_LOG_LEVEL: ") + level_text);
        }
    }
    if (req.verbose) {
        logger.set_level(mcplink::core::logging::LogLevel::DEBUG);
    }

    // 2. Load the server table
    auto loaded = mcplink::core::config::load_server_configs(req.config_path);
    if (mcplink::core::errors::is_error(loaded)) {
        const auto& err = mcplink::core::errors::get_error(loaded);
        LOG_ERROR("Config error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 3;
    }

    mcplink::core::config::ClientSettings settings;
    mcplink::registry::ServerRegistry registry(
        mcplink::core::errors::get_value(loaded), settings,
        [](const std::string& server, const mcplink::protocol::Progress& progress) {
            LOG_INFO("Progress from " + server + ": " + progress.operation_id + " " +
                     std::to_string(static_cast<int>(progress.progress * 100)) + "%" +
                     (progress.message ? " " + progress.message.value() : std::string()));
        });

    // 3. Run the command
    if (req.command == mcplink::app::cli::Command::ConnectAll) {
        const auto outcomes = registry.connect_all();
        nlohmann::json report = nlohmann::json::array();
        bool all_ok = true;
        for (const auto& outcome : outcomes) {
            nlohmann::json entry{{"server", outcome.server}, {"ok", outcome.ok()}};
            if (!outcome.ok()) {
                all_ok = false;
                entry["error"] = error_to_json(outcome.error.value());
            }
            report.push_back(std::move(entry));
        }
        std::cout << report.dump(2) << std::endl;
        registry.close();
        return all_ok ? 0 : 1;
    }

    auto result = registry.execute(req.server, req.method, req.params, req.timeout);
    if (mcplink::core::errors::is_error(result)) {
        const auto& err = mcplink::core::errors::get_error(result);
        LOG_ERROR("Call failed: " + mcplink::core::errors::describe(err));
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        std::cout << nlohmann::json{{"error", error_to_json(err)}}.dump(2) << std::endl;
        registry.close();
        return err.kind == mcplink::core::errors::ErrorKind::Input ? 2 : 1;
    }

    std::cout << mcplink::core::errors::get_value(result).dump(2) << std::endl;
    registry.close();
    return 0;
}
