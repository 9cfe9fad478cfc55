#include "core/config/server_config.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace mcplink::core::config {

using errors::ClientError;
using errors::ErrorKind;
using nlohmann::json;
using protocol::ServerLaunchSpec;

namespace {

ClientError invalid_entry(const std::string& name, const std::string& detail) {
    return ClientError{ErrorKind::Input,
                       "Invalid configuration for server '" + name + "': " + detail,
                       "invalid_server_config"};
}

errors::Result<ServerLaunchSpec> parse_entry(const std::string& name, const json& entry) {
    if (!entry.is_object()) {
        return invalid_entry(name, "entry must be an object");
    }

    ServerLaunchSpec spec;
    const auto command_it = entry.find("command");
    if (command_it == entry.end() || !command_it->is_string()) {
        return invalid_entry(name, "command must be a string");
    }
    spec.command = command_it->get<std::string>();
    if (spec.command.find_first_not_of(" \t") == std::string::npos) {
        return invalid_entry(name, "command cannot be empty");
    }

    const auto args_it = entry.find("args");
    if (args_it != entry.end() && !args_it->is_null()) {
        if (!args_it->is_array()) {
            return invalid_entry(name, "args must be an array");
        }
        for (const auto& arg : *args_it) {
            if (!arg.is_string() || arg.get<std::string>().empty()) {
                return invalid_entry(name, "all args must be non-empty strings");
            }
            spec.args.push_back(arg.get<std::string>());
        }
    }

    const auto cwd_it = entry.find("workingDir");
    if (cwd_it != entry.end() && !cwd_it->is_null()) {
        if (!cwd_it->is_string()) {
            return invalid_entry(name, "workingDir must be a string");
        }
        spec.working_directory = cwd_it->get<std::string>();
    }

    const auto env_it = entry.find("env");
    if (env_it != entry.end() && !env_it->is_null()) {
        if (!env_it->is_object()) {
            return invalid_entry(name, "env must be an object");
        }
        for (const auto& item : env_it->items()) {
            if (!item.value().is_string()) {
                return invalid_entry(name, "env value for '" + item.key() + "' must be a string");
            }
            spec.env[item.key()] = item.value().get<std::string>();
        }
    }
    return spec;
}

}  // namespace

errors::Result<ServerConfigMap> parse_server_configs(const json& document) {
    if (!document.is_object()) {
        return ClientError{ErrorKind::Input, "Server configuration must be a JSON object.",
                           "invalid_server_config"};
    }

    const json* servers = &document;
    const auto nested = document.find("mcpServers");
    if (nested != document.end()) {
        if (!nested->is_object()) {
            return ClientError{ErrorKind::Input, "mcpServers must be a JSON object.",
                               "invalid_server_config"};
        }
        servers = &(*nested);
    }

    if (servers->empty()) {
        return ClientError{ErrorKind::Input, "At least one server must be configured.",
                           "empty_server_config"};
    }

    ServerConfigMap configs;
    for (const auto& item : servers->items()) {
        if (item.key().find_first_not_of(" \t") == std::string::npos) {
            return ClientError{ErrorKind::Input, "Server names cannot be empty.",
                               "invalid_server_config"};
        }
        auto spec = parse_entry(item.key(), item.value());
        if (errors::is_error(spec)) {
            return errors::get_error(spec);
        }
        configs.emplace(item.key(), std::move(errors::get_value(spec)));
    }
    return configs;
}

errors::Result<ServerConfigMap> load_server_configs(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return ClientError{ErrorKind::Input, "Configuration file not found: " + path.string(),
                           "config_not_found", "Pass an existing JSON file with --config."};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return ClientError{ErrorKind::Input, "Failed to open configuration file: " + path.string(),
                           "config_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    const json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return ClientError{ErrorKind::Input,
                           "Configuration file is not valid JSON: " + path.string(),
                           "config_parse_error"};
    }
    return parse_server_configs(document);
}

}  // namespace mcplink::core::config
