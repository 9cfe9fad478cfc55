#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/client_errors.hpp"
#include "protocol/server_spec.hpp"

namespace mcplink::core::config {

using ServerConfigMap = std::map<std::string, protocol::ServerLaunchSpec>;

// Accepts {"mcpServers": {name: spec}} or a bare {name: spec} object.
errors::Result<ServerConfigMap> parse_server_configs(const nlohmann::json& document);

errors::Result<ServerConfigMap> load_server_configs(const std::filesystem::path& path);

}  // namespace mcplink::core::config
