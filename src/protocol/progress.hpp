#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/client_errors.hpp"

namespace mcplink::protocol {

// Payload of a `$/progress` notification.
struct Progress {
    std::string operation_id;
    double progress = 0.0;  // [0, 1]
    std::optional<std::string> message;
    std::optional<nlohmann::json> data;
    bool is_final = false;
};

core::errors::Result<Progress> parse_progress(const nlohmann::json& params);

nlohmann::json to_json(const Progress& progress);

}  // namespace mcplink::protocol
