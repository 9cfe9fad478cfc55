#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/client_errors.hpp"

namespace mcplink::protocol {

// Feature flags negotiated once by `initialize`.
struct Capabilities {
    bool tools = true;
    bool progress = true;
    bool completion = false;
    bool sampling = false;
    bool cancellation = true;
};

bool operator==(const Capabilities& lhs, const Capabilities& rhs);

nlohmann::json to_json(const Capabilities& capabilities);

// Accepts either booleans or objects per key; an object means supported.
core::errors::Result<Capabilities> parse_capabilities(const nlohmann::json& value);

}  // namespace mcplink::protocol
