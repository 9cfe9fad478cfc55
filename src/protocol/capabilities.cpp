#include "protocol/capabilities.hpp"

#include <string>

namespace mcplink::protocol {

using core::errors::ClientError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

core::errors::Result<bool> read_flag(const json& object, const char* key,
                                     const bool fallback) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_object()) {
        return true;
    }
    return ClientError{ErrorKind::Protocol,
                       std::string("Capability '") + key + "' must be a boolean or object.",
                       "invalid_capabilities", "", core::errors::rpc::kInvalidRequest};
}

}  // namespace

bool operator==(const Capabilities& lhs, const Capabilities& rhs) {
    return lhs.tools == rhs.tools && lhs.progress == rhs.progress &&
           lhs.completion == rhs.completion && lhs.sampling == rhs.sampling &&
           lhs.cancellation == rhs.cancellation;
}

json to_json(const Capabilities& capabilities) {
    return json{{"tools", capabilities.tools},
                {"progress", capabilities.progress},
                {"completion", capabilities.completion},
                {"sampling", capabilities.sampling},
                {"cancellation", capabilities.cancellation}};
}

core::errors::Result<Capabilities> parse_capabilities(const json& value) {
    if (!value.is_object()) {
        return ClientError{ErrorKind::Protocol, "Capabilities must be a JSON object.",
                           "invalid_capabilities", "", core::errors::rpc::kInvalidRequest};
    }

    const Capabilities defaults;
    Capabilities parsed;
    struct Field {
        const char* key;
        bool Capabilities::*member;
    };
    const Field fields[] = {{"tools", &Capabilities::tools},
                            {"progress", &Capabilities::progress},
                            {"completion", &Capabilities::completion},
                            {"sampling", &Capabilities::sampling},
                            {"cancellation", &Capabilities::cancellation}};

    for (const auto& field : fields) {
        auto flag = read_flag(value, field.key, defaults.*(field.member));
        if (core::errors::is_error(flag)) {
            return core::errors::get_error(flag);
        }
        parsed.*(field.member) = core::errors::get_value(flag);
    }
    return parsed;
}

}  // namespace mcplink::protocol
