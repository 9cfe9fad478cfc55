#include "protocol/progress.hpp"

namespace mcplink::protocol {

using core::errors::ClientError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

ClientError malformed(const std::string& message) {
    return ClientError{ErrorKind::Protocol, message, "invalid_progress", "",
                       core::errors::rpc::kInvalidParams};
}

}  // namespace

core::errors::Result<Progress> parse_progress(const json& params) {
    if (!params.is_object()) {
        return malformed("Progress params must be an object.");
    }

    Progress parsed;
    const auto id_it = params.find("operation_id");
    if (id_it == params.end() || !id_it->is_string()) {
        return malformed("Progress operation_id must be a string.");
    }
    parsed.operation_id = id_it->get<std::string>();

    const auto value_it = params.find("progress");
    if (value_it == params.end() || !value_it->is_number()) {
        return malformed("Progress value must be a number.");
    }
    parsed.progress = value_it->get<double>();
    if (parsed.progress < 0.0 || parsed.progress > 1.0) {
        return malformed("Progress value must be within [0, 1].");
    }

    const auto message_it = params.find("message");
    if (message_it != params.end() && !message_it->is_null()) {
        if (!message_it->is_string()) {
            return malformed("Progress message must be a string.");
        }
        parsed.message = message_it->get<std::string>();
    }

    const auto data_it = params.find("data");
    if (data_it != params.end() && !data_it->is_null()) {
        if (!data_it->is_object()) {
            return malformed("Progress data must be an object.");
        }
        parsed.data = *data_it;
    }

    const auto final_it = params.find("is_final");
    if (final_it != params.end() && !final_it->is_null()) {
        if (!final_it->is_boolean()) {
            return malformed("Progress is_final must be a boolean.");
        }
        parsed.is_final = final_it->get<bool>();
    }
    return parsed;
}

json to_json(const Progress& progress) {
    json payload{{"operation_id", progress.operation_id},
                 {"progress", progress.progress},
                 {"is_final", progress.is_final}};
    if (progress.message.has_value()) {
        payload["message"] = progress.message.value();
    }
    if (progress.data.has_value()) {
        payload["data"] = progress.data.value();
    }
    return payload;
}

}  // namespace mcplink::protocol
