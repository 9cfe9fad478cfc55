#include "protocol/message.hpp"

#include <limits>
#include <utility>

namespace mcplink::protocol {

using core::errors::ClientError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

ClientError invalid(const std::string& message) {
    return ClientError{ErrorKind::Protocol, message, "invalid_message", "",
                       core::errors::rpc::kInvalidRequest};
}

struct ToJsonVisitor {
    json operator()(const Request& request) const {
        return json{{"jsonrpc", kJsonRpcVersion},
                    {"id", request.id},
                    {"method", request.method},
                    {"params", request.params.is_null() ? json::object() : request.params}};
    }

    json operator()(const Response& response) const {
        json payload{{"jsonrpc", kJsonRpcVersion}, {"id", response.id}};
        if (response.error.has_value()) {
            json error{{"code", response.error->code},
                       {"message", response.error->message}};
            if (response.error->data.has_value()) {
                error["data"] = response.error->data.value();
            }
            payload["error"] = std::move(error);
        } else {
            payload["result"] = response.result;
        }
        return payload;
    }

    json operator()(const Notification& notification) const {
        return json{{"jsonrpc", kJsonRpcVersion},
                    {"method", notification.method},
                    {"params", notification.params.is_null() ? json::object()
                                                             : notification.params}};
    }
};

core::errors::Result<std::int64_t> decode_id(const json& id) {
    if (id.is_number_unsigned()) {
        const auto raw = id.get<std::uint64_t>();
        if (raw == 0 ||
            raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return invalid("Message id must be a positive integer.");
        }
        return static_cast<std::int64_t>(raw);
    }
    if (id.is_number_integer()) {
        const auto raw = id.get<std::int64_t>();
        if (raw <= 0) {
            return invalid("Message id must be a positive integer.");
        }
        return raw;
    }
    return invalid("Message id must be a positive integer.");
}

core::errors::Result<json> decode_params(const json& value) {
    const auto it = value.find("params");
    if (it == value.end() || it->is_null()) {
        return json::object();
    }
    if (!it->is_object() && !it->is_array()) {
        return invalid("params must be an object or an array.");
    }
    return *it;
}

core::errors::Result<ErrorDetail> decode_error(const json& value) {
    if (!value.is_object()) {
        return invalid("error must be an object.");
    }
    const auto code_it = value.find("code");
    const auto message_it = value.find("message");
    if (code_it == value.end() || !code_it->is_number_integer()) {
        return invalid("error.code must be an integer.");
    }
    if (message_it == value.end() || !message_it->is_string()) {
        return invalid("error.message must be a string.");
    }

    ErrorDetail detail;
    detail.code = code_it->get<int>();
    detail.message = message_it->get<std::string>();
    const auto data_it = value.find("data");
    if (data_it != value.end()) {
        detail.data = *data_it;
    }
    return detail;
}

}  // namespace

json to_json(const Message& message) {
    return std::visit(ToJsonVisitor{}, message);
}

std::string encode(const Message& message) {
    return to_json(message).dump();
}

core::errors::Result<Message> decode(const json& value) {
    if (!value.is_object()) {
        return invalid("Message must be a JSON object.");
    }

    const auto id_it = value.find("id");
    const auto method_it = value.find("method");
    const bool has_id = id_it != value.end() && !id_it->is_null();
    const bool has_method = method_it != value.end();

    if (has_method && !method_it->is_string()) {
        return invalid("method must be a string.");
    }

    if (has_id && !has_method) {
        auto id = decode_id(*id_it);
        if (core::errors::is_error(id)) {
            return core::errors::get_error(id);
        }

        Response response;
        response.id = core::errors::get_value(id);
        const auto error_it = value.find("error");
        if (error_it != value.end() && !error_it->is_null()) {
            auto detail = decode_error(*error_it);
            if (core::errors::is_error(detail)) {
                ClientError problem = core::errors::get_error(detail);
                problem.data = json{{"id", response.id}};
                return problem;
            }
            response.error = core::errors::get_value(detail);
        } else {
            const auto result_it = value.find("result");
            if (result_it != value.end()) {
                response.result = *result_it;
            }
        }
        return Message{std::move(response)};
    }

    if (has_method) {
        auto params = decode_params(value);
        if (core::errors::is_error(params)) {
            return core::errors::get_error(params);
        }

        if (!has_id) {
            Notification notification;
            notification.method = method_it->get<std::string>();
            notification.params = core::errors::get_value(params);
            return Message{std::move(notification)};
        }

        auto id = decode_id(*id_it);
        if (core::errors::is_error(id)) {
            return core::errors::get_error(id);
        }
        Request request;
        request.id = core::errors::get_value(id);
        request.method = method_it->get<std::string>();
        request.params = core::errors::get_value(params);
        return Message{std::move(request)};
    }

    return invalid("Message has neither id nor method.");
}

core::errors::Result<Message> decode(const std::string& line) {
    const json parsed = json::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
        return ClientError{ErrorKind::Protocol, "Invalid JSON from server.",
                           "parse_error", "", core::errors::rpc::kParseError};
    }
    return decode(parsed);
}

ClientError to_client_error(const ErrorDetail& detail) {
    ClientError error{ErrorKind::Remote, detail.message, "remote_error", "", detail.code};
    if (detail.data.has_value()) {
        error.data = detail.data.value();
    }
    return error;
}

}  // namespace mcplink::protocol
