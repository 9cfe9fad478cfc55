#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/client_errors.hpp"

namespace mcplink::protocol {

constexpr const char* kJsonRpcVersion = "2.0";

// Reserved method names
constexpr const char* kInitializeMethod = "initialize";
constexpr const char* kShutdownMethod = "shutdown";
constexpr const char* kExitMethod = "exit";
constexpr const char* kProgressMethod = "$/progress";
constexpr const char* kCancelMethod = "$/cancel";

struct ErrorDetail {
    int code = core::errors::rpc::kInternalError;
    std::string message;
    std::optional<nlohmann::json> data;
};

struct Request {
    std::int64_t id = 0;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

// Exactly one of result/error is meaningful; a missing result reads as null.
struct Response {
    std::int64_t id = 0;
    nlohmann::json result = nullptr;
    std::optional<ErrorDetail> error;
};

struct Notification {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

using Message = std::variant<Request, Response, Notification>;

nlohmann::json to_json(const Message& message);

// Single line, no trailing newline.
std::string encode(const Message& message);

// A Response whose id is valid but whose error object is not carries that id
// in the returned error's data as {"id": <id>}.
core::errors::Result<Message> decode(const nlohmann::json& value);
core::errors::Result<Message> decode(const std::string& line);

// Converts a peer error object into the Remote error kind, code preserved.
core::errors::ClientError to_client_error(const ErrorDetail& detail);

}  // namespace mcplink::protocol
