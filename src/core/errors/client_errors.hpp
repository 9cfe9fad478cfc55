#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcplink::core::errors {

    // 1. Closed set of error kinds a caller can observe
    enum class ErrorKind {
        Launch,      // E.g., the server executable could not be spawned
        Connection,  // E.g., handshake failed or the pipe went away
        Protocol,    // E.g., peer wrote a line that is not a JSON-RPC message
        Remote,      // Peer answered with a JSON-RPC error object
        Timeout,     // A single request waited longer than its deadline
        Input,       // E.g., unknown server name or duplicate connect
        Internal     // Synthesized failure such as session teardown
    };

    // JSON-RPC numeric codes
    namespace rpc {
        constexpr int kParseError = -32700;
        constexpr int kInvalidRequest = -32600;
        constexpr int kMethodNotFound = -32601;
        constexpr int kInvalidParams = -32602;
        constexpr int kInternalError = -32603;
        constexpr int kServerNotInitialized = -32002;
        constexpr int kInvalidRequestSequence = -32003;
    }  // namespace rpc

    // The standardized error payload
    struct ClientError {
        ErrorKind kind;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        int rpc_code = 0;               // 0 when no JSON-RPC code applies
        nlohmann::json data = nullptr;  // structured detail from the peer
    };

    // 2. Propagation strategy: a Result holds either T or a ClientError.
    template <typename T>
    using Result = std::variant<T, ClientError>;

    using VoidResult = Result<std::monostate>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ClientError>(result);
    }

    template <typename T>
    const ClientError& get_error(const Result<T>& result) {
        return std::get<ClientError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline VoidResult ok() {
        return std::monostate{};
    }

    // Only connect-time failures are worth another attempt.
    inline bool is_retryable(const ClientError& error) {
        return error.kind == ErrorKind::Launch ||
               error.kind == ErrorKind::Connection;
    }

    inline std::string to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Launch: return "launch";
            case ErrorKind::Connection: return "connection";
            case ErrorKind::Protocol: return "protocol";
            case ErrorKind::Remote: return "remote";
            case ErrorKind::Timeout: return "timeout";
            case ErrorKind::Input: return "input";
            case ErrorKind::Internal: return "internal";
            default: return "unknown";
        }
    }

    inline std::string describe(const ClientError& error) {
        std::string text = to_string(error.kind) + "/" + error.code + ": " + error.message;
        if (error.rpc_code != 0) {
            text += " (rpc " + std::to_string(error.rpc_code) + ")";
        }
        return text;
    }

} // namespace mcplink::core::errors
