#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace mcplink::app::cli {

    using namespace mcplink::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> config;
        std::optional<std::string> server;
        std::optional<std::string> method;
        std::optional<std::string> params;
        std::optional<std::string> timeout_ms;
        bool verbose = false;
    };

    namespace {
        const char* kUsage =
            "Usage: mcplink_cli call --config <file> --server <name> --method <m> "
            "[--params <json>] [--timeout-ms <n>] [--verbose] | "
            "mcplink_cli connect-all --config <file> [--verbose]";

        ClientError missing_value(const std::string& flag) {
            return ClientError{ErrorKind::Input, "Missing value for " + flag, "missing_value"};
        }
    }  // namespace

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ClientError{ErrorKind::Input, "No command provided.", "missing_command", kUsage};
        }

        CliRequest req;
        std::string command = argv[1];
        if (command == "call") {
            req.command = Command::Call;
        } else if (command == "connect-all") {
            req.command = Command::ConnectAll;
        } else {
            return ClientError{ErrorKind::Input, "Unknown command: " + command, "unknown_command",
                               "Supported commands are 'call' and 'connect-all'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return missing_value("--config");
            } else if (args[i] == "--server") {
                if (i + 1 < args.size()) raw.server = args[++i];
                else return missing_value("--server");
            } else if (args[i] == "--method") {
                if (i + 1 < args.size()) raw.method = args[++i];
                else return missing_value("--method");
            } else if (args[i] == "--params") {
                if (i + 1 < args.size()) raw.params = args[++i];
                else return missing_value("--params");
            } else if (args[i] == "--timeout-ms") {
                if (i + 1 < args.size()) raw.timeout_ms = args[++i];
                else return missing_value("--timeout-ms");
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ClientError{ErrorKind::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;

        if (!raw.config.has_value() || raw.config->empty()) {
            return ClientError{ErrorKind::Input, "Must provide --config", "missing_required_flag", kUsage};
        }
        req.config_path = std::filesystem::path(raw.config.value());

        if (req.command == Command::ConnectAll) {
            if (raw.server || raw.method || raw.params || raw.timeout_ms) {
                return ClientError{ErrorKind::Input, "connect-all only accepts --config and --verbose",
                                   "conflicting_flags"};
            }
            return req;
        }

        if (!raw.server.has_value() || raw.server->empty()) {
            return ClientError{ErrorKind::Input, "Must provide --server", "missing_required_flag"};
        }
        if (!raw.method.has_value() || raw.method->empty()) {
            return ClientError{ErrorKind::Input, "Must provide --method", "missing_required_flag"};
        }
        req.server = raw.server.value();
        req.method = raw.method.value();

        if (raw.params) {
            auto parsed = nlohmann::json::parse(raw.params.value(), nullptr, false);
            if (parsed.is_discarded()) {
                return ClientError{ErrorKind::Input, "--params is not valid JSON", "invalid_params",
                                   "Pass a JSON object, e.g. '{\"x\":1}'."};
            }
            if (!parsed.is_object() && !parsed.is_array()) {
                return ClientError{ErrorKind::Input, "--params must be a JSON object or array",
                                   "invalid_params"};
            }
            req.params = std::move(parsed);
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            std::int64_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return ClientError{ErrorKind::Input, "Invalid number for --timeout-ms", "invalid_integer",
                                   "Provide a positive integer."};
            }
            if (timeout <= 0 || timeout > 3600000) {
                return ClientError{ErrorKind::Input, "--timeout-ms out of bounds", "bounds_error",
                                   "Must be between 1 and 3600000."};
            }
            req.timeout = std::chrono::milliseconds(timeout);
        }

        return req;
    }

} // namespace mcplink::app::cli
