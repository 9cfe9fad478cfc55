#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/config/settings.hpp"
#include "core/errors/client_errors.hpp"
#include "protocol/server_spec.hpp"
#include "session/retry.hpp"
#include "session/session_factory.hpp"

namespace mcplink::session {

enum class ConnectionState {
    Unconnected,
    Connecting,
    Ready,
    Failed,
    Closed
};

std::string to_string(ConnectionState state);

// One slot per server name. A slot being Connecting or Ready blocks a second
// connect for the same name.
class ConnectionManager {
public:
    explicit ConnectionManager(core::config::ClientSettings settings,
                               SessionFactory factory = {}, Sleeper sleeper = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Launches and initializes the server, retrying Launch/Connection
    // failures with backoff.
    core::errors::Result<SessionPtr> connect(const std::string& name,
                                             const protocol::ServerLaunchSpec& spec);

    // Closes and forgets the session. Unknown names are a no-op.
    void cleanup(const std::string& name);
    void cleanup_all();

    void mark_failed(const std::string& name, const std::string& reason);

    SessionPtr session(const std::string& name) const;
    ConnectionState state(const std::string& name) const;
    std::optional<std::string> failure_reason(const std::string& name) const;
    std::vector<std::string> connected_servers() const;
    // Names currently Connecting or Ready.
    std::size_t tracked_count() const;

private:
    struct ConnectionRecord {
        ConnectionState state = ConnectionState::Unconnected;
        SessionPtr session;
        std::optional<std::string> failure_reason;
        std::uint64_t generation = 0;
    };

    void transition(const std::string& name, ConnectionRecord& record,
                    ConnectionState next);
    bool is_current(const std::string& name, std::uint64_t generation) const;

    core::config::ClientSettings settings_;
    SessionFactory factory_;
    Sleeper sleeper_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConnectionRecord> connections_;
    std::uint64_t next_generation_ = 0;
};

}  // namespace mcplink::session
