#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/server_config.hpp"
#include "core/config/settings.hpp"
#include "core/errors/client_errors.hpp"
#include "health/health_monitor.hpp"
#include "protocol/progress.hpp"
#include "session/connection_manager.hpp"
#include "session/session_factory.hpp"

namespace mcplink::registry {

struct ConnectOutcome {
    std::string server;
    std::optional<core::errors::ClientError> error;

    bool ok() const { return !error.has_value(); }
};

using ProgressCallback =
    std::function<void(const std::string& server, const protocol::Progress& progress)>;

// Builds the factory the connection manager uses, given the hook that wires
// a fresh session into this registry.
using SessionFactoryBuilder =
    std::function<session::SessionFactory(session::SessionConfigurator configure)>;

// Entry point owning every per-server map: configured launch specs, the
// connection manager and the health monitor.
class ServerRegistry {
public:
    explicit ServerRegistry(core::config::ServerConfigMap servers,
                            core::config::ClientSettings settings = {},
                            ProgressCallback on_progress = {});
    ServerRegistry(core::config::ServerConfigMap servers, core::config::ClientSettings settings,
                   SessionFactoryBuilder build_factory, session::Sleeper sleeper,
                   ProgressCallback on_progress = {}, health::HealthMonitor::Clock clock = {});
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    core::errors::Result<session::SessionPtr> connect(const std::string& name);
    std::vector<ConnectOutcome> connect_all();

    // Connects on demand, then sends one request.
    core::errors::Result<nlohmann::json> execute(
        const std::string& server, const std::string& method,
        nlohmann::json params = nlohmann::json::object(),
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    core::errors::VoidResult cancel(const std::string& server, std::int64_t request_id);

    // Returns true when the server ends up Ready.
    bool reconnect(const std::string& name);
    void cleanup(const std::string& name);

    // Stops monitoring and closes every session. Idempotent.
    void close();

    std::vector<std::string> list_servers() const;
    std::vector<std::string> connected_servers() const;
    session::ConnectionState state(const std::string& name) const;
    session::SessionPtr session(const std::string& name) const;

    health::HealthMonitor& health() { return *health_; }

private:
    core::errors::Result<session::SessionPtr> acquire(const std::string& name,
                                                      bool reuse_ready, bool start_monitor);
    core::errors::Result<const protocol::ServerLaunchSpec*> find_spec(
        const std::string& name) const;
    void configure_session(session::ProtocolSession& session);
    void handle_progress(const std::string& server, const nlohmann::json& params);
    std::mutex& lock_for(const std::string& name);

    core::config::ServerConfigMap servers_;
    core::config::ClientSettings settings_;
    ProgressCallback on_progress_;

    // One lock per configured name, fixed at construction.
    std::map<std::string, std::unique_ptr<std::mutex>> name_locks_;
    std::atomic_bool closed_{false};

    std::unique_ptr<health::HealthMonitor> health_;
    std::unique_ptr<session::ConnectionManager> connections_;
};

}  // namespace mcplink::registry
