#include "registry/server_registry.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/message.hpp"

namespace mcplink::registry {

using core::errors::ClientError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

bool is_connection_loss(const ClientError& error) {
    return error.kind == ErrorKind::Connection || error.code == "connection_lost";
}

ClientError registry_closed() {
    return ClientError{ErrorKind::Input, "Server registry is closed.", "registry_closed"};
}

}  // namespace

ServerRegistry::ServerRegistry(core::config::ServerConfigMap servers,
                               core::config::ClientSettings settings,
                               ProgressCallback on_progress)
    : ServerRegistry(
          std::move(servers), settings,
          [settings](session::SessionConfigurator configure) {
              return session::make_process_session_factory(settings, std::move(configure));
          },
          {}, std::move(on_progress)) {}

ServerRegistry::ServerRegistry(core::config::ServerConfigMap servers,
                               core::config::ClientSettings settings,
                               SessionFactoryBuilder build_factory, session::Sleeper sleeper,
                               ProgressCallback on_progress, health::HealthMonitor::Clock clock)
    : servers_(std::move(servers)),
      settings_(std::move(settings)),
      on_progress_(std::move(on_progress)) {
    for (const auto& entry : servers_) {
        name_locks_.emplace(entry.first, std::make_unique<std::mutex>());
    }

    health_ = std::make_unique<health::HealthMonitor>(
        settings_.heartbeat_interval, settings_.max_heartbeat_miss,
        [this](const std::string& name) { return reconnect(name); },
        [this](const std::string& name) {
            connections_->mark_failed(name, "Server stopped responding.");
        },
        std::move(clock));

    session::SessionFactory factory = build_factory(
        [this](session::ProtocolSession& session) { configure_session(session); });
    connections_ = std::make_unique<session::ConnectionManager>(
        settings_, std::move(factory), std::move(sleeper));

    LOG_DEBUG("ServerRegistry: " + std::to_string(servers_.size()) + " server(s) configured");
}

ServerRegistry::~ServerRegistry() {
    close();
    health_.reset();
    connections_.reset();
}

void ServerRegistry::configure_session(session::ProtocolSession& session) {
    const std::string name = session.server_name();
    session.register_notification_handler(
        protocol::kProgressMethod,
        [this, name](const json& params) { handle_progress(name, params); });
    session.set_activity_callback([this, name] { health_->update_heartbeat(name); });
    session.set_disconnect_callback([this, name](const ClientError& reason) {
        health_->mark_connection_failed(name, reason.message);
    });
}

void ServerRegistry::handle_progress(const std::string& server, const json& params) {
    auto parsed = protocol::parse_progress(params);
    if (core::errors::is_error(parsed)) {
        LOG_WARN("ServerRegistry: dropping progress from " + server + ": " +
                 core::errors::get_error(parsed).message);
        return;
    }
    const protocol::Progress& progress = core::errors::get_value(parsed);
    LOG_DEBUG("ServerRegistry: " + server + " progress " + progress.operation_id + " " +
              std::to_string(progress.progress));
    if (on_progress_) {
        on_progress_(server, progress);
    }
}

std::mutex& ServerRegistry::lock_for(const std::string& name) {
    return *name_locks_.at(name);
}

core::errors::Result<const protocol::ServerLaunchSpec*> ServerRegistry::find_spec(
    const std::string& name) const {
    if (name.find_first_not_of(" \t\r\n") == std::string::npos) {
        return ClientError{ErrorKind::Input, "Server name must not be empty.",
                           "invalid_server_name"};
    }
    auto it = servers_.find(name);
    if (it == servers_.end()) {
        return ClientError{ErrorKind::Input, "Unknown server: " + name, "unknown_server",
                           "Check the server names in the configuration file."};
    }
    return &it->second;
}

core::errors::Result<session::SessionPtr> ServerRegistry::acquire(const std::string& name,
                                                                  const bool reuse_ready,
                                                                  const bool start_monitor) {
    auto spec = find_spec(name);
    if (core::errors::is_error(spec)) {
        return core::errors::get_error(spec);
    }

    std::lock_guard<std::mutex> name_lock(lock_for(name));
    if (closed_.load()) {
        return registry_closed();
    }

    auto existing = connections_->session(name);
    if (existing && existing->is_open() && reuse_ready) {
        return existing;
    }
    if (existing && !existing->is_open()) {
        LOG_INFO("ServerRegistry: discarding dead session for " + name);
        connections_->cleanup(name);
    }

    health_->register_server(name);
    auto connected = connections_->connect(name, *core::errors::get_value(spec));
    if (core::errors::is_error(connected)) {
        const ClientError& error = core::errors::get_error(connected);
        if (error.code != "duplicate_connection") {
            health_->unregister_server(name);
        }
        return error;
    }

    health_->update_heartbeat(name);
    if (start_monitor) {
        health_->start_monitoring();
    }
    LOG_INFO("ServerRegistry: connected to " + name);
    return connected;
}

core::errors::Result<session::SessionPtr> ServerRegistry::connect(const std::string& name) {
    return acquire(name, false, true);
}

std::vector<ConnectOutcome> ServerRegistry::connect_all() {
    std::vector<ConnectOutcome> outcomes;
    for (const auto& entry : servers_) {
        ConnectOutcome outcome;
        outcome.server = entry.first;
        auto connected = acquire(entry.first, true, true);
        if (core::errors::is_error(connected)) {
            outcome.error = core::errors::get_error(connected);
            LOG_WARN("ServerRegistry: " + entry.first + " unavailable: " +
                     outcome.error->message);
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

core::errors::Result<json> ServerRegistry::execute(
    const std::string& server, const std::string& method, json params,
    const std::optional<std::chrono::milliseconds> timeout) {
    if (closed_.load()) {
        return registry_closed();
    }
    auto acquired = acquire(server, true, true);
    if (core::errors::is_error(acquired)) {
        return core::errors::get_error(acquired);
    }

    const session::SessionPtr& session = core::errors::get_value(acquired);
    auto result = session->send_request(method, std::move(params), timeout);
    if (!core::errors::is_error(result)) {
        health_->update_heartbeat(server);
    } else if (is_connection_loss(core::errors::get_error(result))) {
        health_->mark_connection_failed(server, core::errors::get_error(result).message);
    }
    return result;
}

core::errors::VoidResult ServerRegistry::cancel(const std::string& server,
                                                const std::int64_t request_id) {
    if (closed_.load()) {
        return registry_closed();
    }
    auto session = connections_->session(server);
    if (!session) {
        return ClientError{ErrorKind::Input, "Server '" + server + "' is not connected.",
                           "not_connected"};
    }
    return session->cancel(request_id);
}

bool ServerRegistry::reconnect(const std::string& name) {
    if (closed_.load() || servers_.find(name) == servers_.end()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> name_lock(lock_for(name));
        if (closed_.load()) {
            return false;
        }
        connections_->cleanup(name);
    }
    auto connected = acquire(name, true, false);
    if (core::errors::is_error(connected)) {
        LOG_ERROR("ServerRegistry: reconnect to " + name + " failed: " +
                  core::errors::get_error(connected).message);
        return false;
    }
    return true;
}

void ServerRegistry::cleanup(const std::string& name) {
    auto it = name_locks_.find(name);
    if (it == name_locks_.end()) {
        return;
    }
    std::lock_guard<std::mutex> name_lock(*it->second);
    health_->unregister_server(name);
    connections_->cleanup(name);
}

void ServerRegistry::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return;
    }
    LOG_INFO("ServerRegistry: closing");
    health_->stop_monitoring();
    // Waits out any connect already holding a name lock.
    for (auto& entry : name_locks_) {
        std::lock_guard<std::mutex> name_lock(*entry.second);
        health_->unregister_server(entry.first);
        connections_->cleanup(entry.first);
    }
    connections_->cleanup_all();
}

std::vector<std::string> ServerRegistry::list_servers() const {
    std::vector<std::string> names;
    names.reserve(servers_.size());
    for (const auto& entry : servers_) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<std::string> ServerRegistry::connected_servers() const {
    return connections_->connected_servers();
}

session::ConnectionState ServerRegistry::state(const std::string& name) const {
    return connections_->state(name);
}

session::SessionPtr ServerRegistry::session(const std::string& name) const {
    return connections_->session(name);
}

}  // namespace mcplink::registry
