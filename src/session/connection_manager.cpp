#include "session/connection_manager.hpp"

#include <algorithm>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace mcplink::session {

using core::errors::ClientError;
using core::errors::ErrorKind;

std::string to_string(const ConnectionState state) {
    switch (state) {
        case ConnectionState::Unconnected:
            return "unconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Ready:
            return "ready";
        case ConnectionState::Failed:
            return "failed";
        case ConnectionState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

ConnectionManager::ConnectionManager(core::config::ClientSettings settings,
                                     SessionFactory factory, Sleeper sleeper)
    : settings_(std::move(settings)),
      factory_(std::move(factory)),
      sleeper_(std::move(sleeper)) {
    if (!factory_) {
        factory_ = make_process_session_factory(settings_);
    }
    if (!sleeper_) {
        sleeper_ = [](const std::chrono::milliseconds delay) {
            std::this_thread::sleep_for(delay);
        };
    }
}

ConnectionManager::~ConnectionManager() {
    cleanup_all();
}

void ConnectionManager::transition(const std::string& name, ConnectionRecord& record,
                                   const ConnectionState next) {
    const std::string prev = to_string(record.state);
    record.state = next;
    LOG_INFO("ConnectionManager: server " + name + " transition " + prev + " -> " +
             to_string(next));
}

bool ConnectionManager::is_current(const std::string& name,
                                   const std::uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    return it != connections_.end() && it->second.generation == generation;
}

core::errors::Result<SessionPtr> ConnectionManager::connect(
    const std::string& name, const protocol::ServerLaunchSpec& spec) {
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& record = connections_[name];
        if (record.state == ConnectionState::Connecting ||
            record.state == ConnectionState::Ready) {
            return ClientError{ErrorKind::Input,
                               "Server '" + name + "' is already " + to_string(record.state) +
                                   ".",
                               "duplicate_connection",
                               "Call cleanup() before connecting again."};
        }
        generation = ++next_generation_;
        record.generation = generation;
        record.session.reset();
        record.failure_reason.reset();
        transition(name, record, ConnectionState::Connecting);
    }

    int attempts = 0;
    auto result = retry_with_backoff<SessionPtr>(
        settings_.retry, sleeper_,
        [&](int) { return factory_(name, spec); },
        [](const ClientError& error) { return core::errors::is_retryable(error); },
        [&] { return !is_current(name, generation); },
        "ConnectionManager: server " + name, &attempts);

    std::unique_lock<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    const bool cancelled = it == connections_.end() || it->second.generation != generation;
    if (cancelled) {
        lock.unlock();
        if (!core::errors::is_error(result)) {
            core::errors::get_value(result)->close();
        }
        LOG_WARN("ConnectionManager: connect to " + name + " was cancelled by cleanup");
        return ClientError{ErrorKind::Connection,
                           "Connection to server '" + name + "' was cancelled.",
                           "connect_cancelled"};
    }

    ConnectionRecord& record = it->second;
    if (core::errors::is_error(result)) {
        const ClientError& cause = core::errors::get_error(result);
        record.failure_reason = cause.message;
        transition(name, record, ConnectionState::Failed);
        LOG_ERROR("ConnectionManager: server " + name + " failed after " +
                  std::to_string(attempts) + " attempt(s): " + core::errors::describe(cause));
        return ClientError{ErrorKind::Connection,
                           "Failed to connect to server '" + name + "': " + cause.message,
                           "connection_failed", cause.hint, cause.rpc_code,
                           nlohmann::json{{"cause_kind", core::errors::to_string(cause.kind)},
                                          {"cause_code", cause.code},
                                          {"attempts", attempts}}};
    }

    record.session = core::errors::get_value(result);
    transition(name, record, ConnectionState::Ready);
    return record.session;
}

void ConnectionManager::cleanup(const std::string& name) {
    SessionPtr doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(name);
        if (it == connections_.end()) {
            return;
        }
        doomed = std::move(it->second.session);
        transition(name, it->second, ConnectionState::Closed);
        connections_.erase(it);
    }
    if (doomed) {
        doomed->close();
    }
}

void ConnectionManager::cleanup_all() {
    std::unordered_map<std::string, ConnectionRecord> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(connections_);
    }
    for (auto& entry : drained) {
        if (entry.second.session) {
            entry.second.session->close();
        }
    }
    if (!drained.empty()) {
        LOG_INFO("ConnectionManager: closed " + std::to_string(drained.size()) +
                 " connection(s)");
    }
}

void ConnectionManager::mark_failed(const std::string& name, const std::string& reason) {
    SessionPtr doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(name);
        if (it == connections_.end()) {
            return;
        }
        doomed = std::move(it->second.session);
        it->second.failure_reason = reason;
        // Invalidates any connect still in flight for this slot.
        it->second.generation = ++next_generation_;
        transition(name, it->second, ConnectionState::Failed);
    }
    if (doomed) {
        doomed->close();
    }
}

SessionPtr ConnectionManager::session(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    if (it == connections_.end() || it->second.state != ConnectionState::Ready) {
        return nullptr;
    }
    return it->second.session;
}

ConnectionState ConnectionManager::state(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    if (it == connections_.end()) {
        return ConnectionState::Unconnected;
    }
    return it->second.state;
}

std::optional<std::string> ConnectionManager::failure_reason(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second.failure_reason;
}

std::vector<std::string> ConnectionManager::connected_servers() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : connections_) {
            if (entry.second.state == ConnectionState::Ready) {
                names.push_back(entry.first);
            }
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::size_t ConnectionManager::tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(connections_.begin(), connections_.end(), [](const auto& entry) {
            return entry.second.state == ConnectionState::Connecting ||
                   entry.second.state == ConnectionState::Ready;
        }));
}

}  // namespace mcplink::session
