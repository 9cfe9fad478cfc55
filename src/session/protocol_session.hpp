#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "core/errors/client_errors.hpp"
#include "protocol/capabilities.hpp"
#include "protocol/message.hpp"
#include "transport/line_transport.hpp"

namespace mcplink::session {

using RequestOutcome = core::errors::Result<nlohmann::json>;

// A request that has been written and is waiting for its response.
struct PendingCall {
    std::int64_t id = 0;
    std::string method;
    std::shared_future<RequestOutcome> outcome;
};

// Correlates requests and responses over one LineTransport. A background
// reader thread owns inbound dispatch; every pending id is resolved exactly
// once, by its response, its timeout, or session teardown.
class ProtocolSession {
public:
    using NotificationHandler = std::function<void(const nlohmann::json& params)>;
    using ActivityCallback = std::function<void()>;
    using DisconnectCallback = std::function<void(const core::errors::ClientError& reason)>;

    ProtocolSession(std::string server_name,
                    std::unique_ptr<transport::LineTransport> transport,
                    core::config::ClientSettings settings = {});
    ~ProtocolSession();

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    // Spawns the reader thread. Idempotent.
    void start();

    // Runs the `initialize` handshake once; later calls return the stored
    // capabilities.
    core::errors::Result<protocol::Capabilities> initialize();

    core::errors::Result<nlohmann::json> send_request(
        const std::string& method, nlohmann::json params = nlohmann::json::object(),
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    core::errors::Result<PendingCall> begin_request(
        const std::string& method, nlohmann::json params = nlohmann::json::object());

    core::errors::Result<nlohmann::json> wait(const PendingCall& call,
                                              std::chrono::milliseconds timeout);

    core::errors::VoidResult send_notification(
        const std::string& method, nlohmann::json params = nlohmann::json::object());

    // Replaces any handler already registered for `method`.
    void register_notification_handler(const std::string& method,
                                       NotificationHandler handler);

    // Sends `$/cancel`; the local pending entry is left to its own timeout
    // or response.
    core::errors::VoidResult cancel(std::int64_t request_id);

    void close();

    void set_activity_callback(ActivityCallback callback);
    void set_disconnect_callback(DisconnectCallback callback);

    const std::string& server_name() const { return server_name_; }
    bool is_initialized() const;
    bool is_open() const;
    std::optional<protocol::Capabilities> capabilities() const;
    std::size_t pending_count() const;
    bool has_pending(std::int64_t id) const;

private:
    core::errors::Result<PendingCall> dispatch(const std::string& method,
                                               nlohmann::json params,
                                               std::chrono::milliseconds write_timeout);
    core::errors::VoidResult write_message(const protocol::Message& message,
                                           std::chrono::milliseconds timeout);
    bool resolve(std::int64_t id, RequestOutcome outcome);
    void fail_all_pending(const core::errors::ClientError& reason);

    void read_loop();
    void handle_line(const std::string& line);
    void handle_response(const protocol::Response& response);
    void handle_notification(const protocol::Notification& notification);
    void handle_server_request(const protocol::Request& request);
    void handle_stream_end(const core::errors::ClientError& reason);
    void notify_activity();

    std::string server_name_;
    std::unique_ptr<transport::LineTransport> transport_;
    core::config::ClientSettings settings_;
    std::thread reader_;

    mutable std::mutex pending_mutex_;
    std::unordered_map<std::int64_t, std::promise<RequestOutcome>> pending_;
    std::int64_t next_id_ = 0;
    bool stream_ended_ = false;

    mutable std::mutex handlers_mutex_;
    std::unordered_map<std::string, NotificationHandler> handlers_;
    ActivityCallback on_activity_;
    DisconnectCallback on_disconnect_;

    std::mutex init_mutex_;
    mutable std::mutex capabilities_mutex_;
    std::optional<protocol::Capabilities> capabilities_;

    std::mutex lifecycle_mutex_;
    std::atomic_bool started_{false};
    std::atomic_bool closed_{false};
};

}  // namespace mcplink::session
