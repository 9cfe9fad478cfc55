#include "session/protocol_session.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace mcplink::session {

using core::errors::ClientError;
using core::errors::ErrorKind;
using nlohmann::json;
using protocol::Capabilities;

namespace {

// shutdown/exit are best effort; a peer that stopped reading is not waited on.
constexpr std::chrono::milliseconds kFarewellTimeout{200};

ClientError session_closed(const std::string& server_name) {
    return ClientError{ErrorKind::Connection,
                       "Session for server '" + server_name + "' is closed.",
                       "session_closed", "", core::errors::rpc::kInternalError};
}

// Wraps a handshake failure so the connection layer treats it as retryable.
ClientError handshake_failure(const ClientError& cause) {
    ClientError error{ErrorKind::Connection,
                      "Failed to initialize server: " + cause.message,
                      "handshake_failed", cause.hint, cause.rpc_code, cause.data};
    return error;
}

}  // namespace

ProtocolSession::ProtocolSession(std::string server_name,
                                 std::unique_ptr<transport::LineTransport> transport,
                                 core::config::ClientSettings settings)
    : server_name_(std::move(server_name)),
      transport_(std::move(transport)),
      settings_(std::move(settings)) {}

ProtocolSession::~ProtocolSession() {
    close();
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
}

void ProtocolSession::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_.load() || closed_.load()) {
        return;
    }
    started_.store(true);
    reader_ = std::thread(&ProtocolSession::read_loop, this);
}

core::errors::Result<Capabilities> ProtocolSession::initialize() {
    std::lock_guard<std::mutex> init_lock(init_mutex_);
    {
        std::lock_guard<std::mutex> lock(capabilities_mutex_);
        if (capabilities_.has_value()) {
            return capabilities_.value();
        }
    }
    start();

    const json params{{"protocolVersion", settings_.protocol_version},
                      {"capabilities", protocol::to_json(settings_.requested_capabilities)},
                      {"clientInfo",
                       {{"name", settings_.client_name}, {"version", settings_.client_version}}}};

    auto call = dispatch(protocol::kInitializeMethod, params, settings_.request_timeout);
    if (core::errors::is_error(call)) {
        return handshake_failure(core::errors::get_error(call));
    }
    auto outcome = wait(core::errors::get_value(call), settings_.request_timeout);
    if (core::errors::is_error(outcome)) {
        return handshake_failure(core::errors::get_error(outcome));
    }

    const json& result = core::errors::get_value(outcome);
    const auto caps_it = result.is_object() ? result.find("capabilities") : result.end();
    if (!result.is_object() || caps_it == result.end()) {
        return ClientError{ErrorKind::Connection,
                           "Server did not return capabilities in initialize response.",
                           "missing_capabilities", "", core::errors::rpc::kInvalidRequest};
    }

    auto parsed = protocol::parse_capabilities(*caps_it);
    if (core::errors::is_error(parsed)) {
        return handshake_failure(core::errors::get_error(parsed));
    }

    const Capabilities negotiated = core::errors::get_value(parsed);
    {
        std::lock_guard<std::mutex> lock(capabilities_mutex_);
        capabilities_ = negotiated;
    }
    LOG_INFO("ProtocolSession[" + server_name_ + "]: initialized (tools=" +
             (negotiated.tools ? "yes" : "no") + ", cancellation=" +
             (negotiated.cancellation ? "yes" : "no") + ")");
    return negotiated;
}

core::errors::Result<json> ProtocolSession::send_request(
    const std::string& method, json params,
    const std::optional<std::chrono::milliseconds> timeout) {
    if (method != protocol::kInitializeMethod && !is_initialized()) {
        auto initialized = initialize();
        if (core::errors::is_error(initialized)) {
            return core::errors::get_error(initialized);
        }
    }

    // The budget covers handing the request to the peer as well as the reply.
    const auto budget = timeout.value_or(settings_.request_timeout);
    const auto started = std::chrono::steady_clock::now();
    auto call = dispatch(method, std::move(params), budget);
    if (core::errors::is_error(call)) {
        return core::errors::get_error(call);
    }
    const auto spent =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    return wait(core::errors::get_value(call),
                std::max(std::chrono::milliseconds(0), budget - spent));
}

core::errors::Result<PendingCall> ProtocolSession::begin_request(const std::string& method,
                                                                 json params) {
    if (method != protocol::kInitializeMethod && !is_initialized()) {
        auto initialized = initialize();
        if (core::errors::is_error(initialized)) {
            return core::errors::get_error(initialized);
        }
    }
    return dispatch(method, std::move(params), settings_.request_timeout);
}

core::errors::Result<PendingCall> ProtocolSession::dispatch(
    const std::string& method, json params, const std::chrono::milliseconds write_timeout) {
    if (closed_.load()) {
        return session_closed(server_name_);
    }

    PendingCall call;
    call.method = method;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (stream_ended_) {
            return session_closed(server_name_);
        }
        call.id = ++next_id_;
        std::promise<RequestOutcome> promise;
        call.outcome = promise.get_future().share();
        pending_.emplace(call.id, std::move(promise));
    }

    protocol::Request request;
    request.id = call.id;
    request.method = method;
    request.params = params.is_null() ? json::object() : std::move(params);

    auto written = write_message(request, write_timeout);
    if (core::errors::is_error(written)) {
        const ClientError& error = core::errors::get_error(written);
        if (!resolve(call.id, error)) {
            // Already settled by close() or teardown; wait() reports that outcome.
            return call;
        }
        return error;
    }
    LOG_DEBUG("ProtocolSession[" + server_name_ + "]: sent request " +
              std::to_string(call.id) + " (" + method + ")");
    return call;
}

core::errors::Result<json> ProtocolSession::wait(const PendingCall& call,
                                                 const std::chrono::milliseconds timeout) {
    if (!call.outcome.valid()) {
        return ClientError{ErrorKind::Input, "Pending call has no outcome to wait on.",
                           "invalid_pending_call"};
    }
    if (call.outcome.wait_for(timeout) != std::future_status::ready) {
        ClientError timed_out{ErrorKind::Timeout,
                              "Timeout waiting for response to '" + call.method + "' (id " +
                                  std::to_string(call.id) + ")",
                              "request_timeout", "", core::errors::rpc::kInternalError};
        if (resolve(call.id, timed_out)) {
            LOG_WARN("ProtocolSession[" + server_name_ + "]: " + timed_out.message);
        }
    }
    return call.outcome.get();
}

core::errors::VoidResult ProtocolSession::send_notification(const std::string& method,
                                                            json params) {
    if (closed_.load()) {
        return session_closed(server_name_);
    }
    protocol::Notification notification;
    notification.method = method;
    notification.params = params.is_null() ? json::object() : std::move(params);
    return write_message(notification, settings_.request_timeout);
}

core::errors::VoidResult ProtocolSession::write_message(const protocol::Message& message,
                                                        const std::chrono::milliseconds timeout) {
    return transport_->write_line(protocol::encode(message), timeout);
}

void ProtocolSession::register_notification_handler(const std::string& method,
                                                    NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[method] = std::move(handler);
}

core::errors::VoidResult ProtocolSession::cancel(const std::int64_t request_id) {
    const auto caps = capabilities();
    if (!caps.has_value()) {
        return ClientError{ErrorKind::Input, "Client not initialized.", "not_initialized",
                           "", core::errors::rpc::kServerNotInitialized};
    }
    if (!caps->cancellation) {
        return ClientError{ErrorKind::Input, "Server does not support cancellation.",
                           "cancellation_unsupported", "",
                           core::errors::rpc::kInvalidRequest};
    }
    LOG_DEBUG("ProtocolSession[" + server_name_ + "]: cancelling request " +
              std::to_string(request_id));
    return send_notification(protocol::kCancelMethod, json{{"id", request_id}});
}

void ProtocolSession::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return;
    }

    fail_all_pending(session_closed(server_name_));

    bool stream_alive = false;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        stream_alive = !stream_ended_;
    }
    if (stream_alive && is_initialized()) {
        protocol::Notification shutdown;
        shutdown.method = protocol::kShutdownMethod;
        protocol::Notification exit_notice;
        exit_notice.method = protocol::kExitMethod;
        for (const auto& notification : {shutdown, exit_notice}) {
            auto sent = write_message(notification, kFarewellTimeout);
            if (core::errors::is_error(sent)) {
                LOG_DEBUG("ProtocolSession[" + server_name_ + "]: " + notification.method +
                          " not delivered: " + core::errors::get_error(sent).message);
                break;
            }
        }
    }

    transport_->close();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
    }
    LOG_DEBUG("ProtocolSession[" + server_name_ + "]: closed");
}

void ProtocolSession::set_activity_callback(ActivityCallback callback) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    on_activity_ = std::move(callback);
}

void ProtocolSession::set_disconnect_callback(DisconnectCallback callback) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    on_disconnect_ = std::move(callback);
}

bool ProtocolSession::is_initialized() const {
    std::lock_guard<std::mutex> lock(capabilities_mutex_);
    return capabilities_.has_value();
}

bool ProtocolSession::is_open() const {
    if (closed_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return !stream_ended_;
}

std::optional<Capabilities> ProtocolSession::capabilities() const {
    std::lock_guard<std::mutex> lock(capabilities_mutex_);
    return capabilities_;
}

std::size_t ProtocolSession::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

bool ProtocolSession::has_pending(const std::int64_t id) const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.find(id) != pending_.end();
}

bool ProtocolSession::resolve(const std::int64_t id, RequestOutcome outcome) {
    std::promise<RequestOutcome> promise;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }
    promise.set_value(std::move(outcome));
    return true;
}

void ProtocolSession::fail_all_pending(const ClientError& reason) {
    std::unordered_map<std::int64_t, std::promise<RequestOutcome>> drained;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        drained.swap(pending_);
    }
    if (!drained.empty()) {
        LOG_WARN("ProtocolSession[" + server_name_ + "]: failing " +
                 std::to_string(drained.size()) + " pending request(s): " + reason.message);
    }
    for (auto& entry : drained) {
        entry.second.set_value(reason);
    }
}

void ProtocolSession::read_loop() {
    while (true) {
        auto next = transport_->read_line();
        if (core::errors::is_error(next)) {
            handle_stream_end(core::errors::get_error(next));
            return;
        }
        const auto& line = core::errors::get_value(next);
        if (!line.has_value()) {
            handle_stream_end(ClientError{ErrorKind::Internal,
                                          "Server '" + server_name_ + "' closed the connection.",
                                          "connection_lost", "",
                                          core::errors::rpc::kInternalError});
            return;
        }
        if (line->find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        handle_line(line.value());
    }
}

void ProtocolSession::handle_stream_end(const ClientError& reason) {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        stream_ended_ = true;
    }
    ClientError fatal = reason;
    fatal.kind = ErrorKind::Internal;
    fatal.rpc_code = core::errors::rpc::kInternalError;
    if (fatal.code != "connection_lost") {
        fatal.code = "connection_lost";
    }
    fail_all_pending(fatal);

    if (closed_.load()) {
        return;
    }
    LOG_WARN("ProtocolSession[" + server_name_ + "]: stream ended: " + reason.message);
    DisconnectCallback callback;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        callback = on_disconnect_;
    }
    if (callback) {
        callback(fatal);
    }
}

void ProtocolSession::handle_line(const std::string& line) {
    auto decoded = protocol::decode(line);
    if (core::errors::is_error(decoded)) {
        const ClientError& problem = core::errors::get_error(decoded);
        if (problem.data.is_object() && problem.data.contains("id")) {
            const auto id = problem.data.at("id").get<std::int64_t>();
            const bool resolved =
                resolve(id, ClientError{ErrorKind::Protocol, problem.message, "invalid_response",
                                        "", core::errors::rpc::kInvalidRequest,
                                        json{{"line", line}}});
            LOG_WARN("ProtocolSession[" + server_name_ + "]: invalid response for id " +
                     std::to_string(id) + (resolved ? "" : " (no longer pending)") + ": " +
                     problem.message);
            return;
        }
        std::optional<std::int64_t> sole_pending;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            if (pending_.size() == 1) {
                sole_pending = pending_.begin()->first;
            }
        }
        if (sole_pending.has_value()) {
            // Peers that fail to parse a request often answer without an id.
            LOG_WARN("ProtocolSession[" + server_name_ + "]: malformed message while request " +
                     std::to_string(sole_pending.value()) + " is outstanding: " +
                     problem.message);
            resolve(sole_pending.value(),
                    ClientError{ErrorKind::Internal, problem.message, "malformed_response", "",
                                core::errors::rpc::kInternalError, json{{"line", line}}});
        } else {
            LOG_WARN("ProtocolSession[" + server_name_ + "]: dropping malformed message: " +
                     problem.message);
        }
        return;
    }

    notify_activity();
    const protocol::Message& message = core::errors::get_value(decoded);
    if (const auto* response = std::get_if<protocol::Response>(&message)) {
        handle_response(*response);
    } else if (const auto* notification = std::get_if<protocol::Notification>(&message)) {
        handle_notification(*notification);
    } else if (const auto* request = std::get_if<protocol::Request>(&message)) {
        handle_server_request(*request);
    }
}

void ProtocolSession::handle_response(const protocol::Response& response) {
    RequestOutcome outcome = response.result;
    if (response.error.has_value()) {
        outcome = protocol::to_client_error(response.error.value());
    }
    if (!resolve(response.id, std::move(outcome))) {
        LOG_WARN("ProtocolSession[" + server_name_ + "]: dropping response for unknown id " +
                 std::to_string(response.id));
    }
}

void ProtocolSession::handle_notification(const protocol::Notification& notification) {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        const auto it = handlers_.find(notification.method);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        LOG_DEBUG("ProtocolSession[" + server_name_ + "]: no handler for notification '" +
                  notification.method + "'");
        return;
    }
    try {
        handler(notification.params);
    } catch (const std::exception& ex) {
        LOG_ERROR("ProtocolSession[" + server_name_ + "]: handler for '" +
                  notification.method + "' failed: " + ex.what());
    }
}

void ProtocolSession::handle_server_request(const protocol::Request& request) {
    LOG_WARN("ProtocolSession[" + server_name_ + "]: rejecting server request '" +
             request.method + "'");
    protocol::Response reply;
    reply.id = request.id;
    reply.error = protocol::ErrorDetail{core::errors::rpc::kMethodNotFound,
                                        "Method not found: " + request.method, std::nullopt};
    auto sent = write_message(reply, kFarewellTimeout);
    if (core::errors::is_error(sent)) {
        LOG_WARN("ProtocolSession[" + server_name_ + "]: failed to reject request: " +
                 core::errors::get_error(sent).message);
    }
}

void ProtocolSession::notify_activity() {
    ActivityCallback callback;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        callback = on_activity_;
    }
    if (callback) {
        callback();
    }
}

}  // namespace mcplink::session
