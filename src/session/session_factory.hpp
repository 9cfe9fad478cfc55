#pragma once

#include <functional>
#include <memory>
#include <string>
#include "core/config/settings.hpp"
#include "core/errors/client_errors.hpp"
#include "protocol/server_spec.hpp"
#include "session/protocol_session.hpp"

namespace mcplink::session {

using SessionPtr = std::shared_ptr<ProtocolSession>;

// Produces a started, initialized session for one server.
using SessionFactory = std::function<core::errors::Result<SessionPtr>(
    const std::string& name, const protocol::ServerLaunchSpec& spec)>;

// Hook applied to a fresh session before its reader starts, so no inbound
// message can arrive before handlers are installed.
using SessionConfigurator = std::function<void(ProtocolSession& session)>;

SessionFactory make_process_session_factory(core::config::ClientSettings settings,
                                            SessionConfigurator configure = {});

}  // namespace mcplink::session
