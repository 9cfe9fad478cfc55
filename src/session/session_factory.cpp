#include "session/session_factory.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "transport/process_transport.hpp"

namespace mcplink::session {

SessionFactory make_process_session_factory(core::config::ClientSettings settings,
                                            SessionConfigurator configure) {
    return [settings = std::move(settings), configure = std::move(configure)](
               const std::string& name,
               const protocol::ServerLaunchSpec& spec) -> core::errors::Result<SessionPtr> {
        transport::ProcessOptions options;
        options.terminate_grace = settings.terminate_grace;
        options.label = name;

        auto started = transport::ProcessTransport::start(spec, options);
        if (core::errors::is_error(started)) {
            return core::errors::get_error(started);
        }

        auto session = std::make_shared<ProtocolSession>(
            name, std::move(core::errors::get_value(started)), settings);
        if (configure) {
            configure(*session);
        }
        session->start();

        auto initialized = session->initialize();
        if (core::errors::is_error(initialized)) {
            session->close();
            return core::errors::get_error(initialized);
        }
        LOG_DEBUG("SessionFactory: server '" + name + "' ready");
        return session;
    };
}

}  // namespace mcplink::session
