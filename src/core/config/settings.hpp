#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "protocol/capabilities.hpp"

namespace mcplink::core::config {

    // Bounded exponential backoff: delay before attempt n+1 is
    // base_delay * factor^(n-1).
    struct RetryPolicy {
        int max_attempts = 3;
        std::chrono::milliseconds base_delay{1000};
        double factor = 2.0;

        std::chrono::milliseconds delay_after(int attempt) const {
            double delay = static_cast<double>(base_delay.count());
            for (int i = 1; i < attempt; ++i) {
                delay *= factor;
            }
            return std::chrono::milliseconds(static_cast<std::int64_t>(delay));
        }
    };

    // Fixed timing parameters and handshake identity shared by every session.
    struct ClientSettings {
        std::chrono::milliseconds request_timeout{5000};
        std::chrono::milliseconds terminate_grace{5000};
        RetryPolicy retry;
        std::chrono::milliseconds heartbeat_interval{30000};
        int max_heartbeat_miss = 2;

        protocol::Capabilities requested_capabilities;
        std::string client_name = "mcplink";
        std::string client_version = "0.1.0";
        std::string protocol_version = "0.1.0";
    };

} // namespace mcplink::core::config
