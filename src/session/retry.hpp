#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include "core/config/settings.hpp"
#include "core/errors/client_errors.hpp"
#include "core/logging/logger.hpp"

namespace mcplink::session {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Runs `attempt` up to policy.max_attempts times, sleeping
// policy.delay_after(n) between attempts. Stops early on success or when
// `retryable` rejects the error. The last error is returned on exhaustion.
// `cancelled` is polled before every attempt; once it reports true no further
// attempt is made and a `retry_cancelled` error is returned.
template <typename T, typename Attempt, typename Retryable, typename Cancelled>
core::errors::Result<T> retry_with_backoff(const core::config::RetryPolicy& policy,
                                           const Sleeper& sleeper, Attempt&& attempt,
                                           Retryable&& retryable, Cancelled&& cancelled,
                                           const std::string& label,
                                           int* attempts_made = nullptr) {
    const int max_attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    for (int n = 1;; ++n) {
        if (cancelled()) {
            LOG_WARN(label + ": cancelled before attempt " + std::to_string(n));
            return core::errors::ClientError{core::errors::ErrorKind::Connection,
                                             label + ": retries cancelled.", "retry_cancelled"};
        }
        if (attempts_made != nullptr) {
            *attempts_made = n;
        }
        core::errors::Result<T> result = attempt(n);
        if (!core::errors::is_error(result)) {
            return result;
        }

        const auto& error = core::errors::get_error(result);
        if (n >= max_attempts || !retryable(error)) {
            return result;
        }

        const auto delay = policy.delay_after(n);
        LOG_WARN(label + ": attempt " + std::to_string(n) + "/" +
                 std::to_string(max_attempts) + " failed (" + error.message +
                 "), retrying in " + std::to_string(delay.count()) + "ms");
        if (sleeper) {
            sleeper(delay);
        }
    }
}

}  // namespace mcplink::session
