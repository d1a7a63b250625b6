#pragma once

// ============================================================
// retry_policy.hpp -- Bounded retry on rate-limit signals
// ============================================================

#include "../common/cancel_token.hpp"
#include "../common/config.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <chrono>
#include <string>

struct RetryPolicy {
    using milliseconds = std::chrono::milliseconds;

    int          max_attempts{3};
    milliseconds max_wait{30000};
    milliseconds default_wait{5000};

    static RetryPolicy from_config(const ServiceConfig& cfg) {
        RetryPolicy p;
        p.max_attempts = cfg.retry_attempts;
        p.max_wait     = cfg.retry_max_wait;
        p.default_wait = cfg.retry_default_wait;
        return p;
    }

    // Wait before the next attempt: the suggestion (default_wait when the
    // signal carries none) capped at max_wait, never shorter than previous
    milliseconds next_wait(u32 suggested_seconds, milliseconds previous) const {
        milliseconds want = suggested_seconds > 0
            ? milliseconds((i64)suggested_seconds * 1000)
            : default_wait;
        want = std::min(want, max_wait);
        return std::min(std::max(want, previous), max_wait);
    }
};

// Run fn, retrying on RateLimitError up to policy.max_attempts in total.
// Other exceptions propagate at once. No sleep follows the final attempt.
template<typename F>
auto call_with_retry(const RetryPolicy& policy, CancelToken& token,
                     const std::string& what, F&& fn) -> decltype(fn())
{
    std::chrono::milliseconds wait{0};
    for (int attempt = 1;; ++attempt) {
        token.throw_if_cancelled();
        try {
            return fn();
        } catch (const RateLimitError& e) {
            if (attempt >= policy.max_attempts) {
                throw RetryExhaustedError(attempt, e.wait_seconds(),
                    what + ": rate limited " + std::to_string(attempt) +
                    " times, last suggested wait " + std::to_string(e.wait_seconds()) + "s");
            }
            wait = policy.next_wait(e.wait_seconds(), wait);
            LOG_WARN(what + ": rate limited, waiting " + std::to_string(wait.count()) +
                     "ms (attempt " + std::to_string(attempt) + "/" +
                     std::to_string(policy.max_attempts) + ")");
            if (!token.sleep_for(wait)) throw TransferCancelled();
        }
    }
}
