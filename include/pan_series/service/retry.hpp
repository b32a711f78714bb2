#pragma once

#include "pan_series/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace pan_series::service {

struct RetryPolicy {
    int max_attempts = 4;
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{8000};
    double multiplier = 2.0;

    // Delay before attempt `attempt + 1` (attempt is 1-based)
    std::chrono::milliseconds backoff_after(int attempt) const;
};

// Calls fn() until it succeeds, retrying transient TransportError with
// exponential backoff. AuthError and non-transient errors propagate at once;
// the last transient error propagates when the attempts are used up.
// `attempts_out`, when given, receives the number of calls made.
template <typename Fn>
auto with_retry(const RetryPolicy& policy, Fn&& fn, std::atomic<bool>* stop_flag = nullptr,
                int* attempts_out = nullptr) -> decltype(fn()) {
    const int max_attempts = std::max(1, policy.max_attempts);
    for (int attempt = 1;; ++attempt) {
        if (attempts_out) {
            *attempts_out = attempt;
        }
        try {
            return fn();
        } catch (const TransportError& e) {
            if (!e.transient() || attempt >= max_attempts) {
                throw;
            }
            if (stop_flag && stop_flag->load()) {
                throw;
            }
        }
        std::this_thread::sleep_for(policy.backoff_after(attempt));
    }
}

} // namespace pan_series::service
