#pragma once

#include <pinion/result.hpp>
#include <pinion/log.hpp>

#include <algorithm>
#include <chrono>
#include <thread>

namespace pinion {

struct RetryPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{8000};

    // Delay after the given failed attempt (1-based): doubles each time,
    // capped at max_backoff
    std::chrono::milliseconds backoff_for(int failed_attempt) const;
};

// Connection-level failures (refused, reset, timed out, truncated transfer)
bool is_connection_error(const PinionError& e);

// Runs `op` until it succeeds, fails with an error `retryable` rejects, or
// the attempt budget is spent. The last result is returned unchanged, so a
// caller can tell an exhausted budget apart by testing it with `retryable`.
template<typename Op, typename Pred>
auto with_retry(Op&& op, const RetryPolicy& policy, Pred&& retryable,
                const char* what = "operation") -> decltype(op()) {
    const int attempts = std::max(policy.max_attempts, 1);
    for (int attempt = 1;; ++attempt) {
        auto result = op();
        if (result.is_ok()) return result;
        if (!retryable(result.error()) || attempt >= attempts) return result;

        auto delay = policy.backoff_for(attempt);
        log::warn("%s failed (attempt %d/%d): %s; retrying in %lldms",
                  what, attempt, attempts, result.error().message.c_str(),
                  static_cast<long long>(delay.count()));
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace pinion
