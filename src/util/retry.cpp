#include <pinion/retry.hpp>

namespace pinion {

std::chrono::milliseconds RetryPolicy::backoff_for(int failed_attempt) const {
    if (initial_backoff.count() <= 0) return std::chrono::milliseconds(0);

    auto delay = initial_backoff;
    for (int i = 1; i < failed_attempt && delay < max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_backoff);
}

bool is_connection_error(const PinionError& e) {
    return e.code == PinionError::Network;
}

} // namespace pinion
