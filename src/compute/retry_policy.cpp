#include "meterstat/compute/retry_policy.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace meterstat {
namespace compute {

int64_t RetryPolicy::backoffFor(uint32_t attempts) const {
    if (attempts == 0) {
        return 0;
    }
    double delay = static_cast<double>(initial_backoff_ms) *
                   std::pow(multiplier, static_cast<double>(attempts - 1));
    if (delay >= static_cast<double>(max_backoff_ms)) {
        return max_backoff_ms;
    }
    return std::max<int64_t>(0, static_cast<int64_t>(delay));
}

void RetryPolicy::onSuccess(RetryState& state, int64_t now, int64_t poll_interval_ms) const {
    state.attempts = 0;
    state.last_error.clear();
    state.last_success_ms = now;
    state.next_eligible_ms = now + poll_interval_ms;
}

void RetryPolicy::onTransientFailure(RetryState& state, int64_t now, int64_t poll_interval_ms,
                                     const std::string& error) const {
    ++state.attempts;
    state.last_error = error;
    if (state.attempts > max_attempts) {
        // Out of fast retries; keep trying at the normal cadence
        state.next_eligible_ms = now + poll_interval_ms;
    } else {
        state.next_eligible_ms = now + std::min(backoffFor(state.attempts), poll_interval_ms);
    }
}

void RetryPolicy::onPermanentFailure(RetryState& state, const std::string& error) const {
    ++state.attempts;
    state.last_error = error;
    state.needs_attention = true;
    state.next_eligible_ms = std::numeric_limits<int64_t>::max();
}

bool RetryPolicy::isEligible(const RetryState& state, int64_t now) const {
    return !state.needs_attention && now >= state.next_eligible_ms;
}

void RetryPolicy::resetAttention(RetryState& state, int64_t now) const {
    state.attempts = 0;
    state.needs_attention = false;
    state.last_error.clear();
    state.next_eligible_ms = now;
}

} // namespace compute
} // namespace meterstat
