/**
 * @file retry_policy.h
 * @brief Bounded retry state machine for per-series ingestion runs
 *
 * Transient failures back off exponentially up to a limit, then fall back to
 * the regular polling cadence. Permanent failures park the series in a
 * "needs attention" state until its configuration changes.
 */

#pragma once

#include <cstdint>
#include <string>

namespace meterstat {
namespace compute {

/**
 * @brief Retry bookkeeping of one series
 */
struct RetryState {
    uint32_t attempts = 0;            ///< Consecutive failed runs
    int64_t next_eligible_ms = 0;     ///< Earliest time of the next run
    bool needs_attention = false;     ///< Set by permanent failures
    std::string last_error;           ///< Message of the last failure
    int64_t last_success_ms = 0;      ///< Time of the last successful run (0 = never)
};

/**
 * @brief Retry policy parameters
 */
struct RetryPolicy {
    int64_t initial_backoff_ms = 5 * 60 * 1000;   ///< Delay after the first failure
    int64_t max_backoff_ms = 60 * 60 * 1000;      ///< Upper bound of the delay
    double multiplier = 2.0;                      ///< Growth per consecutive failure
    uint32_t max_attempts = 5;                    ///< Backoff retries before the regular cadence

    /**
     * @brief Delay before retry number `attempts` (1-based)
     */
    int64_t backoffFor(uint32_t attempts) const;

    /**
     * @brief Record a successful run; next run one poll interval later
     */
    void onSuccess(RetryState& state, int64_t now, int64_t poll_interval_ms) const;

    /**
     * @brief Record a transient failure and schedule the retry
     */
    void onTransientFailure(RetryState& state, int64_t now, int64_t poll_interval_ms,
                            const std::string& error) const;

    /**
     * @brief Record a permanent failure; no automatic retry
     */
    void onPermanentFailure(RetryState& state, const std::string& error) const;

    /**
     * @brief Whether a run may start at `now`
     */
    bool isEligible(const RetryState& state, int64_t now) const;

    /**
     * @brief Clear attention and backoff after a configuration change
     */
    void resetAttention(RetryState& state, int64_t now) const;
};

} // namespace compute
} // namespace meterstat
