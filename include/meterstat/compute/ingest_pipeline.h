/**
 * @file ingest_pipeline.h
 * @brief One ingestion run for one series
 *
 * A run reads the persisted state of the series, fetches the polling window,
 * aggregates it and persists the changed buckets with a single merge call.
 * Any failure leaves the store untouched; the next run retries from the
 * unchanged watermark.
 */

#pragma once

#include "meterstat/core/statistics_store.h"
#include "meterstat/ingest/sample_fetcher.h"
#include "meterstat/utils/config.h"
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace meterstat {
namespace compute {

/**
 * @brief Outcome of a run
 */
enum class RunStatus {
    Success,            ///< Buckets persisted (or nothing to persist)
    TransientFailure,   ///< Network/5xx/store failure, retry with backoff
    PermanentFailure,   ///< Authentication/4xx or configuration error
    CorruptState,       ///< Persisted state inconsistent, needs attention
    Cancelled,          ///< Cancelled or fetch deadline exceeded
    Busy                ///< Another run for the same series is in progress
};

std::string runStatusToString(RunStatus status);

/**
 * @brief Result of one run
 */
struct RunReport {
    std::string series_id;
    RunStatus status = RunStatus::Success;
    std::string message;                    ///< Error text, empty on success

    TimeRange window;                       ///< Fetched window
    uint64_t samples_fetched = 0;
    uint64_t pages_fetched = 0;
    uint64_t buckets_written = 0;
    uint64_t misaligned = 0;
    uint64_t late_discarded = 0;

    std::optional<int64_t> old_watermark;
    std::optional<int64_t> new_watermark;

    bool ok() const { return status == RunStatus::Success; }
};

/**
 * @brief IngestPipeline - fetch, aggregate and persist one series
 *
 * Runs for different series may execute concurrently. Two runs for the same
 * series never overlap: the second one returns RunStatus::Busy immediately.
 */
class IngestPipeline {
public:
    /**
     * @brief Constructor
     * @param store Statistics store (not owned)
     * @param fetcher Sample fetcher (not owned)
     */
    IngestPipeline(StatisticsStore* store, const SampleFetcher* fetcher);

    /**
     * @brief Execute one run
     * @param config Series configuration
     * @param now Current time (ms since epoch)
     * @param cancel Cancellation token for this run
     */
    RunReport runOnce(const SeriesConfig& config,
                      int64_t now,
                      const CancellationToken& cancel = CancellationToken());

    /**
     * @brief Window a run at `now` would fetch, given the stored watermark
     */
    static TimeRange fetchWindow(const SeriesConfig& config,
                                 const std::optional<int64_t>& watermark,
                                 int64_t now);

    /**
     * @brief Whether a run for the series is in progress
     */
    bool isRunning(const std::string& series_id) const;

    /**
     * @brief Counters across all runs
     */
    std::map<std::string, uint64_t> getStats() const;

private:
    RunReport execute(const SeriesConfig& config, int64_t now, const CancellationToken& cancel);

    void logReport(const RunReport& report) const;

    StatisticsStore* store_;
    const SampleFetcher* fetcher_;

    std::set<std::string> in_flight_;
    mutable std::mutex in_flight_mutex_;

    std::atomic<uint64_t> runs_{0};
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> busy_rejections_{0};
};

} // namespace compute
} // namespace meterstat
