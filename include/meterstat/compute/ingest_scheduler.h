/**
 * @file ingest_scheduler.h
 * @brief Periodic scheduler for per-series ingestion runs
 *
 * A background thread wakes up every tick, picks the series whose polling
 * interval or retry backoff has elapsed, and submits one run per series to a
 * worker pool. Run outcomes drive the retry state machine.
 */

#pragma once

#include "ingest_pipeline.h"
#include "retry_policy.h"
#include "meterstat/core/worker_pool.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace meterstat {
namespace compute {

/**
 * @brief Scheduler configuration
 */
struct IngestSchedulerConfig {
    size_t worker_threads = 2;            ///< Concurrent runs across series
    int64_t tick_interval_ms = 1000;      ///< How often due series are checked
    RetryPolicy retry;                    ///< Backoff parameters
};

/**
 * @brief Scheduling state of one series, as seen from outside
 */
struct SeriesStatus {
    std::string series_id;
    RetryState retry;
    bool in_progress = false;
    std::optional<RunReport> last_report;
};

/**
 * @brief Scheduling metrics
 */
struct SchedulerMetrics {
    uint64_t runs_started = 0;
    uint64_t runs_succeeded = 0;
    uint64_t runs_failed = 0;
    uint64_t runs_cancelled = 0;
    uint64_t series_needing_attention = 0;
};

/**
 * @brief Callback for completed runs
 */
using RunCallback = std::function<void(const RunReport&)>;

/**
 * @brief IngestScheduler - trigger ingestion runs for all registered series
 *
 * Usage flow:
 * 1. Register series with addSeries()
 * 2. start() the background loop, or drive it with pollOnce() in tests
 * 3. Inspect getSeriesStatus() for series needing attention
 * 4. updateSeries() after fixing a configuration clears the attention flag
 * 5. stop()
 */
class IngestScheduler {
public:
    using Clock = std::function<int64_t()>;

    /**
     * @brief Constructor
     * @param config Scheduler configuration
     * @param pipeline Ingest pipeline (not owned)
     * @param clock Source of the current time (defaults to the system clock)
     */
    IngestScheduler(const IngestSchedulerConfig& config,
                    IngestPipeline* pipeline,
                    Clock clock = Clock());

    ~IngestScheduler();

    // ========== Lifecycle Management ==========

    /**
     * @brief Start the background loop
     * @return true if started successfully
     */
    bool start();

    /**
     * @brief Stop the background loop
     * @param wait_completion Let in-progress runs finish instead of cancelling them
     */
    void stop(bool wait_completion = true);

    bool isRunning() const { return running_.load(); }

    // ========== Series Registration ==========

    /**
     * @brief Register a series; it is due immediately
     * @return false if the series id is already registered
     */
    bool addSeries(const SeriesConfig& config);

    /**
     * @brief Replace the configuration of a series
     *
     * Clears the needs-attention flag and any backoff; the series is due
     * immediately.
     * @return false if the series is not registered
     */
    bool updateSeries(const SeriesConfig& config);

    /**
     * @brief Unregister a series; an in-progress run is cancelled
     */
    bool removeSeries(const std::string& series_id);

    // ========== Scheduling ==========

    /**
     * @brief Submit every due series once
     * @param now Current time (ms since epoch)
     * @return Number of runs submitted
     */
    size_t pollOnce(int64_t now);

    /**
     * @brief Block until all submitted runs have finished
     */
    void waitIdle();

    /**
     * @brief Register callback for run completion
     */
    void onRunCompleted(RunCallback callback);

    // ========== Query & Monitoring ==========

    std::optional<SeriesStatus> getSeriesStatus(const std::string& series_id) const;

    std::vector<SeriesStatus> getAllSeriesStatus() const;

    SchedulerMetrics getMetrics() const;

private:
    struct SeriesEntry {
        SeriesConfig config;
        RetryState retry;
        bool in_progress = false;
        uint64_t generation = 0;          ///< Bumped on every configuration change
        CancellationToken cancel;
        std::optional<RunReport> last_report;
    };

    /**
     * @brief Main scheduler loop (runs in background thread)
     */
    void schedulerLoop();

    /**
     * @brief Apply a finished run to the retry state
     */
    void handleReport(const std::string& series_id, uint64_t generation, const RunReport& report);

    static SeriesStatus toStatus(const std::string& series_id, const SeriesEntry& entry);

    IngestSchedulerConfig config_;
    IngestPipeline* pipeline_;
    Clock clock_;

    std::unique_ptr<WorkerPool> pool_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::unique_ptr<std::thread> scheduler_thread_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;

    std::map<std::string, SeriesEntry> series_;
    mutable std::mutex series_mutex_;

    std::vector<RunCallback> callbacks_;
    mutable std::mutex callbacks_mutex_;

    SchedulerMetrics metrics_;
};

} // namespace compute
} // namespace meterstat
