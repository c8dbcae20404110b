#include "meterstat/compute/ingest_scheduler.h"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace meterstat {
namespace compute {

IngestScheduler::IngestScheduler(const IngestSchedulerConfig& config,
                                 IngestPipeline* pipeline,
                                 Clock clock)
    : config_(config),
      pipeline_(pipeline),
      clock_(clock ? std::move(clock) : Clock(current_time_ms)) {
    if (!pipeline_) {
        throw std::invalid_argument("IngestScheduler: pipeline is required");
    }
    if (config_.tick_interval_ms <= 0) {
        throw std::invalid_argument("IngestScheduler: tick_interval_ms must be positive");
    }
    pool_ = std::make_unique<WorkerPool>(config_.worker_threads, "IngestScheduler");
}

IngestScheduler::~IngestScheduler() {
    stop(false);
    pool_->shutdown();
}

// ========== Lifecycle Management ==========

bool IngestScheduler::start() {
    if (running_.load()) {
        std::cerr << "IngestScheduler: already running" << std::endl;
        return false;
    }

    running_.store(true);
    stop_requested_.store(false);

    scheduler_thread_ = std::make_unique<std::thread>(&IngestScheduler::schedulerLoop, this);

    std::cout << "IngestScheduler: started (workers=" << pool_->getThreadCount()
              << ", tick=" << config_.tick_interval_ms << "ms)" << std::endl;
    return true;
}

void IngestScheduler::stop(bool wait_completion) {
    if (!running_.load()) {
        return;
    }

    std::cout << "IngestScheduler: stopping..." << std::endl;

    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_requested_.store(true);
    }
    loop_cv_.notify_all();

    if (scheduler_thread_ && scheduler_thread_->joinable()) {
        scheduler_thread_->join();
    }

    if (!wait_completion) {
        std::lock_guard<std::mutex> lock(series_mutex_);
        for (auto& [id, entry] : series_) {
            if (entry.in_progress) {
                entry.cancel.cancel();
            }
        }
    }
    pool_->waitIdle();

    running_.store(false);
    std::cout << "IngestScheduler: stopped" << std::endl;
}

// ========== Series Registration ==========

bool IngestScheduler::addSeries(const SeriesConfig& config) {
    std::lock_guard<std::mutex> lock(series_mutex_);
    const std::string& id = config.series.series_id;
    if (series_.count(id) > 0) {
        return false;
    }
    SeriesEntry entry;
    entry.config = config;
    series_.emplace(id, std::move(entry));
    std::cout << "IngestScheduler: registered " << config.describe() << std::endl;
    return true;
}

bool IngestScheduler::updateSeries(const SeriesConfig& config) {
    std::lock_guard<std::mutex> lock(series_mutex_);
    auto it = series_.find(config.series.series_id);
    if (it == series_.end()) {
        return false;
    }
    SeriesEntry& entry = it->second;
    entry.config = config;
    ++entry.generation;
    config_.retry.resetAttention(entry.retry, clock_());
    std::cout << "IngestScheduler: updated " << config.describe() << std::endl;
    return true;
}

bool IngestScheduler::removeSeries(const std::string& series_id) {
    std::lock_guard<std::mutex> lock(series_mutex_);
    auto it = series_.find(series_id);
    if (it == series_.end()) {
        return false;
    }
    it->second.cancel.cancel();
    series_.erase(it);
    return true;
}

// ========== Scheduling ==========

size_t IngestScheduler::pollOnce(int64_t now) {
    size_t submitted = 0;
    std::lock_guard<std::mutex> lock(series_mutex_);

    for (auto& [id, entry] : series_) {
        if (entry.in_progress || !config_.retry.isEligible(entry.retry, now)) {
            continue;
        }

        entry.in_progress = true;
        entry.cancel = CancellationToken();

        SeriesConfig config = entry.config;
        CancellationToken cancel = entry.cancel;
        uint64_t generation = entry.generation;
        std::string series_id = id;

        bool queued = pool_->submitTask([this, config, cancel, generation, series_id]() {
            RunReport report = pipeline_->runOnce(config, clock_(), cancel);
            handleReport(series_id, generation, report);
        });

        if (!queued) {
            entry.in_progress = false;
            std::cerr << "IngestScheduler: [" << id << "] worker pool rejected run" << std::endl;
            continue;
        }
        ++metrics_.runs_started;
        ++submitted;
    }
    return submitted;
}

void IngestScheduler::waitIdle() {
    pool_->waitIdle();
}

void IngestScheduler::onRunCompleted(RunCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

// ========== Query & Monitoring ==========

std::optional<SeriesStatus> IngestScheduler::getSeriesStatus(const std::string& series_id) const {
    std::lock_guard<std::mutex> lock(series_mutex_);
    auto it = series_.find(series_id);
    if (it == series_.end()) {
        return std::nullopt;
    }
    return toStatus(it->first, it->second);
}

std::vector<SeriesStatus> IngestScheduler::getAllSeriesStatus() const {
    std::lock_guard<std::mutex> lock(series_mutex_);
    std::vector<SeriesStatus> result;
    result.reserve(series_.size());
    for (const auto& [id, entry] : series_) {
        result.push_back(toStatus(id, entry));
    }
    return result;
}

SchedulerMetrics IngestScheduler::getMetrics() const {
    std::lock_guard<std::mutex> lock(series_mutex_);
    SchedulerMetrics metrics = metrics_;
    metrics.series_needing_attention = 0;
    for (const auto& [id, entry] : series_) {
        if (entry.retry.needs_attention) {
            ++metrics.series_needing_attention;
        }
    }
    return metrics;
}

// ========== Internal Methods ==========

void IngestScheduler::schedulerLoop() {
    while (!stop_requested_.load()) {
        try {
            pollOnce(clock_());
        } catch (const std::exception& e) {
            std::cerr << "IngestScheduler: poll failed: " << e.what() << std::endl;
        }

        std::unique_lock<std::mutex> lock(loop_mutex_);
        loop_cv_.wait_for(lock,
                          std::chrono::milliseconds(config_.tick_interval_ms),
                          [this]() { return stop_requested_.load(); });
    }
}

void IngestScheduler::handleReport(const std::string& series_id,
                                   uint64_t generation,
                                   const RunReport& report) {
    int64_t now = clock_();
    {
        std::lock_guard<std::mutex> lock(series_mutex_);
        auto it = series_.find(series_id);
        if (it != series_.end()) {
            SeriesEntry& entry = it->second;
            entry.in_progress = false;
            entry.last_report = report;

            // A configuration change during the run already reset the retry state
            if (entry.generation == generation) {
                const RetryPolicy& retry = config_.retry;
                switch (report.status) {
                    case RunStatus::Success:
                        retry.onSuccess(entry.retry, now, entry.config.poll_interval_ms);
                        break;
                    case RunStatus::TransientFailure:
                    case RunStatus::Cancelled:
                        retry.onTransientFailure(entry.retry, now,
                                                 entry.config.poll_interval_ms, report.message);
                        break;
                    case RunStatus::PermanentFailure:
                    case RunStatus::CorruptState:
                        retry.onPermanentFailure(entry.retry, report.message);
                        std::cerr << "IngestScheduler: [" << series_id
                                  << "] needs attention: " << report.message << std::endl;
                        break;
                    case RunStatus::Busy:
                        break;
                }
            }
        }

        switch (report.status) {
            case RunStatus::Success: ++metrics_.runs_succeeded; break;
            case RunStatus::Cancelled: ++metrics_.runs_cancelled; break;
            case RunStatus::Busy: break;
            default: ++metrics_.runs_failed; break;
        }
    }

    std::vector<RunCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = callbacks_;
    }
    for (const auto& callback : callbacks) {
        callback(report);
    }
}

SeriesStatus IngestScheduler::toStatus(const std::string& series_id, const SeriesEntry& entry) {
    SeriesStatus status;
    status.series_id = series_id;
    status.retry = entry.retry;
    status.in_progress = entry.in_progress;
    status.last_report = entry.last_report;
    return status;
}

} // namespace compute
} // namespace meterstat
