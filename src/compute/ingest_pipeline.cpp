#include "meterstat/compute/ingest_pipeline.h"
#include "meterstat/algorithms/hourly_aggregator.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace meterstat {
namespace compute {

std::string runStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::Success: return "success";
        case RunStatus::TransientFailure: return "transient_failure";
        case RunStatus::PermanentFailure: return "permanent_failure";
        case RunStatus::CorruptState: return "corrupt_state";
        case RunStatus::Cancelled: return "cancelled";
        case RunStatus::Busy: return "busy";
    }
    return "unknown";
}

namespace {

/**
 * @brief Holds the per-series run slot for the lifetime of a run
 */
class SingleFlightGuard {
public:
    SingleFlightGuard(std::set<std::string>& in_flight, std::mutex& mutex,
                      const std::string& series_id)
        : in_flight_(in_flight), mutex_(mutex), series_id_(series_id), acquired_(false) {
        std::lock_guard<std::mutex> lock(mutex_);
        acquired_ = in_flight_.insert(series_id_).second;
    }

    ~SingleFlightGuard() {
        if (acquired_) {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(series_id_);
        }
    }

    SingleFlightGuard(const SingleFlightGuard&) = delete;
    SingleFlightGuard& operator=(const SingleFlightGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    std::set<std::string>& in_flight_;
    std::mutex& mutex_;
    std::string series_id_;
    bool acquired_;
};

} // namespace

IngestPipeline::IngestPipeline(StatisticsStore* store, const SampleFetcher* fetcher)
    : store_(store), fetcher_(fetcher) {
    if (!store_ || !fetcher_) {
        throw std::invalid_argument("IngestPipeline: store and fetcher are required");
    }
}

RunReport IngestPipeline::runOnce(const SeriesConfig& config,
                                  int64_t now,
                                  const CancellationToken& cancel) {
    const std::string& series_id = config.series.series_id;
    SingleFlightGuard guard(in_flight_, in_flight_mutex_, series_id);
    if (!guard.acquired()) {
        busy_rejections_.fetch_add(1);
        RunReport report;
        report.series_id = series_id;
        report.status = RunStatus::Busy;
        report.message = "run already in progress";
        return report;
    }

    runs_.fetch_add(1);
    RunReport report = execute(config, now, cancel);
    if (report.ok()) {
        successes_.fetch_add(1);
    } else {
        failures_.fetch_add(1);
    }
    logReport(report);
    return report;
}

TimeRange IngestPipeline::fetchWindow(const SeriesConfig& config,
                                      const std::optional<int64_t>& watermark,
                                      int64_t now) {
    int64_t resume = watermark ? *watermark + kMillisPerHour : config.history_start_ms;
    int64_t from = std::max(config.history_start_ms, std::min(resume, now - config.lookback_ms));
    return TimeRange(from, now);
}

bool IngestPipeline::isRunning(const std::string& series_id) const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.count(series_id) > 0;
}

std::map<std::string, uint64_t> IngestPipeline::getStats() const {
    return {
        {"runs", runs_.load()},
        {"successes", successes_.load()},
        {"failures", failures_.load()},
        {"busy_rejections", busy_rejections_.load()}
    };
}

RunReport IngestPipeline::execute(const SeriesConfig& config,
                                  int64_t now,
                                  const CancellationToken& cancel) {
    const Series& series = config.series;

    RunReport report;
    report.series_id = series.series_id;

    try {
        SeriesState state = store_->load_state(series.series_id, series.kind);
        report.old_watermark = state.watermark;
        report.new_watermark = state.watermark;

        report.window = fetchWindow(config, state.watermark, now);
        if (!report.window.valid()) {
            report.message = "history starts after " + format_iso8601(now);
            return report;
        }

        SampleStream stream = fetcher_->fetch(series, config.api_key,
                                              report.window.start_time,
                                              report.window.end_time,
                                              now, cancel);
        std::vector<Sample> samples = stream.drain();
        report.samples_fetched = samples.size();
        report.pages_fetched = stream.pages_fetched();

        if (cancel.is_cancelled()) {
            throw RunCancelledError("run cancelled after fetch");
        }

        AlgorithmConfig aggregator_config = {
            {"late_arrival_margin_ms", std::to_string(config.late_arrival_margin_ms)},
            {"exclude_invalid_samples", config.exclude_invalid_samples ? "true" : "false"}
        };
        HourlyAggregator aggregator(aggregator_config);

        AggregationResult result;
        try {
            result = aggregator.aggregate(series, state, samples);
        } catch (const std::invalid_argument& e) {
            report.status = RunStatus::CorruptState;
            report.message = e.what();
            return report;
        }

        report.misaligned = result.misaligned.size();
        auto late = result.stats.find("late_discarded");
        report.late_discarded = late != result.stats.end() ? static_cast<uint64_t>(late->second) : 0;

        bool watermark_moved = result.new_watermark != state.watermark;
        if (!result.buckets.empty() || watermark_moved) {
            store_->merge(series.series_id, series.kind, result.buckets, result.new_watermark);
        }
        report.buckets_written = result.buckets.size();
        report.new_watermark = result.new_watermark;
        report.status = RunStatus::Success;

    } catch (const FetchError& e) {
        report.status = e.is_transient() ? RunStatus::TransientFailure : RunStatus::PermanentFailure;
        report.message = e.what();
    } catch (const RunCancelledError& e) {
        report.status = RunStatus::Cancelled;
        report.message = e.what();
    } catch (const NonMonotonicCumulativeSumError& e) {
        report.status = RunStatus::CorruptState;
        report.message = e.what();
    } catch (const PersistError& e) {
        report.status = RunStatus::TransientFailure;
        report.message = std::string("persist failed: ") + e.what();
    } catch (const std::invalid_argument& e) {
        report.status = RunStatus::PermanentFailure;
        report.message = e.what();
    } catch (const std::exception& e) {
        report.status = RunStatus::TransientFailure;
        report.message = e.what();
    }

    if (!report.ok()) {
        report.new_watermark = report.old_watermark;
        report.buckets_written = 0;
    }
    return report;
}

void IngestPipeline::logReport(const RunReport& report) const {
    auto watermark_str = [](const std::optional<int64_t>& wm) {
        return wm ? format_iso8601(*wm) : std::string("none");
    };

    if (report.ok()) {
        std::cout << "IngestPipeline: [" << report.series_id << "] "
                  << report.samples_fetched << " samples, "
                  << report.buckets_written << " buckets written, watermark "
                  << watermark_str(report.old_watermark) << " -> "
                  << watermark_str(report.new_watermark) << std::endl;
    } else {
        std::cerr << "IngestPipeline: [" << report.series_id << "] "
                  << runStatusToString(report.status) << ": " << report.message << std::endl;
    }
}

} // namespace compute
} // namespace meterstat
