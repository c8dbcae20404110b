#pragma once

#include "algorithm_base.h"

namespace meterstat {

/**
 * @brief Hourly aggregator
 *
 * Buckets a possibly gappy, possibly overlapping stream of samples into
 * hour-aligned buckets, reduces each bucket according to the series kind and
 * reconciles the result with the buckets already persisted for the series.
 *
 * Configuration parameters:
 * - late_arrival_margin_ms: time an hour stays open after its end, measured
 *   against the latest observed sample (default 3600000)
 * - exclude_invalid_samples: "true" drops samples the provider flagged
 *   invalid (default "false")
 *
 * Not thread-safe; use one instance per run.
 */
class HourlyAggregator : public BucketAlgorithm {
public:
    explicit HourlyAggregator(const AlgorithmConfig& config = {});

    /**
     * @brief Aggregate one polling window
     * @return Changed buckets and proposed watermark
     * @throws NonMonotonicCumulativeSumError if the energy chain is broken or decreases
     * @throws std::invalid_argument if the persisted state does not belong to the series
     */
    AggregationResult aggregate(const Series& series,
                                const SeriesState& prior,
                                const std::vector<Sample>& samples) override;

    void reset() override;

    std::map<std::string, int64_t> get_stats() const override;

    int64_t late_arrival_margin() const { return late_arrival_margin_; }
    bool exclude_invalid_samples() const { return exclude_invalid_; }

private:
    /**
     * @brief Check the persisted state before merging into it
     */
    void validate_prior(const Series& series, const SeriesState& prior) const;

    /**
     * @brief Recompute the stats of a bucket from its slots
     */
    void recompute_bucket(Bucket& bucket, SeriesKind kind) const;

    /**
     * @brief Rebuild the cumulative sums of all open energy buckets
     * @throws NonMonotonicCumulativeSumError if the chain would decrease
     */
    void rebuild_cumulative_chain(const Series& series,
                                  std::map<int64_t, Bucket>& working,
                                  const SeriesState& prior) const;

    /**
     * @brief Close every bucket whose end plus margin has been observed
     * @return Number of buckets closed
     */
    int64_t close_buckets(std::map<int64_t, Bucket>& working,
                          const SeriesState& prior,
                          SeriesKind kind,
                          int64_t latest_observed) const;

    /**
     * @brief Latest hour of the contiguous closed run after the prior watermark
     */
    std::optional<int64_t> advance_watermark(const std::map<int64_t, Bucket>& working,
                                             const SeriesState& prior) const;

    // Configuration
    int64_t late_arrival_margin_;
    bool exclude_invalid_;

    // Statistics
    int64_t passes_;
    int64_t samples_processed_;
    int64_t misaligned_dropped_;
    int64_t late_discarded_;
    int64_t buckets_emitted_;
};

} // namespace meterstat
