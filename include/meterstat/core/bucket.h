#pragma once

#include "sample.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace meterstat {

/**
 * @brief Hourly statistics of a power demand series (kW)
 *
 * sum is kept alongside mean so merged buckets recompute the mean from
 * totals instead of from rounded means.
 */
struct PowerStats {
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double sum = 0.0;
    uint64_t sample_count = 0;

    bool operator==(const PowerStats& other) const {
        return min == other.min && max == other.max && mean == other.mean &&
               sum == other.sum && sample_count == other.sample_count;
    }
    bool operator!=(const PowerStats& other) const { return !(*this == other); }
};

/**
 * @brief Hourly statistics of an energy consumption series (kWh)
 *
 * cumulative_sum is the running total over every bucket of the series up to
 * and including this one.
 */
struct EnergyStats {
    double sum = 0.0;
    double mean = 0.0;
    uint64_t sample_count = 0;
    double cumulative_sum = 0.0;

    bool operator==(const EnergyStats& other) const {
        return sum == other.sum && mean == other.mean &&
               sample_count == other.sample_count &&
               cumulative_sum == other.cumulative_sum;
    }
    bool operator!=(const EnergyStats& other) const { return !(*this == other); }
};

/**
 * @brief Reduced statistic of one bucket, tagged by series kind
 */
using BucketStats = std::variant<PowerStats, EnergyStats>;

/**
 * @brief Kind a BucketStats alternative belongs to
 */
inline SeriesKind stats_kind(const BucketStats& stats) {
    return std::holds_alternative<PowerStats>(stats) ? SeriesKind::PowerDemand
                                                     : SeriesKind::EnergyConsumption;
}

/**
 * @brief Sample count regardless of the stats alternative
 */
inline uint64_t stats_sample_count(const BucketStats& stats) {
    return std::visit([](const auto& s) { return s.sample_count; }, stats);
}

/**
 * @brief One hour-aligned window [hour_start, hour_start + 1h) of a series
 *
 * An open bucket keeps the samples it was reduced from in `slots`
 * (sample timestamp -> latest value) so that a re-fetch of the same samples
 * does not count them twice. Closed buckets are immutable and carry no slots.
 */
struct Bucket {
    int64_t hour_start = 0;
    bool closed = false;
    BucketStats stats;
    std::map<int64_t, double> slots;

    Bucket() = default;

    Bucket(int64_t hour, const BucketStats& s, bool is_closed = false)
        : hour_start(hour), closed(is_closed), stats(s) {}

    int64_t hour_end() const { return hour_start + kMillisPerHour; }

    uint64_t sample_count() const { return stats_sample_count(stats); }

    const PowerStats* power() const { return std::get_if<PowerStats>(&stats); }
    const EnergyStats* energy() const { return std::get_if<EnergyStats>(&stats); }

    bool operator==(const Bucket& other) const {
        return hour_start == other.hour_start && closed == other.closed &&
               stats == other.stats && slots == other.slots;
    }
    bool operator!=(const Bucket& other) const { return !(*this == other); }
};

/**
 * @brief Persisted state of one series as read at the start of a run
 *
 * - watermark: hour_start of the latest contiguous closed and persisted bucket
 * - anchor: the bucket at the watermark (source of the cumulative sum)
 * - pending: persisted buckets after the watermark, ascending by hour
 */
struct SeriesState {
    std::string series_id;
    SeriesKind kind = SeriesKind::PowerDemand;
    std::optional<int64_t> watermark;
    std::optional<Bucket> anchor;
    std::vector<Bucket> pending;

    SeriesState() = default;

    SeriesState(const std::string& id, SeriesKind k)
        : series_id(id), kind(k) {}

    /**
     * @brief Apply a merge batch the way the statistics store does
     *
     * Buckets are upserted by hour, the watermark only moves forward, and
     * anchor/pending are rebuilt around the resulting watermark.
     */
    void apply(const std::vector<Bucket>& buckets, std::optional<int64_t> new_watermark);
};

} // namespace meterstat
