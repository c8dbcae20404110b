#include "meterstat/algorithms/hourly_aggregator.h"
#include "meterstat/algorithms/reducers.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <stdexcept>

namespace meterstat {

namespace {

BucketStats empty_stats(SeriesKind kind) {
    if (kind == SeriesKind::PowerDemand) {
        return PowerStats{};
    }
    return EnergyStats{};
}

bool nearly_equal(double a, double b) {
    double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    return std::fabs(a - b) <= 1e-9 * scale;
}

} // namespace

HourlyAggregator::HourlyAggregator(const AlgorithmConfig& config)
    : BucketAlgorithm(config),
      passes_(0),
      samples_processed_(0),
      misaligned_dropped_(0),
      late_discarded_(0),
      buckets_emitted_(0) {

    late_arrival_margin_ = std::stoll(get_config("late_arrival_margin_ms",
                                                 std::to_string(kMillisPerHour)));
    if (late_arrival_margin_ < 0) {
        throw std::invalid_argument("late_arrival_margin_ms must not be negative");
    }

    std::string exclude_str = get_config("exclude_invalid_samples", "false");
    exclude_invalid_ = (exclude_str == "true" || exclude_str == "1");
}

AggregationResult HourlyAggregator::aggregate(const Series& series,
                                              const SeriesState& prior,
                                              const std::vector<Sample>& samples) {
    validate_prior(series, prior);

    AggregationResult result;
    result.new_watermark = prior.watermark;

    const SeriesKind kind = series.kind;
    const int64_t granularity = native_granularity(kind);

    // Dedup by timestamp; a later sample in fetch order replaces an earlier one
    std::map<int64_t, Sample> latest;
    int64_t duplicates = 0;
    int64_t invalid_excluded = 0;
    for (const auto& sample : samples) {
        if (exclude_invalid_ && sample.is_invalid()) {
            ++invalid_excluded;
            continue;
        }
        auto inserted = latest.insert_or_assign(sample.timestamp, sample);
        if (!inserted.second) {
            ++duplicates;
        }
    }

    std::map<int64_t, Bucket> working;
    for (const auto& bucket : prior.pending) {
        working[bucket.hour_start] = bucket;
    }

    // Assign samples to hour buckets
    std::set<int64_t> touched;
    int64_t late = 0;
    int64_t corrections = 0;
    for (const auto& [ts, sample] : latest) {
        if (!is_aligned(ts, granularity)) {
            MisalignedSampleError error(sample, granularity);
            std::cerr << "HourlyAggregator: [" << series.series_id << "] dropping "
                      << error.what() << std::endl;
            result.misaligned.push_back(error);
            continue;
        }

        if (!result.latest_observed || ts > *result.latest_observed) {
            result.latest_observed = ts;
        }

        int64_t hour = floor_to_hour(ts);
        if (prior.watermark && hour <= *prior.watermark) {
            ++late;
            continue;
        }

        auto it = working.find(hour);
        if (it != working.end() && it->second.closed) {
            ++late;
            continue;
        }
        if (it == working.end()) {
            it = working.emplace(hour, Bucket(hour, empty_stats(kind))).first;
        }

        auto slot = it->second.slots.find(ts);
        if (slot == it->second.slots.end()) {
            it->second.slots.emplace(ts, sample.value);
        } else if (slot->second != sample.value) {
            slot->second = sample.value;
            ++corrections;
        }
        touched.insert(hour);
    }

    // Closed hours come back with every lookback re-fetch
    if (late > 0) {
        std::cout << "HourlyAggregator: [" << series.series_id << "] skipped " << late
                  << " sample(s) for closed hours" << std::endl;
    }

    for (int64_t hour : touched) {
        recompute_bucket(working[hour], kind);
    }

    if (kind == SeriesKind::EnergyConsumption) {
        rebuild_cumulative_chain(series, working, prior);
    }

    int64_t closed = 0;
    if (result.latest_observed) {
        closed = close_buckets(working, prior, kind, *result.latest_observed);
    }

    result.new_watermark = advance_watermark(working, prior);

    // Emit only what differs from the persisted state
    std::map<int64_t, const Bucket*> persisted;
    for (const auto& bucket : prior.pending) {
        persisted[bucket.hour_start] = &bucket;
    }
    for (const auto& [hour, bucket] : working) {
        auto it = persisted.find(hour);
        if (it == persisted.end() || *it->second != bucket) {
            result.buckets.push_back(bucket);
        }
    }

    result.stats = {
        {"samples_in", static_cast<int64_t>(samples.size())},
        {"duplicates_replaced", duplicates},
        {"corrections", corrections},
        {"invalid_excluded", invalid_excluded},
        {"misaligned_dropped", static_cast<int64_t>(result.misaligned.size())},
        {"late_discarded", late},
        {"buckets_closed", closed},
        {"buckets_emitted", static_cast<int64_t>(result.buckets.size())}
    };

    ++passes_;
    samples_processed_ += static_cast<int64_t>(samples.size());
    misaligned_dropped_ += static_cast<int64_t>(result.misaligned.size());
    late_discarded_ += late;
    buckets_emitted_ += static_cast<int64_t>(result.buckets.size());

    return result;
}

void HourlyAggregator::reset() {
    passes_ = 0;
    samples_processed_ = 0;
    misaligned_dropped_ = 0;
    late_discarded_ = 0;
    buckets_emitted_ = 0;
}

std::map<std::string, int64_t> HourlyAggregator::get_stats() const {
    return {
        {"passes", passes_},
        {"samples_processed", samples_processed_},
        {"misaligned_dropped", misaligned_dropped_},
        {"late_discarded", late_discarded_},
        {"buckets_emitted", buckets_emitted_}
    };
}

void HourlyAggregator::validate_prior(const Series& series, const SeriesState& prior) const {
    if (!prior.series_id.empty() && prior.series_id != series.series_id) {
        throw std::invalid_argument("HourlyAggregator: state of series '" + prior.series_id +
                                    "' passed for series '" + series.series_id + "'");
    }

    if (prior.watermark.has_value() != prior.anchor.has_value() ||
        (prior.anchor && prior.anchor->hour_start != *prior.watermark)) {
        throw std::invalid_argument("HourlyAggregator: watermark of series '" +
                                    series.series_id + "' has no matching anchor bucket");
    }

    auto check_kind = [&series](const Bucket& bucket) {
        if (stats_kind(bucket.stats) != series.kind) {
            throw std::invalid_argument("HourlyAggregator: persisted bucket at " +
                                        format_iso8601(bucket.hour_start) +
                                        " does not match kind '" +
                                        series_kind_to_string(series.kind) + "'");
        }
    };

    if (prior.anchor) {
        check_kind(*prior.anchor);
    }

    std::optional<int64_t> previous_hour = prior.watermark;
    for (const auto& bucket : prior.pending) {
        check_kind(bucket);
        if (previous_hour && bucket.hour_start <= *previous_hour) {
            throw std::invalid_argument("HourlyAggregator: pending buckets of series '" +
                                        series.series_id + "' are not ascending after the watermark");
        }
        if (!bucket.closed && bucket.slots.size() != bucket.sample_count()) {
            throw std::invalid_argument("HourlyAggregator: open bucket at " +
                                        format_iso8601(bucket.hour_start) +
                                        " lost its samples");
        }
        previous_hour = bucket.hour_start;
    }

    if (series.kind != SeriesKind::EnergyConsumption) {
        return;
    }

    double running = prior.anchor ? prior.anchor->energy()->cumulative_sum : 0.0;
    for (const auto& bucket : prior.pending) {
        const EnergyStats* energy = bucket.energy();
        double expected = running + energy->sum;
        if (energy->cumulative_sum < running && !nearly_equal(energy->cumulative_sum, running)) {
            throw NonMonotonicCumulativeSumError(
                series.series_id, bucket.hour_start,
                "cumulative sum " + std::to_string(energy->cumulative_sum) +
                " is below " + std::to_string(running));
        }
        if (!nearly_equal(energy->cumulative_sum, expected)) {
            throw NonMonotonicCumulativeSumError(
                series.series_id, bucket.hour_start,
                "expected " + std::to_string(expected) + ", found " +
                std::to_string(energy->cumulative_sum) + " after " + std::to_string(running));
        }
        running = energy->cumulative_sum;
    }
}

void HourlyAggregator::recompute_bucket(Bucket& bucket, SeriesKind kind) const {
    std::vector<double> values;
    values.reserve(bucket.slots.size());
    for (const auto& [ts, value] : bucket.slots) {
        values.push_back(value);
    }

    if (kind == SeriesKind::PowerDemand) {
        const PowerStats* prior = bucket.power();
        PowerStats recomputed = reduce_power(values);
        bucket.stats = prior ? merge_power(*prior, recomputed) : recomputed;
    } else {
        // Cumulative sum is filled in by rebuild_cumulative_chain()
        bucket.stats = reduce_energy(values, 0.0);
    }
}

void HourlyAggregator::rebuild_cumulative_chain(const Series& series,
                                                std::map<int64_t, Bucket>& working,
                                                const SeriesState& prior) const {
    double running = prior.anchor ? prior.anchor->energy()->cumulative_sum : 0.0;
    for (auto& [hour, bucket] : working) {
        auto* energy = std::get_if<EnergyStats>(&bucket.stats);
        if (!bucket.closed) {
            energy->cumulative_sum = running + energy->sum;
            if (energy->cumulative_sum < running && !nearly_equal(energy->cumulative_sum, running)) {
                throw NonMonotonicCumulativeSumError(
                    series.series_id, hour,
                    "hourly sum " + std::to_string(energy->sum) + " would lower the cumulative sum " +
                    std::to_string(running));
            }
        }
        running = energy->cumulative_sum;
    }
}

int64_t HourlyAggregator::close_buckets(std::map<int64_t, Bucket>& working,
                                        const SeriesState& prior,
                                        SeriesKind kind,
                                        int64_t latest_observed) const {
    int64_t closed = 0;
    for (auto& [hour, bucket] : working) {
        if (bucket.closed) {
            continue;
        }
        if (bucket.hour_end() + late_arrival_margin_ > latest_observed) {
            continue;
        }

        // An energy bucket is final only once its predecessor's cumulative sum is
        if (kind == SeriesKind::EnergyConsumption) {
            int64_t predecessor = hour - kMillisPerHour;
            bool first_of_series = !prior.watermark && hour == working.begin()->first;
            bool anchored = prior.watermark && *prior.watermark == predecessor;
            auto it = working.find(predecessor);
            bool predecessor_closed = it != working.end() && it->second.closed;
            if (!first_of_series && !anchored && !predecessor_closed) {
                continue;
            }
        }

        bucket.closed = true;
        bucket.slots.clear();
        ++closed;
    }
    return closed;
}

std::optional<int64_t> HourlyAggregator::advance_watermark(
    const std::map<int64_t, Bucket>& working,
    const SeriesState& prior) const {

    std::optional<int64_t> watermark = prior.watermark;
    if (!watermark && working.empty()) {
        return watermark;
    }

    int64_t next = watermark ? *watermark + kMillisPerHour : working.begin()->first;
    for (;;) {
        auto it = working.find(next);
        if (it == working.end() || !it->second.closed) {
            break;
        }
        watermark = next;
        next += kMillisPerHour;
    }
    return watermark;
}

} // namespace meterstat
