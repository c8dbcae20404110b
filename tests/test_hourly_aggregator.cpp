#include "meterstat/algorithms/hourly_aggregator.h"
#include <gtest/gtest.h>

namespace meterstat {
namespace test {

class HourlyAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = *parse_iso8601("2024-03-01T00:00:00Z");
        power_ = Series("LU1_1-1:1.29.0_pwr_hourly", "LU1", "E1", "1-1:1.29.0",
                        SeriesKind::PowerDemand);
        energy_ = Series("LU1_1-1:1.29.0_energy_hourly", "LU1", "E1", "1-1:1.29.0",
                         SeriesKind::EnergyConsumption);
    }

    int64_t at(int hour, int minute = 0) const {
        return base_ + hour * kMillisPerHour + minute * kMillisPerMinute;
    }

    std::vector<Sample> power_hour(int hour, const std::vector<double>& values) const {
        std::vector<Sample> samples;
        for (size_t i = 0; i < values.size(); ++i) {
            samples.emplace_back(at(hour, static_cast<int>(i) * 15), values[i]);
        }
        return samples;
    }

    static const Bucket* find(const AggregationResult& result, int64_t hour) {
        for (const auto& bucket : result.buckets) {
            if (bucket.hour_start == hour) {
                return &bucket;
            }
        }
        return nullptr;
    }

    static SeriesState after(SeriesState state, const AggregationResult& result) {
        state.apply(result.buckets, result.new_watermark);
        return state;
    }

    Bucket energy_anchor(int hour, double sum, double cumulative) const {
        return Bucket(at(hour), EnergyStats{sum, sum, 1, cumulative}, true);
    }

    int64_t base_ = 0;
    Series power_;
    Series energy_;
};

TEST_F(HourlyAggregatorTest, PowerBucketReducesMinMaxMean) {
    HourlyAggregator aggregator;
    SeriesState prior(power_.series_id, power_.kind);

    auto result = aggregator.aggregate(power_, prior, power_hour(10, {2.0, 3.0, 2.5, 4.0}));

    ASSERT_EQ(result.buckets.size(), 1u);
    const Bucket& bucket = result.buckets[0];
    EXPECT_EQ(bucket.hour_start, at(10));
    EXPECT_FALSE(bucket.closed);
    ASSERT_NE(bucket.power(), nullptr);
    EXPECT_DOUBLE_EQ(bucket.power()->min, 2.0);
    EXPECT_DOUBLE_EQ(bucket.power()->max, 4.0);
    EXPECT_DOUBLE_EQ(bucket.power()->mean, 2.875);
    EXPECT_EQ(bucket.sample_count(), 4u);
    EXPECT_EQ(bucket.slots.size(), 4u);
    EXPECT_FALSE(result.new_watermark.has_value());
    ASSERT_TRUE(result.latest_observed.has_value());
    EXPECT_EQ(*result.latest_observed, at(10, 45));
}

TEST_F(HourlyAggregatorTest, BucketClosesOnceMarginObserved) {
    HourlyAggregator aggregator;
    SeriesState prior(power_.series_id, power_.kind);

    auto samples = power_hour(10, {2.0, 3.0, 2.5, 4.0});
    samples.emplace_back(at(12), 1.0);

    auto result = aggregator.aggregate(power_, prior, samples);

    const Bucket* closed = find(result, at(10));
    ASSERT_NE(closed, nullptr);
    EXPECT_TRUE(closed->closed);
    EXPECT_TRUE(closed->slots.empty());
    EXPECT_EQ(closed->sample_count(), 4u);

    const Bucket* open = find(result, at(12));
    ASSERT_NE(open, nullptr);
    EXPECT_FALSE(open->closed);

    ASSERT_TRUE(result.new_watermark.has_value());
    EXPECT_EQ(*result.new_watermark, at(10));
}

TEST_F(HourlyAggregatorTest, MarginDelaysClosing) {
    HourlyAggregator aggregator(AlgorithmConfig{{"late_arrival_margin_ms", std::to_string(2 * kMillisPerHour)}});
    SeriesState prior(power_.series_id, power_.kind);

    auto samples = power_hour(10, {2.0});
    samples.emplace_back(at(12), 1.0);

    auto result = aggregator.aggregate(power_, prior, samples);
    ASSERT_NE(find(result, at(10)), nullptr);
    EXPECT_FALSE(find(result, at(10))->closed);
    EXPECT_FALSE(result.new_watermark.has_value());

    HourlyAggregator no_margin(AlgorithmConfig{{"late_arrival_margin_ms", "0"}});
    result = no_margin.aggregate(power_, prior, power_hour(10, {2.0, 3.0, 2.5, 4.0}));
    EXPECT_FALSE(find(result, at(10))->closed);

    auto with_next = power_hour(10, {2.0});
    with_next.emplace_back(at(11), 1.0);
    result = no_margin.aggregate(power_, prior, with_next);
    EXPECT_TRUE(find(result, at(10))->closed);
    EXPECT_FALSE(find(result, at(11))->closed);
}

TEST_F(HourlyAggregatorTest, ReingestingSameWindowIsNoOp) {
    HourlyAggregator aggregator;
    SeriesState state(power_.series_id, power_.kind);

    auto samples = power_hour(10, {2.0, 3.0, 2.5, 4.0});
    samples.emplace_back(at(12), 1.0);

    auto first = aggregator.aggregate(power_, state, samples);
    state = after(state, first);

    auto second = aggregator.aggregate(power_, state, samples);
    EXPECT_TRUE(second.buckets.empty());
    EXPECT_EQ(second.new_watermark, state.watermark);
    EXPECT_EQ(second.stats.at("late_discarded"), 4);

    SeriesState replayed = after(state, second);
    ASSERT_EQ(replayed.pending.size(), 1u);
    EXPECT_EQ(replayed.pending[0].sample_count(), 1u);
    EXPECT_EQ(replayed.anchor->sample_count(), 4u);
}

TEST_F(HourlyAggregatorTest, PartialHourMergesAcrossRuns) {
    HourlyAggregator aggregator;
    SeriesState state(power_.series_id, power_.kind);

    auto first = aggregator.aggregate(power_, state, power_hour(10, {2.0, 3.0}));
    state = after(state, first);
    ASSERT_EQ(state.pending.size(), 1u);
    EXPECT_EQ(state.pending[0].sample_count(), 2u);

    // Second run sees the whole hour again plus the rest
    auto second = aggregator.aggregate(power_, state, power_hour(10, {2.0, 3.0, 2.5, 4.0}));
    ASSERT_EQ(second.buckets.size(), 1u);
    const PowerStats* stats = second.buckets[0].power();
    EXPECT_EQ(stats->sample_count, 4u);
    EXPECT_DOUBLE_EQ(stats->sum, 11.5);
    EXPECT_DOUBLE_EQ(stats->mean, 2.875);
    EXPECT_DOUBLE_EQ(stats->max, 4.0);
}

TEST_F(HourlyAggregatorTest, CorrectionKeepsWidenedRange) {
    HourlyAggregator aggregator;
    SeriesState state(power_.series_id, power_.kind);
    state = after(state, aggregator.aggregate(power_, state, power_hour(10, {2.0, 3.0, 2.5, 4.0})));

    std::vector<Sample> correction = {Sample(at(10, 45), 3.0)};
    auto result = aggregator.aggregate(power_, state, correction);

    ASSERT_EQ(result.buckets.size(), 1u);
    const PowerStats* stats = result.buckets[0].power();
    EXPECT_EQ(stats->sample_count, 4u);
    EXPECT_DOUBLE_EQ(stats->sum, 10.5);
    EXPECT_DOUBLE_EQ(stats->mean, 2.625);
    EXPECT_DOUBLE_EQ(stats->min, 2.0);
    EXPECT_DOUBLE_EQ(stats->max, 4.0);
    EXPECT_EQ(result.stats.at("corrections"), 1);
}

TEST_F(HourlyAggregatorTest, LaterDuplicateWins) {
    HourlyAggregator aggregator;
    SeriesState prior(power_.series_id, power_.kind);

    std::vector<Sample> samples = {Sample(at(10), 2.0), Sample(at(10, 15), 1.0), Sample(at(10), 5.0)};
    auto result = aggregator.aggregate(power_, prior, samples);

    ASSERT_EQ(result.buckets.size(), 1u);
    const PowerStats* stats = result.buckets[0].power();
    EXPECT_EQ(stats->sample_count, 2u);
    EXPECT_DOUBLE_EQ(stats->max, 5.0);
    EXPECT_DOUBLE_EQ(stats->mean, 3.0);
    EXPECT_EQ(result.stats.at("duplicates_replaced"), 1);
}

TEST_F(HourlyAggregatorTest, MisalignedSampleIsDropped) {
    HourlyAggregator aggregator;
    SeriesState prior(power_.series_id, power_.kind);

    auto samples = power_hour(10, {2.0, 3.0});
    samples.emplace_back(at(10, 7), 100.0);

    auto result = aggregator.aggregate(power_, prior, samples);

    ASSERT_EQ(result.misaligned.size(), 1u);
    EXPECT_EQ(result.misaligned[0].sample().timestamp, at(10, 7));
    ASSERT_EQ(result.buckets.size(), 1u);
    EXPECT_EQ(result.buckets[0].sample_count(), 2u);
    EXPECT_DOUBLE_EQ(result.buckets[0].power()->max, 3.0);
    EXPECT_EQ(aggregator.get_stats().at("misaligned_dropped"), 1);
}

TEST_F(HourlyAggregatorTest, EnergyRequiresHourAlignment) {
    HourlyAggregator aggregator;
    SeriesState prior(energy_.series_id, energy_.kind);

    std::vector<Sample> samples = {Sample(at(10), 1.0), Sample(at(10, 15), 1.0)};
    auto result = aggregator.aggregate(energy_, prior, samples);

    EXPECT_EQ(result.misaligned.size(), 1u);
    ASSERT_EQ(result.buckets.size(), 1u);
    EXPECT_DOUBLE_EQ(result.buckets[0].energy()->sum, 1.0);
}

TEST_F(HourlyAggregatorTest, LateSampleForClosedHourIsDiscarded) {
    HourlyAggregator aggregator;
    SeriesState state(power_.series_id, power_.kind);

    auto samples = power_hour(10, {2.0, 3.0, 2.5, 4.0});
    samples.emplace_back(at(12), 1.0);
    state = after(state, aggregator.aggregate(power_, state, samples));
    ASSERT_EQ(state.watermark, at(10));

    std::vector<Sample> late = {Sample(at(10, 15), 9.0)};
    auto result = aggregator.aggregate(power_, state, late);

    EXPECT_EQ(find(result, at(10)), nullptr);
    EXPECT_EQ(result.stats.at("late_discarded"), 1);
    EXPECT_EQ(result.new_watermark, state.watermark);
}

TEST_F(HourlyAggregatorTest, RefetchedClosedHoursAreNotWarnings) {
    HourlyAggregator aggregator;
    SeriesState state(power_.series_id, power_.kind);

    auto samples = power_hour(10, {2.0, 3.0, 2.5, 4.0});
    samples.emplace_back(at(12), 1.0);
    state = after(state, aggregator.aggregate(power_, state, samples));
    ASSERT_EQ(state.watermark, at(10));

    ::testing::internal::CaptureStderr();
    auto result = aggregator.aggregate(power_, state, samples);
    std::string warnings = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(result.stats.at("late_discarded"), 4);
    EXPECT_TRUE(result.buckets.empty());
    EXPECT_EQ(warnings.find("closed hours"), std::string::npos) << warnings;
}

TEST_F(HourlyAggregatorTest, EnergyAccumulatesOntoAnchor) {
    HourlyAggregator aggregator;
    SeriesState prior(energy_.series_id, energy_.kind);
    prior.watermark = at(8);
    prior.anchor = energy_anchor(8, 2.0, 100.0);

    auto result = aggregator.aggregate(energy_, prior, {Sample(at(9), 5.0)});

    ASSERT_EQ(result.buckets.size(), 1u);
    const EnergyStats* stats = result.buckets[0].energy();
    ASSERT_NE(stats, nullptr);
    EXPECT_DOUBLE_EQ(stats->sum, 5.0);
    EXPECT_DOUBLE_EQ(stats->mean, 5.0);
    EXPECT_DOUBLE_EQ(stats->cumulative_sum, 105.0);
    EXPECT_FALSE(result.buckets[0].closed);
    EXPECT_EQ(result.new_watermark, at(8));
}

TEST_F(HourlyAggregatorTest, EnergyChainClosesInOrder) {
    HourlyAggregator aggregator;
    SeriesState prior(energy_.series_id, energy_.kind);
    prior.watermark = at(8);
    prior.anchor = energy_anchor(8, 2.0, 100.0);

    std::vector<Sample> samples = {Sample(at(9), 5.0), Sample(at(10), 3.0), Sample(at(11), 2.0)};
    auto result = aggregator.aggregate(energy_, prior, samples);

    ASSERT_EQ(result.buckets.size(), 3u);
    EXPECT_TRUE(result.buckets[0].closed);
    EXPECT_FALSE(result.buckets[1].closed);
    EXPECT_DOUBLE_EQ(result.buckets[0].energy()->cumulative_sum, 105.0);
    EXPECT_DOUBLE_EQ(result.buckets[1].energy()->cumulative_sum, 108.0);
    EXPECT_DOUBLE_EQ(result.buckets[2].energy()->cumulative_sum, 110.0);
    EXPECT_EQ(result.new_watermark, at(9));
}

TEST_F(HourlyAggregatorTest, EnergyGapBlocksClosingAndWatermark) {
    HourlyAggregator aggregator(AlgorithmConfig{{"late_arrival_margin_ms", "0"}});
    SeriesState prior(energy_.series_id, energy_.kind);

    std::vector<Sample> samples = {Sample(at(8), 1.0), Sample(at(10), 2.0), Sample(at(12), 3.0)};
    auto result = aggregator.aggregate(energy_, prior, samples);

    ASSERT_EQ(result.buckets.size(), 3u);
    EXPECT_TRUE(result.buckets[0].closed);
    EXPECT_FALSE(result.buckets[1].closed);   // 09:00 missing, predecessor not final
    EXPECT_FALSE(result.buckets[2].closed);
    EXPECT_DOUBLE_EQ(result.buckets[2].energy()->cumulative_sum, 6.0);
    EXPECT_EQ(result.new_watermark, at(8));
}

TEST_F(HourlyAggregatorTest, MissingHourBlocksWatermarkUntilFilled) {
    HourlyAggregator aggregator(AlgorithmConfig{{"late_arrival_margin_ms", "0"}});
    SeriesState state(power_.series_id, power_.kind);

    std::vector<Sample> samples = {Sample(at(10), 1.0), Sample(at(12), 2.0), Sample(at(13), 3.0)};
    auto first = aggregator.aggregate(power_, state, samples);
    EXPECT_TRUE(find(first, at(10))->closed);
    EXPECT_TRUE(find(first, at(12))->closed);
    EXPECT_FALSE(find(first, at(13))->closed);
    EXPECT_EQ(first.new_watermark, at(10));
    state = after(state, first);

    std::vector<Sample> backfill = {Sample(at(11), 4.0), Sample(at(13), 3.0)};
    auto second = aggregator.aggregate(power_, state, backfill);
    EXPECT_TRUE(find(second, at(11))->closed);
    EXPECT_EQ(second.new_watermark, at(12));
}

TEST_F(HourlyAggregatorTest, WatermarkNeverMovesBackward) {
    HourlyAggregator aggregator;
    SeriesState prior(power_.series_id, power_.kind);
    prior.watermark = at(10);
    prior.anchor = Bucket(at(10), PowerStats{1.0, 1.0, 1.0, 1.0, 1}, true);

    auto result = aggregator.aggregate(power_, prior, {Sample(at(9), 7.0), Sample(at(11), 2.0)});

    ASSERT_TRUE(result.new_watermark.has_value());
    EXPECT_GE(*result.new_watermark, at(10));
    EXPECT_EQ(result.stats.at("late_discarded"), 1);

    result = aggregator.aggregate(power_, prior, {});
    EXPECT_EQ(result.new_watermark, at(10));
    EXPECT_TRUE(result.buckets.empty());
}

TEST_F(HourlyAggregatorTest, BrokenCumulativeChainIsRejected) {
    HourlyAggregator aggregator;
    SeriesState prior(energy_.series_id, energy_.kind);
    prior.watermark = at(8);
    prior.anchor = energy_anchor(8, 2.0, 100.0);

    Bucket corrupt(at(9), EnergyStats{5.0, 5.0, 1, 90.0});
    corrupt.slots[at(9)] = 5.0;
    prior.pending.push_back(corrupt);

    EXPECT_THROW(aggregator.aggregate(energy_, prior, {Sample(at(10), 1.0)}),
                 NonMonotonicCumulativeSumError);
}

TEST_F(HourlyAggregatorTest, DecreasingPersistedChainIsRejected) {
    HourlyAggregator aggregator;
    SeriesState prior(energy_.series_id, energy_.kind);
    prior.watermark = at(8);
    prior.anchor = energy_anchor(8, 2.0, 100.0);

    // consistent with its own sum, but lower than the anchor
    Bucket lower(at(9), EnergyStats{-50.0, -50.0, 1, 50.0});
    lower.slots[at(9)] = -50.0;
    prior.pending.push_back(lower);

    EXPECT_THROW(aggregator.aggregate(energy_, prior, {}), NonMonotonicCumulativeSumError);
}

TEST_F(HourlyAggregatorTest, NegativeHourlySumIsNeverClosed) {
    HourlyAggregator aggregator(AlgorithmConfig{{"late_arrival_margin_ms", "0"}});
    SeriesState prior(energy_.series_id, energy_.kind);
    prior.watermark = at(8);
    prior.anchor = energy_anchor(8, 2.0, 100.0);

    std::vector<Sample> samples = {Sample(at(9), -50.0), Sample(at(10), 1.0)};
    try {
        aggregator.aggregate(energy_, prior, samples);
        FAIL() << "expected NonMonotonicCumulativeSumError";
    } catch (const NonMonotonicCumulativeSumError& e) {
        EXPECT_EQ(e.hour_start(), at(9));
        EXPECT_EQ(e.series_id(), energy_.series_id);
    }
}

TEST_F(HourlyAggregatorTest, PersistedStateOfWrongKindIsRejected) {
    HourlyAggregator aggregator;
    SeriesState prior(power_.series_id, power_.kind);
    prior.watermark = at(8);
    prior.anchor = energy_anchor(8, 2.0, 100.0);

    EXPECT_THROW(aggregator.aggregate(power_, prior, {}), std::invalid_argument);

    SeriesState no_anchor(power_.series_id, power_.kind);
    no_anchor.watermark = at(8);
    EXPECT_THROW(aggregator.aggregate(power_, no_anchor, {}), std::invalid_argument);
}

TEST_F(HourlyAggregatorTest, InvalidSamplesIncludedUnlessExcluded) {
    std::vector<Sample> samples = {
        Sample(at(10), 2.0, "kW", SampleQuality::Valid),
        Sample(at(10, 15), 50.0, "kW", SampleQuality::Invalid)
    };
    SeriesState prior(power_.series_id, power_.kind);

    HourlyAggregator including;
    auto result = including.aggregate(power_, prior, samples);
    EXPECT_EQ(result.buckets[0].sample_count(), 2u);

    HourlyAggregator excluding(AlgorithmConfig{{"exclude_invalid_samples", "true"}});
    EXPECT_TRUE(excluding.exclude_invalid_samples());
    result = excluding.aggregate(power_, prior, samples);
    EXPECT_EQ(result.buckets[0].sample_count(), 1u);
    EXPECT_EQ(result.stats.at("invalid_excluded"), 1);
}

TEST_F(HourlyAggregatorTest, MeanStaysWithinRange) {
    HourlyAggregator aggregator(AlgorithmConfig{{"late_arrival_margin_ms", "0"}});
    SeriesState prior(power_.series_id, power_.kind);

    std::vector<Sample> samples;
    for (int i = 0; i < 24 * 4; ++i) {
        double value = static_cast<double>((i * 37) % 11) - 3.5;
        samples.emplace_back(at(0, i * 15), value);
    }
    auto result = aggregator.aggregate(power_, prior, samples);

    ASSERT_EQ(result.buckets.size(), 24u);
    for (const auto& bucket : result.buckets) {
        const PowerStats* stats = bucket.power();
        EXPECT_LE(stats->min, stats->mean);
        EXPECT_LE(stats->mean, stats->max);
        EXPECT_EQ(stats->sample_count, 4u);
    }
    EXPECT_EQ(result.new_watermark, at(22));
}

TEST_F(HourlyAggregatorTest, StatsAccumulateAndReset) {
    HourlyAggregator aggregator;
    SeriesState prior(power_.series_id, power_.kind);

    aggregator.aggregate(power_, prior, power_hour(10, {1.0, 2.0}));
    aggregator.aggregate(power_, prior, power_hour(11, {1.0}));

    auto stats = aggregator.get_stats();
    EXPECT_EQ(stats["passes"], 2);
    EXPECT_EQ(stats["samples_processed"], 3);
    EXPECT_EQ(stats["buckets_emitted"], 2);

    aggregator.reset();
    EXPECT_EQ(aggregator.get_stats()["passes"], 0);
}

TEST_F(HourlyAggregatorTest, NegativeMarginIsRejected) {
    EXPECT_THROW(HourlyAggregator(AlgorithmConfig{{"late_arrival_margin_ms", "-1"}}), std::invalid_argument);
}

} // namespace test
} // namespace meterstat
