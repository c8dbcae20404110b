#include "meterstat/algorithms/reducers.h"
#include <gtest/gtest.h>

namespace meterstat {
namespace test {

TEST(ReducersTest, PowerMinMaxMean) {
    PowerStats stats = reduce_power({2.0, 4.0, 1.0, 5.0});
    EXPECT_DOUBLE_EQ(stats.min, 1.0);
    EXPECT_DOUBLE_EQ(stats.max, 5.0);
    EXPECT_DOUBLE_EQ(stats.sum, 12.0);
    EXPECT_DOUBLE_EQ(stats.mean, 3.0);
    EXPECT_EQ(stats.sample_count, 4u);
}

TEST(ReducersTest, EnergyAddsToPreviousCumulative) {
    EnergyStats stats = reduce_energy({1.5}, 10.0);
    EXPECT_DOUBLE_EQ(stats.sum, 1.5);
    EXPECT_DOUBLE_EQ(stats.mean, 1.5);
    EXPECT_DOUBLE_EQ(stats.cumulative_sum, 11.5);
    EXPECT_EQ(stats.sample_count, 1u);
}

TEST(ReducersTest, EmptyBucketIsRejected) {
    EXPECT_THROW(reduce_power({}), std::invalid_argument);
    EXPECT_THROW(reduce_energy({}, 0.0), std::invalid_argument);
}

TEST(ReducersTest, DispatchByKind) {
    BucketStats power = reduce(SeriesKind::PowerDemand, {3.0, 1.0});
    ASSERT_TRUE(std::holds_alternative<PowerStats>(power));
    EXPECT_EQ(stats_kind(power), SeriesKind::PowerDemand);

    BucketStats energy = reduce(SeriesKind::EnergyConsumption, {3.0}, 2.0);
    ASSERT_TRUE(std::holds_alternative<EnergyStats>(energy));
    EXPECT_DOUBLE_EQ(std::get<EnergyStats>(energy).cumulative_sum, 5.0);
    EXPECT_EQ(stats_sample_count(energy), 1u);
}

TEST(ReducersTest, MergeWidensRange) {
    PowerStats prior = reduce_power({1.0, 9.0});
    PowerStats corrected = reduce_power({4.0, 5.0});
    PowerStats merged = merge_power(prior, corrected);
    EXPECT_DOUBLE_EQ(merged.min, 1.0);
    EXPECT_DOUBLE_EQ(merged.max, 9.0);
    EXPECT_DOUBLE_EQ(merged.mean, 4.5);
    EXPECT_EQ(merged.sample_count, 2u);
}

TEST(ReducersTest, MergeWithEmptyPriorKeepsRecomputed) {
    PowerStats corrected = reduce_power({4.0, 5.0});
    EXPECT_EQ(merge_power(PowerStats{}, corrected), corrected);
}

}  // namespace test
}  // namespace meterstat
