#include "meterstat/algorithms/reducers.h"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace meterstat {

PowerStats reduce_power(const std::vector<double>& values) {
    if (values.empty()) {
        throw std::invalid_argument("reduce_power: no samples in bucket");
    }

    PowerStats stats;
    stats.min = *std::min_element(values.begin(), values.end());
    stats.max = *std::max_element(values.begin(), values.end());
    stats.sum = std::accumulate(values.begin(), values.end(), 0.0);
    stats.sample_count = values.size();
    stats.mean = stats.sum / static_cast<double>(values.size());
    return stats;
}

EnergyStats reduce_energy(const std::vector<double>& values, double previous_cumulative) {
    if (values.empty()) {
        throw std::invalid_argument("reduce_energy: no samples in bucket");
    }

    EnergyStats stats;
    stats.sum = std::accumulate(values.begin(), values.end(), 0.0);
    stats.sample_count = values.size();
    stats.mean = stats.sum / static_cast<double>(values.size());
    stats.cumulative_sum = previous_cumulative + stats.sum;
    return stats;
}

BucketStats reduce(SeriesKind kind, const std::vector<double>& values,
                   double previous_cumulative) {
    switch (kind) {
        case SeriesKind::PowerDemand:
            return reduce_power(values);
        case SeriesKind::EnergyConsumption:
            return reduce_energy(values, previous_cumulative);
    }
    throw std::invalid_argument("reduce: unknown series kind");
}

PowerStats merge_power(const PowerStats& prior, const PowerStats& recomputed) {
    PowerStats merged = recomputed;
    if (prior.sample_count > 0) {
        merged.min = std::min(prior.min, recomputed.min);
        merged.max = std::max(prior.max, recomputed.max);
    }
    return merged;
}

} // namespace meterstat
