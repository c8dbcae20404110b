#pragma once

#include "../core/bucket.h"
#include <vector>

namespace meterstat {

/**
 * @brief Statistical range of the power samples of one hour
 * @throws std::invalid_argument if values is empty
 */
PowerStats reduce_power(const std::vector<double>& values);

/**
 * @brief Energy total of one hour
 * @param previous_cumulative cumulative sum of the preceding bucket
 * @throws std::invalid_argument if values is empty
 */
EnergyStats reduce_energy(const std::vector<double>& values, double previous_cumulative);

/**
 * @brief Dispatch to the reduction of the given series kind
 */
BucketStats reduce(SeriesKind kind, const std::vector<double>& values,
                   double previous_cumulative = 0.0);

/**
 * @brief Merge a recomputed power reduction into an already persisted one
 *
 * min/max only widen; count, sum and mean come from the recomputed totals,
 * which already cover every sample the prior reduction saw.
 */
PowerStats merge_power(const PowerStats& prior, const PowerStats& recomputed);

} // namespace meterstat
