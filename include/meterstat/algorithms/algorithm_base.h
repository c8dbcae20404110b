#pragma once

#include "../core/bucket.h"
#include "../core/errors.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace meterstat {

/**
 * @brief Algorithm configuration
 */
using AlgorithmConfig = std::map<std::string, std::string>;

/**
 * @brief Output of one aggregation pass over a polling window
 */
struct AggregationResult {
    std::vector<Bucket> buckets;              ///< New or changed buckets, ascending by hour
    std::optional<int64_t> new_watermark;     ///< Proposed watermark (never behind the prior one)
    std::optional<int64_t> latest_observed;   ///< Latest aligned sample timestamp seen
    std::vector<MisalignedSampleError> misaligned;  ///< Dropped samples
    std::map<std::string, int64_t> stats;     ///< Per-pass counters
};

/**
 * @brief Base class for bucketing algorithms
 *
 * Implementations turn a polling window of samples plus the persisted
 * state of a series into the buckets to merge into the statistics store.
 * Supports:
 * - Configuration through key-value parameters
 * - Statistics tracking across passes
 */
class BucketAlgorithm {
public:
    explicit BucketAlgorithm(const AlgorithmConfig& config = {})
        : config_(config) {}

    virtual ~BucketAlgorithm() = default;

    /**
     * @brief Bucket and reduce one polling window
     * @param series Series the samples belong to
     * @param prior Persisted state read at the start of the run
     * @param samples Samples in fetch order
     */
    virtual AggregationResult aggregate(const Series& series,
                                        const SeriesState& prior,
                                        const std::vector<Sample>& samples) = 0;

    /**
     * @brief Reset accumulated statistics
     */
    virtual void reset() {
        // Default: no state to reset
    }

    /**
     * @brief Get statistics accumulated over all passes
     */
    virtual std::map<std::string, int64_t> get_stats() const {
        return {};
    }

    const AlgorithmConfig& get_config() const {
        return config_;
    }

    void set_config(const std::string& key, const std::string& value) {
        config_[key] = value;
    }

    std::string get_config(const std::string& key,
                           const std::string& default_value = "") const {
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : default_value;
    }

protected:
    AlgorithmConfig config_;
};

} // namespace meterstat
