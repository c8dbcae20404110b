#pragma once

#include "bucket.h"
#include "errors.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meterstat {

/**
 * @brief Everything a store keeps for one series
 */
struct SeriesRecord {
    SeriesKind kind = SeriesKind::PowerDemand;
    std::optional<int64_t> watermark;
    std::map<int64_t, Bucket> buckets;  ///< hour_start -> bucket, full history
};

/**
 * @brief Statistics store collaborator
 *
 * System of record for per-hour statistics, keyed by (series id, hour start).
 * A merge is atomic: either the whole batch and the new watermark land, or
 * PersistError is thrown and nothing changes.
 */
class StatisticsStore {
public:
    virtual ~StatisticsStore() = default;

    /**
     * @brief Read the state a run starts from
     * @param series_id Series identifier
     * @param kind Kind of the series (used for series without history)
     * @return Watermark, anchor bucket and pending buckets
     * @throws PersistError if the stored state cannot be read
     */
    virtual SeriesState load_state(const std::string& series_id, SeriesKind kind) = 0;

    /**
     * @brief Append/merge buckets and advance the watermark
     * @param series_id Series identifier
     * @param kind Kind of the series
     * @param buckets Buckets to upsert
     * @param new_watermark Proposed watermark (ignored if behind the stored one)
     * @throws PersistError if the batch is rejected or cannot be written
     */
    virtual void merge(const std::string& series_id,
                       SeriesKind kind,
                       const std::vector<Bucket>& buckets,
                       std::optional<int64_t> new_watermark) = 0;

    /**
     * @brief Buckets of a series whose hour starts within range
     */
    virtual std::vector<Bucket> query(const std::string& series_id,
                                      const TimeRange& range) = 0;

    /**
     * @brief Stored watermark of a series, empty if none yet
     */
    virtual std::optional<int64_t> watermark(const std::string& series_id) = 0;

    /**
     * @brief Ids of all series with stored data
     */
    virtual std::vector<std::string> list_series() = 0;

protected:
    /**
     * @brief Validate a merge batch and apply it to a record copy
     *
     * Rewriting a bucket at or before the stored watermark with different
     * contents is rejected; identical rewrites are ignored.
     */
    static SeriesRecord merged_record(const std::string& series_id,
                                      const SeriesRecord& current,
                                      SeriesKind kind,
                                      const std::vector<Bucket>& buckets,
                                      std::optional<int64_t> new_watermark);

    /**
     * @brief Split a record into watermark, anchor and pending buckets
     */
    static SeriesState state_from_record(const std::string& series_id,
                                         const SeriesRecord& record);

    static std::vector<Bucket> buckets_in_range(const SeriesRecord& record,
                                                const TimeRange& range);
};

/**
 * @brief Statistics store held in process memory
 *
 * Thread-safe. Used by tests and as a staging store.
 */
class InMemoryStatisticsStore : public StatisticsStore {
public:
    InMemoryStatisticsStore() = default;
    ~InMemoryStatisticsStore() override = default;

    SeriesState load_state(const std::string& series_id, SeriesKind kind) override;

    void merge(const std::string& series_id,
               SeriesKind kind,
               const std::vector<Bucket>& buckets,
               std::optional<int64_t> new_watermark) override;

    std::vector<Bucket> query(const std::string& series_id,
                              const TimeRange& range) override;

    std::optional<int64_t> watermark(const std::string& series_id) override;

    std::vector<std::string> list_series() override;

    /**
     * @brief Number of successful merge calls
     */
    uint64_t merge_count() const;

private:
    std::map<std::string, SeriesRecord> records_;
    uint64_t merge_count_ = 0;
    mutable std::mutex mutex_;
};

} // namespace meterstat
