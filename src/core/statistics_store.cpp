#include "meterstat/core/statistics_store.h"

namespace meterstat {

// ========== StatisticsStore helpers ==========

SeriesRecord StatisticsStore::merged_record(const std::string& series_id,
                                            const SeriesRecord& current,
                                            SeriesKind kind,
                                            const std::vector<Bucket>& buckets,
                                            std::optional<int64_t> new_watermark) {
    if (!current.buckets.empty() && current.kind != kind) {
        throw PersistError("series '" + series_id + "' is stored as '" +
                           series_kind_to_string(current.kind) + "', not '" +
                           series_kind_to_string(kind) + "'");
    }

    SeriesRecord record = current;
    record.kind = kind;

    for (const auto& bucket : buckets) {
        if (stats_kind(bucket.stats) != kind) {
            throw PersistError("bucket at " + format_iso8601(bucket.hour_start) +
                               " does not match kind of series '" + series_id + "'");
        }
        if (bucket.hour_start != floor_to_hour(bucket.hour_start)) {
            throw PersistError("bucket at " + std::to_string(bucket.hour_start) +
                               " is not hour aligned");
        }

        auto it = record.buckets.find(bucket.hour_start);
        if (current.watermark && bucket.hour_start <= *current.watermark) {
            if (it == record.buckets.end() || it->second != bucket) {
                throw PersistError("refusing to rewrite closed bucket at " +
                                   format_iso8601(bucket.hour_start) +
                                   " of series '" + series_id + "'");
            }
            continue;
        }
        if (it != record.buckets.end() && it->second.closed && it->second != bucket) {
            throw PersistError("refusing to rewrite closed bucket at " +
                               format_iso8601(bucket.hour_start) +
                               " of series '" + series_id + "'");
        }
        record.buckets[bucket.hour_start] = bucket;
    }

    if (new_watermark && (!record.watermark || *new_watermark > *record.watermark)) {
        auto it = record.buckets.find(*new_watermark);
        if (it == record.buckets.end() || !it->second.closed) {
            throw PersistError("watermark " + format_iso8601(*new_watermark) +
                               " of series '" + series_id + "' has no closed bucket");
        }
        record.watermark = new_watermark;
    }

    return record;
}

SeriesState StatisticsStore::state_from_record(const std::string& series_id,
                                               const SeriesRecord& record) {
    SeriesState state(series_id, record.kind);
    state.watermark = record.watermark;

    auto begin = record.buckets.begin();
    if (record.watermark) {
        auto anchor = record.buckets.find(*record.watermark);
        if (anchor != record.buckets.end()) {
            state.anchor = anchor->second;
        }
        begin = record.buckets.upper_bound(*record.watermark);
    }
    for (auto it = begin; it != record.buckets.end(); ++it) {
        state.pending.push_back(it->second);
    }
    return state;
}

std::vector<Bucket> StatisticsStore::buckets_in_range(const SeriesRecord& record,
                                                      const TimeRange& range) {
    std::vector<Bucket> result;
    for (auto it = record.buckets.lower_bound(range.start_time);
         it != record.buckets.end() && it->first < range.end_time; ++it) {
        result.push_back(it->second);
    }
    return result;
}

// ========== InMemoryStatisticsStore ==========

SeriesState InMemoryStatisticsStore::load_state(const std::string& series_id, SeriesKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(series_id);
    if (it == records_.end()) {
        return SeriesState(series_id, kind);
    }
    return state_from_record(series_id, it->second);
}

void InMemoryStatisticsStore::merge(const std::string& series_id,
                                    SeriesKind kind,
                                    const std::vector<Bucket>& buckets,
                                    std::optional<int64_t> new_watermark) {
    std::lock_guard<std::mutex> lock(mutex_);
    SeriesRecord empty;
    empty.kind = kind;
    auto it = records_.find(series_id);
    const SeriesRecord& current = it != records_.end() ? it->second : empty;

    SeriesRecord updated = merged_record(series_id, current, kind, buckets, new_watermark);
    records_[series_id] = std::move(updated);
    ++merge_count_;
}

std::vector<Bucket> InMemoryStatisticsStore::query(const std::string& series_id,
                                                   const TimeRange& range) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(series_id);
    if (it == records_.end()) {
        return {};
    }
    return buckets_in_range(it->second, range);
}

std::optional<int64_t> InMemoryStatisticsStore::watermark(const std::string& series_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(series_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.watermark;
}

std::vector<std::string> InMemoryStatisticsStore::list_series() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, record] : records_) {
        ids.push_back(id);
    }
    return ids;
}

uint64_t InMemoryStatisticsStore::merge_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return merge_count_;
}

} // namespace meterstat
