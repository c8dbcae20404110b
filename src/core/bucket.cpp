#include "meterstat/core/bucket.h"

namespace meterstat {

void SeriesState::apply(const std::vector<Bucket>& buckets,
                        std::optional<int64_t> new_watermark) {
    std::map<int64_t, Bucket> by_hour;
    if (anchor) {
        by_hour[anchor->hour_start] = *anchor;
    }
    for (const auto& bucket : pending) {
        by_hour[bucket.hour_start] = bucket;
    }
    for (const auto& bucket : buckets) {
        by_hour[bucket.hour_start] = bucket;
    }

    if (new_watermark && (!watermark || *new_watermark > *watermark)) {
        watermark = new_watermark;
    }

    anchor.reset();
    pending.clear();
    for (auto& [hour, bucket] : by_hour) {
        if (watermark && hour < *watermark) {
            continue;
        }
        if (watermark && hour == *watermark) {
            anchor = bucket;
        } else {
            pending.push_back(bucket);
        }
    }
}

} // namespace meterstat
