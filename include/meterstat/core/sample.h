#pragma once

#include "meterstat/utils/common.h"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace meterstat {

/**
 * @brief Provider-reported validity of a reading
 *
 * Unspecified means the provider sent no flag for the reading.
 */
enum class SampleQuality {
    Unspecified = 0,
    Valid = 1,
    Invalid = 2
};

/**
 * @brief A single provider reading
 *
 * Represents one metering interval:
 * - timestamp: start of the interval, milliseconds since epoch (UTC)
 * - value: reading (kW for power, kWh for energy)
 * - unit: unit string as reported by the provider (may be empty)
 * - quality: optional validity flag
 */
struct Sample {
    int64_t timestamp;        // milliseconds since epoch
    double value;
    std::string unit;
    SampleQuality quality;

    Sample() : timestamp(0), value(0.0), quality(SampleQuality::Unspecified) {}

    Sample(int64_t ts, double val)
        : timestamp(ts), value(val), quality(SampleQuality::Unspecified) {}

    Sample(int64_t ts, double val, const std::string& u,
           SampleQuality q = SampleQuality::Unspecified)
        : timestamp(ts), value(val), unit(u), quality(q) {}

    bool is_invalid() const {
        return quality == SampleQuality::Invalid;
    }
};

/**
 * @brief Kind of metering stream
 *
 * Selects both the reduction applied per hour and the native sample
 * granularity expected from the provider.
 */
enum class SeriesKind {
    PowerDemand = 0,        // 15-minute kW samples, reduced to min/max/mean
    EnergyConsumption = 1   // hourly kWh samples, reduced to sum/cumulative sum
};

/**
 * @brief Native sample granularity of a series kind in milliseconds
 */
inline int64_t native_granularity(SeriesKind kind) {
    switch (kind) {
        case SeriesKind::PowerDemand: return 15 * kMillisPerMinute;
        case SeriesKind::EnergyConsumption: return kMillisPerHour;
    }
    return kMillisPerHour;
}

/**
 * @brief Convert series kind to string
 */
inline std::string series_kind_to_string(SeriesKind kind) {
    switch (kind) {
        case SeriesKind::PowerDemand: return "power";
        case SeriesKind::EnergyConsumption: return "energy";
    }
    return "unknown";
}

/**
 * @brief Convert string to series kind
 */
SeriesKind string_to_series_kind(const std::string& str);

/**
 * @brief Identifies one metering stream
 *
 * The kind is fixed for the lifetime of a series. A different OBIS code
 * yields a different series id, see make_series_id().
 */
struct Series {
    std::string series_id;
    std::string metering_point;
    std::string energy_id;
    std::string obis_code;
    SeriesKind kind = SeriesKind::PowerDemand;

    Series() = default;

    Series(const std::string& id, const std::string& mp, const std::string& eid,
           const std::string& obis, SeriesKind k)
        : series_id(id), metering_point(mp), energy_id(eid), obis_code(obis), kind(k) {}
};

/**
 * @brief Build the canonical series id, e.g. "LU0001_1-1:1.29.0_pwr_hourly"
 */
std::string make_series_id(const std::string& metering_point,
                           const std::string& obis_code,
                           SeriesKind kind);

/**
 * @brief Time range, half-open [start_time, end_time)
 */
struct TimeRange {
    int64_t start_time;  // inclusive
    int64_t end_time;    // exclusive

    TimeRange() : start_time(0), end_time(0) {}

    TimeRange(int64_t start, int64_t end)
        : start_time(start), end_time(end) {}

    bool contains(int64_t timestamp) const {
        return timestamp >= start_time && timestamp < end_time;
    }

    int64_t duration() const {
        return end_time - start_time;
    }

    bool valid() const {
        return start_time <= end_time;
    }
};

// ========== Time helpers ==========

/**
 * @brief Truncate a timestamp to the start of its interval
 *
 * Floors towards negative infinity so timestamps before the epoch still land
 * in the interval that contains them.
 */
inline int64_t floor_to(int64_t timestamp, int64_t granularity) {
    int64_t q = timestamp / granularity;
    if (timestamp % granularity != 0 && timestamp < 0) {
        --q;
    }
    return q * granularity;
}

inline int64_t floor_to_hour(int64_t timestamp) {
    return floor_to(timestamp, kMillisPerHour);
}

inline bool is_aligned(int64_t timestamp, int64_t granularity) {
    return floor_to(timestamp, granularity) == timestamp;
}

/**
 * @brief Format as "YYYY-MM-DDTHH:MM:SSZ" (sub-second part dropped)
 */
std::string format_iso8601(int64_t timestamp_ms);

/**
 * @brief Parse an ISO-8601 date-time
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.fff]]" followed by "Z",
 * "+HH:MM" / "-HH:MM" or nothing (UTC assumed).
 * @return Milliseconds since epoch, or empty if the text is not a date-time
 */
std::optional<int64_t> parse_iso8601(const std::string& text);

/**
 * @brief Current wall-clock time in milliseconds since epoch
 */
int64_t current_time_ms();

} // namespace meterstat
