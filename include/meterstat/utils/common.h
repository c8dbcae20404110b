#pragma once

#include <cstdint>
#include <string>

namespace meterstat {

/**
 * @brief Common utilities
 */

// Version information
constexpr const char* METERSTAT_VERSION = "0.1.0";
constexpr int METERSTAT_VERSION_MAJOR = 0;
constexpr int METERSTAT_VERSION_MINOR = 1;
constexpr int METERSTAT_VERSION_PATCH = 0;

// Durations in milliseconds
constexpr int64_t kMillisPerSecond = 1000;
constexpr int64_t kMillisPerMinute = 60 * kMillisPerSecond;
constexpr int64_t kMillisPerHour = 60 * kMillisPerMinute;
constexpr int64_t kMillisPerDay = 24 * kMillisPerHour;

} // namespace meterstat
