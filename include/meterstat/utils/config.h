#pragma once

#include "meterstat/core/sample.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace meterstat {

/**
 * @brief String key-value configuration
 */
using ConfigMap = std::map<std::string, std::string>;

// Defaults
constexpr int64_t DEFAULT_POLL_INTERVAL_MS = 2 * kMillisPerHour;
constexpr int64_t DEFAULT_LATE_ARRIVAL_MARGIN_MS = kMillisPerHour;
constexpr int64_t DEFAULT_INITIAL_SETUP_DAYS = 180;
constexpr int64_t DEFAULT_LOOKBACK_MS = 2 * kMillisPerDay;

/**
 * @brief Configuration of one ingested series
 */
struct SeriesConfig {
    Series series;
    std::string api_key;
    int64_t poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;
    int64_t late_arrival_margin_ms = DEFAULT_LATE_ARRIVAL_MARGIN_MS;
    int64_t history_start_ms = 0;       // first instant ever fetched
    int64_t lookback_ms = DEFAULT_LOOKBACK_MS;
    bool exclude_invalid_samples = false;

    /**
     * @brief Printable summary; never contains the API key
     */
    std::string describe() const;
};

/**
 * @brief Parse a duration such as "500ms", "30s", "15m", "2h" or "2d"
 *
 * A bare integer is taken as milliseconds.
 *
 * @throws std::invalid_argument on malformed or negative input
 */
int64_t parse_duration_ms(const std::string& text);

/**
 * @brief Build a series configuration from key-value pairs
 *
 * Keys: metering_point, energy_id, api_key, kind (required); obis_code,
 * series_id, poll_interval, late_arrival_margin, lookback,
 * exclude_invalid_samples, and either history_start (ISO-8601) or
 * initial_setup_days (optional).
 *
 * @param config Key-value pairs
 * @param now Current time, anchors the default history start
 * @throws std::invalid_argument naming the offending key
 */
SeriesConfig parse_series_config(const ConfigMap& config, int64_t now);

/**
 * @brief Read `key=value` lines; `#` starts a comment line
 * @throws std::runtime_error if the file cannot be read
 * @throws std::invalid_argument on a line without '='
 */
ConfigMap read_config_file(const std::string& path);

/**
 * @brief Load one series configuration file
 */
SeriesConfig load_series_config_file(const std::string& path, int64_t now);

/**
 * @brief Load every `*.conf` file of a directory, sorted by file name
 */
std::vector<SeriesConfig> load_series_config_dir(const std::string& dir, int64_t now);

} // namespace meterstat
