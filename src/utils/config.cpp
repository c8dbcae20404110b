#include "meterstat/utils/config.h"
#include "meterstat/ingest/obis_catalog.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace meterstat {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
    return str.substr(begin, end - begin);
}

std::string get_config(const ConfigMap& config, const std::string& key,
                       const std::string& default_value = "") {
    auto it = config.find(key);
    return (it != config.end()) ? it->second : default_value;
}

std::string require(const ConfigMap& config, const std::string& key) {
    std::string value = trim(get_config(config, key));
    if (value.empty()) {
        throw std::invalid_argument("config: missing required key '" + key + "'");
    }
    return value;
}

int64_t duration_or(const ConfigMap& config, const std::string& key, int64_t default_value) {
    auto it = config.find(key);
    if (it == config.end()) {
        return default_value;
    }
    try {
        return parse_duration_ms(it->second);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("config: key '" + key + "': " + e.what());
    }
}

} // namespace

std::string SeriesConfig::describe() const {
    std::ostringstream oss;
    oss << series.series_id
        << " (" << series_kind_to_string(series.kind)
        << ", mp=" << series.metering_point
        << ", obis=" << series.obis_code
        << ", poll=" << poll_interval_ms / kMillisPerMinute << "m"
        << ", margin=" << late_arrival_margin_ms / kMillisPerMinute << "m"
        << ", history_start=" << format_iso8601(history_start_ms) << ")";
    return oss.str();
}

int64_t parse_duration_ms(const std::string& text) {
    std::string str = trim(text);
    size_t pos = 0;
    while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
        ++pos;
    }
    if (pos == 0) {
        throw std::invalid_argument("invalid duration '" + text + "'");
    }

    int64_t amount = 0;
    try {
        amount = std::stoll(str.substr(0, pos));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("duration '" + text + "' out of range");
    }

    std::string unit = trim(str.substr(pos));
    int64_t factor = 0;
    if (unit.empty() || unit == "ms") {
        factor = 1;
    } else if (unit == "s") {
        factor = kMillisPerSecond;
    } else if (unit == "m" || unit == "min") {
        factor = kMillisPerMinute;
    } else if (unit == "h") {
        factor = kMillisPerHour;
    } else if (unit == "d") {
        factor = kMillisPerDay;
    } else {
        throw std::invalid_argument("unknown duration unit '" + unit + "' in '" + text + "'");
    }
    if (amount > std::numeric_limits<int64_t>::max() / factor) {
        throw std::invalid_argument("duration '" + text + "' out of range");
    }
    return amount * factor;
}

SeriesConfig parse_series_config(const ConfigMap& config, int64_t now) {
    SeriesConfig result;
    Series& series = result.series;

    series.metering_point = require(config, "metering_point");
    series.energy_id = require(config, "energy_id");
    result.api_key = require(config, "api_key");

    try {
        series.kind = string_to_series_kind(require(config, "kind"));
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("config: key 'kind' must be 'power' or 'energy', got '" +
                                    get_config(config, "kind") + "'");
    }

    series.obis_code = trim(get_config(config, "obis_code", DEFAULT_OBIS_CODE));
    if (!lookup_obis(series.obis_code)) {
        std::cerr << "Config: unknown OBIS code '" << series.obis_code
                  << "' for metering point " << series.metering_point << std::endl;
    }

    series.series_id = trim(get_config(config, "series_id"));
    if (series.series_id.empty()) {
        series.series_id = make_series_id(series.metering_point, series.obis_code, series.kind);
    }

    result.poll_interval_ms = duration_or(config, "poll_interval", DEFAULT_POLL_INTERVAL_MS);
    if (result.poll_interval_ms <= 0) {
        throw std::invalid_argument("config: key 'poll_interval' must be positive");
    }
    result.late_arrival_margin_ms = duration_or(config, "late_arrival_margin",
                                                DEFAULT_LATE_ARRIVAL_MARGIN_MS);
    result.lookback_ms = duration_or(config, "lookback", DEFAULT_LOOKBACK_MS);
    if (result.lookback_ms <= 0) {
        throw std::invalid_argument("config: key 'lookback' must be positive");
    }

    std::string history_start = trim(get_config(config, "history_start"));
    if (!history_start.empty()) {
        auto parsed = parse_iso8601(history_start);
        if (!parsed) {
            throw std::invalid_argument("config: key 'history_start' is not an ISO-8601 date: '" +
                                        history_start + "'");
        }
        result.history_start_ms = floor_to_hour(*parsed);
    } else {
        int64_t days = DEFAULT_INITIAL_SETUP_DAYS;
        // days_to_fetch_during_initial_setup is the name older configurations use
        std::string days_key = "initial_setup_days";
        std::string days_str = trim(get_config(config, days_key));
        if (days_str.empty()) {
            days_key = "days_to_fetch_during_initial_setup";
            days_str = trim(get_config(config, days_key));
        }
        if (!days_str.empty()) {
            try {
                days = std::stoll(days_str);
            } catch (const std::exception&) {
                throw std::invalid_argument("config: key '" + days_key + "' is not a number: '" +
                                            days_str + "'");
            }
            if (days <= 0) {
                throw std::invalid_argument("config: key '" + days_key + "' must be positive");
            }
            if (days > std::numeric_limits<int64_t>::max() / kMillisPerDay ||
                now < std::numeric_limits<int64_t>::min() + days * kMillisPerDay) {
                throw std::invalid_argument("config: key '" + days_key + "' out of range: '" +
                                            days_str + "'");
            }
        }
        result.history_start_ms = floor_to_hour(now - days * kMillisPerDay);
    }

    std::string exclude = trim(get_config(config, "exclude_invalid_samples", "false"));
    result.exclude_invalid_samples = (exclude == "true" || exclude == "1");

    return result;
}

ConfigMap read_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("config: cannot open " + path);
    }

    ConfigMap config;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string stripped = trim(line);
        // If the line starts with # then it is a comment. Ignore it.
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }
        size_t eq = stripped.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("config: " + path + ":" + std::to_string(line_no) +
                                        ": expected key=value");
        }
        config[trim(stripped.substr(0, eq))] = trim(stripped.substr(eq + 1));
    }
    return config;
}

SeriesConfig load_series_config_file(const std::string& path, int64_t now) {
    ConfigMap config = read_config_file(path);
    try {
        return parse_series_config(config, now);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(path + ": " + e.what());
    }
}

std::vector<SeriesConfig> load_series_config_dir(const std::string& dir, int64_t now) {
    std::vector<std::string> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".conf") {
            files.push_back(entry.path().string());
        }
    }
    if (ec) {
        throw std::runtime_error("config: cannot list " + dir + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    std::vector<SeriesConfig> configs;
    for (const auto& file : files) {
        configs.push_back(load_series_config_file(file, now));
        std::cout << "Config: loaded " << configs.back().describe() << std::endl;
    }
    return configs;
}

} // namespace meterstat
