#include "meterstat/core/sample.h"
#include <cctype>
#include <chrono>
#include <cstdio>

namespace meterstat {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

bool is_leap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) {
        return 29;
    }
    return kDays[m - 1];
}

// Reads exactly `count` digits starting at pos
bool read_digits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

} // namespace

SeriesKind string_to_series_kind(const std::string& str) {
    std::string lower = str;
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "power" || lower == "power_demand") return SeriesKind::PowerDemand;
    if (lower == "energy" || lower == "energy_consumption") return SeriesKind::EnergyConsumption;

    throw std::invalid_argument("Unknown series kind: " + str);
}

std::string make_series_id(const std::string& metering_point,
                           const std::string& obis_code,
                           SeriesKind kind) {
    const char* suffix = kind == SeriesKind::PowerDemand ? "pwr_hourly" : "energy_hourly";
    return metering_point + "_" + obis_code + "_" + suffix;
}

std::string format_iso8601(int64_t timestamp_ms) {
    int64_t seconds = floor_to(timestamp_ms, kMillisPerSecond) / kMillisPerSecond;
    int64_t days = floor_to(seconds, 86400) / 86400;
    int64_t secs_of_day = seconds - days * 86400;

    int64_t year;
    unsigned month;
    unsigned day;
    civil_from_days(days, year, month, day);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                  static_cast<long long>(year), month, day,
                  static_cast<int>(secs_of_day / 3600),
                  static_cast<int>((secs_of_day / 60) % 60),
                  static_cast<int>(secs_of_day % 60));
    return buf;
}

std::optional<int64_t> parse_iso8601(const std::string& text) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }

    int hour = 0, minute = 0, second = 0, millis = 0;
    int64_t offset_minutes = 0;

    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') {
            return std::nullopt;
        }
        ++pos;
        if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (expect(text, pos, ':')) {
            if (!read_digits(text, pos, 2, second)) {
                return std::nullopt;
            }
            if (expect(text, pos, '.')) {
                // Keep millisecond precision, ignore further digits
                int scale = 100;
                size_t digits = 0;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    if (scale > 0) {
                        millis += (text[pos] - '0') * scale;
                        scale /= 10;
                    }
                    ++pos;
                    ++digits;
                }
                if (digits == 0) {
                    return std::nullopt;
                }
            }
        }
        if (hour > 23 || minute > 59 || second > 59) {
            return std::nullopt;
        }

        if (pos < text.size()) {
            char tz = text[pos++];
            if (tz == 'Z' || tz == 'z') {
                // UTC
            } else if (tz == '+' || tz == '-') {
                int off_h = 0, off_m = 0;
                if (!read_digits(text, pos, 2, off_h)) {
                    return std::nullopt;
                }
                expect(text, pos, ':');
                if (!read_digits(text, pos, 2, off_m) || off_h > 23 || off_m > 59) {
                    return std::nullopt;
                }
                offset_minutes = off_h * 60 + off_m;
                if (tz == '-') {
                    offset_minutes = -offset_minutes;
                }
            } else {
                return std::nullopt;
            }
        }
    }

    if (pos != text.size()) {
        return std::nullopt;
    }

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
    return seconds * kMillisPerSecond + millis;
}

int64_t current_time_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

} // namespace meterstat
