#include "meterstat/ingest/leneda_codec.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdio>
#include <iostream>

namespace meterstat {

using json = nlohmann::json;

namespace {

bool read_value(const json& field, double& value) {
    if (field.is_number()) {
        value = field.get<double>();
        return true;
    }
    if (field.is_string()) {
        const std::string& text = field.get_ref<const std::string&>();
        try {
            size_t used = 0;
            value = std::stod(text, &used);
            return used == text.size();
        } catch (const std::exception&) {
            return false;
        }
    }
    return false;
}

void decode_entries(const json& entries, SamplePage& page, int64_t& skipped) {
    if (!entries.is_array()) {
        throw FetchError(FetchErrorKind::Permanent,
                         "time-series entries are not an array");
    }

    for (const auto& entry : entries) {
        if (!entry.is_object()) {
            ++skipped;
            continue;
        }

        auto started = entry.find("startedAt");
        auto value_field = entry.find("value");
        if (started == entry.end() || !started->is_string() || value_field == entry.end()) {
            ++skipped;
            continue;
        }

        auto timestamp = parse_iso8601(started->get<std::string>());
        double value = 0.0;
        if (!timestamp || !read_value(*value_field, value)) {
            ++skipped;
            continue;
        }

        SampleQuality quality = SampleQuality::Unspecified;
        auto type = entry.find("type");
        if (type != entry.end() && type->is_string()) {
            quality = quality_from_type(type->get<std::string>());
        }

        page.items.emplace_back(*timestamp, value, page.unit, quality);
    }
}

} // namespace

SamplePage decode_time_series_page(const std::string& json_text) {
    json body;
    try {
        body = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw FetchError(FetchErrorKind::Permanent,
                         std::string("malformed time-series response: ") + e.what());
    }
    if (!body.is_object()) {
        throw FetchError(FetchErrorKind::Permanent, "time-series response is not an object");
    }

    SamplePage page;
    auto unit = body.find("unit");
    if (unit != body.end() && unit->is_string()) {
        page.unit = unit->get<std::string>();
    }

    auto next = body.find("nextPage");
    if (next != body.end() && next->is_string()) {
        page.next_page_token = next->get<std::string>();
    }

    int64_t skipped = 0;
    auto items = body.find("items");
    if (items != body.end()) {
        decode_entries(*items, page, skipped);
    }
    auto aggregated = body.find("aggregatedTimeSeries");
    if (aggregated != body.end()) {
        decode_entries(*aggregated, page, skipped);
    }

    if (skipped > 0) {
        std::cerr << "LenedaCodec: skipped " << skipped
                  << " entr" << (skipped == 1 ? "y" : "ies")
                  << " with invalid timestamp or value" << std::endl;
    }
    return page;
}

SampleQuality quality_from_type(const std::string& type) {
    if (type == "Actual") {
        return SampleQuality::Valid;
    }
    if (type == "Invalid" || type == "Missing") {
        return SampleQuality::Invalid;
    }
    return SampleQuality::Unspecified;
}

std::string request_path(const FetchRequest& request) {
    std::string path = "/metering-points/" + url_encode(request.metering_point) + "/time-series";
    if (!request.aggregation_level.empty() && request.aggregation_level != "None") {
        path += "/aggregated";
    }
    return path;
}

std::string build_request_query(const FetchRequest& request) {
    std::string query;
    auto add = [&query](const std::string& key, const std::string& value) {
        if (!query.empty()) {
            query += '&';
        }
        query += key + "=" + url_encode(value);
    };

    add("startDateTime", format_iso8601(request.from));
    add("endDateTime", format_iso8601(request.to));
    add("obisCode", request.obis_code);
    if (!request.aggregation_level.empty() && request.aggregation_level != "None") {
        add("aggregationLevel", request.aggregation_level);
        add("transformationMode", "Accumulation");
    }
    if (!request.page_token.empty()) {
        add("page", request.page_token);
    }
    return query;
}

std::vector<std::pair<std::string, std::string>> request_headers(const FetchRequest& request) {
    return {
        {"X-API-KEY", request.api_key},
        {"X-ENERGY-ID", request.energy_id}
    };
}

std::string url_encode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            encoded += buf;
        }
    }
    return encoded;
}

} // namespace meterstat
