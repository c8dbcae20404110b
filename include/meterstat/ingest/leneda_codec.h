#pragma once

#include "sample_fetcher.h"
#include <string>
#include <utility>
#include <vector>

namespace meterstat {

/**
 * @brief Base URL of the Leneda data platform API
 */
constexpr const char* LENEDA_API_BASE_URL = "https://api.leneda.eu/api";

/**
 * @brief Decode one time-series response body
 *
 * Accepts the `items` array (15-minute series) and the
 * `aggregatedTimeSeries` array (hourly aggregation). Entries with an
 * unparsable `startedAt` or a non-numeric `value` are skipped.
 *
 * @param json_text Response body
 * @return Decoded page in provider order
 * @throws FetchError (Permanent) if the body is not a JSON object
 */
SamplePage decode_time_series_page(const std::string& json_text);

/**
 * @brief Map the provider's `type` field to a quality flag
 */
SampleQuality quality_from_type(const std::string& type);

/**
 * @brief Path of the time-series endpoint for a request, relative to the base URL
 */
std::string request_path(const FetchRequest& request);

/**
 * @brief URL-encoded query string for a request
 */
std::string build_request_query(const FetchRequest& request);

/**
 * @brief Authentication headers for a request
 */
std::vector<std::pair<std::string, std::string>> request_headers(const FetchRequest& request);

/**
 * @brief Percent-encode a query component
 */
std::string url_encode(const std::string& value);

} // namespace meterstat
