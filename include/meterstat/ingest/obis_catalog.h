#pragma once

#include <optional>
#include <string>
#include <vector>

namespace meterstat {

/**
 * @brief OBIS code used when a series does not name one
 */
constexpr const char* DEFAULT_OBIS_CODE = "1-1:1.29.0";

/**
 * @brief One metering channel the provider exposes
 */
struct ObisEntry {
    std::string code;
    std::string description;
    std::string service_type;   // Consumption, Production, ...
    std::string unit;           // native unit of the 15-minute samples
};

/**
 * @brief All known OBIS codes, in catalog order
 */
const std::vector<ObisEntry>& obis_catalog();

/**
 * @brief Look up an OBIS code
 * @return Entry, or empty if the code is unknown
 */
std::optional<ObisEntry> lookup_obis(const std::string& code);

} // namespace meterstat
