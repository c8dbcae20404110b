#include "meterstat/ingest/obis_catalog.h"

namespace meterstat {

const std::vector<ObisEntry>& obis_catalog() {
    static const std::vector<ObisEntry> catalog = {
        {"1-1:1.29.0", "Measured active consumption", "Consumption", "kW"},
        {"1-1:2.29.0", "Measured active production", "Production", "kW"},
        {"1-1:3.29.0", "Measured reactive consumption", "Consumption", "kVAR"},
        {"1-1:4.29.0", "Measured reactive production", "Production", "kVAR"},

        // Sharing groups, consumption side
        {"1-65:1.29.1", "Consumption covered by production of sharing group layer 1", "Consumption", "kW"},
        {"1-65:1.29.3", "Consumption covered by production of sharing group layer 2", "Consumption", "kW"},
        {"1-65:1.29.2", "Consumption covered by production of sharing group layer 3", "Consumption", "kW"},
        {"1-65:1.29.4", "Consumption covered by production of sharing group layer 4", "Consumption", "kW"},
        {"1-65:1.29.9", "Remaining consumption after sharing", "Consumption", "kW"},

        // Sharing groups, production side
        {"1-65:2.29.1", "Production shared within sharing group layer 1", "Production", "kW"},
        {"1-65:2.29.3", "Production shared within sharing group layer 2", "Production", "kW"},
        {"1-65:2.29.2", "Production shared within sharing group layer 3", "Production", "kW"},
        {"1-65:2.29.4", "Production shared within sharing group layer 4", "Production", "kW"},
        {"1-65:2.29.9", "Remaining production after sharing", "Production", "kW"},
    };
    return catalog;
}

std::optional<ObisEntry> lookup_obis(const std::string& code) {
    for (const auto& entry : obis_catalog()) {
        if (entry.code == code) {
            return entry;
        }
    }
    return std::nullopt;
}

} // namespace meterstat
