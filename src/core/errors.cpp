#include "meterstat/core/errors.h"

namespace meterstat {

FetchError FetchError::from_http_status(int status, const std::string& message) {
    std::string text = "HTTP " + std::to_string(status) + ": " + message;
    if (status == 408 || status == 429 || status >= 500) {
        return FetchError(FetchErrorKind::Transient, text, status);
    }
    return FetchError(FetchErrorKind::Permanent, text, status);
}

MisalignedSampleError::MisalignedSampleError(const Sample& sample, int64_t granularity_ms)
    : std::runtime_error("sample at " + format_iso8601(sample.timestamp) +
                         " (" + std::to_string(sample.timestamp) + " ms) is not aligned to " +
                         std::to_string(granularity_ms / kMillisPerMinute) + " min"),
      sample_(sample) {}

NonMonotonicCumulativeSumError::NonMonotonicCumulativeSumError(const std::string& series_id,
                                                               int64_t hour_start,
                                                               const std::string& detail)
    : std::runtime_error("series '" + series_id + "' cumulative sum broken at " +
                         format_iso8601(hour_start) + ": " + detail),
      series_id_(series_id),
      hour_start_(hour_start) {}

} // namespace meterstat
