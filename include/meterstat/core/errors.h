#pragma once

#include "sample.h"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace meterstat {

/**
 * @brief Whether a failed fetch may be retried with the same window
 */
enum class FetchErrorKind {
    Transient,  ///< Network failure or 5xx, retry with backoff
    Permanent   ///< Authentication or other 4xx, needs operator attention
};

/**
 * @brief Provider-side failure surfaced by the sample fetcher
 */
class FetchError : public std::runtime_error {
public:
    FetchError(FetchErrorKind kind, const std::string& message, int http_status = 0)
        : std::runtime_error(message), kind_(kind), http_status_(http_status) {}

    /**
     * @brief Classify an HTTP status code
     *
     * 408, 429 and 5xx are transient; any other status >= 400 is permanent.
     */
    static FetchError from_http_status(int status, const std::string& message);

    FetchErrorKind kind() const { return kind_; }
    bool is_transient() const { return kind_ == FetchErrorKind::Transient; }
    int http_status() const { return http_status_; }

private:
    FetchErrorKind kind_;
    int http_status_;
};

/**
 * @brief A sample not aligned to its series' native granularity
 *
 * Recorded per sample, never aborts a run.
 */
class MisalignedSampleError : public std::runtime_error {
public:
    MisalignedSampleError(const Sample& sample, int64_t granularity_ms);

    const Sample& sample() const { return sample_; }

private:
    Sample sample_;
};

/**
 * @brief The persisted cumulative-sum chain of an energy series is broken
 *
 * Fatal for the run of that series; the watermark does not advance.
 */
class NonMonotonicCumulativeSumError : public std::runtime_error {
public:
    NonMonotonicCumulativeSumError(const std::string& series_id, int64_t hour_start,
                                   const std::string& detail);

    const std::string& series_id() const { return series_id_; }
    int64_t hour_start() const { return hour_start_; }

private:
    std::string series_id_;
    int64_t hour_start_;
};

/**
 * @brief Statistics store rejected or failed a merge
 */
class PersistError : public std::runtime_error {
public:
    explicit PersistError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A run was cancelled or exceeded its fetch deadline
 */
class RunCancelledError : public std::runtime_error {
public:
    explicit RunCancelledError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace meterstat
