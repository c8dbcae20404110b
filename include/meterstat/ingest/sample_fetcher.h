#pragma once

#include "../core/errors.h"
#include "../core/sample.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace meterstat {

/**
 * @brief Shared cancellation flag for one run
 *
 * Copies share the same flag, so the scheduler can keep one copy and hand
 * another to the run.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool is_cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief One page request sent to the remote source
 */
struct FetchRequest {
    std::string metering_point;
    std::string energy_id;
    std::string obis_code;
    std::string api_key;
    int64_t from = 0;                 // ms since epoch
    int64_t to = 0;                   // ms since epoch
    std::string aggregation_level;    // "None" (15-min samples) or "Hour"
    std::string page_token;           // empty for the first page
};

/**
 * @brief One page of provider samples
 */
struct SamplePage {
    std::vector<Sample> items;        // provider order
    std::string unit;
    std::string next_page_token;      // empty on the last page
};

/**
 * @brief Remote data source collaborator
 *
 * Implementations perform one network-bound page retrieval per call and
 * report provider failures as FetchError.
 */
class RemoteDataSource {
public:
    virtual ~RemoteDataSource() = default;

    /**
     * @brief Retrieve one page
     * @throws FetchError on network, server or authentication failures
     */
    virtual SamplePage fetch_page(const FetchRequest& request) = 0;
};

/**
 * @brief Fetcher configuration
 */
struct FetcherConfig {
    int64_t max_days_per_request = 30;                   // provider limit per request
    int64_t clock_skew_allowance_ms = 5 * kMillisPerMinute;
    int64_t fetch_timeout_ms = 0;                        // 0 = no deadline

    FetcherConfig() = default;
};

/**
 * @brief Lazily produced, single-pass sequence of samples
 *
 * Pages are requested on demand while the caller consumes samples. Between
 * two page requests the stream checks the cancellation token and the fetch
 * deadline and throws RunCancelledError if either has tripped.
 */
class SampleStream {
public:
    SampleStream(RemoteDataSource& source,
                 FetchRequest base_request,
                 std::vector<TimeRange> chunks,
                 CancellationToken cancel,
                 int64_t timeout_ms);

    SampleStream(SampleStream&&) = default;
    SampleStream(const SampleStream&) = delete;
    SampleStream& operator=(const SampleStream&) = delete;

    /**
     * @brief Produce the next sample
     * @return false once the sequence is exhausted
     * @throws FetchError, RunCancelledError
     */
    bool next(Sample& sample);

    /**
     * @brief Collect all remaining samples
     */
    std::vector<Sample> drain();

    uint64_t pages_fetched() const { return pages_fetched_; }
    uint64_t samples_produced() const { return samples_produced_; }
    size_t chunk_count() const { return chunks_.size(); }

private:
    /**
     * @brief Request the next page, moving to the next chunk when needed
     * @return false when all chunks are exhausted
     */
    bool fetch_next_page();

    void check_cancelled() const;

    RemoteDataSource* source_;
    FetchRequest request_;
    std::vector<TimeRange> chunks_;
    size_t next_chunk_;
    bool chunk_open_;

    SamplePage page_;
    size_t page_pos_;

    CancellationToken cancel_;
    int64_t timeout_ms_;
    std::chrono::steady_clock::time_point started_;

    uint64_t pages_fetched_;
    uint64_t samples_produced_;
};

/**
 * @brief Sample fetcher
 *
 * Splits a fetch window into provider-sized chunks and returns a lazy stream
 * over all pages of all chunks, in provider order. Performs no dedup or sort.
 */
class SampleFetcher {
public:
    explicit SampleFetcher(RemoteDataSource& source, const FetcherConfig& config = FetcherConfig());

    /**
     * @brief Start fetching samples of a series over [from, to]
     * @param series Series to fetch
     * @param api_key Provider credential for the series
     * @param from Window start (ms since epoch)
     * @param to Window end (ms since epoch)
     * @param now Current time, bounds `to` together with the clock-skew allowance
     * @param cancel Cancellation token checked between pages
     * @throws std::invalid_argument if from > to or to is too far in the future
     */
    SampleStream fetch(const Series& series,
                       const std::string& api_key,
                       int64_t from,
                       int64_t to,
                       int64_t now,
                       const CancellationToken& cancel = CancellationToken()) const;

    /**
     * @brief Chunks a window is split into
     */
    std::vector<TimeRange> split_window(int64_t from, int64_t to) const;

    const FetcherConfig& config() const { return config_; }

    /**
     * @brief Provider aggregation level for a series kind
     */
    static std::string aggregation_level_for(SeriesKind kind);

private:
    RemoteDataSource& source_;
    FetcherConfig config_;
};

} // namespace meterstat
