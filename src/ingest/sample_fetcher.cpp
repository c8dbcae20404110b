#include "meterstat/ingest/sample_fetcher.h"
#include <algorithm>
#include <stdexcept>

namespace meterstat {

// ========== SampleStream ==========

SampleStream::SampleStream(RemoteDataSource& source,
                           FetchRequest base_request,
                           std::vector<TimeRange> chunks,
                           CancellationToken cancel,
                           int64_t timeout_ms)
    : source_(&source),
      request_(std::move(base_request)),
      chunks_(std::move(chunks)),
      next_chunk_(0),
      chunk_open_(false),
      page_pos_(0),
      cancel_(std::move(cancel)),
      timeout_ms_(timeout_ms),
      started_(std::chrono::steady_clock::now()),
      pages_fetched_(0),
      samples_produced_(0) {}

bool SampleStream::next(Sample& sample) {
    while (page_pos_ >= page_.items.size()) {
        if (!fetch_next_page()) {
            return false;
        }
    }

    sample = page_.items[page_pos_++];
    if (sample.unit.empty()) {
        sample.unit = page_.unit;
    }
    ++samples_produced_;
    return true;
}

std::vector<Sample> SampleStream::drain() {
    std::vector<Sample> samples;
    Sample sample;
    while (next(sample)) {
        samples.push_back(std::move(sample));
    }
    return samples;
}

bool SampleStream::fetch_next_page() {
    if (!chunk_open_ || page_.next_page_token.empty()) {
        if (next_chunk_ >= chunks_.size()) {
            return false;
        }
        const TimeRange& chunk = chunks_[next_chunk_++];
        request_.from = chunk.start_time;
        request_.to = chunk.end_time;
        request_.page_token.clear();
        chunk_open_ = true;
    } else {
        if (page_.next_page_token == request_.page_token) {
            throw FetchError(FetchErrorKind::Permanent,
                             "provider repeated page token '" + request_.page_token + "'");
        }
        request_.page_token = page_.next_page_token;
    }

    check_cancelled();

    page_ = source_->fetch_page(request_);
    page_pos_ = 0;
    ++pages_fetched_;
    return true;
}

void SampleStream::check_cancelled() const {
    if (cancel_.is_cancelled()) {
        throw RunCancelledError("fetch of " + request_.metering_point + " cancelled after " +
                                std::to_string(pages_fetched_) + " page(s)");
    }
    if (timeout_ms_ > 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_).count();
        if (elapsed > timeout_ms_) {
            throw RunCancelledError("fetch of " + request_.metering_point +
                                    " exceeded deadline of " + std::to_string(timeout_ms_) + " ms");
        }
    }
}

// ========== SampleFetcher ==========

SampleFetcher::SampleFetcher(RemoteDataSource& source, const FetcherConfig& config)
    : source_(source), config_(config) {
    if (config_.max_days_per_request <= 0) {
        throw std::invalid_argument("SampleFetcher: max_days_per_request must be positive");
    }
    if (config_.clock_skew_allowance_ms < 0 || config_.fetch_timeout_ms < 0) {
        throw std::invalid_argument("SampleFetcher: durations must not be negative");
    }
}

SampleStream SampleFetcher::fetch(const Series& series,
                                  const std::string& api_key,
                                  int64_t from,
                                  int64_t to,
                                  int64_t now,
                                  const CancellationToken& cancel) const {
    if (from > to) {
        throw std::invalid_argument("SampleFetcher: window start " + format_iso8601(from) +
                                    " is after window end " + format_iso8601(to));
    }
    if (to > now + config_.clock_skew_allowance_ms) {
        throw std::invalid_argument("SampleFetcher: window end " + format_iso8601(to) +
                                    " is in the future");
    }

    FetchRequest request;
    request.metering_point = series.metering_point;
    request.energy_id = series.energy_id;
    request.obis_code = series.obis_code;
    request.api_key = api_key;
    request.aggregation_level = aggregation_level_for(series.kind);

    return SampleStream(source_, std::move(request), split_window(from, to),
                        cancel, config_.fetch_timeout_ms);
}

std::vector<TimeRange> SampleFetcher::split_window(int64_t from, int64_t to) const {
    std::vector<TimeRange> chunks;
    const int64_t max_span = config_.max_days_per_request * kMillisPerDay;
    for (int64_t start = from; start < to; ) {
        int64_t end = std::min(start + max_span, to);
        chunks.emplace_back(start, end);
        start = end;
    }
    return chunks;
}

std::string SampleFetcher::aggregation_level_for(SeriesKind kind) {
    return kind == SeriesKind::EnergyConsumption ? "Hour" : "None";
}

} // namespace meterstat
