#pragma once

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "meterstat/core/sample.h"
#include "meterstat/ingest/sample_fetcher.h"

namespace meterstat {
namespace utils {

/**
 * @brief CSV loader for recorded provider samples
 *
 * Format: timestamp,value[,quality]
 * - timestamp: ISO-8601 (e.g. 2024-03-01T10:15:00Z) or milliseconds since epoch
 * - value: reading
 * - quality: optional, "valid" or "invalid"
 *
 * Rows keep file order, so duplicates and out-of-order rows are replayed the
 * way the provider sent them.
 */
class CsvSampleLoader {
public:
    /**
     * @param filepath CSV file path
     * @param skip_header Whether the first line is a header
     */
    explicit CsvSampleLoader(const std::string& filepath, bool skip_header = true)
        : filepath_(filepath), skip_header_(skip_header) {}

    /**
     * @brief Load all rows
     * @throw std::runtime_error if the file cannot be opened or a row is malformed
     */
    std::vector<Sample> loadAll(const std::string& unit = "") const {
        std::ifstream file(filepath_);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file: " + filepath_);
        }

        std::vector<Sample> samples;
        std::string line;
        int line_number = 0;

        if (skip_header_ && std::getline(file, line)) {
            line_number++;
        }

        while (std::getline(file, line)) {
            line_number++;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty() || line[0] == '#') {
                continue;
            }

            try {
                samples.push_back(parseLine(line, unit));
            } catch (const std::exception& e) {
                throw std::runtime_error(
                    "Parse error at line " + std::to_string(line_number) +
                    " in file " + filepath_ + ": " + e.what()
                );
            }
        }

        return samples;
    }

    const std::string& getFilePath() const { return filepath_; }

private:
    static Sample parseLine(const std::string& line, const std::string& unit) {
        std::vector<std::string> tokens = split(line, ',');
        if (tokens.size() < 2 || tokens.size() > 3) {
            throw std::runtime_error(
                "Invalid CSV format. Expected timestamp,value[,quality], got " +
                std::to_string(tokens.size()) + " columns"
            );
        }

        Sample sample;
        sample.timestamp = parseTimestamp(tokens[0]);
        try {
            sample.value = std::stod(tokens[1]);
        } catch (const std::exception&) {
            throw std::runtime_error("invalid value '" + tokens[1] + "'");
        }
        sample.unit = unit;

        if (tokens.size() == 3) {
            if (tokens[2] == "invalid") {
                sample.quality = SampleQuality::Invalid;
            } else if (tokens[2] == "valid") {
                sample.quality = SampleQuality::Valid;
            }
        }
        return sample;
    }

    static int64_t parseTimestamp(const std::string& token) {
        bool numeric = !token.empty() &&
            std::all_of(token.begin(), token.end(), [](unsigned char c) {
                return std::isdigit(c) || c == '-';
            }) &&
            token.find('-', 1) == std::string::npos;
        if (numeric) {
            return std::stoll(token);
        }
        auto parsed = parse_iso8601(token);
        if (!parsed) {
            throw std::runtime_error("invalid timestamp '" + token + "'");
        }
        return *parsed;
    }

    static std::vector<std::string> split(const std::string& str, char delimiter) {
        std::vector<std::string> tokens;
        std::stringstream ss(str);
        std::string token;

        while (std::getline(ss, token, delimiter)) {
            size_t begin = token.find_first_not_of(" \t");
            size_t end = token.find_last_not_of(" \t");
            tokens.push_back(begin == std::string::npos ? "" : token.substr(begin, end - begin + 1));
        }

        return tokens;
    }

    std::string filepath_;
    bool skip_header_;
};

/**
 * @brief Remote data source replaying recorded samples
 *
 * Serves the samples whose timestamp falls in [from, to] of each request,
 * in recorded order, split into pages of `page_size` items.
 */
class ReplayDataSource : public RemoteDataSource {
public:
    ReplayDataSource(std::vector<Sample> samples, const std::string& unit, size_t page_size = 96)
        : samples_(std::move(samples)), unit_(unit), page_size_(page_size == 0 ? 1 : page_size),
          requests_(0) {}

    SamplePage fetch_page(const FetchRequest& request) override {
        ++requests_;

        std::vector<Sample> matching;
        for (const auto& sample : samples_) {
            if (sample.timestamp >= request.from && sample.timestamp <= request.to) {
                matching.push_back(sample);
            }
        }

        size_t offset = 0;
        if (!request.page_token.empty()) {
            try {
                offset = std::stoul(request.page_token);
            } catch (const std::exception&) {
                throw FetchError(FetchErrorKind::Permanent,
                                 "invalid page token '" + request.page_token + "'", 400);
            }
        }

        SamplePage page;
        page.unit = unit_;
        for (size_t i = offset; i < matching.size() && i < offset + page_size_; ++i) {
            page.items.push_back(matching[i]);
        }
        if (offset + page_size_ < matching.size()) {
            page.next_page_token = std::to_string(offset + page_size_);
        }
        return page;
    }

    size_t requestCount() const { return requests_; }

private:
    std::vector<Sample> samples_;
    std::string unit_;
    size_t page_size_;
    size_t requests_;
};

}  // namespace utils
}  // namespace meterstat
