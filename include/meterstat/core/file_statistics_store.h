#pragma once

#include "statistics_store.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace meterstat {

/**
 * @brief Storage format version for compatibility checking
 */
constexpr uint32_t METERSTAT_STORE_FORMAT_VERSION = 1;

/**
 * @brief Magic number to identify statistics files
 */
constexpr uint32_t METERSTAT_STORE_MAGIC_NUMBER = 0x4D535453; // "MSTS" in hex

/**
 * @brief File header structure
 */
struct StoreFileHeader {
    uint32_t magic_number;        // Magic number for file identification
    uint32_t format_version;      // Storage format version
    uint8_t kind;                 // SeriesKind of the series
    uint8_t has_watermark;        // 1 if watermark is set
    int64_t watermark;            // Watermark hour start
    uint64_t bucket_count;        // Number of buckets that follow

    StoreFileHeader()
        : magic_number(METERSTAT_STORE_MAGIC_NUMBER),
          format_version(METERSTAT_STORE_FORMAT_VERSION),
          kind(0),
          has_watermark(0),
          watermark(0),
          bucket_count(0) {}
};

/**
 * @brief Statistics store persisted to disk
 *
 * Features:
 * - One binary file per series under the base directory
 * - Merges are written to a temporary file and renamed over the old one,
 *   so a crash leaves either the old or the new file
 * - Records are cached after the first read
 */
class FileStatisticsStore : public StatisticsStore {
public:
    /**
     * @param base_path Directory for series files (created if missing)
     * @throws PersistError if the directory cannot be created
     */
    explicit FileStatisticsStore(const std::string& base_path);
    ~FileStatisticsStore() override = default;

    SeriesState load_state(const std::string& series_id, SeriesKind kind) override;

    void merge(const std::string& series_id,
               SeriesKind kind,
               const std::vector<Bucket>& buckets,
               std::optional<int64_t> new_watermark) override;

    std::vector<Bucket> query(const std::string& series_id,
                              const TimeRange& range) override;

    std::optional<int64_t> watermark(const std::string& series_id) override;

    std::vector<std::string> list_series() override;

    /**
     * @brief Get storage statistics
     * @return Map of statistics
     */
    std::map<std::string, uint64_t> get_statistics() const;

    std::string get_base_path() const { return base_path_; }

    /**
     * @brief File a series is stored in
     */
    std::string series_path(const std::string& series_id) const;

private:
    /**
     * @brief Cached record of a series, read from disk on first use
     * @return nullptr if the series has no file
     */
    const SeriesRecord* find_record(const std::string& series_id);

    SeriesRecord read_file(const std::string& path, std::string& series_id);
    void write_file(const std::string& series_id, const SeriesRecord& record);

    std::string base_path_;
    std::map<std::string, SeriesRecord> cache_;
    uint64_t bytes_written_;
    uint64_t bytes_read_;
    uint64_t merges_;
    mutable std::mutex mutex_;
};

} // namespace meterstat
