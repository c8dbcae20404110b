#include "meterstat/core/file_statistics_store.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace meterstat {

namespace fs = std::filesystem;

namespace {

constexpr const char* kSeriesFileExtension = ".mstat";

class BinaryWriter {
public:
    explicit BinaryWriter(std::ofstream& out) : out_(out), bytes_(0) {}

    template <typename T>
    void put(const T& value) {
        out_.write(reinterpret_cast<const char*>(&value), sizeof(value));
        bytes_ += sizeof(value);
    }

    void put_string(const std::string& str) {
        uint64_t len = str.size();
        put(len);
        out_.write(str.data(), static_cast<std::streamsize>(len));
        bytes_ += len;
    }

    uint64_t bytes() const { return bytes_; }

private:
    std::ofstream& out_;
    uint64_t bytes_;
};

class BinaryReader {
public:
    BinaryReader(std::ifstream& in, const std::string& path)
        : in_(in), path_(path), bytes_(0) {}

    template <typename T>
    T get() {
        T value{};
        in_.read(reinterpret_cast<char*>(&value), sizeof(value));
        if (!in_) {
            throw PersistError("truncated statistics file " + path_);
        }
        bytes_ += sizeof(value);
        return value;
    }

    std::string get_string() {
        uint64_t len = get<uint64_t>();
        if (len > (1u << 20)) {
            throw PersistError("corrupt string length in " + path_);
        }
        std::string str(len, '\0');
        if (len > 0) {
            in_.read(&str[0], static_cast<std::streamsize>(len));
            if (!in_) {
                throw PersistError("truncated statistics file " + path_);
            }
        }
        bytes_ += len;
        return str;
    }

    uint64_t bytes() const { return bytes_; }

private:
    std::ifstream& in_;
    const std::string& path_;
    uint64_t bytes_;
};

void write_bucket(BinaryWriter& writer, const Bucket& bucket) {
    writer.put(bucket.hour_start);
    writer.put(static_cast<uint8_t>(bucket.closed ? 1 : 0));
    if (const PowerStats* p = bucket.power()) {
        writer.put(p->min);
        writer.put(p->max);
        writer.put(p->mean);
        writer.put(p->sum);
        writer.put(p->sample_count);
    } else {
        const EnergyStats* e = bucket.energy();
        writer.put(e->sum);
        writer.put(e->mean);
        writer.put(e->sample_count);
        writer.put(e->cumulative_sum);
    }
    writer.put(static_cast<uint64_t>(bucket.slots.size()));
    for (const auto& [ts, value] : bucket.slots) {
        writer.put(ts);
        writer.put(value);
    }
}

Bucket read_bucket(BinaryReader& reader, SeriesKind kind) {
    Bucket bucket;
    bucket.hour_start = reader.get<int64_t>();
    bucket.closed = reader.get<uint8_t>() != 0;
    if (kind == SeriesKind::PowerDemand) {
        PowerStats p;
        p.min = reader.get<double>();
        p.max = reader.get<double>();
        p.mean = reader.get<double>();
        p.sum = reader.get<double>();
        p.sample_count = reader.get<uint64_t>();
        bucket.stats = p;
    } else {
        EnergyStats e;
        e.sum = reader.get<double>();
        e.mean = reader.get<double>();
        e.sample_count = reader.get<uint64_t>();
        e.cumulative_sum = reader.get<double>();
        bucket.stats = e;
    }
    uint64_t slot_count = reader.get<uint64_t>();
    for (uint64_t i = 0; i < slot_count; ++i) {
        int64_t ts = reader.get<int64_t>();
        double value = reader.get<double>();
        bucket.slots.emplace(ts, value);
    }
    return bucket;
}

} // namespace

FileStatisticsStore::FileStatisticsStore(const std::string& base_path)
    : base_path_(base_path),
      bytes_written_(0),
      bytes_read_(0),
      merges_(0) {
    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        fs::create_directories(base_path_, ec);
        if (ec) {
            throw PersistError("cannot create statistics directory " + base_path_ +
                               ": " + ec.message());
        }
    }
}

std::string FileStatisticsStore::series_path(const std::string& series_id) const {
    std::string name;
    name.reserve(series_id.size());
    for (char c : series_id) {
        bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
        name.push_back(keep ? c : '_');
    }
    return base_path_ + "/" + name + kSeriesFileExtension;
}

SeriesState FileStatisticsStore::load_state(const std::string& series_id, SeriesKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SeriesRecord* record = find_record(series_id);
    if (!record) {
        return SeriesState(series_id, kind);
    }
    return state_from_record(series_id, *record);
}

void FileStatisticsStore::merge(const std::string& series_id,
                                SeriesKind kind,
                                const std::vector<Bucket>& buckets,
                                std::optional<int64_t> new_watermark) {
    std::lock_guard<std::mutex> lock(mutex_);
    SeriesRecord empty;
    empty.kind = kind;
    const SeriesRecord* current = find_record(series_id);

    SeriesRecord updated = merged_record(series_id, current ? *current : empty,
                                         kind, buckets, new_watermark);
    write_file(series_id, updated);
    cache_[series_id] = std::move(updated);
    ++merges_;
}

std::vector<Bucket> FileStatisticsStore::query(const std::string& series_id,
                                               const TimeRange& range) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SeriesRecord* record = find_record(series_id);
    if (!record) {
        return {};
    }
    return buckets_in_range(*record, range);
}

std::optional<int64_t> FileStatisticsStore::watermark(const std::string& series_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SeriesRecord* record = find_record(series_id);
    if (!record) {
        return std::nullopt;
    }
    return record->watermark;
}

std::vector<std::string> FileStatisticsStore::list_series() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(base_path_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != kSeriesFileExtension) {
            continue;
        }
        try {
            std::string series_id;
            SeriesRecord record = read_file(entry.path().string(), series_id);
            cache_.emplace(series_id, std::move(record));
            ids.push_back(series_id);
        } catch (const PersistError& e) {
            std::cerr << "FileStatisticsStore: skipping " << entry.path()
                      << ": " << e.what() << std::endl;
        }
    }
    if (ec) {
        throw PersistError("cannot list " + base_path_ + ": " + ec.message());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::map<std::string, uint64_t> FileStatisticsStore::get_statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, uint64_t> stats;

    stats["bytes_written"] = bytes_written_;
    stats["bytes_read"] = bytes_read_;
    stats["merges"] = merges_;
    stats["cached_series"] = cache_.size();

    return stats;
}

// Private helper methods

const SeriesRecord* FileStatisticsStore::find_record(const std::string& series_id) {
    auto it = cache_.find(series_id);
    if (it != cache_.end()) {
        return &it->second;
    }

    std::string path = series_path(series_id);
    if (!fs::exists(path)) {
        return nullptr;
    }

    std::string stored_id;
    SeriesRecord record = read_file(path, stored_id);
    if (stored_id != series_id) {
        throw PersistError("statistics file " + path + " belongs to series '" +
                           stored_id + "', not '" + series_id + "'");
    }
    return &cache_.emplace(series_id, std::move(record)).first->second;
}

SeriesRecord FileStatisticsStore::read_file(const std::string& path, std::string& series_id) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw PersistError("cannot open statistics file " + path);
    }

    BinaryReader reader(in, path);
    StoreFileHeader header;
    header.magic_number = reader.get<uint32_t>();
    if (header.magic_number != METERSTAT_STORE_MAGIC_NUMBER) {
        throw PersistError("bad magic number in " + path);
    }
    header.format_version = reader.get<uint32_t>();
    if (header.format_version != METERSTAT_STORE_FORMAT_VERSION) {
        throw PersistError("unsupported format version " +
                           std::to_string(header.format_version) + " in " + path);
    }
    header.kind = reader.get<uint8_t>();
    header.has_watermark = reader.get<uint8_t>();
    header.watermark = reader.get<int64_t>();
    header.bucket_count = reader.get<uint64_t>();

    if (header.kind > static_cast<uint8_t>(SeriesKind::EnergyConsumption)) {
        throw PersistError("unknown series kind in " + path);
    }

    SeriesRecord record;
    record.kind = static_cast<SeriesKind>(header.kind);
    if (header.has_watermark) {
        record.watermark = header.watermark;
    }
    series_id = reader.get_string();

    for (uint64_t i = 0; i < header.bucket_count; ++i) {
        Bucket bucket = read_bucket(reader, record.kind);
        record.buckets[bucket.hour_start] = std::move(bucket);
    }

    bytes_read_ += reader.bytes();
    return record;
}

void FileStatisticsStore::write_file(const std::string& series_id, const SeriesRecord& record) {
    std::string path = series_path(series_id);
    std::string tmp_path = path + ".tmp";

    uint64_t written = 0;
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw PersistError("cannot open " + tmp_path + " for writing");
        }

        StoreFileHeader header;
        header.kind = static_cast<uint8_t>(record.kind);
        header.has_watermark = record.watermark ? 1 : 0;
        header.watermark = record.watermark.value_or(0);
        header.bucket_count = record.buckets.size();

        BinaryWriter writer(out);
        writer.put(header.magic_number);
        writer.put(header.format_version);
        writer.put(header.kind);
        writer.put(header.has_watermark);
        writer.put(header.watermark);
        writer.put(header.bucket_count);
        writer.put_string(series_id);
        for (const auto& [hour, bucket] : record.buckets) {
            write_bucket(writer, bucket);
        }

        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            fs::remove(tmp_path, ignored);
            throw PersistError("failed writing " + tmp_path);
        }
        written = writer.bytes();
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw PersistError("cannot replace " + path + ": " + ec.message());
    }
    bytes_written_ += written;
}

} // namespace meterstat
