#include "meterstat/compute/ingest_pipeline.h"
#include "meterstat/core/file_statistics_store.h"
#include "meterstat/utils/config.h"
#include "meterstat/utils/csv_sample_loader.h"
#include <algorithm>
#include <iomanip>
#include <iostream>

using namespace meterstat;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <samples.csv> <power|energy> [storage_dir] [series.conf]\n"
              << "\n"
              << "Replays recorded samples through the ingestion pipeline, polling every\n"
              << "poll_interval of simulated time, and prints the persisted hourly buckets.\n";
}

void print_bucket(const Bucket& bucket) {
    std::cout << "  " << format_iso8601(bucket.hour_start)
              << (bucket.closed ? "  closed " : "  open   ");
    if (const PowerStats* p = bucket.power()) {
        std::cout << "min=" << std::setw(8) << p->min
                  << " max=" << std::setw(8) << p->max
                  << " mean=" << std::setw(8) << p->mean
                  << " n=" << p->sample_count;
    } else if (const EnergyStats* e = bucket.energy()) {
        std::cout << "sum=" << std::setw(8) << e->sum
                  << " cumulative=" << std::setw(10) << e->cumulative_sum
                  << " n=" << e->sample_count;
    }
    std::cout << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string csv_path = argv[1];
    const std::string storage_dir = argc > 3 ? argv[3] : "./meterstat_replay";

    std::cout << "========================================" << std::endl;
    std::cout << "meterstat ingest replay (v" << METERSTAT_VERSION << ")" << std::endl;
    std::cout << "========================================\n" << std::endl;

    try {
        SeriesKind kind = string_to_series_kind(argv[2]);
        std::string unit = kind == SeriesKind::PowerDemand ? "kW" : "kWh";

        // 1. Load recorded samples
        utils::CsvSampleLoader loader(csv_path);
        std::vector<Sample> samples = loader.loadAll(unit);
        if (samples.empty()) {
            std::cerr << "No samples in " << csv_path << std::endl;
            return 1;
        }
        auto [first, last] = std::minmax_element(samples.begin(), samples.end(),
            [](const Sample& a, const Sample& b) { return a.timestamp < b.timestamp; });
        int64_t begin = floor_to_hour(first->timestamp);
        int64_t end = last->timestamp + native_granularity(kind);

        std::cout << "1. Loaded " << samples.size() << " samples, "
                  << format_iso8601(begin) << " ~ " << format_iso8601(end) << "\n" << std::endl;

        // 2. Series configuration
        SeriesConfig config;
        if (argc > 4) {
            config = load_series_config_file(argv[4], end);
        } else {
            ConfigMap map = {
                {"metering_point", "LU0000000000000000000000000000001"},
                {"energy_id", "REPLAY"},
                {"api_key", "replay"},
                {"kind", argv[2]},
                {"history_start", format_iso8601(begin)}
            };
            config = parse_series_config(map, end);
        }
        std::cout << "2. Series " << config.describe() << "\n" << std::endl;

        // 3. Replay polls over simulated time
        utils::ReplayDataSource source(std::move(samples), unit);
        SampleFetcher fetcher(source);
        FileStatisticsStore store(storage_dir);
        compute::IngestPipeline pipeline(&store, &fetcher);

        std::cout << "3. Replaying polls every "
                  << config.poll_interval_ms / kMillisPerMinute << " minutes..." << std::endl;
        int runs = 0;
        int failures = 0;
        for (int64_t now = begin + config.poll_interval_ms; ; now += config.poll_interval_ms) {
            int64_t poll_time = std::min(now, end + config.late_arrival_margin_ms);
            compute::RunReport report = pipeline.runOnce(config, poll_time);
            ++runs;
            if (!report.ok()) {
                ++failures;
            }
            if (poll_time >= end + config.late_arrival_margin_ms) {
                break;
            }
        }
        std::cout << "   " << runs << " runs, " << failures << " failed\n" << std::endl;

        // 4. Print persisted buckets
        auto buckets = store.query(config.series.series_id, TimeRange(begin, end + kMillisPerHour));
        auto watermark = store.watermark(config.series.series_id);
        std::cout << "4. Persisted " << buckets.size() << " buckets (watermark "
                  << (watermark ? format_iso8601(*watermark) : std::string("none")) << ")" << std::endl;
        for (const auto& bucket : buckets) {
            print_bucket(bucket);
        }

        auto stats = store.get_statistics();
        std::cout << "\n   bytes written: " << stats["bytes_written"]
                  << ", merges: " << stats["merges"] << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
