#include "meterstat/ingest/sample_fetcher.h"
#include "meterstat/utils/csv_sample_loader.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <functional>

namespace fs = std::filesystem;

namespace meterstat {
namespace test {

// Records every request and answers with a scripted page
class ScriptedSource : public RemoteDataSource {
public:
    using Handler = std::function<SamplePage(const FetchRequest&)>;

    explicit ScriptedSource(Handler handler) : handler_(std::move(handler)) {}

    SamplePage fetch_page(const FetchRequest& request) override {
        requests.push_back(request);
        return handler_(request);
    }

    std::vector<FetchRequest> requests;

private:
    Handler handler_;
};

class SampleFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = 1709251200000;  // 2024-03-01T00:00:00Z
        power_ = Series("LU1_1-1:1.29.0_pwr_hourly", "LU1", "E1", "1-1:1.29.0",
                        SeriesKind::PowerDemand);
        energy_ = Series("LU1_1-1:1.29.0_energy_hourly", "LU1", "E1", "1-1:1.29.0",
                         SeriesKind::EnergyConsumption);
    }

    static SamplePage empty_page(const FetchRequest&) { return SamplePage(); }

    int64_t base_ = 0;
    Series power_;
    Series energy_;
};

TEST_F(SampleFetcherTest, SplitsLongWindowIntoChunks) {
    ScriptedSource source(empty_page);
    SampleFetcher fetcher(source);

    auto chunks = fetcher.split_window(base_, base_ + 65 * kMillisPerDay);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].start_time, base_);
    EXPECT_EQ(chunks[0].end_time, base_ + 30 * kMillisPerDay);
    EXPECT_EQ(chunks[1].start_time, chunks[0].end_time);
    EXPECT_EQ(chunks[2].end_time, base_ + 65 * kMillisPerDay);

    EXPECT_TRUE(fetcher.split_window(base_, base_).empty());
}

TEST_F(SampleFetcherTest, RequestCarriesSeriesAndCredentials) {
    ScriptedSource source(empty_page);
    SampleFetcher fetcher(source);

    auto stream = fetcher.fetch(energy_, "secret", base_, base_ + kMillisPerDay,
                                base_ + kMillisPerDay);
    EXPECT_TRUE(stream.drain().empty());

    ASSERT_EQ(source.requests.size(), 1u);
    const FetchRequest& request = source.requests[0];
    EXPECT_EQ(request.metering_point, "LU1");
    EXPECT_EQ(request.energy_id, "E1");
    EXPECT_EQ(request.obis_code, "1-1:1.29.0");
    EXPECT_EQ(request.api_key, "secret");
    EXPECT_EQ(request.aggregation_level, "Hour");
    EXPECT_EQ(request.from, base_);
    EXPECT_EQ(request.to, base_ + kMillisPerDay);
    EXPECT_TRUE(request.page_token.empty());
}

TEST_F(SampleFetcherTest, AggregationLevelFollowsKind) {
    EXPECT_EQ(SampleFetcher::aggregation_level_for(SeriesKind::PowerDemand), "None");
    EXPECT_EQ(SampleFetcher::aggregation_level_for(SeriesKind::EnergyConsumption), "Hour");
}

TEST_F(SampleFetcherTest, StreamIsLazy) {
    ScriptedSource source(empty_page);
    SampleFetcher fetcher(source);

    auto stream = fetcher.fetch(power_, "k", base_, base_ + 70 * kMillisPerDay,
                                base_ + 70 * kMillisPerDay);
    EXPECT_EQ(stream.chunk_count(), 3u);
    EXPECT_TRUE(source.requests.empty());

    stream.drain();
    EXPECT_EQ(source.requests.size(), 3u);
    EXPECT_EQ(stream.pages_fetched(), 3u);
}

TEST_F(SampleFetcherTest, FollowsPageTokens) {
    const int64_t t0 = base_;
    ScriptedSource source([t0](const FetchRequest& request) {
        SamplePage page;
        page.unit = "kW";
        if (request.page_token.empty()) {
            page.items.emplace_back(t0, 1.0);
            page.items.emplace_back(t0 + 15 * kMillisPerMinute, 2.0);
            page.next_page_token = "p2";
        } else if (request.page_token == "p2") {
            page.items.emplace_back(t0 + 30 * kMillisPerMinute, 3.0, "W");
        }
        return page;
    });
    SampleFetcher fetcher(source);

    auto stream = fetcher.fetch(power_, "k", base_, base_ + kMillisPerHour, base_ + kMillisPerHour);
    auto samples = stream.drain();

    ASSERT_EQ(samples.size(), 3u);
    EXPECT_DOUBLE_EQ(samples[2].value, 3.0);
    EXPECT_EQ(samples[0].unit, "kW");
    EXPECT_EQ(samples[2].unit, "W");
    EXPECT_EQ(stream.pages_fetched(), 2u);
    EXPECT_EQ(stream.samples_produced(), 3u);
    ASSERT_EQ(source.requests.size(), 2u);
    EXPECT_EQ(source.requests[1].page_token, "p2");
}

TEST_F(SampleFetcherTest, RepeatedPageTokenIsPermanentError) {
    ScriptedSource source([](const FetchRequest&) {
        SamplePage page;
        page.next_page_token = "again";
        return page;
    });
    SampleFetcher fetcher(source);

    auto stream = fetcher.fetch(power_, "k", base_, base_ + kMillisPerHour, base_ + kMillisPerHour);
    try {
        stream.drain();
        FAIL() << "expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.kind(), FetchErrorKind::Permanent);
    }
}

TEST_F(SampleFetcherTest, InvalidWindowIsRejected) {
    ScriptedSource source(empty_page);
    SampleFetcher fetcher(source);

    EXPECT_THROW(fetcher.fetch(power_, "k", base_ + 1, base_, base_), std::invalid_argument);
    EXPECT_THROW(fetcher.fetch(power_, "k", base_, base_ + kMillisPerHour, base_),
                 std::invalid_argument);
    // within the clock skew allowance
    EXPECT_NO_THROW(fetcher.fetch(power_, "k", base_, base_ + kMillisPerMinute, base_));
    EXPECT_TRUE(source.requests.empty());
}

TEST_F(SampleFetcherTest, InvalidConfigIsRejected) {
    ScriptedSource source(empty_page);
    FetcherConfig config;
    config.max_days_per_request = 0;
    EXPECT_THROW(SampleFetcher(source, config), std::invalid_argument);

    config = FetcherConfig();
    config.fetch_timeout_ms = -1;
    EXPECT_THROW(SampleFetcher(source, config), std::invalid_argument);
}

TEST_F(SampleFetcherTest, CancellationStopsBeforeNextPage) {
    CancellationToken cancel;
    ScriptedSource source([cancel](const FetchRequest&) mutable {
        SamplePage page;
        page.items.emplace_back(0, 1.0);
        cancel.cancel();
        return page;
    });
    SampleFetcher fetcher(source);

    auto stream = fetcher.fetch(power_, "k", base_, base_ + 60 * kMillisPerDay,
                                base_ + 60 * kMillisPerDay, cancel);
    Sample sample;
    EXPECT_TRUE(stream.next(sample));
    EXPECT_THROW(stream.next(sample), RunCancelledError);
    EXPECT_EQ(source.requests.size(), 1u);
}

TEST_F(SampleFetcherTest, ErrorsFromSourcePropagate) {
    ScriptedSource source([](const FetchRequest&) -> SamplePage {
        throw FetchError::from_http_status(503, "maintenance");
    });
    SampleFetcher fetcher(source);

    auto stream = fetcher.fetch(power_, "k", base_, base_ + kMillisPerHour, base_ + kMillisPerHour);
    try {
        stream.drain();
        FAIL() << "expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_TRUE(e.is_transient());
        EXPECT_EQ(e.http_status(), 503);
    }
}

class ReplayDataSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file_ = "./test_replay_samples.csv";
    }

    void TearDown() override {
        if (fs::exists(test_file_)) {
            fs::remove(test_file_);
        }
    }

    void write_file(const std::string& content) {
        std::ofstream out(test_file_);
        out << content;
    }

    std::string test_file_;
};

TEST_F(ReplayDataSourceTest, LoadsIsoAndEpochTimestamps) {
    write_file("timestamp,value,quality\n"
               "2024-03-01T00:00:00Z,1.5,valid\n"
               "1709252100000,2.5\n"
               "# comment\n"
               "\n"
               "2024-03-01T00:30:00Z,3.5,invalid\n");

    utils::CsvSampleLoader loader(test_file_);
    auto samples = loader.loadAll("kW");
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_EQ(samples[0].timestamp, 1709251200000);
    EXPECT_EQ(samples[0].quality, SampleQuality::Valid);
    EXPECT_EQ(samples[1].timestamp, 1709252100000);
    EXPECT_EQ(samples[1].unit, "kW");
    EXPECT_TRUE(samples[2].is_invalid());
}

TEST_F(ReplayDataSourceTest, MalformedRowReportsLine) {
    write_file("timestamp,value\n2024-03-01T00:00:00Z,abc\n");
    utils::CsvSampleLoader loader(test_file_);
    try {
        loader.loadAll();
        FAIL() << "expected parse error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
}

TEST_F(ReplayDataSourceTest, ServesWindowInPages) {
    std::vector<Sample> samples;
    const int64_t base = 1709251200000;
    for (int i = 0; i < 10; ++i) {
        samples.emplace_back(base + i * 15 * kMillisPerMinute, i);
    }
    utils::ReplayDataSource source(samples, "kW", 3);
    SampleFetcher fetcher(source);

    Series series("s", "LU1", "E1", "1-1:1.29.0", SeriesKind::PowerDemand);
    auto stream = fetcher.fetch(series, "k", base + kMillisPerHour, base + 2 * kMillisPerHour,
                                base + 2 * kMillisPerHour);
    auto fetched = stream.drain();

    // [01:00, 02:00] inclusive holds samples 4..8
    ASSERT_EQ(fetched.size(), 5u);
    EXPECT_DOUBLE_EQ(fetched.front().value, 4.0);
    EXPECT_DOUBLE_EQ(fetched.back().value, 8.0);
    EXPECT_EQ(fetched.front().unit, "kW");
    EXPECT_EQ(source.requestCount(), 2u);
}

TEST_F(ReplayDataSourceTest, BadPageTokenIsPermanent) {
    utils::ReplayDataSource source({}, "kW");
    FetchRequest request;
    request.page_token = "x";
    try {
        source.fetch_page(request);
        FAIL() << "expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.kind(), FetchErrorKind::Permanent);
        EXPECT_EQ(e.http_status(), 400);
    }
}

}  // namespace test
}  // namespace meterstat
