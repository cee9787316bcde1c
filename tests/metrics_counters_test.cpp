#include "metrics/metrics_counters.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace BuildCacheS3::Metrics
{

using namespace std::chrono_literals;

TEST(MetricsCountersTest, StartsAtZero)
{
    MetricsCounters counters;
    const auto s = counters.Snapshot();
    EXPECT_EQ(s.gets, 0u);
    EXPECT_EQ(s.hits, 0u);
    EXPECT_EQ(s.misses, 0u);
    EXPECT_EQ(s.get_errors, 0u);
    EXPECT_EQ(s.puts, 0u);
    EXPECT_EQ(s.put_errors, 0u);
    EXPECT_EQ(s.total_get_bytes, 0u);
    EXPECT_EQ(s.total_put_bytes, 0u);
    EXPECT_EQ(s.total_get_duration, Duration::zero());
}

TEST(MetricsCountersTest, AccumulatesTransfers)
{
    MetricsCounters counters;
    counters.AddGetTransfer(100, 10ms);
    counters.AddGetTransfer(50, 5ms);
    counters.AddPutTransfer(7, 1ms);

    const auto s = counters.Snapshot();
    EXPECT_EQ(s.total_get_bytes, 150u);
    EXPECT_EQ(s.total_get_duration, Duration(15ms));
    EXPECT_EQ(s.total_put_bytes, 7u);
    EXPECT_EQ(s.total_put_duration, Duration(1ms));
}

TEST(MetricsCountersTest, ConcurrentIncrementsAreNotLost)
{
    MetricsCounters counters;
    constexpr int kThreads   = 8;
    constexpr int kPerThread = 1000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&counters] {
            for (int i = 0; i < kPerThread; ++i) {
                counters.IncrementGets();
                counters.IncrementHits();
                counters.AddPutTransfer(1, 1ns);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(counters.GetGets(), kThreads * kPerThread);
    EXPECT_EQ(counters.GetHits(), kThreads * kPerThread);
    EXPECT_EQ(counters.Snapshot().total_put_bytes, kThreads * kPerThread);
}

TEST(MetricsCountersTest, SummaryWithoutBytes)
{
    MetricsCounters counters;
    counters.IncrementGets();
    counters.IncrementMisses();
    counters.IncrementPuts();
    counters.IncrementPutErrors();

    EXPECT_EQ(
        counters.Summary(),
        "1 gets: 0 hits, 1 misses, 0 errors, 0.0s total dur\n1 puts: 1 errors, 0.0s total dur"
    );
}

TEST(MetricsCountersTest, SummaryWithBytesReportsThroughput)
{
    MetricsCounters counters;
    counters.IncrementGets();
    counters.IncrementHits();
    counters.AddGetTransfer(2'000'000, 2s);

    const std::string summary = counters.Summary();
    EXPECT_EQ(
        summary.substr(0, summary.find('\n')),
        "1 gets: 1 hits, 0 misses, 0 errors, 2.0s total dur; total 2.00 MB; avg 1.00 MB/s"
    );
}

TEST(MetricsCountersTest, SummaryRoundsToTenthsOfSeconds)
{
    MetricsCounters counters;
    counters.AddPutTransfer(0, 1249ms);
    EXPECT_NE(counters.Summary().find("0 puts: 0 errors, 1.2s total dur"), std::string::npos);
}

TEST(MetricsCountersTest, CsvHeaderAndRowColumnOrder)
{
    MetricsCounters counters;
    counters.IncrementGets();
    counters.IncrementGets();
    counters.IncrementHits();
    counters.IncrementMisses();
    counters.IncrementPuts();
    counters.IncrementPuts();
    counters.IncrementPuts();
    counters.IncrementGetErrors();
    counters.AddGetTransfer(42, 1500ms);
    counters.AddPutTransfer(1024, 61001ms);

    std::ostringstream out;
    ASSERT_TRUE(counters.WriteCsv(out, true).has_value());
    EXPECT_EQ(
        out.str(),
        "gets,hits,misses,puts,getErrors,putErrors,totalGetBytes,totalGetDur,totalPutBytes,"
        "totalPutDur\n"
        "2,1,1,3,1,0,42,00:00:01.500,1024,00:01:01.001\n"
    );
}

TEST(MetricsCountersTest, CsvWithoutHeader)
{
    MetricsCounters counters;
    std::ostringstream out;
    ASSERT_TRUE(counters.WriteCsv(out, false).has_value());
    EXPECT_EQ(out.str(), "0,0,0,0,0,0,0,00:00:00.000,0,00:00:00.000\n");
}

TEST(MetricsCountersTest, CsvReportsStreamFailure)
{
    MetricsCounters counters;
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    auto res = counters.WriteCsv(out, true);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Storage::StorageErrc::IOError);
}

TEST(MetricsCountersTest, CsvDurationHoursAreNotWrapped)
{
    EXPECT_EQ(FormatCsvDuration(25h + 2min + 3s + 4ms), "25:02:03.004");
    EXPECT_EQ(FormatCsvDuration(999us), "00:00:00.000");
}

}  // namespace BuildCacheS3::Metrics
