#include <gtest/gtest.h>
#include "../../src/common/latency_stats.h"

using namespace Sluice;
using namespace std::chrono_literals;

TEST(LatencyStatsTest, EmptySummary) {
    LatencyStats stats;
    auto summary = stats.Summarize();
    EXPECT_EQ(summary.count, 0u);
    EXPECT_DOUBLE_EQ(summary.max_us, 0.0);
}

TEST(LatencyStatsTest, NearestRankPercentiles) {
    std::vector<long long> samples;
    // Shuffled on purpose; the summary sorts its own copy
    for (long long v = 100; v >= 1; --v) {
        samples.push_back(v);
    }
    auto summary = LatencyStats::ComputeSummary(samples);
    EXPECT_EQ(summary.count, 100u);
    EXPECT_DOUBLE_EQ(summary.min_us, 1.0);
    EXPECT_DOUBLE_EQ(summary.max_us, 100.0);
    EXPECT_DOUBLE_EQ(summary.p50_us, 50.0);
    EXPECT_DOUBLE_EQ(summary.p90_us, 90.0);
    EXPECT_DOUBLE_EQ(summary.p99_us, 99.0);
    EXPECT_DOUBLE_EQ(summary.average_us, 50.5);
}

TEST(LatencyStatsTest, SingleSample) {
    LatencyStats stats;
    stats.Add(2ms);
    auto summary = stats.Summarize();
    EXPECT_EQ(stats.Count(), 1u);
    EXPECT_DOUBLE_EQ(summary.p50_us, 2000.0);
    EXPECT_DOUBLE_EQ(summary.p99_us, 2000.0);
    EXPECT_NE(summary.ToString().find("p99=2ms"), std::string::npos);
}
