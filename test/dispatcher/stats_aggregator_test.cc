#include <gtest/gtest.h>
#include "../../src/dispatcher/stats_aggregator.h"
#include <chrono>
#include <thread>
#include <vector>

using namespace Sluice;
using namespace std::chrono_literals;

class StatsAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        stats_ = std::make_unique<StatsAggregator>(64);
    }

    static Outcome Succeeded(uint64_t id, std::chrono::nanoseconds latency) {
        Outcome outcome = Outcome::Success(id);
        outcome.latency = latency;
        return outcome;
    }

    std::unique_ptr<StatsAggregator> stats_;
};

TEST_F(StatsAggregatorTest, StartsEmpty) {
    Stats snapshot = stats_->Snapshot();
    EXPECT_EQ(snapshot.total_submitted, 0u);
    EXPECT_EQ(snapshot.TotalCompleted(), 0u);
    EXPECT_TRUE(snapshot.Balanced());
    EXPECT_EQ(snapshot.AverageLatency(), 0ns);
}

TEST_F(StatsAggregatorTest, CountsEveryOutcomeKind) {
    for (int i = 0; i < 4; ++i) {
        stats_->RecordAdmitted();
    }
    stats_->RecordOutcome(Succeeded(1, 10ms));
    stats_->RecordOutcome(Outcome::Failure(2, OutcomeStatus::kFailed, ErrorCode::kProcessingFault, "x"));
    stats_->RecordOutcome(Outcome::Failure(3, OutcomeStatus::kTimedOut, ErrorCode::kDeadlineExceeded, "x"));
    stats_->RecordOutcome(Outcome::Failure(4, OutcomeStatus::kTimedOut, ErrorCode::kAborted, "x"));
    stats_->RecordRefused(Outcome::Failure(5, OutcomeStatus::kRejected, ErrorCode::kAtCapacity, "x"));
    stats_->Flush();

    Stats snapshot = stats_->Snapshot();
    EXPECT_EQ(snapshot.total_submitted, 5u);
    EXPECT_EQ(snapshot.total_succeeded, 1u);
    EXPECT_EQ(snapshot.total_failed, 1u);
    EXPECT_EQ(snapshot.total_timed_out, 2u);
    EXPECT_EQ(snapshot.total_aborted, 1u);
    EXPECT_EQ(snapshot.total_rejected, 1u);
    EXPECT_EQ(snapshot.total_queue_full, 0u);
    EXPECT_TRUE(snapshot.Balanced());
}

TEST_F(StatsAggregatorTest, QueueFullIsASubsetOfRejected) {
    stats_->RecordAdmitted();
    stats_->RecordOutcome(Outcome::Failure(1, OutcomeStatus::kRejected, ErrorCode::kQueueFull, "x"));
    stats_->RecordRefused(Outcome::Failure(2, OutcomeStatus::kRejected, ErrorCode::kClosed, "x"));
    stats_->Flush();

    Stats snapshot = stats_->Snapshot();
    EXPECT_EQ(snapshot.total_rejected, 2u);
    EXPECT_EQ(snapshot.total_queue_full, 1u);
    EXPECT_TRUE(snapshot.Balanced());
}

TEST_F(StatsAggregatorTest, LatencyAveragesSuccessesOnly) {
    for (int i = 0; i < 3; ++i) {
        stats_->RecordAdmitted();
    }
    stats_->RecordOutcome(Succeeded(1, 10ms));
    stats_->RecordOutcome(Succeeded(2, 30ms));
    Outcome failed = Outcome::Failure(3, OutcomeStatus::kFailed, ErrorCode::kProcessingFault, "x");
    failed.latency = 1s;
    stats_->RecordOutcome(failed);
    stats_->Flush();

    Stats snapshot = stats_->Snapshot();
    EXPECT_EQ(snapshot.cumulative_latency, 40ms);
    EXPECT_EQ(snapshot.AverageLatency(), 20ms);
}

TEST_F(StatsAggregatorTest, ConcurrentRecordersAreAllCounted) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 500;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                stats_->RecordAdmitted();
                stats_->RecordOutcome(Succeeded(t * kPerThread + i, 1us));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    stats_->Flush();

    Stats snapshot = stats_->Snapshot();
    EXPECT_EQ(snapshot.total_submitted, static_cast<uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(snapshot.total_succeeded, static_cast<uint64_t>(kThreads * kPerThread));
}

TEST_F(StatsAggregatorTest, StoppedAggregatorIsFrozen) {
    stats_->RecordAdmitted();
    stats_->RecordOutcome(Succeeded(1, 5ms));
    stats_->Stop();
    EXPECT_TRUE(stats_->IsStopped());

    Stats final_stats = stats_->Snapshot();
    EXPECT_EQ(final_stats.total_succeeded, 1u);

    stats_->RecordAdmitted();
    stats_->RecordOutcome(Succeeded(2, 5ms));
    stats_->Flush();
    stats_->Stop();

    Stats later = stats_->Snapshot();
    EXPECT_EQ(later.total_submitted, final_stats.total_submitted);
    EXPECT_EQ(later.total_succeeded, final_stats.total_succeeded);
}

TEST(StatsTest, ToStringReportsPercentages) {
    Stats stats;
    stats.total_submitted = 4;
    stats.total_succeeded = 3;
    stats.total_failed = 1;
    std::string text = stats.ToString();
    EXPECT_NE(text.find("succeeded=3 (75.0%)"), std::string::npos);
    EXPECT_NE(text.find("failed=1 (25.0%)"), std::string::npos);
}
