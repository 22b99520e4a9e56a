#include <gtest/gtest.h>
#include "../../src/dispatcher/synthetic_processor.h"
#include <chrono>
#include <thread>

using namespace Sluice;
using namespace std::chrono_literals;

class SyntheticProcessorTest : public ::testing::Test {
protected:
    static SyntheticWorkload FastWorkload() {
        SyntheticWorkload workload;
        workload.base_cost = 1ms;
        workload.cost_step = 2ms;
        workload.cost_buckets = 5;
        workload.failure_modulus = 7;
        return workload;
    }

    static Request MakeRequest(uint64_t id) {
        return Request{id, "/api/endpoint" + std::to_string(id % NUM_ENDPOINTS), std::nullopt};
    }
};

TEST_F(SyntheticProcessorTest, CostDependsOnIdBucket) {
    SyntheticProcessor processor{SyntheticWorkload{}};
    // Defaults: 100ms plus 50ms per bucket over 5 buckets
    EXPECT_EQ(processor.CostOf(0), 100ms);
    EXPECT_EQ(processor.CostOf(1), 150ms);
    EXPECT_EQ(processor.CostOf(4), 300ms);
    EXPECT_EQ(processor.CostOf(5), 100ms);
    EXPECT_EQ(processor.CostOf(13), 250ms);
}

TEST_F(SyntheticProcessorTest, CompletesOrdinaryRequests) {
    SyntheticProcessor processor(FastWorkload());
    CancelToken token(std::nullopt, nullptr);
    for (uint64_t id = 1; id <= 6; ++id) {
        EXPECT_EQ(processor.Process(MakeRequest(id), token), ProcessStatus::kCompleted);
    }
}

TEST_F(SyntheticProcessorTest, FaultsOnMultiplesOfModulus) {
    SyntheticProcessor processor(FastWorkload());
    CancelToken token(std::nullopt, nullptr);
    EXPECT_THROW(processor.Process(MakeRequest(7), token), ProcessingError);
    EXPECT_THROW(processor.Process(MakeRequest(14), token), ProcessingError);
    EXPECT_EQ(processor.Process(MakeRequest(8), token), ProcessStatus::kCompleted);
}

TEST_F(SyntheticProcessorTest, ZeroModulusDisablesFaults) {
    SyntheticWorkload workload = FastWorkload();
    workload.failure_modulus = 0;
    SyntheticProcessor processor(workload);
    CancelToken token(std::nullopt, nullptr);
    EXPECT_EQ(processor.Process(MakeRequest(7), token), ProcessStatus::kCompleted);
}

TEST_F(SyntheticProcessorTest, DeadlineCutsTheWorkShort) {
    SyntheticWorkload workload;
    workload.base_cost = 5s;
    SyntheticProcessor processor(workload);
    CancelToken token(Clock::now() + 20ms, nullptr);

    auto start = Clock::now();
    EXPECT_EQ(processor.Process(MakeRequest(1), token), ProcessStatus::kCancelled);
    EXPECT_LT(Clock::now() - start, 2s);
}

TEST_F(SyntheticProcessorTest, AbortCutsTheWorkShort) {
    SyntheticWorkload workload;
    workload.base_cost = 5s;
    SyntheticProcessor processor(workload);
    absl::Notification abort;
    CancelToken token(std::nullopt, &abort);

    std::thread aborter([&abort]() {
        std::this_thread::sleep_for(20ms);
        abort.Notify();
    });
    auto start = Clock::now();
    EXPECT_EQ(processor.Process(MakeRequest(1), token), ProcessStatus::kCancelled);
    EXPECT_LT(Clock::now() - start, 2s);
    EXPECT_TRUE(token.Aborted());
    aborter.join();
}
