#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/dispatcher/worker_pool.h"
#include <chrono>
#include <thread>
#include <vector>

using namespace Sluice;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class MockTaskProcessor : public TaskProcessor {
public:
    MOCK_METHOD(ProcessStatus, Process, (const Request& request, const CancelToken& token), (override));
};

class WorkerPoolTest : public ::testing::Test {
protected:
    static constexpr int kWorkers = 2;

    void SetUp() override {
        stats_ = std::make_unique<StatsAggregator>(64);
        queue_ = std::make_unique<WorkQueue>(16);
        gate_ = std::make_unique<AdmissionGate>(16);
        pool_ = std::make_unique<WorkerPool>(kWorkers, *queue_, processor_, *stats_, abort_);
    }

    void TearDown() override {
        StopPool();
    }

    void StopPool() {
        if (pool_) {
            queue_->Close(kWorkers);
            pool_.reset();
        }
    }

    // Queues a request the way the dispatcher does and returns its reply
    ReplyReceiver Submit(uint64_t id, std::optional<Clock::time_point> deadline = std::nullopt) {
        auto channel = MakeReplyChannel();
        Task task{Request{id, "/api/endpoint" + std::to_string(id), deadline},
                  std::move(channel.first), Permit(), Clock::now()};
        EXPECT_EQ(gate_->TryAcquire(&task.permit), AdmissionStatus::kAdmitted);
        stats_->RecordAdmitted();
        EXPECT_EQ(queue_->Enqueue(task, 0ns), EnqueueStatus::kOk);
        return std::move(channel.second);
    }

    NiceMock<MockTaskProcessor> processor_;
    absl::Notification abort_;
    std::unique_ptr<StatsAggregator> stats_;
    std::unique_ptr<WorkQueue> queue_;
    std::unique_ptr<AdmissionGate> gate_;
    std::unique_ptr<WorkerPool> pool_;
};

TEST_F(WorkerPoolTest, ProcessesEveryQueuedRequest) {
    EXPECT_CALL(processor_, Process(_, _)).Times(5).WillRepeatedly(Return(ProcessStatus::kCompleted));
    pool_->Start();

    std::vector<ReplyReceiver> replies;
    for (uint64_t id = 1; id <= 5; ++id) {
        replies.push_back(Submit(id));
    }
    for (uint64_t id = 1; id <= 5; ++id) {
        Outcome outcome = replies[id - 1].Wait();
        EXPECT_EQ(outcome.request_id, id);
        EXPECT_TRUE(outcome.ok());
        EXPECT_GE(outcome.worker_id, 0);
        EXPECT_LT(outcome.worker_id, kWorkers);
    }

    StopPool();
    EXPECT_EQ(gate_->InFlight(), 0u);
    stats_->Flush();
    EXPECT_EQ(stats_->Snapshot().total_succeeded, 5u);
    EXPECT_TRUE(stats_->Snapshot().Balanced());
}

TEST_F(WorkerPoolTest, FaultDoesNotStopTheWorker) {
    EXPECT_CALL(processor_, Process(Field(&Request::id, 1u), _))
        .WillOnce(Throw(ProcessingError("bad request")));
    EXPECT_CALL(processor_, Process(Field(&Request::id, 2u), _))
        .WillOnce(Invoke([](const Request&, const CancelToken&) -> ProcessStatus {
            throw 42;
        }));
    EXPECT_CALL(processor_, Process(Field(&Request::id, 3u), _))
        .WillOnce(Return(ProcessStatus::kCompleted));
    pool_->Start();

    ReplyReceiver first = Submit(1);
    ReplyReceiver second = Submit(2);
    ReplyReceiver third = Submit(3);

    Outcome failed = first.Wait();
    EXPECT_EQ(failed.status, OutcomeStatus::kFailed);
    EXPECT_TRUE(failed.Is(ErrorCode::kProcessingFault));
    EXPECT_EQ(failed.error->detail, "bad request");

    Outcome unknown = second.Wait();
    EXPECT_EQ(unknown.status, OutcomeStatus::kFailed);
    EXPECT_TRUE(unknown.Is(ErrorCode::kProcessingFault));

    EXPECT_TRUE(third.Wait().ok());
    EXPECT_EQ(pool_->NumBusy(), 0);
}

TEST_F(WorkerPoolTest, ExpiredDeadlineSkipsProcessor) {
    EXPECT_CALL(processor_, Process(_, _)).Times(0);
    pool_->Start();

    Outcome outcome = Submit(1, Clock::now() - 1ms).Wait();
    EXPECT_EQ(outcome.status, OutcomeStatus::kTimedOut);
    EXPECT_TRUE(outcome.Is(ErrorCode::kDeadlineExceeded));
}

TEST_F(WorkerPoolTest, DeadlineCancelsLongProcessing) {
    EXPECT_CALL(processor_, Process(_, _))
        .WillOnce(Invoke([](const Request&, const CancelToken& token) {
            return token.SleepFor(10s) ? ProcessStatus::kCompleted : ProcessStatus::kCancelled;
        }));
    pool_->Start();

    auto start = Clock::now();
    Outcome outcome = Submit(1, Clock::now() + 30ms).Wait();
    EXPECT_EQ(outcome.status, OutcomeStatus::kTimedOut);
    EXPECT_TRUE(outcome.Is(ErrorCode::kDeadlineExceeded));
    EXPECT_LT(Clock::now() - start, 5s);
    EXPECT_EQ(pool_->LateCancellations(), 0);
}

TEST_F(WorkerPoolTest, CompletionAfterDeadlineIsTimedOut) {
    // Ignores the token and overruns its deadline
    EXPECT_CALL(processor_, Process(_, _))
        .WillOnce(Invoke([](const Request&, const CancelToken&) {
            std::this_thread::sleep_for(40ms);
            return ProcessStatus::kCompleted;
        }));
    pool_->Start();

    Outcome outcome = Submit(1, Clock::now() + 10ms).Wait();
    EXPECT_EQ(outcome.status, OutcomeStatus::kTimedOut);
    EXPECT_TRUE(outcome.Is(ErrorCode::kDeadlineExceeded));
}

TEST_F(WorkerPoolTest, ProcessorIgnoringDeadlineIsFlagged) {
    const auto overrun = std::chrono::milliseconds(LATE_CANCELLATION_WARNING_MS) + 50ms;
    EXPECT_CALL(processor_, Process(_, _))
        .WillOnce(Invoke([overrun](const Request&, const CancelToken&) {
            std::this_thread::sleep_for(10ms + overrun);
            return ProcessStatus::kCompleted;
        }))
        .WillOnce(Return(ProcessStatus::kCompleted));
    pool_->Start();

    Outcome late = Submit(1, Clock::now() + 10ms).Wait();
    EXPECT_EQ(late.status, OutcomeStatus::kTimedOut);
    EXPECT_TRUE(late.Is(ErrorCode::kDeadlineExceeded));
    EXPECT_EQ(pool_->LateCancellations(), 1);

    EXPECT_TRUE(Submit(2).Wait().ok());
    EXPECT_EQ(pool_->LateCancellations(), 1);
}

TEST_F(WorkerPoolTest, AbortFinishesQueuedWorkWithoutProcessing) {
    EXPECT_CALL(processor_, Process(_, _)).Times(0);
    abort_.Notify();
    pool_->Start();

    std::vector<ReplyReceiver> replies;
    for (uint64_t id = 1; id <= 3; ++id) {
        replies.push_back(Submit(id));
    }
    for (auto& reply : replies) {
        Outcome outcome = reply.Wait();
        EXPECT_EQ(outcome.status, OutcomeStatus::kTimedOut);
        EXPECT_TRUE(outcome.Is(ErrorCode::kAborted));
    }

    StopPool();
    stats_->Flush();
    EXPECT_EQ(stats_->Snapshot().total_aborted, 3u);
    EXPECT_EQ(gate_->InFlight(), 0u);
}

TEST_F(WorkerPoolTest, DroppedReceiverStillCounted) {
    EXPECT_CALL(processor_, Process(_, _)).WillOnce(Return(ProcessStatus::kCompleted));
    pool_->Start();

    {
        ReplyReceiver dropped = Submit(1);
    }

    StopPool();
    stats_->Flush();
    EXPECT_EQ(stats_->Snapshot().total_succeeded, 1u);
    EXPECT_EQ(gate_->InFlight(), 0u);
}
