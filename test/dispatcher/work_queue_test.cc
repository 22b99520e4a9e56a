#include <gtest/gtest.h>
#include "../../src/dispatcher/work_queue.h"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace Sluice;
using namespace std::chrono_literals;

class WorkQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        queue_ = std::make_unique<WorkQueue>(2);
    }

    // The receiver is kept so that every sender can be answered before it goes away
    Task MakeTask(uint64_t id) {
        auto channel = MakeReplyChannel();
        receivers_.push_back(std::move(channel.second));
        return Task{Request{id, "/api/endpoint" + std::to_string(id), std::nullopt},
                    std::move(channel.first), Permit(), Clock::now()};
    }

    static void Answer(Task& task) {
        EXPECT_TRUE(task.reply.Send(Outcome::Success(task.request.id)));
    }

    std::unique_ptr<WorkQueue> queue_;
    std::vector<ReplyReceiver> receivers_;
};

TEST_F(WorkQueueTest, FifoOrder) {
    Task first = MakeTask(1);
    Task second = MakeTask(2);
    ASSERT_EQ(queue_->Enqueue(first, 0ns), EnqueueStatus::kOk);
    ASSERT_EQ(queue_->Enqueue(second, 0ns), EnqueueStatus::kOk);
    EXPECT_EQ(queue_->Size(), 2u);

    auto a = queue_->Dequeue();
    auto b = queue_->Dequeue();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->request.id, 1u);
    EXPECT_EQ(b->request.id, 2u);
    EXPECT_EQ(a->request.payload, "/api/endpoint1");
    Answer(*a);
    Answer(*b);
}

TEST_F(WorkQueueTest, FullQueueRejectsFastAndKeepsTask) {
    Task first = MakeTask(1);
    Task second = MakeTask(2);
    Task third = MakeTask(3);
    ASSERT_EQ(queue_->Enqueue(first, 0ns), EnqueueStatus::kOk);
    ASSERT_EQ(queue_->Enqueue(second, 0ns), EnqueueStatus::kOk);

    EXPECT_EQ(queue_->Enqueue(third, 0ns), EnqueueStatus::kFull);
    // Still owned by the caller
    EXPECT_EQ(third.request.id, 3u);
    EXPECT_TRUE(third.reply.valid());
    Answer(third);

    for (int i = 0; i < 2; ++i) {
        auto task = queue_->Dequeue();
        ASSERT_TRUE(task.has_value());
        Answer(*task);
    }
}

TEST_F(WorkQueueTest, EnqueueWaitsForSpace) {
    Task first = MakeTask(1);
    Task second = MakeTask(2);
    Task third = MakeTask(3);
    ASSERT_EQ(queue_->Enqueue(first, 0ns), EnqueueStatus::kOk);
    ASSERT_EQ(queue_->Enqueue(second, 0ns), EnqueueStatus::kOk);

    std::thread consumer([this]() {
        std::this_thread::sleep_for(30ms);
        auto task = queue_->Dequeue();
        ASSERT_TRUE(task.has_value());
        Answer(*task);
    });

    EXPECT_EQ(queue_->Enqueue(third, 5s), EnqueueStatus::kOk);
    consumer.join();

    for (int i = 0; i < 2; ++i) {
        auto task = queue_->Dequeue();
        ASSERT_TRUE(task.has_value());
        Answer(*task);
    }
}

TEST_F(WorkQueueTest, EnqueueWaitTimesOut) {
    Task first = MakeTask(1);
    Task second = MakeTask(2);
    Task third = MakeTask(3);
    ASSERT_EQ(queue_->Enqueue(first, 0ns), EnqueueStatus::kOk);
    ASSERT_EQ(queue_->Enqueue(second, 0ns), EnqueueStatus::kOk);

    auto start = Clock::now();
    EXPECT_EQ(queue_->Enqueue(third, 20ms), EnqueueStatus::kFull);
    EXPECT_GE(Clock::now() - start, 20ms);
    Answer(third);

    for (int i = 0; i < 2; ++i) {
        auto task = queue_->Dequeue();
        ASSERT_TRUE(task.has_value());
        Answer(*task);
    }
}

TEST_F(WorkQueueTest, CloseDrainsBeforeSentinels) {
    WorkQueue queue(8);
    for (uint64_t id = 1; id <= 3; ++id) {
        Task task = MakeTask(id);
        ASSERT_EQ(queue.Enqueue(task, 0ns), EnqueueStatus::kOk);
    }

    queue.Close(2);
    EXPECT_TRUE(queue.IsClosed());

    Task late = MakeTask(4);
    EXPECT_EQ(queue.Enqueue(late, 0ns), EnqueueStatus::kClosed);
    Answer(late);

    // Queued work comes out first, then one sentinel per consumer
    for (uint64_t id = 1; id <= 3; ++id) {
        auto task = queue.Dequeue();
        ASSERT_TRUE(task.has_value());
        EXPECT_EQ(task->request.id, id);
        Answer(*task);
    }
    EXPECT_FALSE(queue.Dequeue().has_value());
    EXPECT_FALSE(queue.Dequeue().has_value());
    EXPECT_EQ(queue.Size(), 0u);
}

TEST_F(WorkQueueTest, CloseReleasesBlockedConsumers) {
    std::vector<std::thread> consumers;
    std::atomic<int> stopped{0};
    for (int i = 0; i < 2; ++i) {
        consumers.emplace_back([this, &stopped]() {
            if (!queue_->Dequeue().has_value()) {
                stopped++;
            }
        });
    }

    std::this_thread::sleep_for(20ms);
    queue_->Close(2);
    for (auto& t : consumers) {
        t.join();
    }
    EXPECT_EQ(stopped.load(), 2);
}

TEST_F(WorkQueueTest, PermitTravelsWithTask) {
    AdmissionGate gate(1);
    Task task = MakeTask(1);
    ASSERT_EQ(gate.Acquire(&task.permit), AdmissionStatus::kAdmitted);
    ASSERT_EQ(queue_->Enqueue(task, 0ns), EnqueueStatus::kOk);
    EXPECT_FALSE(task.permit.held());
    EXPECT_EQ(gate.InFlight(), 1u);

    auto dequeued = queue_->Dequeue();
    ASSERT_TRUE(dequeued.has_value());
    EXPECT_TRUE(dequeued->permit.held());
    Answer(*dequeued);
    dequeued->permit.Release();
    EXPECT_EQ(gate.InFlight(), 0u);
}
