#ifndef SLUICE_DISPATCHER_WORK_QUEUE_H_
#define SLUICE_DISPATCHER_WORK_QUEUE_H_

#include <chrono>
#include <optional>
#include "folly/MPMCQueue.h"
#include "absl/synchronization/mutex.h"

#include "admission_gate.h"
#include "reply_channel.h"
#include "request.h"

namespace Sluice {

/**
 * An admitted request on its way to a worker. Carries everything the worker
 * needs to finish it: the reply path and the permit to hand back.
 */
struct Task {
	Request request;
	ReplySender reply;
	Permit permit;
	Clock::time_point submitted_at;
};

enum class EnqueueStatus {
	kOk,
	kFull,
	kClosed,
};

/**
 * Bounded FIFO between the dispatch path and the worker pool. An empty
 * optional in the ring is a close sentinel; each consumer exits on the first
 * one it reads.
 */
class WorkQueue {
public:
	explicit WorkQueue(size_t capacity);
	~WorkQueue();

	WorkQueue(const WorkQueue&) = delete;
	WorkQueue& operator=(const WorkQueue&) = delete;

	/**
	 * Enqueues a task, waiting up to `wait` for space when the queue is full
	 * @param task moved from only when kOk is returned
	 * @param wait zero rejects immediately on a full queue
	 */
	EnqueueStatus Enqueue(Task& task, std::chrono::nanoseconds wait);

	/**
	 * Blocks until a task or a close sentinel arrives
	 * @return nullopt once this consumer has been told to stop
	 */
	std::optional<Task> Dequeue();

	/**
	 * Refuses further enqueues and posts one sentinel per consumer behind the
	 * tasks already queued, so consumers drain before they stop
	 */
	void Close(int num_consumers);

	bool IsClosed() const;
	size_t Size() const;
	size_t Capacity() const { return capacity_; }

private:
	const size_t capacity_;
	folly::MPMCQueue<std::optional<Task>> queue_;

	// Producers hold it shared across their write so that no task can land
	// behind the sentinels posted by Close()
	mutable absl::Mutex close_mu_;
	bool closed_ ABSL_GUARDED_BY(close_mu_) = false;
};

} // namespace Sluice
#endif // SLUICE_DISPATCHER_WORK_QUEUE_H_
