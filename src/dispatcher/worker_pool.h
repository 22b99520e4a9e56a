#ifndef SLUICE_DISPATCHER_WORKER_POOL_H_
#define SLUICE_DISPATCHER_WORKER_POOL_H_

#include <atomic>
#include <thread>
#include <vector>
#include "absl/synchronization/notification.h"

#include "stats_aggregator.h"
#include "task_processor.h"
#include "work_queue.h"

namespace Sluice {

/**
 * Fixed set of worker threads draining the work queue. Each worker turns a
 * task into exactly one outcome, publishes it to the aggregator and the reply
 * path, then returns the task's permit.
 */
class WorkerPool {
public:
	/**
	 * @param abort once notified, remaining tasks are finished as aborted
	 */
	WorkerPool(int num_workers, WorkQueue& queue, TaskProcessor& processor,
			StatsAggregator& stats, const absl::Notification& abort);

	/**
	 * Joins the workers; the queue must have been closed first
	 */
	~WorkerPool();

	WorkerPool(const WorkerPool&) = delete;
	WorkerPool& operator=(const WorkerPool&) = delete;

	void Start();

	// Waits for every worker to observe its close sentinel
	void Join();

	int NumWorkers() const { return num_workers_; }

	// Workers currently inside a processing attempt
	int NumBusy() const { return busy_count_.load(std::memory_order_relaxed); }

	// Highest NumBusy() observed since Start()
	int PeakBusy() const { return peak_busy_.load(std::memory_order_relaxed); }

	// Attempts that returned long after their deadline had passed
	int LateCancellations() const { return late_cancellations_.load(std::memory_order_relaxed); }

private:
	void WorkerThread(int worker_id);
	Outcome RunTask(int worker_id, const Task& task);
	void CheckOverrun(int worker_id, const Request& request);
	void Finish(int worker_id, Task& task, Outcome outcome);

	const int num_workers_;
	WorkQueue& queue_;
	TaskProcessor& processor_;
	StatsAggregator& stats_;
	const absl::Notification& abort_;

	std::vector<std::thread> threads_;
	std::atomic<int> thread_count_{0};
	std::atomic<int> busy_count_{0};
	std::atomic<int> peak_busy_{0};
	std::atomic<int> late_cancellations_{0};
};

} // namespace Sluice
#endif // SLUICE_DISPATCHER_WORKER_POOL_H_
