#include "worker_pool.h"

#include <exception>
#include <glog/logging.h>

#include "common/config.h"

namespace Sluice {

WorkerPool::WorkerPool(int num_workers, WorkQueue& queue, TaskProcessor& processor,
		StatsAggregator& stats, const absl::Notification& abort)
	: num_workers_(num_workers),
	queue_(queue),
	processor_(processor),
	stats_(stats),
	abort_(abort) {
		if (num_workers_ < 1) {
			LOG(FATAL) << "WorkerPool: worker count must be at least 1";
		}
	}

WorkerPool::~WorkerPool() {
	Join();
	VLOG(3) << "[WorkerPool]: Destructed";
}

void WorkerPool::Start() {
	if (!threads_.empty()) {
		LOG(WARNING) << "WorkerPool already started";
		return;
	}
	for (int i = 0; i < num_workers_; i++) {
		threads_.emplace_back(&WorkerPool::WorkerThread, this, i);
	}

	// Wait for all threads to start
	while (thread_count_.load() != num_workers_) {
		std::this_thread::yield();
	}
	VLOG(3) << "[WorkerPool]: Started " << num_workers_ << " workers";
}

void WorkerPool::Join() {
	for (std::thread& thread : threads_) {
		if (thread.joinable()) {
			thread.join();
		}
	}
}

//----------------------------------------------------------------------------
// Worker loop
//----------------------------------------------------------------------------

void WorkerPool::WorkerThread(int worker_id) {
	thread_count_.fetch_add(1, std::memory_order_relaxed);
	size_t handled = 0;

	while (true) {
		std::optional<Task> task = queue_.Dequeue();

		// Sentinel: the queue is closed and everything ahead of it was handled
		if (!task.has_value()) {
			break;
		}

		Outcome outcome = RunTask(worker_id, *task);
		Finish(worker_id, *task, std::move(outcome));
		handled++;
	}

	VLOG(1) << "Worker " << worker_id << " exiting after " << handled << " requests";
}

Outcome WorkerPool::RunTask(int worker_id, const Task& task) {
	const Request& request = task.request;

	if (abort_.HasBeenNotified()) {
		return Outcome::Failure(request.id, OutcomeStatus::kTimedOut, ErrorCode::kAborted,
				"dispatcher aborted before processing started");
	}
	if (request.DeadlineElapsed(Clock::now())) {
		return Outcome::Failure(request.id, OutcomeStatus::kTimedOut, ErrorCode::kDeadlineExceeded,
				"deadline elapsed before processing started");
	}

	int busy = busy_count_.fetch_add(1, std::memory_order_relaxed) + 1;
	int peak = peak_busy_.load(std::memory_order_relaxed);
	while (busy > peak && !peak_busy_.compare_exchange_weak(peak, busy, std::memory_order_relaxed)) {
	}

	VLOG(2) << "Worker " << worker_id << " started request #" << request.id;
	CancelToken token(request.deadline, &abort_);
	Outcome outcome;
	try {
		ProcessStatus status = processor_.Process(request, token);
		if (status == ProcessStatus::kCancelled) {
			if (token.Aborted()) {
				outcome = Outcome::Failure(request.id, OutcomeStatus::kTimedOut, ErrorCode::kAborted,
						"aborted by shutdown during processing");
			} else {
				outcome = Outcome::Failure(request.id, OutcomeStatus::kTimedOut,
						ErrorCode::kDeadlineExceeded, "deadline elapsed during processing");
			}
		} else if (request.DeadlineElapsed(Clock::now())) {
			// Processing finished, but the deadline fired first
			outcome = Outcome::Failure(request.id, OutcomeStatus::kTimedOut,
					ErrorCode::kDeadlineExceeded, "processing completed after the deadline");
		} else {
			outcome = Outcome::Success(request.id);
		}
	} catch (const std::exception& e) {
		LOG(ERROR) << "Worker " << worker_id << ": request #" << request.id << " failed: " << e.what();
		outcome = Outcome::Failure(request.id, OutcomeStatus::kFailed, ErrorCode::kProcessingFault, e.what());
	} catch (...) {
		LOG(ERROR) << "Worker " << worker_id << ": request #" << request.id << " raised a non-standard exception";
		outcome = Outcome::Failure(request.id, OutcomeStatus::kFailed, ErrorCode::kProcessingFault,
				"unknown fault");
	}

	busy_count_.fetch_sub(1, std::memory_order_relaxed);
	CheckOverrun(worker_id, request);
	return outcome;
}

void WorkerPool::CheckOverrun(int worker_id, const Request& request) {
	if (!request.deadline.has_value()) {
		return;
	}
	auto overrun = Clock::now() - *request.deadline;
	if (overrun > std::chrono::milliseconds(LATE_CANCELLATION_WARNING_MS)) {
		late_cancellations_.fetch_add(1, std::memory_order_relaxed);
		LOG(WARNING) << "Worker " << worker_id << ": request #" << request.id << " returned "
			<< std::chrono::duration_cast<std::chrono::milliseconds>(overrun).count()
			<< "ms after its deadline; the processor is not honoring its cancel token";
	}
}

// Statistics first so a caller woken by the reply can already observe them
// after a flush; the permit goes back last.
void WorkerPool::Finish(int worker_id, Task& task, Outcome outcome) {
	outcome.worker_id = worker_id;
	outcome.latency = Clock::now() - task.submitted_at;

	stats_.RecordOutcome(outcome);
	VLOG(1) << "Worker " << worker_id << " finished " << outcome;

	if (!task.reply.Send(std::move(outcome))) {
		VLOG(2) << "Caller abandoned request #" << task.request.id;
	}
	task.permit.Release();
}

} // namespace Sluice
