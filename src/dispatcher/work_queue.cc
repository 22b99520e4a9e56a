#include "work_queue.h"

#include <glog/logging.h>

namespace Sluice {

WorkQueue::WorkQueue(size_t capacity)
	: capacity_(capacity),
	queue_(capacity) {
		if (capacity_ == 0) {
			LOG(FATAL) << "WorkQueue: capacity must be at least 1";
		}
		VLOG(3) << "[WorkQueue]: Constructed with capacity " << capacity_;
	}

WorkQueue::~WorkQueue() {
	ssize_t remaining = queue_.size();
	if (remaining > 0) {
		LOG(WARNING) << "WorkQueue destructor: " << remaining << " entries left in the queue";
	}
}

EnqueueStatus WorkQueue::Enqueue(Task& task, std::chrono::nanoseconds wait) {
	absl::ReaderMutexLock lock(&close_mu_);
	if (closed_) {
		return EnqueueStatus::kClosed;
	}
	bool written;
	if (wait <= std::chrono::nanoseconds::zero()) {
		written = queue_.write(std::move(task));
	} else {
		written = queue_.tryWriteUntil(Clock::now() + wait, std::move(task));
	}
	if (!written) {
		VLOG(2) << "WorkQueue::Enqueue: queue full, request #" << task.request.id << " refused";
		return EnqueueStatus::kFull;
	}
	return EnqueueStatus::kOk;
}

std::optional<Task> WorkQueue::Dequeue() {
	std::optional<Task> task;
	queue_.blockingRead(task);
	return task;
}

void WorkQueue::Close(int num_consumers) {
	{
		absl::WriterMutexLock lock(&close_mu_);
		if (closed_) {
			return;
		}
		closed_ = true;
	}
	// No producer can write past this point; sentinels land behind every task
	for (int i = 0; i < num_consumers; i++) {
		queue_.blockingWrite(std::nullopt);
	}
	VLOG(1) << "[WorkQueue]: Closed, " << num_consumers << " sentinels posted";
}

bool WorkQueue::IsClosed() const {
	absl::ReaderMutexLock lock(&close_mu_);
	return closed_;
}

size_t WorkQueue::Size() const {
	// Negative while consumers are blocked waiting on an empty queue
	ssize_t size = queue_.size();
	return size > 0 ? static_cast<size_t>(size) : 0;
}

} // namespace Sluice
