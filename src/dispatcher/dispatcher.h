#ifndef SLUICE_DISPATCHER_DISPATCHER_H_
#define SLUICE_DISPATCHER_DISPATCHER_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "absl/synchronization/notification.h"

#include "common/config.h"
#include "admission_gate.h"
#include "reply_channel.h"
#include "request.h"
#include "shutdown_coordinator.h"
#include "stats_aggregator.h"
#include "task_processor.h"
#include "work_queue.h"
#include "worker_pool.h"

namespace Sluice {

class Configuration;

enum class AdmissionPolicy {
	// Submitters beyond the admission limit block until a permit frees up
	kWait,
	// Submitters beyond the admission limit are rejected immediately
	kReject,
};

struct DispatcherOptions {
	int worker_count = DEFAULT_WORKER_COUNT;
	size_t queue_capacity = DEFAULT_QUEUE_CAPACITY;
	size_t admission_limit = DEFAULT_ADMISSION_LIMIT;
	AdmissionPolicy admission_policy = AdmissionPolicy::kWait;
	// Zero rejects a request the moment the work queue is full
	std::chrono::milliseconds enqueue_timeout{DEFAULT_ENQUEUE_TIMEOUT_MS};
	// Deadline for callers that give none; zero means no deadline
	std::chrono::milliseconds per_request_timeout{DEFAULT_PER_REQUEST_TIMEOUT_MS};
	std::chrono::milliseconds shutdown_grace_period{DEFAULT_SHUTDOWN_GRACE_PERIOD_MS};
	size_t stats_queue_capacity = DEFAULT_STATS_QUEUE_CAPACITY;

	static DispatcherOptions FromConfig(const Configuration& config);
};

/**
 * Bounded-concurrency request dispatcher.
 *
 * caller -> AdmissionGate -> WorkQueue -> worker -> reply -> caller, with
 * every outcome also credited to the StatsAggregator. Every submission gets
 * exactly one Outcome; refusals are outcomes too, never exceptions.
 */
class Dispatcher {
public:
	Dispatcher(const DispatcherOptions& options, std::shared_ptr<TaskProcessor> processor);

	/**
	 * Shuts down with the configured grace period if still running
	 */
	~Dispatcher();

	Dispatcher(const Dispatcher&) = delete;
	Dispatcher& operator=(const Dispatcher&) = delete;

	/**
	 * Submits a payload and blocks until its outcome is known
	 * @param timeout relative deadline; nullopt applies per_request_timeout,
	 *        zero or negative is already expired
	 */
	Outcome Submit(std::string payload,
			std::optional<std::chrono::milliseconds> timeout = std::nullopt);

	/**
	 * Same admission path as Submit() but returns once the request is queued
	 * (or refused). Dropping the receiver abandons the reply only.
	 */
	ReplyReceiver SubmitAsync(std::string payload,
			std::optional<std::chrono::milliseconds> timeout = std::nullopt);

	// Non-blocking point-in-time read of the counters
	Stats StatsSnapshot() const { return stats_.Snapshot(); }

	// Waits until every outcome produced so far is reflected in StatsSnapshot()
	void FlushStats() { stats_.Flush(); }

	/**
	 * Drains and stops the dispatcher, blocking until Stopped
	 * @param grace_period nullopt applies the configured shutdown_grace_period
	 */
	ShutdownReport Shutdown(std::optional<std::chrono::milliseconds> grace_period = std::nullopt);

	DispatcherState State() const { return coordinator_.State(); }
	size_t InFlight() const { return gate_.InFlight(); }
	size_t AvailablePermits() const { return gate_.Available(); }
	// Submitters blocked on the admission limit
	size_t WaitingSubmitters() const { return gate_.Waiters(); }
	size_t QueueDepth() const { return queue_.Size(); }
	int BusyWorkers() const { return workers_.NumBusy(); }
	int PeakConcurrency() const { return workers_.PeakBusy(); }
	const DispatcherOptions& options() const { return options_; }

private:
	std::optional<Clock::time_point> DeadlineFor(Clock::time_point now,
			std::optional<std::chrono::milliseconds> timeout) const;
	ReplyReceiver Refuse(uint64_t id, ErrorCode code, Clock::time_point submitted_at);

	const DispatcherOptions options_;
	std::shared_ptr<TaskProcessor> processor_;

	StatsAggregator stats_;
	AdmissionGate gate_;
	WorkQueue queue_;
	absl::Notification abort_;
	WorkerPool workers_;
	ShutdownCoordinator coordinator_;

	std::atomic<uint64_t> next_id_{1};
};

} // namespace Sluice
#endif // SLUICE_DISPATCHER_DISPATCHER_H_
