#ifndef SLUICE_DISPATCHER_SHUTDOWN_COORDINATOR_H_
#define SLUICE_DISPATCHER_SHUTDOWN_COORDINATOR_H_

#include <chrono>
#include <cstdint>
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"

#include "admission_gate.h"
#include "stats_aggregator.h"
#include "work_queue.h"
#include "worker_pool.h"

namespace Sluice {

enum class DispatcherState {
	kRunning,
	kDraining,
	kStopped,
};

const char* ToString(DispatcherState state);

struct ShutdownReport {
	// True if in-flight work drained before the grace period ran out
	bool drained = true;
	// Requests still in flight when the grace period expired
	size_t abandoned = 0;
	std::chrono::nanoseconds elapsed{0};
};

/**
 * Running -> Draining -> Stopped.
 *
 * Draining closes admission, then lets admitted requests finish for up to
 * the grace period. If the period runs out, the abort signal is raised and
 * every request still queued or processing finishes as aborted. The work
 * queue is closed after that, and Stopped is reached once the workers have
 * exited and the aggregator holds its final counts.
 */
class ShutdownCoordinator {
public:
	ShutdownCoordinator(AdmissionGate& gate, WorkQueue& queue, WorkerPool& workers,
			StatsAggregator& stats, absl::Notification& abort);

	ShutdownCoordinator(const ShutdownCoordinator&) = delete;
	ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

	/**
	 * Blocks until Stopped. Only the first caller drives the transition;
	 * everyone else waits for it and gets the same report.
	 */
	ShutdownReport Shutdown(std::chrono::nanoseconds grace_period);

	DispatcherState State() const;

	// Blocks until the state reaches Stopped
	void AwaitStopped();

private:
	ShutdownReport Drain(std::chrono::nanoseconds grace_period);

	AdmissionGate& gate_;
	WorkQueue& queue_;
	WorkerPool& workers_;
	StatsAggregator& stats_;
	absl::Notification& abort_;

	mutable absl::Mutex mu_;
	absl::CondVar state_changed_;
	DispatcherState state_ ABSL_GUARDED_BY(mu_) = DispatcherState::kRunning;
	ShutdownReport report_ ABSL_GUARDED_BY(mu_);
};

} // namespace Sluice
#endif // SLUICE_DISPATCHER_SHUTDOWN_COORDINATOR_H_
