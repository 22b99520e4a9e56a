#include "shutdown_coordinator.h"

#include <glog/logging.h>

namespace Sluice {

const char* ToString(DispatcherState state) {
	switch (state) {
		case DispatcherState::kRunning:
			return "Running";
		case DispatcherState::kDraining:
			return "Draining";
		case DispatcherState::kStopped:
			return "Stopped";
	}
	return "Unknown";
}

ShutdownCoordinator::ShutdownCoordinator(AdmissionGate& gate, WorkQueue& queue,
		WorkerPool& workers, StatsAggregator& stats, absl::Notification& abort)
	: gate_(gate),
	queue_(queue),
	workers_(workers),
	stats_(stats),
	abort_(abort) {}

ShutdownReport ShutdownCoordinator::Shutdown(std::chrono::nanoseconds grace_period) {
	{
		absl::MutexLock lock(&mu_);
		if (state_ != DispatcherState::kRunning) {
			while (state_ != DispatcherState::kStopped) {
				state_changed_.Wait(&mu_);
			}
			return report_;
		}
		state_ = DispatcherState::kDraining;
		state_changed_.SignalAll();
	}

	ShutdownReport report = Drain(grace_period);

	{
		absl::MutexLock lock(&mu_);
		report_ = report;
		state_ = DispatcherState::kStopped;
		state_changed_.SignalAll();
	}
	return report;
}

ShutdownReport ShutdownCoordinator::Drain(std::chrono::nanoseconds grace_period) {
	ShutdownReport report;
	const Clock::time_point started = Clock::now();
	const Clock::time_point grace_deadline = started + grace_period;
	LOG(INFO) << "Shutdown requested: draining " << gate_.InFlight()
		<< " in-flight requests, grace period "
		<< std::chrono::duration_cast<std::chrono::milliseconds>(grace_period).count() << "ms";

	// Stop admissions; submitters blocked on the gate fail with Closed
	gate_.Close();

	Clock::time_point now = Clock::now();
	std::chrono::nanoseconds remaining = grace_deadline > now ? grace_deadline - now : std::chrono::nanoseconds::zero();
	report.drained = gate_.AwaitIdle(remaining);
	if (!report.drained) {
		report.abandoned = gate_.InFlight();
		LOG(WARNING) << "Grace period expired with " << report.abandoned
			<< " requests in flight, aborting them";
		abort_.Notify();
	}

	// Sentinels go in only now: posting them can block on a full queue, and
	// only a drained or aborted queue is guaranteed to make room
	queue_.Close(workers_.NumWorkers());

	workers_.Join();

	// Submitters that got a permit but lost the race with the queue closing
	// still hold it until their rejection is recorded
	while (!gate_.AwaitIdle(std::chrono::seconds(1))) {
		LOG(WARNING) << "Waiting for " << gate_.InFlight() << " permits to be returned";
	}
	// A submitter woken by the close may not have recorded its refusal yet
	while (!gate_.AwaitNoCallers(std::chrono::seconds(1))) {
		LOG(WARNING) << "Waiting for " << gate_.Callers() << " submitters to finish";
	}

	stats_.Stop();

	report.elapsed = Clock::now() - started;
	Stats final_stats = stats_.Snapshot();
	LOG(INFO) << "Dispatcher stopped in "
		<< std::chrono::duration_cast<std::chrono::milliseconds>(report.elapsed).count()
		<< "ms: " << final_stats.ToString();
	if (!final_stats.Balanced()) {
		LOG(ERROR) << "Final statistics do not balance: submitted=" << final_stats.total_submitted
			<< " completed=" << final_stats.TotalCompleted();
	}
	return report;
}

DispatcherState ShutdownCoordinator::State() const {
	absl::MutexLock lock(&mu_);
	return state_;
}

void ShutdownCoordinator::AwaitStopped() {
	absl::MutexLock lock(&mu_);
	while (state_ != DispatcherState::kStopped) {
		state_changed_.Wait(&mu_);
	}
}

} // namespace Sluice
