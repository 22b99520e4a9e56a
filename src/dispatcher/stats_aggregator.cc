#include "stats_aggregator.h"

#include <sstream>
#include <glog/logging.h>

namespace Sluice {

namespace {

double Percent(uint64_t part, uint64_t total) {
	return total == 0 ? 0.0 : (static_cast<double>(part) / static_cast<double>(total)) * 100.0;
}

} // end of namespace

std::string Stats::ToString() const {
	std::ostringstream out;
	out.setf(std::ios::fixed);
	out.precision(1);
	out << "submitted=" << total_submitted
		<< " succeeded=" << total_succeeded << " (" << Percent(total_succeeded, total_submitted) << "%)"
		<< " failed=" << total_failed << " (" << Percent(total_failed, total_submitted) << "%)"
		<< " timed_out=" << total_timed_out << " [aborted=" << total_aborted << "]"
		<< " rejected=" << total_rejected << " [queue_full=" << total_queue_full << "]"
		<< " avg_latency="
		<< std::chrono::duration_cast<std::chrono::microseconds>(AverageLatency()).count() / 1000.0
		<< "ms";
	return out.str();
}

StatsAggregator::StatsAggregator(size_t queue_capacity)
	: events_(queue_capacity) {
		thread_ = std::thread(&StatsAggregator::AggregatorThread, this);
		VLOG(3) << "[StatsAggregator]: Constructed";
	}

StatsAggregator::~StatsAggregator() {
	Stop();
}

void StatsAggregator::RecordAdmitted() {
	Post({EventKind::kAdmitted, OutcomeStatus::kSuccess, std::nullopt, std::chrono::nanoseconds::zero()});
}

void StatsAggregator::RecordOutcome(const Outcome& outcome) {
	std::optional<ErrorCode> code;
	if (outcome.error.has_value()) {
		code = outcome.error->code;
	}
	Post({EventKind::kCompleted, outcome.status, code, outcome.latency});
}

void StatsAggregator::RecordRefused(const Outcome& outcome) {
	std::optional<ErrorCode> code;
	if (outcome.error.has_value()) {
		code = outcome.error->code;
	}
	Post({EventKind::kRefused, outcome.status, code, outcome.latency});
}

void StatsAggregator::Post(StatsEvent event) {
	absl::ReaderMutexLock lock(&stop_mu_);
	if (stopped_) {
		VLOG(2) << "StatsAggregator: stopped, event ignored";
		return;
	}
	posted_.fetch_add(1, std::memory_order_acq_rel);
	events_.blockingWrite(event);
}

void StatsAggregator::Apply(const StatsEvent& event) {
	switch (event.kind) {
		case EventKind::kAdmitted:
			stats_.total_submitted++;
			return;
		case EventKind::kRefused:
			stats_.total_submitted++;
			break;
		case EventKind::kCompleted:
			break;
	}

	switch (event.status) {
		case OutcomeStatus::kSuccess:
			stats_.total_succeeded++;
			stats_.cumulative_latency += event.latency;
			break;
		case OutcomeStatus::kFailed:
			stats_.total_failed++;
			break;
		case OutcomeStatus::kTimedOut:
			stats_.total_timed_out++;
			if (event.code == ErrorCode::kAborted) {
				stats_.total_aborted++;
			}
			break;
		case OutcomeStatus::kRejected:
			stats_.total_rejected++;
			if (event.code == ErrorCode::kQueueFull) {
				stats_.total_queue_full++;
			}
			break;
	}
}

void StatsAggregator::AggregatorThread() {
	std::optional<StatsEvent> event;
	while (true) {
		events_.blockingRead(event);
		if (!event.has_value()) {
			break;
		}
		absl::MutexLock lock(&mu_);
		Apply(*event);
		applied_++;
		applied_cv_.SignalAll();
	}
	VLOG(3) << "[StatsAggregator]: Aggregator thread exiting";
}

Stats StatsAggregator::Snapshot() const {
	absl::MutexLock lock(&mu_);
	return stats_;
}

void StatsAggregator::Flush() {
	uint64_t target = posted_.load(std::memory_order_acquire);
	absl::MutexLock lock(&mu_);
	while (applied_ < target) {
		applied_cv_.Wait(&mu_);
	}
}

void StatsAggregator::Stop() {
	{
		absl::WriterMutexLock lock(&stop_mu_);
		if (stopped_) {
			return;
		}
		stopped_ = true;
	}
	// Every accepted event sits ahead of the sentinel
	events_.blockingWrite(std::nullopt);
	if (thread_.joinable()) {
		thread_.join();
	}
	Stats final_stats = Snapshot();
	VLOG(1) << "[StatsAggregator]: Stopped with " << final_stats.ToString();
}

bool StatsAggregator::IsStopped() const {
	absl::ReaderMutexLock lock(&stop_mu_);
	return stopped_;
}

} // namespace Sluice
