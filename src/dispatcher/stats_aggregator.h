#ifndef SLUICE_DISPATCHER_STATS_AGGREGATOR_H_
#define SLUICE_DISPATCHER_STATS_AGGREGATOR_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include "folly/MPMCQueue.h"
#include "absl/synchronization/mutex.h"

#include "common/config.h"
#include "request.h"

namespace Sluice {

/**
 * Point-in-time copy of the dispatcher counters. total_aborted counts the
 * subset of total_timed_out cut short by shutdown, total_queue_full the
 * subset of total_rejected refused by a full work queue.
 */
struct Stats {
	uint64_t total_submitted = 0;
	uint64_t total_succeeded = 0;
	uint64_t total_failed = 0;
	uint64_t total_timed_out = 0;
	uint64_t total_rejected = 0;
	uint64_t total_aborted = 0;
	uint64_t total_queue_full = 0;
	// Summed over successful outcomes only
	std::chrono::nanoseconds cumulative_latency{0};

	uint64_t TotalCompleted() const {
		return total_succeeded + total_failed + total_timed_out + total_rejected;
	}

	// Holds whenever no request is in flight
	bool Balanced() const { return total_submitted == TotalCompleted(); }

	std::chrono::nanoseconds AverageLatency() const {
		if (total_succeeded == 0) {
			return std::chrono::nanoseconds::zero();
		}
		return cumulative_latency / static_cast<int64_t>(total_succeeded);
	}

	std::string ToString() const;
};

/**
 * Owns the dispatcher counters. Completions are posted as events and applied
 * one at a time by a dedicated thread, so a snapshot always reflects a prefix
 * of the recorded events.
 */
class StatsAggregator {
public:
	explicit StatsAggregator(size_t queue_capacity = DEFAULT_STATS_QUEUE_CAPACITY);
	~StatsAggregator();

	StatsAggregator(const StatsAggregator&) = delete;
	StatsAggregator& operator=(const StatsAggregator&) = delete;

	// A request passed admission; its outcome follows through RecordOutcome()
	void RecordAdmitted();

	// Terminal outcome of an admitted request
	void RecordOutcome(const Outcome& outcome);

	// A submission refused before admission: counted as submitted and rejected at once
	void RecordRefused(const Outcome& outcome);

	Stats Snapshot() const;

	// Blocks until every event recorded before the call has been applied
	void Flush();

	// Drains pending events and stops the aggregator thread. Later records are
	// ignored so the final snapshot never changes.
	void Stop();

	bool IsStopped() const;

private:
	enum class EventKind {
		kAdmitted,
		kCompleted,
		kRefused,
	};

	struct StatsEvent {
		EventKind kind;
		OutcomeStatus status;
		std::optional<ErrorCode> code;
		std::chrono::nanoseconds latency;
	};

	void Post(StatsEvent event);
	void Apply(const StatsEvent& event) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
	void AggregatorThread();

	folly::MPMCQueue<std::optional<StatsEvent>> events_;
	std::thread thread_;

	// Shared by producers while posting, exclusive while stopping
	mutable absl::Mutex stop_mu_;
	bool stopped_ ABSL_GUARDED_BY(stop_mu_) = false;

	std::atomic<uint64_t> posted_{0};

	mutable absl::Mutex mu_;
	absl::CondVar applied_cv_;
	Stats stats_ ABSL_GUARDED_BY(mu_);
	uint64_t applied_ ABSL_GUARDED_BY(mu_) = 0;
};

} // namespace Sluice
#endif // SLUICE_DISPATCHER_STATS_AGGREGATOR_H_
