#ifndef SLUICE_LOAD_GENERATOR_H_
#define SLUICE_LOAD_GENERATOR_H_

#include <atomic>
#include <chrono>
#include <optional>
#include "folly/MPMCQueue.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"

#include "common/latency_stats.h"
#include "../dispatcher/dispatcher.h"

namespace Sluice {

class Configuration;

struct WorkloadOptions {
	int num_requests = DEFAULT_NUM_REQUESTS;
	std::chrono::milliseconds arrival_interval{DEFAULT_ARRIVAL_INTERVAL_MS};
	std::chrono::milliseconds response_timeout{DEFAULT_RESPONSE_TIMEOUT_MS};
	std::chrono::milliseconds monitor_interval{DEFAULT_MONITOR_INTERVAL_MS};

	static WorkloadOptions FromConfig(const Configuration& config);
};

// Replies handed from the generator to the collector; empty means no more
using PendingReplyQueue = folly::MPMCQueue<std::optional<ReplyReceiver>>;

struct CollectorResult {
	int received = 0;
	int succeeded = 0;
	bool timed_out = false;
	LatencyStats latencies;
};

/**
 * Submits num_requests synthetic requests, one per arrival interval, and
 * forwards each reply to the collector. Stops early once `stop` is set.
 * @return number of requests submitted
 */
int GenerateRequests(Dispatcher& dispatcher, const WorkloadOptions& options,
		PendingReplyQueue& pending, const std::atomic<bool>& stop);

/**
 * Waits on each reply in submission order. Gives up at the first reply that
 * does not arrive within the response timeout.
 */
CollectorResult CollectResponses(PendingReplyQueue& pending, const WorkloadOptions& options);

/**
 * Logs permit and queue usage every monitor interval until `done` fires
 */
void MonitorDispatcher(const Dispatcher& dispatcher, const WorkloadOptions& options,
		const absl::Notification& done);

} // namespace Sluice
#endif // SLUICE_LOAD_GENERATOR_H_
