#include "load_generator.h"

#include <string>
#include <thread>
#include <glog/logging.h>

#include "common/configuration.h"

namespace Sluice {

WorkloadOptions WorkloadOptions::FromConfig(const Configuration& config) {
	const auto& w = config.config().workload;
	WorkloadOptions options;
	options.num_requests = w.num_requests.get();
	options.arrival_interval = std::chrono::milliseconds(w.arrival_interval_ms.get());
	options.response_timeout = std::chrono::milliseconds(w.response_timeout_ms.get());
	options.monitor_interval = std::chrono::milliseconds(w.monitor_interval_ms.get());
	return options;
}

int GenerateRequests(Dispatcher& dispatcher, const WorkloadOptions& options,
		PendingReplyQueue& pending, const std::atomic<bool>& stop) {
	int submitted = 0;
	for (int i = 0; i < options.num_requests; ++i) {
		if (stop.load(std::memory_order_relaxed)) {
			LOG(INFO) << "Generator stopping early after " << submitted << " requests";
			break;
		}
		std::string path = "/api/endpoint" + std::to_string(i % NUM_ENDPOINTS);
		VLOG(1) << "[Generator]: submitting " << path;
		pending.blockingWrite(dispatcher.SubmitAsync(std::move(path)));
		submitted++;

		if (i + 1 < options.num_requests) {
			std::this_thread::sleep_for(options.arrival_interval);
		}
	}
	// Sentinel
	pending.blockingWrite(std::nullopt);
	return submitted;
}

CollectorResult CollectResponses(PendingReplyQueue& pending, const WorkloadOptions& options) {
	CollectorResult result;
	while (true) {
		std::optional<ReplyReceiver> reply;
		pending.blockingRead(reply);
		if (!reply.has_value()) {
			break;
		}

		std::optional<Outcome> outcome = reply->WaitFor(options.response_timeout);
		if (!outcome.has_value()) {
			LOG(WARNING) << "[Collector]: no reply within " << options.response_timeout.count()
				<< "ms, giving up on the remaining responses";
			result.timed_out = true;
			break;
		}

		result.received++;
		if (outcome->ok()) {
			result.succeeded++;
			result.latencies.Add(outcome->latency);
			VLOG(1) << "[Collector]: " << *outcome;
		} else {
			LOG(INFO) << "[Collector]: " << *outcome;
		}
	}
	return result;
}

void MonitorDispatcher(const Dispatcher& dispatcher, const WorkloadOptions& options,
		const absl::Notification& done) {
	const absl::Duration interval = absl::FromChrono(options.monitor_interval);
	while (!done.WaitForNotificationWithTimeout(interval)) {
		LOG(INFO) << "[Monitor]: available permits " << dispatcher.AvailablePermits()
			<< "/" << dispatcher.options().admission_limit
			<< ", in flight " << dispatcher.InFlight()
			<< ", queued " << dispatcher.QueueDepth()
			<< ", busy workers " << dispatcher.BusyWorkers()
			<< ", waiting submitters " << dispatcher.WaitingSubmitters();
	}
}

} // namespace Sluice
