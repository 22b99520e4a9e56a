#include "dispatcher.h"

#include <utility>
#include <glog/logging.h>

#include "common/configuration.h"

namespace Sluice {

DispatcherOptions DispatcherOptions::FromConfig(const Configuration& config) {
	const auto& d = config.config().dispatcher;
	DispatcherOptions options;
	options.worker_count = d.worker_count.get();
	options.queue_capacity = d.queue_capacity.get();
	options.admission_limit = d.admission_limit.get();
	options.admission_policy = d.admission_policy.get() == "reject"
		? AdmissionPolicy::kReject : AdmissionPolicy::kWait;
	options.enqueue_timeout = std::chrono::milliseconds(d.enqueue_timeout_ms.get());
	options.per_request_timeout = std::chrono::milliseconds(d.per_request_timeout_ms.get());
	options.shutdown_grace_period = std::chrono::milliseconds(d.shutdown_grace_period_ms.get());
	options.stats_queue_capacity = d.stats_queue_capacity.get();
	return options;
}

Dispatcher::Dispatcher(const DispatcherOptions& options, std::shared_ptr<TaskProcessor> processor)
	: options_(options),
	processor_(std::move(processor)),
	stats_(options.stats_queue_capacity),
	gate_(options.admission_limit),
	queue_(options.queue_capacity),
	workers_(options.worker_count, queue_, *processor_, stats_, abort_),
	coordinator_(gate_, queue_, workers_, stats_, abort_) {
		workers_.Start();
		LOG(INFO) << "Dispatcher running: workers=" << options_.worker_count
			<< " admission_limit=" << options_.admission_limit
			<< " queue_capacity=" << options_.queue_capacity
			<< " policy=" << (options_.admission_policy == AdmissionPolicy::kWait ? "wait" : "reject");
	}

Dispatcher::~Dispatcher() {
	if (coordinator_.State() != DispatcherState::kStopped) {
		Shutdown();
	}
}

std::optional<Clock::time_point> Dispatcher::DeadlineFor(Clock::time_point now,
		std::optional<std::chrono::milliseconds> timeout) const {
	if (timeout.has_value()) {
		return now + *timeout;
	}
	if (options_.per_request_timeout > std::chrono::milliseconds::zero()) {
		return now + options_.per_request_timeout;
	}
	return std::nullopt;
}

ReplyReceiver Dispatcher::Refuse(uint64_t id, ErrorCode code, Clock::time_point submitted_at) {
	Outcome outcome = Outcome::Failure(id, OutcomeStatus::kRejected, code,
			code == ErrorCode::kClosed ? "dispatcher is not accepting requests"
			: "admission limit reached");
	outcome.latency = Clock::now() - submitted_at;
	stats_.RecordRefused(outcome);
	VLOG(1) << "Refused " << outcome;
	return MakeReadyReply(std::move(outcome));
}

ReplyReceiver Dispatcher::SubmitAsync(std::string payload,
		std::optional<std::chrono::milliseconds> timeout) {
	const Clock::time_point submitted_at = Clock::now();
	const uint64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
	AdmissionGate::Caller caller(&gate_);

	Permit permit;
	AdmissionStatus admission = options_.admission_policy == AdmissionPolicy::kWait
		? gate_.Acquire(&permit) : gate_.TryAcquire(&permit);
	if (admission == AdmissionStatus::kClosed) {
		return Refuse(id, ErrorCode::kClosed, submitted_at);
	}
	if (admission == AdmissionStatus::kAtCapacity) {
		return Refuse(id, ErrorCode::kAtCapacity, submitted_at);
	}

	auto channel = MakeReplyChannel();
	Task task{
		Request{id, std::move(payload), DeadlineFor(submitted_at, timeout)},
		std::move(channel.first),
		std::move(permit),
		submitted_at,
	};
	stats_.RecordAdmitted();

	EnqueueStatus enqueued = queue_.Enqueue(task, options_.enqueue_timeout);
	if (enqueued == EnqueueStatus::kOk) {
		VLOG(2) << "Queued request #" << id;
		return std::move(channel.second);
	}

	// Admitted but never reached a worker: the outcome is produced here
	Outcome outcome = enqueued == EnqueueStatus::kFull
		? Outcome::Failure(id, OutcomeStatus::kRejected, ErrorCode::kQueueFull, "work queue is full")
		: Outcome::Failure(id, OutcomeStatus::kRejected, ErrorCode::kClosed,
				"work queue closed by shutdown");
	outcome.latency = Clock::now() - submitted_at;
	VLOG(1) << "Refused " << outcome;
	stats_.RecordOutcome(outcome);
	bool delivered = task.reply.Send(std::move(outcome));
	DCHECK(delivered) << "receiver for request #" << id << " dropped before it was returned";
	task.permit.Release();
	return std::move(channel.second);
}

Outcome Dispatcher::Submit(std::string payload, std::optional<std::chrono::milliseconds> timeout) {
	ReplyReceiver reply = SubmitAsync(std::move(payload), timeout);
	return reply.Wait();
}

ShutdownReport Dispatcher::Shutdown(std::optional<std::chrono::milliseconds> grace_period) {
	std::chrono::milliseconds grace = grace_period.value_or(options_.shutdown_grace_period);
	if (grace < std::chrono::milliseconds::zero()) {
		grace = std::chrono::milliseconds::zero();
	}
	return coordinator_.Shutdown(grace);
}

} // namespace Sluice
