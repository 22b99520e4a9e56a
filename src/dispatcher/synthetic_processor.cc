#include "synthetic_processor.h"

#include <string>
#include <glog/logging.h>

#include "common/configuration.h"

namespace Sluice {

SyntheticWorkload SyntheticWorkload::FromConfig(const Configuration& config) {
	const auto& w = config.config().workload;
	SyntheticWorkload workload;
	workload.base_cost = std::chrono::milliseconds(w.base_cost_ms.get());
	workload.cost_step = std::chrono::milliseconds(w.cost_step_ms.get());
	workload.cost_buckets = w.cost_buckets.get();
	workload.failure_modulus = w.failure_modulus.get();
	return workload;
}

SyntheticProcessor::SyntheticProcessor(SyntheticWorkload workload) : workload_(workload) {
	if (workload_.cost_buckets < 1) {
		LOG(FATAL) << "SyntheticProcessor: cost_buckets must be at least 1";
	}
}

std::chrono::milliseconds SyntheticProcessor::CostOf(uint64_t request_id) const {
	uint64_t bucket = request_id % static_cast<uint64_t>(workload_.cost_buckets);
	return workload_.base_cost + workload_.cost_step * static_cast<int64_t>(bucket);
}

ProcessStatus SyntheticProcessor::Process(const Request& request, const CancelToken& token) {
	std::chrono::milliseconds cost = CostOf(request.id);
	VLOG(2) << "Processing request #" << request.id << " (" << request.payload << ") for "
		<< cost.count() << "ms";

	if (!token.SleepFor(cost)) {
		return ProcessStatus::kCancelled;
	}

	if (workload_.failure_modulus > 0 &&
			request.id % static_cast<uint64_t>(workload_.failure_modulus) == 0) {
		throw ProcessingError("simulated fault while handling " + request.payload);
	}
	return ProcessStatus::kCompleted;
}

} // namespace Sluice
