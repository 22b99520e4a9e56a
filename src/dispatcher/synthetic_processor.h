#ifndef SLUICE_DISPATCHER_SYNTHETIC_PROCESSOR_H_
#define SLUICE_DISPATCHER_SYNTHETIC_PROCESSOR_H_

#include <chrono>

#include "common/config.h"
#include "task_processor.h"

namespace Sluice {

class Configuration;

struct SyntheticWorkload {
	std::chrono::milliseconds base_cost{DEFAULT_BASE_COST_MS};
	std::chrono::milliseconds cost_step{DEFAULT_COST_STEP_MS};
	int cost_buckets = DEFAULT_COST_BUCKETS;
	// Requests whose id is a multiple of this fail; 0 disables faults
	int failure_modulus = DEFAULT_FAILURE_MODULUS;

	static SyntheticWorkload FromConfig(const Configuration& config);
};

/**
 * Simulated request handler: spends a cost derived from the request id and
 * faults on every failure_modulus-th request.
 */
class SyntheticProcessor : public TaskProcessor {
public:
	explicit SyntheticProcessor(SyntheticWorkload workload);

	ProcessStatus Process(const Request& request, const CancelToken& token) override;

	std::chrono::milliseconds CostOf(uint64_t request_id) const;

private:
	const SyntheticWorkload workload_;
};

} // namespace Sluice
#endif // SLUICE_DISPATCHER_SYNTHETIC_PROCESSOR_H_
