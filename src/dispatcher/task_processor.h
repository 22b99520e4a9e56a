#ifndef SLUICE_DISPATCHER_TASK_PROCESSOR_H_
#define SLUICE_DISPATCHER_TASK_PROCESSOR_H_

#include <stdexcept>
#include <string>

#include "cancellation.h"
#include "request.h"

namespace Sluice {

enum class ProcessStatus {
	kCompleted,
	// The token fired and the attempt was abandoned
	kCancelled,
};

// Raised by a processor for a request it cannot handle
class ProcessingError : public std::runtime_error {
public:
	explicit ProcessingError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * The unit of actual work. Called concurrently from every worker thread.
 * Implementations must watch the token and return kCancelled promptly once
 * it fires; a fault is reported by throwing.
 */
class TaskProcessor {
public:
	virtual ~TaskProcessor() = default;
	virtual ProcessStatus Process(const Request& request, const CancelToken& token) = 0;
};

} // namespace Sluice
#endif // SLUICE_DISPATCHER_TASK_PROCESSOR_H_
