#ifndef SLUICE_DISPATCHER_REQUEST_H_
#define SLUICE_DISPATCHER_REQUEST_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace Sluice {

using Clock = std::chrono::steady_clock;

/**
 * A unit of synthetic work. Immutable once created.
 */
struct Request {
	uint64_t id = 0;
	std::string payload;
	// Absolute deadline; nullopt means the request never times out
	std::optional<Clock::time_point> deadline;

	bool DeadlineElapsed(Clock::time_point now) const {
		return deadline.has_value() && now >= *deadline;
	}
};

enum class OutcomeStatus {
	kSuccess,
	kFailed,
	kTimedOut,
	kRejected,
};

// Why a request did not succeed. Rejected pairs with kClosed, kAtCapacity or
// kQueueFull; TimedOut with kDeadlineExceeded or kAborted; Failed with
// kProcessingFault.
enum class ErrorCode {
	kClosed,
	kAtCapacity,
	kQueueFull,
	kDeadlineExceeded,
	kProcessingFault,
	kAborted,
};

struct OutcomeError {
	ErrorCode code;
	std::string detail;
};

struct Outcome {
	uint64_t request_id = 0;
	OutcomeStatus status = OutcomeStatus::kFailed;
	std::optional<OutcomeError> error;
	// Submission to outcome
	std::chrono::nanoseconds latency{0};
	// Worker that produced the outcome, -1 for the admission and shutdown paths
	int worker_id = -1;

	bool ok() const { return status == OutcomeStatus::kSuccess; }
	bool Is(ErrorCode code) const { return error.has_value() && error->code == code; }

	static Outcome Success(uint64_t id);
	static Outcome Failure(uint64_t id, OutcomeStatus status, ErrorCode code, std::string detail);
};

const char* ToString(OutcomeStatus status);
const char* ToString(ErrorCode code);
std::ostream& operator<<(std::ostream& os, OutcomeStatus status);
std::ostream& operator<<(std::ostream& os, ErrorCode code);
std::ostream& operator<<(std::ostream& os, const Outcome& outcome);

} // namespace Sluice
#endif // SLUICE_DISPATCHER_REQUEST_H_
