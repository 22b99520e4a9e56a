#include "request.h"

#include <utility>

namespace Sluice {

Outcome Outcome::Success(uint64_t id) {
	Outcome outcome;
	outcome.request_id = id;
	outcome.status = OutcomeStatus::kSuccess;
	return outcome;
}

Outcome Outcome::Failure(uint64_t id, OutcomeStatus status, ErrorCode code, std::string detail) {
	Outcome outcome;
	outcome.request_id = id;
	outcome.status = status;
	outcome.error = OutcomeError{code, std::move(detail)};
	return outcome;
}

const char* ToString(OutcomeStatus status) {
	switch (status) {
		case OutcomeStatus::kSuccess:
			return "Success";
		case OutcomeStatus::kFailed:
			return "Failed";
		case OutcomeStatus::kTimedOut:
			return "TimedOut";
		case OutcomeStatus::kRejected:
			return "Rejected";
	}
	return "Unknown";
}

const char* ToString(ErrorCode code) {
	switch (code) {
		case ErrorCode::kClosed:
			return "Closed";
		case ErrorCode::kAtCapacity:
			return "AtCapacity";
		case ErrorCode::kQueueFull:
			return "QueueFull";
		case ErrorCode::kDeadlineExceeded:
			return "DeadlineExceeded";
		case ErrorCode::kProcessingFault:
			return "ProcessingFault";
		case ErrorCode::kAborted:
			return "Aborted";
	}
	return "Unknown";
}

std::ostream& operator<<(std::ostream& os, OutcomeStatus status) {
	return os << ToString(status);
}

std::ostream& operator<<(std::ostream& os, ErrorCode code) {
	return os << ToString(code);
}

std::ostream& operator<<(std::ostream& os, const Outcome& outcome) {
	os << "request #" << outcome.request_id << " " << outcome.status;
	if (outcome.error.has_value()) {
		os << " (" << outcome.error->code;
		if (!outcome.error->detail.empty()) {
			os << ": " << outcome.error->detail;
		}
		os << ")";
	}
	os << " in " << std::chrono::duration_cast<std::chrono::microseconds>(outcome.latency).count() << "us";
	if (outcome.worker_id >= 0) {
		os << " by worker " << outcome.worker_id;
	}
	return os;
}

} // namespace Sluice
