#include "admission_gate.h"

#include <glog/logging.h>
#include "absl/time/time.h"

namespace Sluice {

void Permit::Release() {
	if (gate_ != nullptr) {
		AdmissionGate* gate = gate_;
		gate_ = nullptr;
		gate->Release();
	}
}

AdmissionGate::AdmissionGate(size_t limit) : limit_(limit) {
	if (limit_ == 0) {
		LOG(FATAL) << "AdmissionGate: admission limit must be at least 1";
	}
	VLOG(3) << "[AdmissionGate]: Constructed with " << limit_ << " permits";
}

AdmissionGate::~AdmissionGate() {
	absl::MutexLock lock(&mu_);
	if (in_flight_ > 0) {
		LOG(WARNING) << "AdmissionGate destructor: " << in_flight_
			<< " permits still held";
	}
}

AdmissionStatus AdmissionGate::Acquire(Permit* permit) {
	{
		absl::MutexLock lock(&mu_);
		++waiters_;
		while (!closed_ && in_flight_ >= limit_) {
			permit_returned_.Wait(&mu_);
		}
		--waiters_;
		if (closed_) {
			return AdmissionStatus::kClosed;
		}
		++in_flight_;
	}
	// Assigned outside the lock: overwriting a held permit releases it
	*permit = Permit(this);
	return AdmissionStatus::kAdmitted;
}

AdmissionStatus AdmissionGate::TryAcquire(Permit* permit) {
	{
		absl::MutexLock lock(&mu_);
		if (closed_) {
			return AdmissionStatus::kClosed;
		}
		if (in_flight_ >= limit_) {
			return AdmissionStatus::kAtCapacity;
		}
		++in_flight_;
	}
	*permit = Permit(this);
	return AdmissionStatus::kAdmitted;
}

void AdmissionGate::Release() {
	absl::MutexLock lock(&mu_);
	if (in_flight_ == 0) {
		// Only a double release gets here; accounting can no longer be trusted
		LOG(FATAL) << "AdmissionGate: permit accounting underflow";
	}
	--in_flight_;
	permit_returned_.SignalAll();
}

void AdmissionGate::Close() {
	absl::MutexLock lock(&mu_);
	if (closed_) {
		return;
	}
	closed_ = true;
	permit_returned_.SignalAll();
	VLOG(1) << "[AdmissionGate]: Closed with " << in_flight_ << " permits held";
}

bool AdmissionGate::AwaitIdle(std::chrono::nanoseconds timeout) {
	absl::Time deadline = absl::Now() + absl::FromChrono(timeout);
	absl::MutexLock lock(&mu_);
	while (in_flight_ > 0) {
		if (permit_returned_.WaitWithDeadline(&mu_, deadline)) {
			return in_flight_ == 0;
		}
	}
	return true;
}

AdmissionGate::Caller::Caller(AdmissionGate* gate) : gate_(gate) {
	absl::MutexLock lock(&gate_->mu_);
	++gate_->callers_;
}

AdmissionGate::Caller::~Caller() {
	absl::MutexLock lock(&gate_->mu_);
	DCHECK_GT(gate_->callers_, 0u);
	--gate_->callers_;
	if (gate_->callers_ == 0) {
		gate_->permit_returned_.SignalAll();
	}
}

bool AdmissionGate::AwaitNoCallers(std::chrono::nanoseconds timeout) {
	absl::Time deadline = absl::Now() + absl::FromChrono(timeout);
	absl::MutexLock lock(&mu_);
	while (callers_ > 0) {
		if (permit_returned_.WaitWithDeadline(&mu_, deadline)) {
			return callers_ == 0;
		}
	}
	return true;
}

bool AdmissionGate::IsClosed() const {
	absl::MutexLock lock(&mu_);
	return closed_;
}

size_t AdmissionGate::InFlight() const {
	absl::MutexLock lock(&mu_);
	return in_flight_;
}

size_t AdmissionGate::Waiters() const {
	absl::MutexLock lock(&mu_);
	return waiters_;
}

size_t AdmissionGate::Callers() const {
	absl::MutexLock lock(&mu_);
	return callers_;
}

size_t AdmissionGate::Available() const {
	absl::MutexLock lock(&mu_);
	return limit_ - in_flight_;
}

} // namespace Sluice
