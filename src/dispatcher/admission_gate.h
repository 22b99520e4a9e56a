#ifndef SLUICE_DISPATCHER_ADMISSION_GATE_H_
#define SLUICE_DISPATCHER_ADMISSION_GATE_H_

#include <chrono>
#include <cstddef>

#include "absl/synchronization/mutex.h"

namespace Sluice {

class AdmissionGate;

enum class AdmissionStatus {
	kAdmitted,
	kClosed,
	kAtCapacity,
};

/**
 * One unit of admitted concurrency. Move-only; the permit goes back to its
 * gate exactly once, on Release() or destruction.
 */
class Permit {
public:
	Permit() = default;
	~Permit() { Release(); }

	Permit(Permit&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
	Permit& operator=(Permit&& other) noexcept {
		if (this != &other) {
			Release();
			gate_ = other.gate_;
			other.gate_ = nullptr;
		}
		return *this;
	}

	Permit(const Permit&) = delete;
	Permit& operator=(const Permit&) = delete;

	bool held() const { return gate_ != nullptr; }
	void Release();

private:
	friend class AdmissionGate;
	explicit Permit(AdmissionGate* gate) : gate_(gate) {}

	AdmissionGate* gate_ = nullptr;
};

/**
 * Counting permit pool bounding the number of in-flight requests.
 * No FIFO fairness: every waiter is woken when a permit comes back.
 */
class AdmissionGate {
public:
	explicit AdmissionGate(size_t limit);
	~AdmissionGate();

	AdmissionGate(const AdmissionGate&) = delete;
	AdmissionGate& operator=(const AdmissionGate&) = delete;

	/**
	 * Blocks until a permit is free or the gate is closed
	 * @return kAdmitted with *permit filled in, or kClosed
	 */
	AdmissionStatus Acquire(Permit* permit);

	/**
	 * Never blocks
	 * @return kAdmitted, kClosed, or kAtCapacity when every permit is held
	 */
	AdmissionStatus TryAcquire(Permit* permit);

	// Fails every pending and future acquire with kClosed. Held permits stay valid.
	void Close();

	// Waits until no permit is held. Returns false if the timeout elapsed first.
	bool AwaitIdle(std::chrono::nanoseconds timeout);

	/**
	 * Marks a submitting thread from its first admission attempt until its
	 * outcome, refusal included, has been recorded. Shutdown waits for every
	 * caller before freezing the statistics.
	 */
	class Caller {
	public:
		explicit Caller(AdmissionGate* gate);
		~Caller();

		Caller(const Caller&) = delete;
		Caller& operator=(const Caller&) = delete;

	private:
		AdmissionGate* gate_;
	};

	// Waits until no Caller is live. Returns false if the timeout elapsed first.
	bool AwaitNoCallers(std::chrono::nanoseconds timeout);

	bool IsClosed() const;
	size_t InFlight() const;
	// Callers currently blocked in Acquire()
	size_t Waiters() const;
	size_t Callers() const;
	size_t Available() const;
	size_t Limit() const { return limit_; }

private:
	friend class Permit;
	void Release();

	const size_t limit_;
	mutable absl::Mutex mu_;
	absl::CondVar permit_returned_;
	size_t in_flight_ ABSL_GUARDED_BY(mu_) = 0;
	size_t waiters_ ABSL_GUARDED_BY(mu_) = 0;
	size_t callers_ ABSL_GUARDED_BY(mu_) = 0;
	bool closed_ ABSL_GUARDED_BY(mu_) = false;
};

} // namespace Sluice
#endif // SLUICE_DISPATCHER_ADMISSION_GATE_H_
