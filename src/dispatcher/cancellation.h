#ifndef SLUICE_DISPATCHER_CANCELLATION_H_
#define SLUICE_DISPATCHER_CANCELLATION_H_

#include <algorithm>
#include <chrono>
#include <optional>

#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

#include "request.h"

namespace Sluice {

/**
 * Handed to a processor for one request. Fires when the request's deadline
 * passes or when the dispatcher aborts all in-flight work at shutdown,
 * whichever comes first. Processors poll IsCancelled() or block in SleepFor().
 */
class CancelToken {
public:
	CancelToken(std::optional<Clock::time_point> deadline, const absl::Notification* abort)
		: deadline_(deadline), abort_(abort) {}

	bool Aborted() const { return abort_ != nullptr && abort_->HasBeenNotified(); }

	bool DeadlineElapsed() const {
		return deadline_.has_value() && Clock::now() >= *deadline_;
	}

	bool IsCancelled() const { return Aborted() || DeadlineElapsed(); }

	std::optional<Clock::time_point> deadline() const { return deadline_; }

	/**
	 * Sleeps for the given duration unless cancelled first
	 * @return true if the full duration elapsed, false if cancelled
	 */
	bool SleepFor(std::chrono::nanoseconds duration) const {
		Clock::time_point wake = Clock::now() + duration;
		Clock::time_point limit = deadline_.has_value() ? std::min(wake, *deadline_) : wake;
		for (;;) {
			Clock::time_point now = Clock::now();
			if (now >= limit) {
				break;
			}
			absl::Duration remaining = absl::FromChrono(
				std::chrono::duration_cast<std::chrono::nanoseconds>(limit - now));
			if (abort_ != nullptr) {
				if (abort_->WaitForNotificationWithTimeout(remaining)) {
					return false;
				}
			} else {
				absl::SleepFor(remaining);
			}
		}
		return !IsCancelled() && Clock::now() >= wake;
	}

private:
	std::optional<Clock::time_point> deadline_;
	const absl::Notification* abort_;
};

} // namespace Sluice
#endif // SLUICE_DISPATCHER_CANCELLATION_H_
