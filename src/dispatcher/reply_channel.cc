#include "reply_channel.h"

#include <glog/logging.h>
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace Sluice {

struct ReplySlot {
	absl::Mutex mu;
	absl::CondVar delivered;
	std::optional<Outcome> outcome ABSL_GUARDED_BY(mu);
	bool receiver_alive ABSL_GUARDED_BY(mu) = true;
};

std::pair<ReplySender, ReplyReceiver> MakeReplyChannel() {
	auto slot = std::make_shared<ReplySlot>();
	return {ReplySender(slot), ReplyReceiver(slot)};
}

ReplyReceiver MakeReadyReply(Outcome outcome) {
	auto channel = MakeReplyChannel();
	bool delivered = channel.first.Send(std::move(outcome));
	DCHECK(delivered);
	return std::move(channel.second);
}

//----------------------------------------------------------------------------
// ReplySender
//----------------------------------------------------------------------------

ReplySender::~ReplySender() {
	Abandon();
}

ReplySender& ReplySender::operator=(ReplySender&& other) noexcept {
	if (this != &other) {
		Abandon();
		slot_ = std::move(other.slot_);
	}
	return *this;
}

bool ReplySender::Send(Outcome outcome) {
	if (!slot_) {
		LOG(ERROR) << "ReplySender::Send on an empty sender for request #" << outcome.request_id;
		return false;
	}
	std::shared_ptr<ReplySlot> slot = std::move(slot_);
	absl::MutexLock lock(&slot->mu);
	if (slot->outcome.has_value()) {
		LOG(ERROR) << "Second outcome for request #" << outcome.request_id << " dropped";
		return false;
	}
	slot->outcome = std::move(outcome);
	slot->delivered.SignalAll();
	return slot->receiver_alive;
}

// A sender dropped before Send() would leave its receiver waiting forever.
void ReplySender::Abandon() {
	if (!slot_) {
		return;
	}
	std::shared_ptr<ReplySlot> slot = std::move(slot_);
	absl::MutexLock lock(&slot->mu);
	if (slot->outcome.has_value()) {
		return;
	}
	LOG(DFATAL) << "Reply sender destroyed without an outcome";
	slot->outcome = Outcome::Failure(0, OutcomeStatus::kFailed, ErrorCode::kProcessingFault,
			"reply dropped before an outcome was produced");
	slot->delivered.SignalAll();
}

//----------------------------------------------------------------------------
// ReplyReceiver
//----------------------------------------------------------------------------

ReplyReceiver::~ReplyReceiver() {
	Detach();
}

ReplyReceiver& ReplyReceiver::operator=(ReplyReceiver&& other) noexcept {
	if (this != &other) {
		Detach();
		slot_ = std::move(other.slot_);
	}
	return *this;
}

void ReplyReceiver::Detach() {
	if (!slot_) {
		return;
	}
	{
		absl::MutexLock lock(&slot_->mu);
		slot_->receiver_alive = false;
	}
	slot_.reset();
}

Outcome ReplyReceiver::Wait() {
	CHECK(slot_ != nullptr) << "Wait on an empty ReplyReceiver";
	absl::MutexLock lock(&slot_->mu);
	while (!slot_->outcome.has_value()) {
		slot_->delivered.Wait(&slot_->mu);
	}
	return *slot_->outcome;
}

std::optional<Outcome> ReplyReceiver::WaitFor(std::chrono::nanoseconds timeout) {
	CHECK(slot_ != nullptr) << "WaitFor on an empty ReplyReceiver";
	absl::Time deadline = absl::Now() + absl::FromChrono(timeout);
	absl::MutexLock lock(&slot_->mu);
	while (!slot_->outcome.has_value()) {
		if (slot_->delivered.WaitWithDeadline(&slot_->mu, deadline)) {
			break;
		}
	}
	return slot_->outcome;
}

bool ReplyReceiver::Ready() const {
	if (!slot_) {
		return false;
	}
	absl::MutexLock lock(&slot_->mu);
	return slot_->outcome.has_value();
}

} // namespace Sluice
