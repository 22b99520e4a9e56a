#ifndef SLUICE_DISPATCHER_REPLY_CHANNEL_H_
#define SLUICE_DISPATCHER_REPLY_CHANNEL_H_

#include <chrono>
#include <memory>
#include <optional>
#include <utility>

#include "request.h"

namespace Sluice {

struct ReplySlot;
class ReplyReceiver;

/**
 * Writing end of a single-use reply path. Exactly one outcome is ever
 * delivered; the sender is move-only so ownership travels with the request.
 */
class ReplySender {
public:
	ReplySender() = default;
	~ReplySender();

	ReplySender(ReplySender&&) noexcept = default;
	ReplySender& operator=(ReplySender&& other) noexcept;
	ReplySender(const ReplySender&) = delete;
	ReplySender& operator=(const ReplySender&) = delete;

	/**
	 * Delivers the outcome
	 * @return false if the receiver was dropped or an outcome was already sent
	 */
	bool Send(Outcome outcome);

	bool valid() const { return slot_ != nullptr; }

private:
	friend std::pair<ReplySender, ReplyReceiver> MakeReplyChannel();
	explicit ReplySender(std::shared_ptr<ReplySlot> slot) : slot_(std::move(slot)) {}

	void Abandon();

	std::shared_ptr<ReplySlot> slot_;
};

/**
 * Reading end of a single-use reply path. Dropping it abandons interest in
 * the outcome; the request still runs to completion.
 */
class ReplyReceiver {
public:
	ReplyReceiver() = default;
	~ReplyReceiver();

	ReplyReceiver(ReplyReceiver&&) noexcept = default;
	ReplyReceiver& operator=(ReplyReceiver&& other) noexcept;
	ReplyReceiver(const ReplyReceiver&) = delete;
	ReplyReceiver& operator=(const ReplyReceiver&) = delete;

	// Blocks until the outcome arrives
	Outcome Wait();

	// Returns nullopt if nothing arrived within the timeout
	std::optional<Outcome> WaitFor(std::chrono::nanoseconds timeout);

	bool Ready() const;
	bool valid() const { return slot_ != nullptr; }

private:
	friend std::pair<ReplySender, ReplyReceiver> MakeReplyChannel();
	explicit ReplyReceiver(std::shared_ptr<ReplySlot> slot) : slot_(std::move(slot)) {}

	void Detach();

	std::shared_ptr<ReplySlot> slot_;
};

std::pair<ReplySender, ReplyReceiver> MakeReplyChannel();

// A receiver whose outcome is already known, used for refusals
ReplyReceiver MakeReadyReply(Outcome outcome);

} // namespace Sluice
#endif // SLUICE_DISPATCHER_REPLY_CHANNEL_H_
