#pragma once

#include <memory>

namespace readyq {

class Backend;

/**
 * Self-notification channel. It is registered inside its backend under kNotifyKey, so a wake surfaces through
 * the same wait() path as any other event.
 *
 * The backend calls reattach() after every wait(), whether or not the channel fired.
 */
class Notifier {
  public:
	virtual ~Notifier() = default;
	// Creates the channel's own resources, if any.
	virtual int init() = 0;
	virtual int attach() = 0;
	virtual int reattach() = 0;
	virtual int notify() = 0;
	virtual int detach() = 0;
	// Whether fd belongs to this channel rather than to a caller.
	[[nodiscard]] virtual bool hasFd(int fd) const noexcept = 0;
};

// Byte channel over a socketpair, armed through the backend's own add/modify/remove. Works with any backend.
std::unique_ptr<Notifier> createPipeNotifier(Backend &backend);

#ifdef __linux__
std::unique_ptr<Notifier> createEventFdNotifier(Backend &backend);
#endif

} // namespace readyq
