#include "events.h"

#include <algorithm>
#include <type_traits>

namespace readyq {

#if READYQ_HAVE_KQUEUE

namespace {

// NetBSD before 10 declares udata as intptr_t; everyone else uses void *.
template <typename T> uintptr_t keyFromUdata(T udata) {
	if constexpr (std::is_pointer_v<T>) {
		return reinterpret_cast<uintptr_t>(udata);
	} else {
		return static_cast<uintptr_t>(udata);
	}
}

} // namespace

uintptr_t rawEventKey(const RawEvent &raw) { return keyFromUdata(raw.udata); }

Event translateEvent(const RawEvent &raw) {
	Event ev;
	ev.key = rawEventKey(raw);
	switch (raw.filter) {
	case EVFILT_READ:
		ev.readable = true;
		// Closing the read side of a pipe wakes writers, but kqueue only reports it on the read filter.
		ev.writable = (raw.flags & EV_EOF) != 0;
		break;
	case EVFILT_WRITE:
		ev.writable = true;
		break;
	case EVFILT_VNODE:
	case EVFILT_PROC:
	case EVFILT_SIGNAL:
	case EVFILT_TIMER:
		ev.readable = true;
		break;
	default:
		break;
	}
	return ev;
}

#elif READYQ_HAVE_EPOLL

uintptr_t rawEventKey(const RawEvent &raw) { return static_cast<uintptr_t>(raw.data.u64); }

Event translateEvent(const RawEvent &raw) {
	constexpr uint32_t kReadMask = EPOLLIN | EPOLLRDHUP | EPOLLPRI | EPOLLHUP | EPOLLERR;
	constexpr uint32_t kWriteMask = EPOLLOUT | EPOLLHUP | EPOLLERR;

	Event ev;
	ev.key = rawEventKey(raw);
	ev.readable = (raw.events & kReadMask) != 0;
	ev.writable = (raw.events & kWriteMask) != 0;
	return ev;
}

#endif

#if READYQ_HAVE_KQUEUE || READYQ_HAVE_EPOLL

bool Events::notified() const {
	const auto records = raw();
	return std::any_of(records.begin(), records.end(),
					   [](const RawEvent &record) { return rawEventKey(record) == kNotifyKey; });
}

size_t Events::count() const { return static_cast<size_t>(std::distance(begin(), end())); }

#endif

} // namespace readyq
