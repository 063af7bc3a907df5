#pragma once

#include "event.h"

#include <cstddef>
#include <iterator>
#include <span>
#include <vector>

#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__) ||                  \
	defined(__DragonFly__)
#define READYQ_HAVE_KQUEUE 1
#include <sys/types.h>
#include <sys/event.h>
#include <sys/time.h>
#elif defined(__linux__)
#define READYQ_HAVE_EPOLL 1
#include <sys/epoll.h>
#endif

namespace readyq {

#if READYQ_HAVE_KQUEUE
using RawEvent = struct kevent;
#elif READYQ_HAVE_EPOLL
using RawEvent = struct epoll_event;
#endif

#if READYQ_HAVE_KQUEUE || READYQ_HAVE_EPOLL

uintptr_t rawEventKey(const RawEvent &raw);
Event translateEvent(const RawEvent &raw);

/**
 * Reusable buffer of fired events. A backend's wait() replaces its contents; iteration translates records
 * lazily and may be repeated any number of times against the same snapshot.
 *
 * Records carrying kNotifyKey belong to the self-notification channel and are never yielded.
 */
class Events {
  public:
	static constexpr size_t kCapacity = 1024;

	class Iterator {
	  public:
		using iterator_category = std::forward_iterator_tag;
		using value_type = Event;
		using difference_type = std::ptrdiff_t;
		using pointer = void;
		using reference = Event;

		Iterator() = default;
		Iterator(const RawEvent *pos, const RawEvent *end) : mPos(pos), mEnd(end) { skipReserved(); }

		Event operator*() const { return translateEvent(*mPos); }
		Iterator &operator++() {
			++mPos;
			skipReserved();
			return *this;
		}
		Iterator operator++(int) {
			Iterator tmp = *this;
			++*this;
			return tmp;
		}
		bool operator==(const Iterator &other) const { return mPos == other.mPos; }

	  private:
		void skipReserved() {
			while (mPos != mEnd && rawEventKey(*mPos) == kNotifyKey) {
				++mPos;
			}
		}

		const RawEvent *mPos = nullptr;
		const RawEvent *mEnd = nullptr;
	};

	Events() : mList(kCapacity) {}

	[[nodiscard]] Iterator begin() const { return {mList.data(), mList.data() + mLength}; }
	[[nodiscard]] Iterator end() const { return {mList.data() + mLength, mList.data() + mLength}; }

	// Whether the last wait() was woken through notify().
	[[nodiscard]] bool notified() const;
	[[nodiscard]] size_t count() const;
	[[nodiscard]] bool empty() const { return begin() == end(); }
	void clear() { mLength = 0; }

	// Backend side: fill slots, then commit how many were written.
	std::span<RawEvent> slots() { return {mList.data(), mList.size()}; }
	[[nodiscard]] std::span<const RawEvent> raw() const { return {mList.data(), mLength}; }
	void commit(size_t length) { mLength = length < mList.size() ? length : mList.size(); }

  private:
	std::vector<RawEvent> mList;
	size_t mLength = 0;
};

#endif

} // namespace readyq
