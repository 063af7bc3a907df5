#pragma once

#include "event.h"
#include "events.h"

#include <chrono>
#include <memory>
#include <optional>
#include <span>

namespace readyq {

using Timeout = std::optional<std::chrono::nanoseconds>;

/**
 * A native readiness-notification primitive. Every fallible operation returns 0 on success or the errno
 * value reported by the kernel.
 *
 * add/modify/remove/notify may be called from any thread, including while another thread is blocked in
 * wait(). The Events buffer handed to wait() must be owned by the calling thread for the duration of the call.
 */
class Backend {
  public:
	virtual ~Backend() = default;
	virtual int init() = 0;
	[[nodiscard]] virtual const char *name() const noexcept = 0;
	[[nodiscard]] virtual int fd() const noexcept = 0;
	[[nodiscard]] virtual bool supportsLevel() const noexcept = 0;
	[[nodiscard]] virtual bool supportsEdge() const noexcept = 0;

	virtual int add(int fd, Event ev, PollMode mode) = 0;
	virtual int modify(int fd, Event ev, PollMode mode) = 0;
	virtual int remove(int fd) = 0;
	// Blocks until an event fires, the timeout elapses or notify() is called. A timeout is not an error.
	virtual int wait(Events &events, Timeout timeout) = 0;
	// Wakes one current or future wait(). Best-effort; never fails outwardly.
	virtual void notify() = 0;
};

namespace detail {

#if READYQ_HAVE_KQUEUE
std::unique_ptr<Backend> createKqueueBackend();
#endif
#if READYQ_HAVE_EPOLL
std::unique_ptr<Backend> createEpollBackend();
#endif
#if READYQ_ENABLE_LIBURING
std::unique_ptr<Backend> createIoUringBackend();
#endif

} // namespace detail

#if READYQ_HAVE_KQUEUE
// Submits raw kevent changes to a kqueue backend, with the same receipt checking as add/modify. This is how
// timer, signal, process and vnode filters are armed; their records report readable under the key carried in
// udata. Returns EINVAL if the backend is not kqueue or more than two changes are passed.
int submitKqueueChanges(Backend &backend, std::span<const struct kevent> changes);
#endif

// Initializes the first available backend, honouring READYQ_BACKEND. Returns null if none could be created.
std::unique_ptr<Backend> createBackend();

// Same as createBackend(), restricted to the named backend.
std::unique_ptr<Backend> createBackend(const char *name);

} // namespace readyq
