#include "backend.h"

#include "common.h"
#include "config.h"
#include "errors.h"
#include "notifier.h"
#include "timeutil.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>

#include <fcntl.h>
#include <sys/event.h>
#include <sys/time.h>
#include <unistd.h>

namespace {

using readyq::Event;
using readyq::PollMode;

using Udata = decltype(std::declval<struct kevent>().udata);

Udata udataFromKey(uintptr_t key) {
	if constexpr (std::is_pointer_v<Udata>) {
		return reinterpret_cast<Udata>(key);
	} else {
		return static_cast<Udata>(key);
	}
}

unsigned short modeToFlags(PollMode mode) {
	switch (mode) {
	case PollMode::Oneshot:
		return EV_ONESHOT;
	case PollMode::Level:
		return 0;
	case PollMode::Edge:
		return EV_CLEAR;
	case PollMode::EdgeOneshot:
		return EV_ONESHOT | EV_CLEAR;
	}
	return EV_ONESHOT;
}

class KqueueBackend : public readyq::Backend {
  public:
	static constexpr size_t kMaxChanges = 2;

	~KqueueBackend() override;

	int init() override;
	[[nodiscard]] const char *name() const noexcept override { return "kqueue"; }
	[[nodiscard]] int fd() const noexcept override { return mKqueueFd; }
	[[nodiscard]] bool supportsLevel() const noexcept override { return true; }
	[[nodiscard]] bool supportsEdge() const noexcept override { return true; }

	int add(int fd, Event ev, PollMode mode) override;
	int modify(int fd, Event ev, PollMode mode) override;
	int remove(int fd) override;
	int wait(readyq::Events &events, readyq::Timeout timeout) override;
	void notify() override;

	int submitChanges(std::span<const struct kevent> changes) const;

  private:
	std::unique_ptr<readyq::Notifier> createNotifier();

	int mKqueueFd = -1;
	std::unique_ptr<readyq::Notifier> mNotify;
	bool mNotifyAttached = false;
};

#ifdef EVFILT_USER

// Wakes the queue through a user-triggered filter instead of allocating a socketpair.
class UserEventNotifier : public readyq::Notifier {
  public:
	explicit UserEventNotifier(const KqueueBackend &backend) : mBackend(backend) {}

	int init() override { return 0; }
	int attach() override { return submit(EV_ADD | EV_RECEIPT | EV_CLEAR, 0); }
	// EV_CLEAR re-arms the filter after every delivery.
	int reattach() override { return 0; }
	int notify() override { return submit(EV_ADD | EV_RECEIPT, NOTE_TRIGGER); }
	int detach() override { return submit(EV_DELETE | EV_RECEIPT, 0); }
	[[nodiscard]] bool hasFd(int) const noexcept override { return false; }

  private:
	int submit(unsigned short flags, unsigned int fflags) const {
		std::array<struct kevent, 1> change{};
		EV_SET(&change[0], 0, EVFILT_USER, flags, fflags, 0, udataFromKey(readyq::kNotifyKey));
		return mBackend.submitChanges(change);
	}

	const KqueueBackend &mBackend;
};

#endif

KqueueBackend::~KqueueBackend() {
	VERBOSE_LOG("readyq(kqueue): drop kqueue_fd=%d\n", mKqueueFd);
	if (mNotifyAttached) {
		if (int err = mNotify->detach(); err != 0) {
			DEBUG_LOG("readyq(kqueue): detaching notifier failed: %d (%s)\n", err, strerror(err));
		}
	}
	mNotify.reset();
	if (mKqueueFd >= 0) {
		close(mKqueueFd);
		mKqueueFd = -1;
	}
}

std::unique_ptr<readyq::Notifier> KqueueBackend::createNotifier() {
#ifdef EVFILT_USER
	if (readyq::config().notify == readyq::NotifyStrategy::Native) {
		return std::make_unique<UserEventNotifier>(*this);
	}
#endif
	return readyq::createPipeNotifier(*this);
}

int KqueueBackend::init() {
	mKqueueFd = kqueue();
	if (mKqueueFd < 0) {
		int err = errno;
		DEBUG_LOG("readyq(kqueue): kqueue() failed: %d (%s)\n", err, strerror(err));
		return err;
	}
	if (fcntl(mKqueueFd, F_SETFD, FD_CLOEXEC) != 0) {
		int err = errno;
		DEBUG_LOG("readyq(kqueue): fcntl(F_SETFD) failed: %d (%s)\n", err, strerror(err));
		return err;
	}

	mNotify = createNotifier();
	if (int err = mNotify->init(); err != 0) {
		return err;
	}
	if (int err = mNotify->attach(); err != 0) {
		DEBUG_LOG("readyq(kqueue): registering notifier failed: %d (%s)\n", err, strerror(err));
		return err;
	}
	mNotifyAttached = true;

	VERBOSE_LOG("readyq(kqueue): new kqueue_fd=%d\n", mKqueueFd);
	return 0;
}

int KqueueBackend::add(int fd, Event ev, PollMode mode) {
	// kqueue has no separate creation step; arming a filter on an unknown fd creates it.
	return modify(fd, ev, mode);
}

int KqueueBackend::modify(int fd, Event ev, PollMode mode) {
	if (!mNotify || !mNotify->hasFd(fd)) {
		VERBOSE_LOG("readyq(kqueue): modify kqueue_fd=%d fd=%d key=%zu readable=%d writable=%d mode=%s\n",
					mKqueueFd, fd, static_cast<size_t>(ev.key), ev.readable, ev.writable, readyq::pollModeName(mode));
	}

	const unsigned short modeFlags = modeToFlags(mode);
	const unsigned short readFlags = ev.readable ? (EV_ADD | modeFlags) : EV_DELETE;
	const unsigned short writeFlags = ev.writable ? (EV_ADD | modeFlags) : EV_DELETE;

	std::array<struct kevent, kMaxChanges> changes{};
	EV_SET(&changes[0], fd, EVFILT_READ, readFlags | EV_RECEIPT, 0, 0, udataFromKey(ev.key));
	EV_SET(&changes[1], fd, EVFILT_WRITE, writeFlags | EV_RECEIPT, 0, 0, udataFromKey(ev.key));
	return submitChanges(changes);
}

int KqueueBackend::remove(int fd) { return modify(fd, Event::none(0), PollMode::Oneshot); }

int KqueueBackend::submitChanges(std::span<const struct kevent> changes) const {
	std::array<struct kevent, kMaxChanges> receipts{};
	if (changes.size() > receipts.size()) {
		return EINVAL;
	}

	// Every change carries EV_RECEIPT, so the receipts fill the event list and kevent() returns immediately.
	const int count = static_cast<int>(changes.size());
	int rc;
	do {
		rc = kevent(mKqueueFd, changes.data(), count, receipts.data(), count, nullptr);
	} while (rc < 0 && errno == EINTR);
	if (rc < 0) {
		int err = errno;
		DEBUG_LOG("readyq(kqueue): kevent(changes) failed: %d (%s)\n", err, strerror(err));
		return err;
	}

	for (int i = 0; i < rc; ++i) {
		const auto &receipt = receipts[static_cast<size_t>(i)];
		if ((receipt.flags & EV_ERROR) == 0 || receipt.data == 0) {
			continue;
		}
		if (readyq::isBenignChangeError(static_cast<intptr_t>(receipt.data))) {
			continue;
		}
		DEBUG_LOG("readyq(kqueue): change on ident %lu filter %d failed: %d (%s)\n",
				  static_cast<unsigned long>(receipt.ident), receipt.filter, static_cast<int>(receipt.data),
				  strerror(static_cast<int>(receipt.data)));
		return static_cast<int>(receipt.data);
	}
	return 0;
}

int KqueueBackend::wait(readyq::Events &events, readyq::Timeout timeout) {
	VERBOSE_LOG("readyq(kqueue): wait kqueue_fd=%d timeout_ns=%lld\n", mKqueueFd,
				timeout ? static_cast<long long>(timeout->count()) : -1LL);

	const readyq::Deadline deadline(timeout);
	auto slots = events.slots();
	int count;
	while (true) {
		struct timespec ts{};
		struct timespec *tsp = nullptr;
		if (!deadline.infinite()) {
			ts = readyq::toTimespec(deadline.remaining());
			tsp = &ts;
		}
		count = kevent(mKqueueFd, nullptr, 0, slots.data(), static_cast<int>(slots.size()), tsp);
		if (count >= 0) {
			break;
		}
		if (errno == EINTR) {
			continue;
		}
		int err = errno;
		events.clear();
		DEBUG_LOG("readyq(kqueue): kevent wait failed: %d (%s)\n", err, strerror(err));
		return err;
	}
	events.commit(static_cast<size_t>(count));

	VERBOSE_LOG("readyq(kqueue): new events kqueue_fd=%d res=%d\n", mKqueueFd, count);

	// Clear the notification (if received) and re-register interest in it.
	return mNotify->reattach();
}

void KqueueBackend::notify() {
	VERBOSE_LOG("readyq(kqueue): notify kqueue_fd=%d\n", mKqueueFd);
	if (!mNotify) {
		return;
	}
	if (int err = mNotify->notify(); err != 0) {
		DEBUG_LOG("readyq(kqueue): notify failed: %d (%s)\n", err, strerror(err));
	}
}

} // namespace

namespace readyq {

int submitKqueueChanges(Backend &backend, std::span<const struct kevent> changes) {
	if (strcmp(backend.name(), "kqueue") != 0) {
		return EINVAL;
	}
	std::array<struct kevent, KqueueBackend::kMaxChanges> receipted{};
	if (changes.size() > receipted.size()) {
		return EINVAL;
	}
	for (size_t i = 0; i < changes.size(); ++i) {
		receipted[i] = changes[i];
		receipted[i].flags |= EV_RECEIPT;
	}
	return static_cast<KqueueBackend &>(backend).submitChanges(std::span(receipted.data(), changes.size()));
}

namespace detail {

std::unique_ptr<Backend> createKqueueBackend() { return std::make_unique<KqueueBackend>(); }

} // namespace detail

} // namespace readyq
