#include "backend.h"

#include "common.h"
#include "config.h"
#include "notifier.h"
#include "timeutil.h"

#include <cerrno>
#include <cstring>
#include <memory>

#include <sys/epoll.h>
#include <unistd.h>

namespace {

using readyq::Event;
using readyq::PollMode;

uint32_t interestToEvents(Event ev, PollMode mode) {
	uint32_t events = 0;
	if (ev.readable) {
		events |= EPOLLIN | EPOLLRDHUP | EPOLLPRI;
	}
	if (ev.writable) {
		events |= EPOLLOUT;
	}
	switch (mode) {
	case PollMode::Oneshot:
		events |= EPOLLONESHOT;
		break;
	case PollMode::Level:
		break;
	case PollMode::Edge:
		events |= EPOLLET;
		break;
	case PollMode::EdgeOneshot:
		events |= EPOLLET | EPOLLONESHOT;
		break;
	}
	return events;
}

class EpollBackend : public readyq::Backend {
  public:
	~EpollBackend() override;

	int init() override;
	[[nodiscard]] const char *name() const noexcept override { return "epoll"; }
	[[nodiscard]] int fd() const noexcept override { return mEpollFd; }
	[[nodiscard]] bool supportsLevel() const noexcept override { return true; }
	[[nodiscard]] bool supportsEdge() const noexcept override { return true; }

	int add(int fd, Event ev, PollMode mode) override;
	int modify(int fd, Event ev, PollMode mode) override;
	int remove(int fd) override;
	int wait(readyq::Events &events, readyq::Timeout timeout) override;
	void notify() override;

  private:
	int control(int op, int fd, Event ev, PollMode mode) const;
	[[nodiscard]] bool isNotifierFd(int fd) const { return mNotify && mNotify->hasFd(fd); }

	int mEpollFd = -1;
	std::unique_ptr<readyq::Notifier> mNotify;
	bool mNotifyAttached = false;
};

EpollBackend::~EpollBackend() {
	VERBOSE_LOG("readyq(epoll): drop epoll_fd=%d\n", mEpollFd);
	if (mNotifyAttached) {
		if (int err = mNotify->detach(); err != 0) {
			DEBUG_LOG("readyq(epoll): detaching notifier failed: %d (%s)\n", err, strerror(err));
		}
	}
	mNotify.reset();
	if (mEpollFd >= 0) {
		close(mEpollFd);
		mEpollFd = -1;
	}
}

int EpollBackend::init() {
	mEpollFd = epoll_create1(EPOLL_CLOEXEC);
	if (mEpollFd < 0) {
		int err = errno;
		DEBUG_LOG("readyq(epoll): epoll_create1 failed: %d (%s)\n", err, strerror(err));
		return err;
	}

	if (readyq::config().notify == readyq::NotifyStrategy::Pipe) {
		mNotify = readyq::createPipeNotifier(*this);
	} else {
		mNotify = readyq::createEventFdNotifier(*this);
	}
	if (int err = mNotify->init(); err != 0) {
		return err;
	}
	if (int err = mNotify->attach(); err != 0) {
		DEBUG_LOG("readyq(epoll): registering notifier failed: %d (%s)\n", err, strerror(err));
		return err;
	}
	mNotifyAttached = true;

	VERBOSE_LOG("readyq(epoll): new epoll_fd=%d\n", mEpollFd);
	return 0;
}

int EpollBackend::control(int op, int fd, Event ev, PollMode mode) const {
	struct epoll_event event{};
	event.events = interestToEvents(ev, mode);
	event.data.u64 = static_cast<uint64_t>(ev.key);
	if (epoll_ctl(mEpollFd, op, fd, &event) != 0) {
		int err = errno;
		DEBUG_LOG("readyq(epoll): epoll_ctl op=%d fd=%d failed: %d (%s)\n", op, fd, err, strerror(err));
		return err;
	}
	return 0;
}

int EpollBackend::add(int fd, Event ev, PollMode mode) {
	if (!isNotifierFd(fd)) {
		VERBOSE_LOG("readyq(epoll): add epoll_fd=%d fd=%d key=%zu readable=%d writable=%d mode=%s\n", mEpollFd, fd,
					static_cast<size_t>(ev.key), ev.readable, ev.writable, readyq::pollModeName(mode));
	}
	return control(EPOLL_CTL_ADD, fd, ev, mode);
}

int EpollBackend::modify(int fd, Event ev, PollMode mode) {
	if (!isNotifierFd(fd)) {
		VERBOSE_LOG("readyq(epoll): modify epoll_fd=%d fd=%d key=%zu readable=%d writable=%d mode=%s\n", mEpollFd,
					fd, static_cast<size_t>(ev.key), ev.readable, ev.writable, readyq::pollModeName(mode));
	}
	return control(EPOLL_CTL_MOD, fd, ev, mode);
}

int EpollBackend::remove(int fd) {
	VERBOSE_LOG("readyq(epoll): remove epoll_fd=%d fd=%d\n", mEpollFd, fd);
	if (epoll_ctl(mEpollFd, EPOLL_CTL_DEL, fd, nullptr) != 0) {
		int err = errno;
		// Not registered, or the registration already went away with its file.
		if (err == ENOENT) {
			return 0;
		}
		DEBUG_LOG("readyq(epoll): epoll_ctl del fd=%d failed: %d (%s)\n", fd, err, strerror(err));
		return err;
	}
	return 0;
}

int EpollBackend::wait(readyq::Events &events, readyq::Timeout timeout) {
	VERBOSE_LOG("readyq(epoll): wait epoll_fd=%d timeout_ns=%lld\n", mEpollFd,
				timeout ? static_cast<long long>(timeout->count()) : -1LL);

	const readyq::Deadline deadline(timeout);
	auto slots = events.slots();
	int count;
	while (true) {
		const int timeoutMs = deadline.infinite() ? -1 : readyq::toMillisRoundUp(deadline.remaining());
		count = epoll_wait(mEpollFd, slots.data(), static_cast<int>(slots.size()), timeoutMs);
		if (count >= 0) {
			break;
		}
		if (errno == EINTR) {
			continue;
		}
		int err = errno;
		events.clear();
		DEBUG_LOG("readyq(epoll): epoll_wait failed: %d (%s)\n", err, strerror(err));
		return err;
	}
	events.commit(static_cast<size_t>(count));

	VERBOSE_LOG("readyq(epoll): new events epoll_fd=%d res=%d\n", mEpollFd, count);

	return mNotify->reattach();
}

void EpollBackend::notify() {
	VERBOSE_LOG("readyq(epoll): notify epoll_fd=%d\n", mEpollFd);
	if (!mNotify) {
		return;
	}
	if (int err = mNotify->notify(); err != 0) {
		DEBUG_LOG("readyq(epoll): notify failed: %d (%s)\n", err, strerror(err));
	}
}

} // namespace

namespace readyq::detail {

std::unique_ptr<Backend> createEpollBackend() { return std::make_unique<EpollBackend>(); }

} // namespace readyq::detail
