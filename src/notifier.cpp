#include "notifier.h"

#include "backend.h"
#include "common.h"

#include <cerrno>
#include <cstdint>
#include <cstring>

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/eventfd.h>
#endif

namespace readyq {

namespace {

int setNonBlockingCloexec(int fd) {
	int flags = fcntl(fd, F_GETFL, 0);
	if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
		return errno;
	}
	int fdFlags = fcntl(fd, F_GETFD, 0);
	if (fdFlags < 0 || fcntl(fd, F_SETFD, fdFlags | FD_CLOEXEC) != 0) {
		return errno;
	}
	return 0;
}

class PipeNotifier : public Notifier {
  public:
	explicit PipeNotifier(Backend &backend) : mBackend(backend) {}
	~PipeNotifier() override;

	int init() override;
	int attach() override;
	int reattach() override;
	int notify() override;
	int detach() override;
	[[nodiscard]] bool hasFd(int fd) const noexcept override { return fd == mReadFd; }

  private:
	Backend &mBackend;
	int mReadFd = -1;
	int mWriteFd = -1;
};

PipeNotifier::~PipeNotifier() {
	if (mReadFd >= 0) {
		close(mReadFd);
	}
	if (mWriteFd >= 0) {
		close(mWriteFd);
	}
}

int PipeNotifier::init() {
	int fds[2];
	if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
		int err = errno;
		DEBUG_LOG("readyq(notify): socketpair failed: %d (%s)\n", err, strerror(err));
		return err;
	}
	mReadFd = fds[0];
	mWriteFd = fds[1];
	for (int fd : fds) {
		if (int err = setNonBlockingCloexec(fd); err != 0) {
			DEBUG_LOG("readyq(notify): fcntl on fd %d failed: %d (%s)\n", fd, err, strerror(err));
			return err;
		}
	}
	return 0;
}

int PipeNotifier::attach() { return mBackend.add(mReadFd, Event::readableOnly(kNotifyKey), PollMode::Oneshot); }

int PipeNotifier::reattach() {
	// Drain before re-arming; a byte written in between then still fires the fresh registration.
	uint8_t buf[64];
	while (true) {
		ssize_t rc = read(mReadFd, buf, sizeof(buf));
		if (rc > 0) {
			continue;
		}
		if (rc < 0 && errno == EINTR) {
			continue;
		}
		break;
	}
	return mBackend.modify(mReadFd, Event::readableOnly(kNotifyKey), PollMode::Oneshot);
}

int PipeNotifier::notify() {
	const uint8_t byte = 1;
	while (write(mWriteFd, &byte, 1) < 0) {
		if (errno == EINTR) {
			continue;
		}
		if (errno == EAGAIN || errno == EWOULDBLOCK) {
			// Channel is full, so a wake is already pending.
			return 0;
		}
		return errno;
	}
	return 0;
}

int PipeNotifier::detach() { return mBackend.remove(mReadFd); }

#ifdef __linux__

class EventFdNotifier : public Notifier {
  public:
	explicit EventFdNotifier(Backend &backend) : mBackend(backend) {}
	~EventFdNotifier() override {
		if (mEventFd >= 0) {
			close(mEventFd);
		}
	}

	int init() override {
		mEventFd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
		if (mEventFd < 0) {
			int err = errno;
			DEBUG_LOG("readyq(notify): eventfd failed: %d (%s)\n", err, strerror(err));
			return err;
		}
		return 0;
	}
	int attach() override { return mBackend.add(mEventFd, Event::readableOnly(kNotifyKey), PollMode::Oneshot); }
	int reattach() override;
	int notify() override;
	int detach() override { return mBackend.remove(mEventFd); }
	[[nodiscard]] bool hasFd(int fd) const noexcept override { return fd == mEventFd; }

  private:
	Backend &mBackend;
	int mEventFd = -1;
};

int EventFdNotifier::reattach() {
	uint64_t value = 0;
	while (read(mEventFd, &value, sizeof(value)) < 0 && errno == EINTR) {
	}
	return mBackend.modify(mEventFd, Event::readableOnly(kNotifyKey), PollMode::Oneshot);
}

int EventFdNotifier::notify() {
	const uint64_t value = 1;
	while (write(mEventFd, &value, sizeof(value)) < 0) {
		if (errno == EINTR) {
			continue;
		}
		if (errno == EAGAIN) {
			return 0;
		}
		return errno;
	}
	return 0;
}

#endif

} // namespace

std::unique_ptr<Notifier> createPipeNotifier(Backend &backend) { return std::make_unique<PipeNotifier>(backend); }

#ifdef __linux__
std::unique_ptr<Notifier> createEventFdNotifier(Backend &backend) {
	return std::make_unique<EventFdNotifier>(backend);
}
#endif

} // namespace readyq
