#include "backend.h"

#include "common.h"
#include "notifier.h"
#include "timeutil.h"

#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <liburing.h>
#include <poll.h>

namespace {

using readyq::Event;
using readyq::PollMode;

constexpr unsigned kQueueDepth = 256;

// User data of completions that carry no registration.
constexpr uint64_t kIgnoreToken = 0;
constexpr uint64_t kNotifyToken = 1;
constexpr uint64_t kFirstToken = 2;

struct Registration {
	Event ev;
	PollMode mode = PollMode::Oneshot;
	// Token of the armed poll request, kIgnoreToken while disarmed.
	uint64_t token = kIgnoreToken;
};

unsigned pollMask(Event ev) {
	unsigned mask = 0;
	if (ev.readable) {
		mask |= POLLIN | POLLRDHUP | POLLPRI;
	}
	if (ev.writable) {
		mask |= POLLOUT;
	}
	return mask;
}

class IoUringBackend : public readyq::Backend {
  public:
	~IoUringBackend() override;

	int init() override;
	[[nodiscard]] const char *name() const noexcept override { return "io_uring"; }
	[[nodiscard]] int fd() const noexcept override { return mRingReady ? mRing.ring_fd : -1; }
	// A poll request either fires once or once per wakeup; neither is level-triggered.
	[[nodiscard]] bool supportsLevel() const noexcept override { return false; }
	[[nodiscard]] bool supportsEdge() const noexcept override { return true; }

	int add(int fd, Event ev, PollMode mode) override;
	int modify(int fd, Event ev, PollMode mode) override;
	int remove(int fd) override;
	int wait(readyq::Events &events, readyq::Timeout timeout) override;
	void notify() override;

	int submitNop();

  private:
	struct io_uring_sqe *getSqeLocked();
	int submitLocked();
	void armLocked(int fd, Registration &reg);
	void cancelLocked(Registration &reg);
	size_t reapCompletions(readyq::Events &events);

	struct io_uring mRing{};
	bool mRingReady = false;

	// Guards the submission queue and the registration tables. Completions are reaped only by wait().
	std::mutex mMutex;
	std::unordered_map<int, Registration> mRegistrations;
	std::unordered_map<uint64_t, int> mFdByToken;
	uint64_t mNextToken = kFirstToken;

	std::unique_ptr<readyq::Notifier> mNotify;
};

// A NOP's completion stays queued until wait() reaps it, which latches the wake.
class NopNotifier : public readyq::Notifier {
  public:
	explicit NopNotifier(IoUringBackend &backend) : mBackend(backend) {}

	int init() override { return 0; }
	int attach() override { return 0; }
	int reattach() override { return 0; }
	int notify() override { return mBackend.submitNop(); }
	int detach() override { return 0; }
	[[nodiscard]] bool hasFd(int) const noexcept override { return false; }

  private:
	IoUringBackend &mBackend;
};

IoUringBackend::~IoUringBackend() {
	VERBOSE_LOG("readyq(io_uring): drop ring_fd=%d\n", fd());
	mNotify.reset();
	if (mRingReady) {
		io_uring_queue_exit(&mRing);
		mRingReady = false;
	}
}

int IoUringBackend::init() {
	int rc = io_uring_queue_init(kQueueDepth, &mRing, 0);
	if (rc < 0) {
		DEBUG_LOG("readyq(io_uring): io_uring_queue_init failed: %d (%s)\n", -rc, strerror(-rc));
		return -rc;
	}
	mRingReady = true;

	// Without EXT_ARG a timed wait has to queue a timeout request, which would race with other submitters.
	if ((mRing.features & IORING_FEAT_EXT_ARG) == 0) {
		DEBUG_LOG("readyq(io_uring): kernel lacks IORING_FEAT_EXT_ARG\n");
		return ENOTSUP;
	}

	mNotify = std::make_unique<NopNotifier>(*this);
	if (int err = mNotify->init(); err != 0) {
		return err;
	}
	if (int err = mNotify->attach(); err != 0) {
		return err;
	}

	DEBUG_LOG("readyq(io_uring): backend initialized (depth=%u)\n", kQueueDepth);
	return 0;
}

struct io_uring_sqe *IoUringBackend::getSqeLocked() {
	struct io_uring_sqe *sqe = io_uring_get_sqe(&mRing);
	if (!sqe) {
		// Queue full: push what is pending to the kernel and try again.
		submitLocked();
		sqe = io_uring_get_sqe(&mRing);
	}
	return sqe;
}

int IoUringBackend::submitLocked() {
	while (true) {
		int rc = io_uring_submit(&mRing);
		if (rc >= 0) {
			return 0;
		}
		if (rc == -EINTR) {
			continue;
		}
		DEBUG_LOG("readyq(io_uring): io_uring_submit failed: %d (%s)\n", -rc, strerror(-rc));
		return -rc;
	}
}

void IoUringBackend::armLocked(int fd, Registration &reg) {
	const unsigned mask = pollMask(reg.ev);
	if (mask == 0) {
		reg.token = kIgnoreToken;
		return;
	}
	struct io_uring_sqe *sqe = getSqeLocked();
	if (!sqe) {
		reg.token = kIgnoreToken;
		return;
	}
	if (reg.mode == PollMode::Edge) {
		io_uring_prep_poll_multishot(sqe, fd, mask);
	} else {
		io_uring_prep_poll_add(sqe, fd, mask);
	}
	reg.token = mNextToken++;
	io_uring_sqe_set_data64(sqe, reg.token);
	mFdByToken[reg.token] = fd;
}

void IoUringBackend::cancelLocked(Registration &reg) {
	if (reg.token == kIgnoreToken) {
		return;
	}
	mFdByToken.erase(reg.token);
	if (struct io_uring_sqe *sqe = getSqeLocked()) {
		io_uring_prep_poll_remove(sqe, reg.token);
		io_uring_sqe_set_data64(sqe, kIgnoreToken);
	}
	reg.token = kIgnoreToken;
}

int IoUringBackend::add(int fd, Event ev, PollMode mode) {
	VERBOSE_LOG("readyq(io_uring): add fd=%d key=%zu readable=%d writable=%d mode=%s\n", fd,
				static_cast<size_t>(ev.key), ev.readable, ev.writable, readyq::pollModeName(mode));
	if (mode == PollMode::Level) {
		return EINVAL;
	}

	std::lock_guard lk(mMutex);
	auto [it, inserted] = mRegistrations.try_emplace(fd);
	if (!inserted) {
		return EEXIST;
	}
	it->second.ev = ev;
	it->second.mode = mode;
	armLocked(fd, it->second);
	if (pollMask(ev) != 0 && it->second.token == kIgnoreToken) {
		mRegistrations.erase(it);
		return EBUSY;
	}
	return submitLocked();
}

int IoUringBackend::modify(int fd, Event ev, PollMode mode) {
	VERBOSE_LOG("readyq(io_uring): modify fd=%d key=%zu readable=%d writable=%d mode=%s\n", fd,
				static_cast<size_t>(ev.key), ev.readable, ev.writable, readyq::pollModeName(mode));
	if (mode == PollMode::Level) {
		return EINVAL;
	}

	std::lock_guard lk(mMutex);
	auto it = mRegistrations.find(fd);
	if (it == mRegistrations.end()) {
		return ENOENT;
	}
	Registration &reg = it->second;
	cancelLocked(reg);
	reg.ev = ev;
	reg.mode = mode;
	armLocked(fd, reg);
	if (pollMask(ev) != 0 && reg.token == kIgnoreToken) {
		submitLocked();
		return EBUSY;
	}
	return submitLocked();
}

int IoUringBackend::remove(int fd) {
	VERBOSE_LOG("readyq(io_uring): remove fd=%d\n", fd);
	std::lock_guard lk(mMutex);
	auto it = mRegistrations.find(fd);
	if (it == mRegistrations.end()) {
		return 0;
	}
	cancelLocked(it->second);
	mRegistrations.erase(it);
	return submitLocked();
}

int IoUringBackend::submitNop() {
	std::lock_guard lk(mMutex);
	struct io_uring_sqe *sqe = getSqeLocked();
	if (!sqe) {
		return EBUSY;
	}
	io_uring_prep_nop(sqe);
	io_uring_sqe_set_data64(sqe, kNotifyToken);
	return submitLocked();
}

size_t IoUringBackend::reapCompletions(readyq::Events &events) {
	auto slots = events.slots();
	size_t count = 0;
	unsigned seen = 0;
	struct io_uring_cqe *cqe;
	unsigned head;

	std::lock_guard lk(mMutex);
	io_uring_for_each_cqe(&mRing, head, cqe) {
		if (count == slots.size()) {
			break;
		}
		++seen;
		const uint64_t token = io_uring_cqe_get_data64(cqe);
		if (token == kIgnoreToken) {
			continue;
		}
		if (token == kNotifyToken) {
			slots[count] = {};
			slots[count].data.u64 = static_cast<uint64_t>(readyq::kNotifyKey);
			++count;
			continue;
		}

		auto fdIt = mFdByToken.find(token);
		if (fdIt == mFdByToken.end()) {
			// Completion of a request that has since been modified or removed.
			continue;
		}
		const int fd = fdIt->second;
		Registration &reg = mRegistrations.at(fd);
		const bool more = (cqe->flags & IORING_CQE_F_MORE) != 0;
		if (!more) {
			mFdByToken.erase(fdIt);
			reg.token = kIgnoreToken;
		}
		if (cqe->res == -ECANCELED) {
			continue;
		}

		slots[count] = {};
		slots[count].events = cqe->res < 0 ? static_cast<uint32_t>(EPOLLERR) : static_cast<uint32_t>(cqe->res);
		slots[count].data.u64 = static_cast<uint64_t>(reg.ev.key);
		++count;

		// The kernel ends a multishot poll early on overflow; edge interest must keep firing.
		if (!more && reg.mode == PollMode::Edge) {
			armLocked(fd, reg);
			submitLocked();
		}
	}
	io_uring_cq_advance(&mRing, seen);

	events.commit(count);
	return count;
}

int IoUringBackend::wait(readyq::Events &events, readyq::Timeout timeout) {
	VERBOSE_LOG("readyq(io_uring): wait ring_fd=%d timeout_ns=%lld\n", fd(),
				timeout ? static_cast<long long>(timeout->count()) : -1LL);

	const readyq::Deadline deadline(timeout);
	while (true) {
		struct io_uring_cqe *cqe = nullptr;
		struct __kernel_timespec ts{};
		struct __kernel_timespec *tsp = nullptr;
		if (!deadline.infinite()) {
			const struct timespec remaining = readyq::toTimespec(deadline.remaining());
			ts.tv_sec = remaining.tv_sec;
			ts.tv_nsec = remaining.tv_nsec;
			tsp = &ts;
		}
		int rc = io_uring_wait_cqe_timeout(&mRing, &cqe, tsp);
		if (rc == -EINTR) {
			continue;
		}
		if (rc == -ETIME) {
			events.clear();
			return 0;
		}
		if (rc < 0) {
			events.clear();
			DEBUG_LOG("readyq(io_uring): io_uring_wait_cqe_timeout failed: %d (%s)\n", -rc, strerror(-rc));
			return -rc;
		}
		// Only stale or internal completions arrived; keep waiting for the time that is left.
		if (reapCompletions(events) > 0 || deadline.remaining().count() == 0) {
			break;
		}
	}

	VERBOSE_LOG("readyq(io_uring): new events ring_fd=%d res=%zu\n", fd(), events.raw().size());
	return mNotify->reattach();
}

void IoUringBackend::notify() {
	VERBOSE_LOG("readyq(io_uring): notify ring_fd=%d\n", fd());
	if (!mNotify) {
		return;
	}
	if (int err = mNotify->notify(); err != 0) {
		DEBUG_LOG("readyq(io_uring): notify failed: %d (%s)\n", err, strerror(err));
	}
}

} // namespace

namespace readyq::detail {

std::unique_ptr<Backend> createIoUringBackend() { return std::make_unique<IoUringBackend>(); }

} // namespace readyq::detail
