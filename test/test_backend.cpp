#include "test_util.h"

#include <cerrno>
#include <span>
#include <type_traits>

using readyq::Event;
using readyq::PollMode;

namespace {

void testOneshotFiresOnceUntilRearmed(readyq::Backend &backend) {
    SocketPair sp;
    readyq::Events events;
    TEST_CHECK_OK(backend.add(sp.a, Event::readableOnly(7), PollMode::Oneshot));
    writeByte(sp.b);

    TEST_CHECK_OK(backend.wait(events, 1s));
    auto ev = findKey(events, 7);
    TEST_CHECK_MSG(ev.has_value(), "%s: readable event missing", backend.name());
    TEST_CHECK(ev->readable);

    // Data is still unread, but the registration has been consumed.
    TEST_CHECK_OK(backend.wait(events, 50ms));
    TEST_CHECK(!findKey(events, 7).has_value());

    TEST_CHECK_OK(backend.modify(sp.a, Event::readableOnly(7), PollMode::Oneshot));
    TEST_CHECK_OK(backend.wait(events, 1s));
    TEST_CHECK(findKey(events, 7).has_value());

    TEST_CHECK_OK(backend.remove(sp.a));
}

void testLevelKeepsReporting(readyq::Backend &backend) {
    if (!backend.supportsLevel()) {
        TEST_CHECK_EQ(EINVAL, backend.add(0, Event::readableOnly(1), PollMode::Level));
        return;
    }
    SocketPair sp;
    readyq::Events events;
    TEST_CHECK_OK(backend.add(sp.a, Event::readableOnly(11), PollMode::Level));
    writeByte(sp.b);

    for (int i = 0; i < 3; ++i) {
        TEST_CHECK_OK(backend.wait(events, 1s));
        TEST_CHECK_MSG(findKey(events, 11).has_value(), "%s: level event missing on round %d", backend.name(), i);
    }

    drain(sp.a);
    TEST_CHECK_OK(backend.wait(events, 50ms));
    TEST_CHECK(!findKey(events, 11).has_value());
    TEST_CHECK_OK(backend.remove(sp.a));
}

void testEdgeDoesNotRefire(readyq::Backend &backend) {
    if (!backend.supportsEdge()) {
        return;
    }
    SocketPair sp;
    readyq::Events events;
    TEST_CHECK_OK(backend.add(sp.a, Event::readableOnly(12), PollMode::Edge));
    writeByte(sp.b);

    TEST_CHECK_OK(backend.wait(events, 1s));
    TEST_CHECK(findKey(events, 12).has_value());

    TEST_CHECK_OK(backend.wait(events, 50ms));
    TEST_CHECK_MSG(!findKey(events, 12).has_value(), "%s: edge event fired without new data", backend.name());

    writeByte(sp.b);
    TEST_CHECK_OK(backend.wait(events, 1s));
    TEST_CHECK(findKey(events, 12).has_value());
    TEST_CHECK_OK(backend.remove(sp.a));
}

void testDirectionsAreIndependent(readyq::Backend &backend) {
    SocketPair sp;
    readyq::Events events;
    // Readable too, but only write interest is registered.
    writeByte(sp.b);
    TEST_CHECK_OK(backend.add(sp.a, Event::writableOnly(21), PollMode::Oneshot));

    TEST_CHECK_OK(backend.wait(events, 1s));
    auto ev = findKey(events, 21);
    TEST_CHECK(ev.has_value());
    TEST_CHECK(ev->writable);
    TEST_CHECK(!ev->readable);

    TEST_CHECK_OK(backend.modify(sp.a, Event::readableOnly(21), PollMode::Oneshot));
    TEST_CHECK_OK(backend.wait(events, 1s));
    ev = findKey(events, 21);
    TEST_CHECK(ev.has_value());
    TEST_CHECK(ev->readable);
    TEST_CHECK_OK(backend.remove(sp.a));
}

void testLevelDirectionSwitch(readyq::Backend &backend) {
    if (!backend.supportsLevel()) {
        return;
    }
    SocketPair sp;
    readyq::Events events;
    // Pending data keeps the read side ready throughout.
    writeByte(sp.b);
    TEST_CHECK_OK(backend.add(sp.a, Event::readableOnly(22), PollMode::Level));
    TEST_CHECK_OK(backend.wait(events, 1s));
    auto ev = findKey(events, 22);
    TEST_CHECK(ev.has_value());
    TEST_CHECK(ev->readable);
    TEST_CHECK(!ev->writable);

    TEST_CHECK_OK(backend.modify(sp.a, Event::readableOnly(22), PollMode::Level));
    TEST_CHECK_OK(backend.modify(sp.a, Event::writableOnly(22), PollMode::Level));
    for (int i = 0; i < 3; ++i) {
        TEST_CHECK_OK(backend.wait(events, 1s));
        ev = findKey(events, 22);
        TEST_CHECK_MSG(ev.has_value(), "%s: write interest missing on round %d", backend.name(), i);
        TEST_CHECK(ev->writable);
        TEST_CHECK_MSG(!ev->readable, "%s: disarmed read interest still reported", backend.name());
    }

    TEST_CHECK_OK(backend.modify(sp.a, Event::readableOnly(22), PollMode::Level));
    TEST_CHECK_OK(backend.wait(events, 1s));
    ev = findKey(events, 22);
    TEST_CHECK(ev.has_value());
    TEST_CHECK(ev->readable);
    TEST_CHECK_MSG(!ev->writable, "%s: disarmed write interest still reported", backend.name());
    TEST_CHECK_OK(backend.remove(sp.a));
}

void testModifyReplacesKey(readyq::Backend &backend) {
    SocketPair sp;
    readyq::Events events;
    TEST_CHECK_OK(backend.add(sp.a, Event::readableOnly(31), PollMode::Oneshot));
    TEST_CHECK_OK(backend.modify(sp.a, Event::readableOnly(32), PollMode::Oneshot));
    writeByte(sp.b);

    TEST_CHECK_OK(backend.wait(events, 1s));
    TEST_CHECK(!findKey(events, 31).has_value());
    TEST_CHECK(findKey(events, 32).has_value());
    TEST_CHECK_OK(backend.remove(sp.a));
}

void testSeveralKeysInOneWait(readyq::Backend &backend) {
    SocketPair first;
    SocketPair second;
    readyq::Events events;
    TEST_CHECK_OK(backend.add(first.a, Event::readableOnly(41), PollMode::Oneshot));
    TEST_CHECK_OK(backend.add(second.a, Event::readableOnly(42), PollMode::Oneshot));
    writeByte(first.b);
    writeByte(second.b);

    bool sawFirst = false;
    bool sawSecond = false;
    for (int i = 0; i < 4 && !(sawFirst && sawSecond); ++i) {
        TEST_CHECK_OK(backend.wait(events, 1s));
        sawFirst = sawFirst || findKey(events, 41).has_value();
        sawSecond = sawSecond || findKey(events, 42).has_value();
    }
    TEST_CHECK(sawFirst);
    TEST_CHECK(sawSecond);
    TEST_CHECK_OK(backend.remove(first.a));
    TEST_CHECK_OK(backend.remove(second.a));
}

void testRemoveIsIdempotent(readyq::Backend &backend) {
    SocketPair sp;
    readyq::Events events;
    TEST_CHECK_OK(backend.add(sp.a, Event::readableOnly(51), PollMode::Oneshot));
    TEST_CHECK_OK(backend.remove(sp.a));
    TEST_CHECK_OK(backend.remove(sp.a));
    // Never registered at all.
    TEST_CHECK_OK(backend.remove(sp.b));

    writeByte(sp.b);
    TEST_CHECK_OK(backend.wait(events, 50ms));
    TEST_CHECK(!findKey(events, 51).has_value());
}

void testPeerCloseReportsBothDirections(readyq::Backend &backend) {
    SocketPair sp;
    readyq::Events events;
    TEST_CHECK_OK(backend.add(sp.a, Event::readableOnly(61), PollMode::Oneshot));
    sp.closeB();

    TEST_CHECK_OK(backend.wait(events, 1s));
    auto ev = findKey(events, 61);
    TEST_CHECK(ev.has_value());
    TEST_CHECK(ev->readable);
    TEST_CHECK_MSG(ev->writable, "%s: closed peer not reported as writable", backend.name());
    TEST_CHECK_OK(backend.remove(sp.a));
}

void testReaderCloseWakesBlockedWriter(readyq::Backend &backend) {
    int fds[2];
    TEST_CHECK(pipe(fds) == 0);
    const int readEnd = fds[0];
    const int writeEnd = fds[1];
    TEST_CHECK(fcntl(writeEnd, F_SETFL, fcntl(writeEnd, F_GETFL, 0) | O_NONBLOCK) == 0);

    // Fill the pipe so the write end is no longer ready.
    char chunk[4096] = {};
    while (write(writeEnd, chunk, sizeof(chunk)) > 0) {
    }
    while (write(writeEnd, chunk, 1) > 0) {
    }

    readyq::Events events;
    TEST_CHECK_OK(backend.add(writeEnd, Event::writableOnly(63), PollMode::Oneshot));
    TEST_CHECK_OK(backend.wait(events, 50ms));
    TEST_CHECK_MSG(!findKey(events, 63).has_value(), "%s: full pipe reported writable", backend.name());

    close(readEnd);
    TEST_CHECK_OK(backend.wait(events, 1s));
    auto ev = findKey(events, 63);
    TEST_CHECK_MSG(ev.has_value(), "%s: writer not woken by reader close", backend.name());
    TEST_CHECK(ev->writable);

    TEST_CHECK_OK(backend.remove(writeEnd));
    close(writeEnd);
}

void testRemoveAfterDescriptorReuse(readyq::Backend &backend) {
    SocketPair sp;
    SocketPair other;
    TEST_CHECK_OK(backend.add(sp.a, Event::readableOnly(71), PollMode::Oneshot));

    // Closing drops the kernel-side registration; the number then names an unrelated file.
    const int number = sp.a;
    sp.closeA();
    TEST_CHECK(dup2(other.a, number) == number);
    TEST_CHECK_OK(backend.remove(number));
    close(number);
}

void testTimeoutElapses(readyq::Backend &backend) {
    readyq::Events events;
    const auto requested = 60ms;
    const auto start = std::chrono::steady_clock::now();
    TEST_CHECK_OK(backend.wait(events, requested));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    TEST_CHECK(events.empty());
    TEST_CHECK(!events.notified());
    TEST_CHECK_MSG(elapsed >= requested, "%s: wait returned after %lld ms", backend.name(),
                   static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()));

    const auto zeroStart = std::chrono::steady_clock::now();
    TEST_CHECK_OK(backend.wait(events, 0ns));
    TEST_CHECK(std::chrono::steady_clock::now() - zeroStart < 1s);
    TEST_CHECK(events.empty());
}

#if READYQ_HAVE_KQUEUE

void testKqueueTimerFilter(readyq::Backend &backend) {
    struct kevent change{};
    EV_SET(&change, 1, EVFILT_TIMER, EV_ADD | EV_ONESHOT, 0, 20, 0);
    if constexpr (std::is_pointer_v<decltype(change.udata)>) {
        change.udata = reinterpret_cast<decltype(change.udata)>(uintptr_t{81});
    } else {
        change.udata = static_cast<decltype(change.udata)>(81);
    }
    TEST_CHECK_OK(readyq::submitKqueueChanges(backend, std::span(&change, 1)));

    readyq::Events events;
    TEST_CHECK_OK(backend.wait(events, 1s));
    auto ev = findKey(events, 81);
    TEST_CHECK_MSG(ev.has_value(), "timer filter did not fire");
    TEST_CHECK(*ev == Event::readableOnly(81));
}

#endif

void testReportsOwnDescriptor(readyq::Backend &backend) { TEST_CHECK(backend.fd() >= 0); }

} // namespace

int main() {
    int ran = forEachBackend(testReportsOwnDescriptor);
    TEST_CHECK_MSG(ran > 0, "no backend could be initialized");
    forEachBackend(testOneshotFiresOnceUntilRearmed);
    forEachBackend(testLevelKeepsReporting);
    forEachBackend(testEdgeDoesNotRefire);
    forEachBackend(testDirectionsAreIndependent);
    forEachBackend(testLevelDirectionSwitch);
    forEachBackend(testModifyReplacesKey);
    forEachBackend(testSeveralKeysInOneWait);
    forEachBackend(testRemoveIsIdempotent);
    forEachBackend(testPeerCloseReportsBothDirections);
    forEachBackend(testReaderCloseWakesBlockedWriter);
    forEachBackend(testRemoveAfterDescriptorReuse);
    forEachBackend(testTimeoutElapses);
#if READYQ_HAVE_KQUEUE
    forEachBackend(testKqueueTimerFilter);
#endif

    printf("test_backend: %d backend(s) passed\n", ran);
    return EXIT_SUCCESS;
}
