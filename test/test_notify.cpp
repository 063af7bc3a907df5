#include "test_util.h"

#include <thread>

using readyq::Event;
using readyq::PollMode;

namespace {

void testWakesBlockedWait(readyq::Backend &backend) {
    readyq::Events events;
    std::thread waker([&backend] {
        std::this_thread::sleep_for(50ms);
        backend.notify();
    });

    const auto start = std::chrono::steady_clock::now();
    int err = backend.wait(events, std::nullopt);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    waker.join();

    TEST_CHECK_OK(err);
    TEST_CHECK_MSG(events.notified(), "%s: wake not reported", backend.name());
    TEST_CHECK(events.empty());
    TEST_CHECK_EQ(0, events.count());
    TEST_CHECK(elapsed < 5s);
}

void testWakeBeforeWaitIsLatched(readyq::Backend &backend) {
    readyq::Events events;
    backend.notify();

    TEST_CHECK_OK(backend.wait(events, 5s));
    TEST_CHECK(events.notified());
    TEST_CHECK(events.empty());
}

void testRepeatedWakesCoalesce(readyq::Backend &backend) {
    readyq::Events events;
    backend.notify();
    backend.notify();
    backend.notify();

    TEST_CHECK_OK(backend.wait(events, 5s));
    TEST_CHECK(events.notified());

    // Nothing is left over for the next wait.
    TEST_CHECK_OK(backend.wait(events, 50ms));
    TEST_CHECK(!events.notified());
}

void testWakeAlongsideEvents(readyq::Backend &backend) {
    SocketPair sp;
    readyq::Events events;
    TEST_CHECK_OK(backend.add(sp.a, Event::readableOnly(5), PollMode::Oneshot));
    writeByte(sp.b);
    backend.notify();

    bool sawEvent = false;
    bool sawWake = false;
    for (int i = 0; i < 4 && !(sawEvent && sawWake); ++i) {
        TEST_CHECK_OK(backend.wait(events, 1s));
        sawEvent = sawEvent || findKey(events, 5).has_value();
        sawWake = sawWake || events.notified();
        for (Event ev : events) {
            TEST_CHECK(ev.key != readyq::kNotifyKey);
        }
    }
    TEST_CHECK(sawEvent);
    TEST_CHECK(sawWake);
    TEST_CHECK_OK(backend.remove(sp.a));
}

void testWakeRepeatsAcrossWaits(readyq::Backend &backend) {
    readyq::Events events;
    for (int i = 0; i < 5; ++i) {
        backend.notify();
        TEST_CHECK_OK(backend.wait(events, 5s));
        TEST_CHECK_MSG(events.notified(), "%s: wake %d lost", backend.name(), i);
    }
}

} // namespace

int main() {
    int ran = forEachBackend(testWakesBlockedWait);
    TEST_CHECK_MSG(ran > 0, "no backend could be initialized");
    forEachBackend(testWakeBeforeWaitIsLatched);
    forEachBackend(testRepeatedWakesCoalesce);
    forEachBackend(testWakeAlongsideEvents);
    forEachBackend(testWakeRepeatsAcrossWaits);

    const char *strategy = getenv("READYQ_NOTIFY");
    printf("test_notify (%s): %d backend(s) passed\n", strategy ? strategy : "native", ran);
    return EXIT_SUCCESS;
}
