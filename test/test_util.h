#ifndef READYQ_TEST_UTIL_H
#define READYQ_TEST_UTIL_H

#include "backend.h"
#include "test_assert.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace std::chrono_literals;

// Every backend the library may have been built with; the ones that are missing or fail to initialize are
// skipped.
inline const char *const kBackendNames[] = {"kqueue", "epoll", "io_uring"};

struct SocketPair {
    int a = -1;
    int b = -1;

    SocketPair() {
        int fds[2];
        TEST_CHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        a = fds[0];
        b = fds[1];
        for (int fd : fds) {
            int flags = fcntl(fd, F_GETFL, 0);
            TEST_CHECK(flags >= 0);
            TEST_CHECK(fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0);
        }
    }
    ~SocketPair() {
        closeA();
        closeB();
    }
    SocketPair(const SocketPair &) = delete;
    SocketPair &operator=(const SocketPair &) = delete;

    void closeA() {
        if (a >= 0) {
            close(a);
            a = -1;
        }
    }
    void closeB() {
        if (b >= 0) {
            close(b);
            b = -1;
        }
    }
};

inline void writeByte(int fd) {
    const char byte = 'x';
    TEST_CHECK(write(fd, &byte, 1) == 1);
}

inline void drain(int fd) {
    char buf[256];
    while (read(fd, buf, sizeof(buf)) > 0) {
    }
}

inline std::optional<readyq::Event> findKey(const readyq::Events &events, uintptr_t key) {
    for (readyq::Event ev : events) {
        if (ev.key == key) {
            return ev;
        }
    }
    return std::nullopt;
}

inline int forEachBackend(const std::function<void(readyq::Backend &)> &body) {
    int ran = 0;
    for (const char *name : kBackendNames) {
        std::unique_ptr<readyq::Backend> backend = readyq::createBackend(name);
        if (!backend) {
            continue;
        }
        TEST_CHECK_STR_EQ(name, backend->name());
        body(*backend);
        ++ran;
    }
    return ran;
}

#endif
