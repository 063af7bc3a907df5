#include "backend.h"

#include "common.h"
#include "config.h"

#include <cstring>
#include <memory>

namespace readyq {

namespace {

using BackendFactory = auto (*)() -> std::unique_ptr<Backend>;

struct BackendEntry {
	const char *name;
	BackendFactory factory;
};

constexpr BackendEntry kBackends[] = {
#if READYQ_HAVE_KQUEUE
	{"kqueue", detail::createKqueueBackend},
#endif
#if READYQ_HAVE_EPOLL
	{"epoll", detail::createEpollBackend},
#endif
#if READYQ_ENABLE_LIBURING
	// Poll requests cannot express level-triggered interest, so io_uring is only chosen when asked for.
	{"io_uring", detail::createIoUringBackend},
#endif
};

std::unique_ptr<Backend> tryCreate(const BackendEntry &entry) {
	DEBUG_LOG("readyq: initializing %s backend\n", entry.name);
	auto backend = entry.factory();
	if (!backend) {
		return nullptr;
	}
	if (int err = backend->init(); err != 0) {
		DEBUG_LOG("readyq: %s backend unavailable: %d (%s)\n", entry.name, err, strerror(err));
		return nullptr;
	}
	return backend;
}

} // namespace

std::unique_ptr<Backend> createBackend(const char *name) {
	for (const auto &entry : kBackends) {
		if (strcmp(entry.name, name) == 0) {
			return tryCreate(entry);
		}
	}
	DEBUG_LOG("readyq: backend %s is not compiled in\n", name);
	return nullptr;
}

std::unique_ptr<Backend> createBackend() {
	const std::string &preferred = config().backend;
	if (!preferred.empty()) {
		if (auto backend = createBackend(preferred.c_str())) {
			return backend;
		}
	}

	for (const auto &entry : kBackends) {
		if (!preferred.empty() && preferred == entry.name) {
			continue;
		}
		if (auto backend = tryCreate(entry)) {
			return backend;
		}
	}

	DEBUG_LOG("readyq: no backend available\n");
	return nullptr;
}

} // namespace readyq
