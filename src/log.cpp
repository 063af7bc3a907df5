#include "common.h"
#include "config.h"

#include <cstdarg>
#include <cstdio>
#include <pthread.h>
#include <type_traits>

namespace {

// glibc uses an integer thread id; Apple and the BSDs use a pointer.
template <typename T> void printThreadId(T threadId) {
	if constexpr (std::is_pointer_v<T>) {
		fprintf(stderr, "[thread %p] ", static_cast<const void *>(threadId));
	} else {
		fprintf(stderr, "[thread %lu] ", static_cast<unsigned long>(threadId));
	}
}

} // namespace

bool readyq::debugEnabled = readyq::config().debug;
unsigned int readyq::debugIndent = readyq::config().debugIndent;

void readyq::debug_log(const char *fmt, ...) {
	va_list args;
	va_start(args, fmt);
	if (readyq::debugEnabled) {
		for (size_t i = 0; i < readyq::debugIndent; i++)
			fprintf(stderr, "\t");
		printThreadId(pthread_self());
		vfprintf(stderr, fmt, args);
		fflush(stderr);
	}

	va_end(args);
}
