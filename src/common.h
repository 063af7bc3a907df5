#pragma once

#include <cstdint>

#define DEBUG_LOG(...)                                                                                                 \
	do {                                                                                                               \
		if (readyq::debugEnabled) {                                                                                    \
			readyq::debug_log(__VA_ARGS__);                                                                            \
		}                                                                                                              \
	} while (0)
#ifndef NDEBUG
#define VERBOSE_LOG(...) DEBUG_LOG(__VA_ARGS__)
#else
#define VERBOSE_LOG(...) ((void)0)
#endif

namespace readyq {

extern bool debugEnabled;
extern unsigned int debugIndent;

void debug_log(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace readyq
