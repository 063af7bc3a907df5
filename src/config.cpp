#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <string>

namespace readyq {

std::optional<NotifyStrategy> notifyStrategyFromString(const std::string &value) {
	if (value.empty() || value == "native") {
		return NotifyStrategy::Native;
	}
	if (value == "pipe") {
		return NotifyStrategy::Pipe;
	}
	return std::nullopt;
}

Config parseConfig(EnvLookup lookup) {
	Config cfg;
	if (const char *debug = lookup("READYQ_DEBUG")) {
		cfg.debug = debug[0] != '\0' && std::string(debug) != "0";
	}
	if (const char *indent = lookup("READYQ_DEBUG_INDENT")) {
		char *end = nullptr;
		unsigned long value = std::strtoul(indent, &end, 10);
		if (end != indent && *end == '\0') {
			cfg.debugIndent = static_cast<unsigned int>(value);
		}
	}
	if (const char *backend = lookup("READYQ_BACKEND")) {
		cfg.backend = backend;
	}
	if (const char *notify = lookup("READYQ_NOTIFY")) {
		if (auto strategy = notifyStrategyFromString(notify)) {
			cfg.notify = *strategy;
		} else {
			// Logging is configured by this very struct, so report directly.
			fprintf(stderr, "readyq: ignoring unknown READYQ_NOTIFY value '%s'\n", notify);
		}
	}
	return cfg;
}

const Config &config() {
	static const Config cfg = parseConfig([](const char *name) -> const char * { return std::getenv(name); });
	return cfg;
}

} // namespace readyq
