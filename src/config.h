#pragma once

#include <optional>
#include <string>

namespace readyq {

enum class NotifyStrategy {
	Native,
	Pipe,
};

struct Config {
	bool debug = false;
	unsigned int debugIndent = 0;
	// Backend tried first by createBackend(); empty keeps the built-in order.
	std::string backend;
	NotifyStrategy notify = NotifyStrategy::Native;
};

using EnvLookup = const char *(*)(const char *name);

Config parseConfig(EnvLookup lookup);
const Config &config();

std::optional<NotifyStrategy> notifyStrategyFromString(const std::string &value);

} // namespace readyq
