#pragma once

#include <cstdint>

namespace readyq {

// Reserved for the backend's self-notification channel. Callers must never register a handle under this key.
constexpr uintptr_t kNotifyKey = UINTPTR_MAX;

struct Event {
	uintptr_t key = 0;
	bool readable = false;
	bool writable = false;

	static constexpr Event all(uintptr_t key) { return {key, true, true}; }
	static constexpr Event readableOnly(uintptr_t key) { return {key, true, false}; }
	static constexpr Event writableOnly(uintptr_t key) { return {key, false, true}; }
	static constexpr Event none(uintptr_t key) { return {key, false, false}; }

	constexpr bool operator==(const Event &other) const = default;
};

enum class PollMode {
	Oneshot,
	Level,
	Edge,
	EdgeOneshot,
};

inline const char *pollModeName(PollMode mode) {
	switch (mode) {
	case PollMode::Oneshot:
		return "oneshot";
	case PollMode::Level:
		return "level";
	case PollMode::Edge:
		return "edge";
	case PollMode::EdgeOneshot:
		return "edge-oneshot";
	}
	return "unknown";
}

} // namespace readyq
