#pragma once

#include <chrono>
#include <climits>
#include <ctime>
#include <optional>

namespace readyq {

inline constexpr long NS_PER_SECOND = 1000000000L;
inline constexpr long NS_PER_MILLISECOND = 1000000L;

inline struct timespec toTimespec(std::chrono::nanoseconds duration) {
	if (duration.count() < 0) {
		duration = std::chrono::nanoseconds::zero();
	}
	struct timespec ts{};
	ts.tv_sec = static_cast<time_t>(duration.count() / NS_PER_SECOND);
	ts.tv_nsec = static_cast<long>(duration.count() % NS_PER_SECOND);
	return ts;
}

// Rounds up so a millisecond-granular wait never returns before the requested duration.
inline int toMillisRoundUp(std::chrono::nanoseconds duration) {
	if (duration.count() <= 0) {
		return 0;
	}
	const long long ms = (duration.count() + NS_PER_MILLISECOND - 1) / NS_PER_MILLISECOND;
	return ms > INT_MAX ? INT_MAX : static_cast<int>(ms);
}

/**
 * Absolute end point of an optional relative timeout, so that interrupted waits can be resumed with the time
 * that is actually left.
 */
class Deadline {
  public:
	using Clock = std::chrono::steady_clock;

	explicit Deadline(std::optional<std::chrono::nanoseconds> timeout) {
		if (timeout) {
			mEnd = Clock::now() + *timeout;
		}
	}

	[[nodiscard]] bool infinite() const { return !mEnd.has_value(); }

	[[nodiscard]] std::chrono::nanoseconds remaining() const {
		if (!mEnd) {
			return std::chrono::nanoseconds::max();
		}
		const auto left = std::chrono::duration_cast<std::chrono::nanoseconds>(*mEnd - Clock::now());
		return left.count() > 0 ? left : std::chrono::nanoseconds::zero();
	}

  private:
	std::optional<Clock::time_point> mEnd;
};

} // namespace readyq
