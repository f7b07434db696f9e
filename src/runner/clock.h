#pragma once

#include <chrono>

namespace FleetRunner {

/**
 * Wall clock and blocking sleep used to pace polling and repeated passes
 */
class IClock {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Duration = std::chrono::duration<double>;

	virtual ~IClock() = default;

	virtual TimePoint Now() = 0;
	virtual void Sleep(Duration duration) = 0;
};

class SystemClock : public IClock {
public:
	TimePoint Now() override;
	void Sleep(Duration duration) override;
};

} // namespace FleetRunner
