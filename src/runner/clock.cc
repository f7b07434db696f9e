#include "clock.h"

#include <thread>

namespace FleetRunner {

IClock::TimePoint SystemClock::Now() {
	return std::chrono::system_clock::now();
}

void SystemClock::Sleep(Duration duration) {
	if (duration.count() <= 0) {
		return;
	}
	std::this_thread::sleep_for(duration);
}

} // namespace FleetRunner
