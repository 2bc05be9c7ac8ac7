#include "core/Clock.hpp"

#include <thread>

namespace SK {

auto SystemClock::now() const -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::now();
}

void SystemClock::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() <= 0)
        return;
    std::this_thread::sleep_for(duration);
}

auto systemClock() -> std::shared_ptr<Clock> {
    static auto instance = std::make_shared<SystemClock>();
    return instance;
}

} // namespace SK
