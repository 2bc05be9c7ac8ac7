#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

namespace SK {

/**
 * Clock abstracts wall-clock reads and blocking sleeps so that lock waits,
 * migration windows and cache expiry can be driven deterministically.
 *
 * - now() returns wall-clock time; file modification times are compared
 *   against it, so implementations must stay on the system_clock epoch.
 * - sleepFor() blocks the calling thread. A manual clock used in tests may
 *   advance its own time instead of sleeping.
 */
struct Clock {
    virtual ~Clock() = default;

    virtual auto now() const -> std::chrono::system_clock::time_point = 0;
    virtual void sleepFor(std::chrono::milliseconds duration)          = 0;
};

struct SystemClock final : Clock {
    auto now() const -> std::chrono::system_clock::time_point override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

// Process-wide default clock shared by components constructed without one.
[[nodiscard]] auto systemClock() -> std::shared_ptr<Clock>;

[[nodiscard]] inline auto toMillis(std::chrono::system_clock::time_point tp) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline auto fromMillis(std::int64_t millis) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{millis}};
}

} // namespace SK
