#pragma once

#include "core/Clock.hpp"
#include "core/Error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace SK {

/**
 * Advisory cross-process lock built on exclusive creation of "<path>.lock".
 *
 * - acquire() polls until the lock file can be created or the timeout
 *   is spent. A lock file older than the staleness threshold is presumed to
 *   belong to a crashed owner; it is deleted and creation is retried at once
 *   without sleeping.
 * - Staleness is judged by the lock file's modification time only. The owner
 *   pid recorded in the file is informational and never checked for liveness.
 * - Only cooperating processes are excluded. Nothing stops a process from
 *   writing the guarded file without taking the lock.
 */
class LockManager {
public:
    struct Options {
        std::chrono::milliseconds staleAfter{10'000};
        std::chrono::milliseconds retryInterval{50};
    };

    struct Owner {
        std::int64_t pid          = 0;
        std::int64_t acquiredAtMs = 0;
    };

    // Releases the lock on destruction if, and only if, it was acquired.
    class Guard {
    public:
        Guard(LockManager& owner, std::filesystem::path lockedPath, bool held);
        ~Guard();

        Guard(Guard const&)            = delete;
        Guard& operator=(Guard const&) = delete;
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;

        [[nodiscard]] auto held() const -> bool { return isHeld; }
        explicit operator bool() const { return isHeld; }

        void release();

    private:
        LockManager*          manager;
        std::filesystem::path path;
        bool                  isHeld;
    };

    LockManager();
    explicit LockManager(Options options, std::shared_ptr<Clock> clockSource = systemClock());

    [[nodiscard]] auto acquire(std::filesystem::path const& path, std::chrono::milliseconds timeout) -> bool;
    void release(std::filesystem::path const& path);

    [[nodiscard]] auto lock(std::filesystem::path const& path, std::chrono::milliseconds timeout) -> Guard;

    [[nodiscard]] static auto lockPathFor(std::filesystem::path const& path) -> std::filesystem::path;
    [[nodiscard]] static auto readLockOwner(std::filesystem::path const& path) -> Expected<Owner>;

    [[nodiscard]] auto options() const -> Options const& { return opts; }

private:
    enum class Attempt {
        Acquired,
        Busy,
        Reclaimed,
        Failed
    };

    auto tryCreate(std::filesystem::path const& lockPath) -> Attempt;
    auto reclaimIfStale(std::filesystem::path const& lockPath) -> Attempt;

    Options                opts;
    std::shared_ptr<Clock> clock;
};

} // namespace SK
