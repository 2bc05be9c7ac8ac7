#include <doctest/doctest.h>

#include "StateKeepTestHelper.hpp"
#include "io/AtomicFile.hpp"
#include "lock/LockManager.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include <unistd.h>

using namespace SK;
using namespace std::chrono_literals;
using SK::Test::LogCapture;
using SK::Test::ManualClock;
using SK::Test::TempDir;

TEST_SUITE("lock.manager") {
    TEST_CASE("acquire creates the lock file and release removes it") {
        TempDir     tmp("statekeep_lock_basic");
        LockManager locks;
        auto const  target   = tmp.path / "claude-ralph-s1.json";
        auto const  lockPath = LockManager::lockPathFor(target);

        CHECK(lockPath.filename() == "claude-ralph-s1.json.lock");

        REQUIRE(locks.acquire(target, 200ms));
        CHECK(std::filesystem::exists(lockPath));

        auto owner = LockManager::readLockOwner(lockPath);
        REQUIRE(owner.has_value());
        CHECK(owner->pid == ::getpid());
        CHECK(owner->acquiredAtMs > 0);

        auto const raw = SK::Test::readRaw(lockPath);
        CHECK(raw == std::to_string(::getpid()) + "\n" + std::to_string(owner->acquiredAtMs));

        locks.release(target);
        CHECK_FALSE(std::filesystem::exists(lockPath));
    }

    TEST_CASE("fresh lock held elsewhere times out with a single warning") {
        TempDir    tmp("statekeep_lock_timeout");
        auto       clock  = std::make_shared<ManualClock>();
        auto const target = tmp.path / "state.json";
        SK::Test::writeRaw(LockManager::lockPathFor(target), "999999\n0");

        LockManager locks(LockManager::Options{.staleAfter = 10'000ms, .retryInterval = 50ms}, clock);
        LogCapture  capture;

        CHECK_FALSE(locks.acquire(target, 200ms));
        CHECK(clock->sleeps.load() == 4);
        CHECK(capture.count(LogLevel::Warn) == 1);
        CHECK(capture.contains(LogLevel::Warn, "Timed out"));
        // The other holder's lock is left alone.
        CHECK(std::filesystem::exists(LockManager::lockPathFor(target)));
    }

    TEST_CASE("final sleep is clamped to the remaining wait") {
        TempDir    tmp("statekeep_lock_clamp");
        auto       clock  = std::make_shared<ManualClock>();
        auto const target = tmp.path / "state.json";
        SK::Test::writeRaw(LockManager::lockPathFor(target), "1\n0");

        LockManager locks(LockManager::Options{.staleAfter = 10'000ms, .retryInterval = 50ms}, clock);
        auto const  start = clock->now();

        CHECK_FALSE(locks.acquire(target, 120ms));
        CHECK(clock->sleeps.load() == 3);
        CHECK(clock->now() - start == 120ms);
    }

    TEST_CASE("zero timeout gives up after one attempt") {
        TempDir    tmp("statekeep_lock_zero");
        auto       clock  = std::make_shared<ManualClock>();
        auto const target = tmp.path / "state.json";
        SK::Test::writeRaw(LockManager::lockPathFor(target), "1\n0");

        LockManager locks(LockManager::Options{}, clock);
        CHECK_FALSE(locks.acquire(target, 0ms));
        CHECK(clock->sleeps.load() == 0);
    }

    TEST_CASE("stale lock is reclaimed without waiting") {
        TempDir    tmp("statekeep_lock_stale");
        auto const target   = tmp.path / "state.json";
        auto const lockPath = LockManager::lockPathFor(target);
        SK::Test::writeRaw(lockPath, "424242\n1000");
        SK::Test::setAge(lockPath, 20s);

        auto        clock = std::make_shared<ManualClock>();
        LockManager locks(LockManager::Options{}, clock);
        LogCapture  capture;

        REQUIRE(locks.acquire(target, 200ms));
        CHECK(clock->sleeps.load() == 0);
        CHECK(capture.count(LogLevel::Info) == 1);
        CHECK(capture.contains(LogLevel::Info, "pid 424242"));

        auto owner = LockManager::readLockOwner(lockPath);
        REQUIRE(owner.has_value());
        CHECK(owner->pid == ::getpid());
        locks.release(target);
    }

    TEST_CASE("lock exactly at the staleness threshold is still held") {
        TempDir    tmp("statekeep_lock_threshold");
        auto const target   = tmp.path / "state.json";
        auto const lockPath = LockManager::lockPathFor(target);
        SK::Test::writeRaw(lockPath, "1\n0");

        auto stamp = Io::modificationTime(lockPath);
        REQUIRE(stamp.has_value());
        auto        clock = std::make_shared<ManualClock>(*stamp + 10'000ms);
        LockManager locks(LockManager::Options{}, clock);

        CHECK_FALSE(locks.acquire(target, 0ms));
        CHECK(std::filesystem::exists(lockPath));
    }

    TEST_CASE("release of an absent lock is harmless") {
        TempDir     tmp("statekeep_lock_absent");
        LockManager locks;
        LogCapture  capture;
        CHECK_NOTHROW(locks.release(tmp.path / "never-locked.json"));
        CHECK(capture.count(LogLevel::Warn) == 0);
    }

    TEST_CASE("release removes a lock regardless of who created it") {
        TempDir    tmp("statekeep_lock_foreign");
        auto const target = tmp.path / "state.json";
        SK::Test::writeRaw(LockManager::lockPathFor(target), "31337\n0");

        LockManager locks;
        locks.release(target);
        CHECK_FALSE(std::filesystem::exists(LockManager::lockPathFor(target)));
    }

    TEST_CASE("guard releases on scope exit") {
        TempDir     tmp("statekeep_lock_guard");
        LockManager locks;
        auto const  target = tmp.path / "state.json";
        {
            auto guard = locks.lock(target, 200ms);
            REQUIRE(guard.held());
            CHECK(static_cast<bool>(guard));
            CHECK(std::filesystem::exists(LockManager::lockPathFor(target)));

            auto moved = std::move(guard);
            CHECK_FALSE(guard.held());
            CHECK(moved.held());
        }
        CHECK_FALSE(std::filesystem::exists(LockManager::lockPathFor(target)));
    }

    TEST_CASE("guard that failed to acquire leaves the foreign lock in place") {
        TempDir    tmp("statekeep_lock_guard_busy");
        auto const target = tmp.path / "state.json";
        SK::Test::writeRaw(LockManager::lockPathFor(target), "7\n0");

        auto        clock = std::make_shared<ManualClock>();
        LockManager locks(LockManager::Options{}, clock);
        {
            auto guard = locks.lock(target, 100ms);
            CHECK_FALSE(guard.held());
        }
        CHECK(std::filesystem::exists(LockManager::lockPathFor(target)));
    }

    TEST_CASE("second acquire in the same process waits for the first") {
        TempDir     tmp("statekeep_lock_reentry");
        auto        clock = std::make_shared<ManualClock>();
        LockManager locks(LockManager::Options{}, clock);
        auto const  target = tmp.path / "state.json";

        REQUIRE(locks.acquire(target, 100ms));
        CHECK_FALSE(locks.acquire(target, 100ms));
        locks.release(target);
        CHECK(locks.acquire(target, 100ms));
        locks.release(target);
    }

    TEST_CASE("missing directory fails immediately with an error log") {
        TempDir     tmp("statekeep_lock_nodir");
        auto        clock = std::make_shared<ManualClock>();
        LockManager locks(LockManager::Options{}, clock);
        LogCapture  capture;

        CHECK_FALSE(locks.acquire(tmp.path / "missing" / "state.json", 1000ms));
        CHECK(clock->sleeps.load() == 0);
        CHECK(capture.count(LogLevel::Error) == 1);
        CHECK(capture.count(LogLevel::Warn) == 0);
    }

    TEST_CASE("malformed owner records are reported") {
        TempDir    tmp("statekeep_lock_owner");
        auto const lockPath = tmp.path / "state.json.lock";

        SK::Test::writeRaw(lockPath, "no newline");
        auto noLine = LockManager::readLockOwner(lockPath);
        REQUIRE_FALSE(noLine.has_value());
        CHECK(noLine.error().code == Error::Code::MalformedInput);

        SK::Test::writeRaw(lockPath, "abc\n123");
        auto badPid = LockManager::readLockOwner(lockPath);
        REQUIRE_FALSE(badPid.has_value());
        CHECK(badPid.error().code == Error::Code::MalformedInput);

        SK::Test::writeRaw(lockPath, "12\n345\r");
        auto crlf = LockManager::readLockOwner(lockPath);
        REQUIRE(crlf.has_value());
        CHECK(crlf->pid == 12);
        CHECK(crlf->acquiredAtMs == 345);

        auto missing = LockManager::readLockOwner(tmp.path / "absent.lock");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NotFound);
    }
}
