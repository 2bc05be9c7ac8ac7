#include <doctest/doctest.h>

#include "StateKeepTestHelper.hpp"
#include "coordinator/StateCoordinator.hpp"
#include "io/AtomicFile.hpp"
#include "lock/LockManager.hpp"

#include <cerrno>
#include <chrono>
#include <exception>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace SK;
using namespace std::chrono_literals;
using nlohmann::json;
using SK::Test::TempDir;

namespace {

// Runs body in a forked child and returns its pid. The child never returns
// into the test runner; its exit status reports success (0) or failure.
auto spawn(std::function<bool()> body) -> pid_t {
    pid_t pid = ::fork();
    if (pid != 0)
        return pid;

    // The logger's worker thread does not exist in the child.
    set_logging_enabled(false);
    int status = 1;
    try {
        status = body() ? 0 : 1;
    } catch (std::exception const&) {
        status = 2;
    }
    ::_exit(status);
}

auto waitFor(pid_t pid) -> int {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

auto optionsIn(std::filesystem::path const& dir) -> CoordinatorOptions {
    CoordinatorOptions options;
    options.scratch_dir           = dir.string();
    options.write_lock_timeout_ms = 5000;
    options.read_lock_timeout_ms  = 5000;
    return options;
}

auto ralphRecord(std::string const& storyId, std::size_t padding) -> json {
    return json{{"active", true},
                {"storyId", storyId},
                {"activatedAt", 1700000000000},
                {"prdPath", std::string(padding, storyId.front())}};
}

} // namespace

TEST_SUITE("coordinator.processes") {
    TEST_CASE("concurrent writers leave exactly one complete record") {
        TempDir tmp("statekeep_proc_writers");
        auto    options = optionsIn(tmp.path);

        auto const recordA = ralphRecord("A", 64 * 1024);
        auto const recordB = ralphRecord("B", 96 * 1024);

        auto writer = [&](json const& record) {
            return [&options, &record] {
                StateCoordinator coordinator(options);
                for (int i = 0; i < 25; ++i)
                    coordinator.writeState("ralph", "ralph", std::string{"shared"}, record);
                return true;
            };
        };

        pid_t first  = spawn(writer(recordA));
        pid_t second = spawn(writer(recordB));
        REQUIRE(first > 0);
        REQUIRE(second > 0);
        CHECK(waitFor(first) == 0);
        CHECK(waitFor(second) == 0);

        StateCoordinator coordinator(options);
        auto             loaded = coordinator.readState("ralph", "ralph", std::string{"shared"});
        REQUIRE(loaded.has_value());
        CHECK((*loaded == recordA || *loaded == recordB));

        for (auto const& entry : std::filesystem::directory_iterator(tmp.path)) {
            auto const name = entry.path().filename().string();
            CHECK(name == "claude-ralph-shared.json");
        }
    }

    TEST_CASE("reader never observes a torn record while writers run") {
        TempDir tmp("statekeep_proc_reader");
        auto    options = optionsIn(tmp.path);
        // Readers must not be serialised behind writers for this check.
        options.read_lock_timeout_ms = 0;

        auto const recordA = ralphRecord("A", 256 * 1024);
        auto const recordB = ralphRecord("B", 512 * 1024);
        auto const path    = tmp.path / "claude-ralph-shared.json";

        {
            StateCoordinator seed(options);
            seed.writeState("ralph", "ralph", std::string{"shared"}, recordA);
        }

        pid_t writerPid = spawn([&options, &recordA, &recordB] {
            StateCoordinator coordinator(options);
            for (int i = 0; i < 40; ++i)
                coordinator.writeState("ralph", "ralph", std::string{"shared"}, (i % 2 == 0) ? recordB : recordA);
            return true;
        });
        REQUIRE(writerPid > 0);

        int   reads  = 0;
        int   torn   = 0;
        int   status = 0;
        pid_t waited = 0;
        do {
            auto text = Io::readTextFile(path);
            if (!text)
                continue;
            ++reads;
            auto parsed = json::parse(*text, nullptr, false);
            if (parsed.is_discarded() || (parsed != recordA && parsed != recordB))
                ++torn;
        } while ((waited = ::waitpid(writerPid, &status, WNOHANG)) == 0 || (waited < 0 && errno == EINTR));
        REQUIRE(waited == writerPid);
        CHECK(WIFEXITED(status));
        CHECK(WEXITSTATUS(status) == 0);
        CHECK(reads > 0);
        CHECK(torn == 0);
    }

    TEST_CASE("separate processes with the same override share one session path") {
        TempDir tmp("statekeep_proc_override");
        auto    options             = optionsIn(tmp.path);
        options.session_id_override = "abc";

        auto const expected = tmp.path / "claude-ralph-abc.json";

        auto invocation = [&options, &expected](std::string const& storyId) {
            return [&options, &expected, storyId] {
                StateCoordinator coordinator(options);
                if (coordinator.sessionId() != "abc")
                    return false;
                if (coordinator.paths().sessionPath("ralph", coordinator.sessionId()) != expected)
                    return false;
                coordinator.writeState("ralph", "ralph", ralphRecord(storyId, 16));
                return true;
            };
        };

        // Run one after the other, as two invocations of the same tool would.
        pid_t first = spawn(invocation("A"));
        REQUIRE(first > 0);
        CHECK(waitFor(first) == 0);
        pid_t second = spawn(invocation("B"));
        REQUIRE(second > 0);
        CHECK(waitFor(second) == 0);

        std::vector<std::string> names;
        for (auto const& entry : std::filesystem::directory_iterator(tmp.path))
            names.push_back(entry.path().filename().string());
        CHECK(names == std::vector<std::string>{"claude-ralph-abc.json"});

        StateCoordinator coordinator(options);
        CHECK(coordinator.readState("ralph", "ralph") == std::optional<json>{ralphRecord("B", 16)});
        CHECK(coordinator.listActiveSessions("ralph") == std::vector<std::string>{"abc"});
    }

    TEST_CASE("lock excludes cooperating processes") {
        TempDir    tmp("statekeep_proc_lock");
        auto const counter = tmp.path / "counter.txt";
        REQUIRE(Io::writeFileAtomic(counter, "0", false).has_value());

        auto incrementer = [&counter] {
            LockManager locks;
            for (int i = 0; i < 50; ++i) {
                auto guard = locks.lock(counter, 10s);
                if (!guard)
                    return false;
                auto text = Io::readTextFile(counter);
                if (!text)
                    return false;
                auto next = std::to_string(std::stoi(*text) + 1);
                if (!Io::writeFileAtomic(counter, next, false))
                    return false;
            }
            return true;
        };

        std::vector<pid_t> children;
        for (int i = 0; i < 3; ++i)
            children.push_back(spawn(incrementer));
        for (auto pid : children) {
            REQUIRE(pid > 0);
            CHECK(waitFor(pid) == 0);
        }

        auto text = Io::readTextFile(counter);
        REQUIRE(text.has_value());
        CHECK(*text == "150");
        CHECK_FALSE(std::filesystem::exists(LockManager::lockPathFor(counter)));
    }

    TEST_CASE("lock abandoned by a dead process is reclaimed once stale") {
        TempDir    tmp("statekeep_proc_crash");
        auto const target = tmp.path / "state.json";

        pid_t crashed = spawn([&target] {
            LockManager locks;
            // Exits holding the lock, as a crashed owner would.
            return locks.acquire(target, 1s);
        });
        REQUIRE(crashed > 0);
        REQUIRE(waitFor(crashed) == 0);

        auto const lockPath = LockManager::lockPathFor(target);
        REQUIRE(std::filesystem::exists(lockPath));
        auto owner = LockManager::readLockOwner(lockPath);
        REQUIRE(owner.has_value());
        CHECK(owner->pid == crashed);

        SK::Test::setAge(lockPath, 11s);
        LockManager locks;
        CHECK(locks.acquire(target, 200ms));
        locks.release(target);
    }
}
