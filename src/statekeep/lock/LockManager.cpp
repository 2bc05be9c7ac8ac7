#include "lock/LockManager.hpp"

#include "io/AtomicFile.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace SK {

namespace {

// Bounds the number of back-to-back reclaims inside one acquire() so two
// acquirers that both consider each other's lock stale cannot spin forever.
constexpr int kMaxConsecutiveReclaims = 8;

auto parseInt64(std::string_view text, std::int64_t& out) -> bool {
    while (!text.empty() && (text.back() == '\r' || text.back() == ' '))
        text.remove_suffix(1);
    if (text.empty())
        return false;
    auto result = std::from_chars(text.data(), text.data() + text.size(), out);
    return result.ec == std::errc{} && result.ptr == text.data() + text.size();
}

auto writeAll(int fd, std::string_view content) -> bool {
    std::size_t total = 0;
    while (total < content.size()) {
        auto written = ::write(fd, content.data() + total, content.size() - total);
        if (written < 0 && errno == EINTR)
            continue;
        if (written <= 0)
            return false;
        total += static_cast<std::size_t>(written);
    }
    return true;
}

} // namespace

LockManager::Guard::Guard(LockManager& owner, std::filesystem::path lockedPath, bool held)
    : manager(&owner), path(std::move(lockedPath)), isHeld(held) {}

LockManager::Guard::~Guard() {
    this->release();
}

LockManager::Guard::Guard(Guard&& other) noexcept
    : manager(other.manager), path(std::move(other.path)), isHeld(other.isHeld) {
    other.isHeld = false;
}

void LockManager::Guard::release() {
    if (!this->isHeld)
        return;
    this->isHeld = false;
    this->manager->release(this->path);
}

LockManager::LockManager()
    : LockManager(Options{}, systemClock()) {}

LockManager::LockManager(Options options, std::shared_ptr<Clock> clockSource)
    : opts(options), clock(clockSource ? std::move(clockSource) : systemClock()) {}

auto LockManager::lockPathFor(std::filesystem::path const& path) -> std::filesystem::path {
    auto lockPath = path;
    lockPath += ".lock";
    return lockPath;
}

auto LockManager::acquire(std::filesystem::path const& path, std::chrono::milliseconds timeout) -> bool {
    auto const lockPath = lockPathFor(path);
    auto const start    = this->clock->now();
    int        reclaims = 0;

    while (true) {
        switch (this->tryCreate(lockPath)) {
        case Attempt::Acquired:
            sk_debug("Acquired lock " + lockPath.string(), "LockManager");
            return true;
        case Attempt::Failed:
            return false;
        case Attempt::Reclaimed:
            if (++reclaims <= kMaxConsecutiveReclaims)
                continue;
            break;
        case Attempt::Busy:
            break;
        }

        auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(this->clock->now() - start);
        if (elapsed >= timeout) {
            sk_warn("Timed out after " + std::to_string(elapsed.count()) + "ms waiting for lock " + lockPath.string(),
                    "LockManager");
            return false;
        }
        reclaims = 0;
        this->clock->sleepFor(std::min(this->opts.retryInterval, timeout - elapsed));
    }
}

void LockManager::release(std::filesystem::path const& path) {
    auto const      lockPath = lockPathFor(path);
    std::error_code ec;
    std::filesystem::remove(lockPath, ec);
    if (ec) {
        sk_warn("Failed to release lock " + lockPath.string() + ": " + ec.message(), "LockManager");
        return;
    }
    sk_debug("Released lock " + lockPath.string(), "LockManager");
}

auto LockManager::lock(std::filesystem::path const& path, std::chrono::milliseconds timeout) -> Guard {
    bool held = this->acquire(path, timeout);
    return Guard{*this, path, held};
}

auto LockManager::tryCreate(std::filesystem::path const& lockPath) -> Attempt {
    int fd = ::open(lockPath.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd >= 0) {
        auto content = std::to_string(::getpid()) + "\n" + std::to_string(toMillis(this->clock->now()));
        if (!writeAll(fd, content)) {
            // The file's existence is what holds the lock; the owner record is diagnostic.
            sk_warn("Failed to record owner in " + lockPath.string(), "LockManager");
        }
        ::close(fd);
        return Attempt::Acquired;
    }
    int const err = errno;
    if (err == EEXIST)
        return this->reclaimIfStale(lockPath);

    auto error = Io::errorFromErrno(err, "Failed to create lock " + lockPath.string());
    sk_error(describeError(error), "LockManager");
    return Attempt::Failed;
}

auto LockManager::reclaimIfStale(std::filesystem::path const& lockPath) -> Attempt {
    auto stamp = Io::modificationTime(lockPath);
    if (!stamp) {
        // Released between our create attempt and the stat; try again at once.
        if (stamp.error().code == Error::Code::NotFound)
            return Attempt::Reclaimed;
        sk_error(describeError(stamp.error()), "LockManager");
        return Attempt::Failed;
    }

    auto const age = this->clock->now() - *stamp;
    if (age <= this->opts.staleAfter)
        return Attempt::Busy;

    auto const owner = readLockOwner(lockPath);

    std::error_code ec;
    std::filesystem::remove(lockPath, ec);
    if (ec) {
        sk_error("Failed to remove stale lock " + lockPath.string() + ": " + ec.message(), "LockManager");
        return Attempt::Failed;
    }

    auto const  ageMs = std::chrono::duration_cast<std::chrono::milliseconds>(age).count();
    std::string ownerText = owner ? "pid " + std::to_string(owner->pid) : std::string{"unknown owner"};
    sk_info("Reclaimed stale lock " + lockPath.string() + " (" + ownerText + ", age " + std::to_string(ageMs) + "ms)",
            "LockManager");
    return Attempt::Reclaimed;
}

auto LockManager::readLockOwner(std::filesystem::path const& path) -> Expected<Owner> {
    auto text = Io::readTextFile(path);
    if (!text)
        return std::unexpected(text.error());

    std::string_view view{*text};
    auto const       newline = view.find('\n');
    if (newline == std::string_view::npos)
        return std::unexpected(Error{Error::Code::MalformedInput, "Lock file has no timestamp line"});

    Owner owner;
    if (!parseInt64(view.substr(0, newline), owner.pid) || !parseInt64(view.substr(newline + 1), owner.acquiredAtMs))
        return std::unexpected(Error{Error::Code::MalformedInput, "Lock file owner record is malformed"});
    return owner;
}

} // namespace SK
