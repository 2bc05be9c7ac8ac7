#include "io/AtomicFile.hpp"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace SK::Io {

namespace {

std::atomic<std::uint64_t> tempSequence{0};

auto errorFromErrorCode(std::error_code const& ec, std::string_view prefix) -> Error {
    return errorFromErrno(ec.value(), prefix);
}

} // namespace

auto errorFromErrno(int err, std::string_view prefix) -> Error {
    auto message = std::string(prefix) + ": " + std::strerror(err);
    switch (err) {
    case ENOENT:
        return Error{Error::Code::NotFound, std::move(message)};
    case EEXIST:
        return Error{Error::Code::AlreadyExists, std::move(message)};
    case EACCES:
    case EPERM:
    case EROFS:
        return Error{Error::Code::InvalidPermissions, std::move(message)};
    default:
        return Error{Error::Code::IoFailure, std::move(message)};
    }
}

auto fsyncFileDescriptor(int fd) -> Expected<void> {
    if (::fsync(fd) != 0) {
        return std::unexpected(errorFromErrno(errno, "fsync failed"));
    }
    return {};
}

auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void> {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return std::unexpected(errorFromErrno(errno, "open directory failed"));
    }
    auto result = fsyncFileDescriptor(fd);
    ::close(fd);
    return result;
}

auto tempPathFor(std::filesystem::path const& path) -> std::filesystem::path {
    auto tmpPath = path;
    tmpPath += ".tmp.";
    tmpPath += std::to_string(::getpid());
    tmpPath += ".";
    tmpPath += std::to_string(tempSequence.fetch_add(1, std::memory_order_relaxed));
    return tmpPath;
}

auto writeFileAtomic(std::filesystem::path const& path,
                     std::string_view content,
                     bool fsyncData) -> Expected<void> {
    std::error_code ec;
    auto            parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(errorFromErrorCode(ec, "Failed to create directories"));
        }
    }

    auto tmpPath = tempPathFor(path);

    int fd = ::open(tmpPath.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(errorFromErrno(errno, "Failed to open temp file"));
    }

    auto fail = [&](Error error) -> Expected<void> {
        ::close(fd);
        removePathIfExists(tmpPath);
        return std::unexpected(std::move(error));
    };

    std::size_t totalWritten = 0;
    while (totalWritten < content.size()) {
        auto const* ptr       = content.data() + totalWritten;
        auto const  remaining = content.size() - totalWritten;
        auto        written   = ::write(fd, ptr, remaining);
        if (written < 0 && errno == EINTR)
            continue;
        if (written <= 0) {
            return fail(errorFromErrno(written < 0 ? errno : EIO, "Failed to write temp file"));
        }
        totalWritten += static_cast<std::size_t>(written);
    }

    if (fsyncData) {
        if (auto sync = fsyncFileDescriptor(fd); !sync) {
            return fail(sync.error());
        }
    }

    if (::close(fd) != 0) {
        auto error = errorFromErrno(errno, "Failed to close temp file");
        removePathIfExists(tmpPath);
        return std::unexpected(std::move(error));
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        removePathIfExists(tmpPath);
        return std::unexpected(errorFromErrorCode(ec, "Failed to rename temp file"));
    }

    if (fsyncData && !parent.empty()) {
        auto syncDir = fsyncDirectory(parent);
        if (!syncDir) {
            return syncDir;
        }
    }

    return {};
}

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "File not found: " + path.string()});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (stream.bad()) {
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to read file: " + path.string()});
    }
    return oss.str();
}

auto modificationTime(std::filesystem::path const& path) -> Expected<std::chrono::system_clock::time_point> {
    std::error_code ec;
    auto            stamp = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::unexpected(errorFromErrorCode(ec, "Failed to stat " + path.string()));
    }
    auto sys = std::chrono::file_clock::to_sys(stamp);
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys);
}

auto removePathIfExists(std::filesystem::path const& path) -> bool {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return !ec;
}

} // namespace SK::Io
