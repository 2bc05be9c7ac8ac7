#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace SK::Io {

[[nodiscard]] auto fsyncFileDescriptor(int fd) -> Expected<void>;
[[nodiscard]] auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void>;

// Same-directory sibling used as the staging file for an atomic replace:
// "<path>.tmp.<pid>.<sequence>". The sequence keeps concurrent writers inside
// one process apart; the pid keeps processes apart.
[[nodiscard]] auto tempPathFor(std::filesystem::path const& path) -> std::filesystem::path;

// Replaces `path` with `content` so that readers observe either the previous
// complete file or the new complete file. The parent directory is created when
// missing. On failure the staging file is removed and the error returned.
[[nodiscard]] auto writeFileAtomic(std::filesystem::path const& path,
                                   std::string_view content,
                                   bool fsyncData) -> Expected<void>;

[[nodiscard]] auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

[[nodiscard]] auto modificationTime(std::filesystem::path const& path)
    -> Expected<std::chrono::system_clock::time_point>;

// Returns false only when the path existed and could not be removed.
auto removePathIfExists(std::filesystem::path const& path) -> bool;

[[nodiscard]] auto errorFromErrno(int err, std::string_view prefix) -> Error;

} // namespace SK::Io
