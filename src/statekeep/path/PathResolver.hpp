#pragma once

#include "core/Clock.hpp"
#include "path/SessionId.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SK {

/**
 * Computes state file locations inside one scratch directory.
 *
 * Path expectations:
 * - Session scoped: "<scratch>/<namespace>-<baseName>-<sanitizedSessionId>.<ext>"
 * - Legacy (pre session isolation): "<scratch>/<namespace>-<baseName>.<ext>"
 * - sessionPath() and legacyPath() are pure; only resolveWithMigration(),
 *   sweepStale() and listActive() touch the filesystem.
 * - Enumeration failures never propagate: they are logged and yield an empty
 *   result.
 */
class PathResolver {
public:
    struct Options {
        // Empty means the system temporary directory.
        std::filesystem::path     scratchDir;
        std::string               productNamespace{"claude"};
        std::string               extension{"json"};
        std::size_t               maxSessionIdLength{kDefaultSessionIdMaxLength};
        std::chrono::milliseconds legacyGraceWindow{std::chrono::hours{1}};
    };

    PathResolver();
    explicit PathResolver(Options options, std::shared_ptr<Clock> clockSource = systemClock());

    [[nodiscard]] auto sessionPath(std::string_view baseName, std::string_view sessionId) const -> std::filesystem::path;
    [[nodiscard]] auto legacyPath(std::string_view baseName) const -> std::filesystem::path;

    // Existing session file wins; otherwise a legacy file touched within the
    // grace window; otherwise the (possibly not yet existing) session file.
    [[nodiscard]] auto resolveWithMigration(std::string_view baseName, std::string_view sessionId) const
        -> std::filesystem::path;

    // Removes session scoped files for baseName last modified more than maxAge
    // ago. Returns the number of files actually removed.
    auto sweepStale(std::string_view baseName, std::chrono::milliseconds maxAge) const -> std::size_t;

    // Session identifiers embedded in session scoped files for baseName that
    // were modified within ttl, sorted.
    [[nodiscard]] auto listActive(std::string_view baseName, std::chrono::milliseconds ttl) const
        -> std::vector<std::string>;

    // Extracts the session component from a file name produced by sessionPath().
    [[nodiscard]] auto sessionIdFromFileName(std::string_view baseName, std::string_view fileName) const
        -> std::optional<std::string>;

    [[nodiscard]] auto scratchDir() const -> std::filesystem::path const& { return directory; }
    [[nodiscard]] auto options() const -> Options const& { return opts; }

private:
    struct Candidate {
        std::filesystem::path                 path;
        std::string                           sessionId;
        std::chrono::system_clock::time_point modified;
    };

    [[nodiscard]] auto sessionPrefix(std::string_view baseName) const -> std::string;
    [[nodiscard]] auto fileSuffix() const -> std::string;
    [[nodiscard]] auto enumerate(std::string_view baseName) const -> std::vector<Candidate>;

    Options                opts;
    std::filesystem::path  directory;
    std::shared_ptr<Clock> clock;
};

} // namespace SK
