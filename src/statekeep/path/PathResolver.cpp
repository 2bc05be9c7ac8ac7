#include "path/PathResolver.hpp"

#include "io/AtomicFile.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace SK {

namespace {

auto defaultScratchDir() -> std::filesystem::path {
    std::error_code ec;
    auto            tmp = std::filesystem::temp_directory_path(ec);
    if (ec || tmp.empty())
        return std::filesystem::path{"/tmp"};
    return tmp;
}

} // namespace

PathResolver::PathResolver()
    : PathResolver(Options{}, systemClock()) {}

PathResolver::PathResolver(Options options, std::shared_ptr<Clock> clockSource)
    : opts(std::move(options)),
      directory(opts.scratchDir.empty() ? defaultScratchDir() : opts.scratchDir),
      clock(clockSource ? std::move(clockSource) : systemClock()) {}

auto PathResolver::sessionPrefix(std::string_view baseName) const -> std::string {
    std::string prefix;
    prefix.reserve(this->opts.productNamespace.size() + baseName.size() + 2);
    prefix.append(this->opts.productNamespace);
    prefix.push_back('-');
    prefix.append(baseName);
    prefix.push_back('-');
    return prefix;
}

auto PathResolver::fileSuffix() const -> std::string {
    return "." + this->opts.extension;
}

auto PathResolver::sessionPath(std::string_view baseName, std::string_view sessionId) const -> std::filesystem::path {
    auto name = this->sessionPrefix(baseName);
    name.append(sanitizeSessionId(sessionId, this->opts.maxSessionIdLength));
    name.append(this->fileSuffix());
    return this->directory / name;
}

auto PathResolver::legacyPath(std::string_view baseName) const -> std::filesystem::path {
    std::string name = this->opts.productNamespace;
    name.push_back('-');
    name.append(baseName);
    name.append(this->fileSuffix());
    return this->directory / name;
}

auto PathResolver::resolveWithMigration(std::string_view baseName, std::string_view sessionId) const
    -> std::filesystem::path {
    auto const      scoped = this->sessionPath(baseName, sessionId);
    std::error_code ec;
    if (std::filesystem::exists(scoped, ec))
        return scoped;

    auto const legacy   = this->legacyPath(baseName);
    auto const modified = Io::modificationTime(legacy);
    if (!modified)
        return scoped;

    auto const age = this->clock->now() - *modified;
    if (age <= this->opts.legacyGraceWindow) {
        sk_debug("Using legacy state file " + legacy.string() + " for session " + std::string{sessionId}, "PathResolver");
        return legacy;
    }
    return scoped;
}

auto PathResolver::sessionIdFromFileName(std::string_view baseName, std::string_view fileName) const
    -> std::optional<std::string> {
    auto const prefix = this->sessionPrefix(baseName);
    auto const suffix = this->fileSuffix();
    if (fileName.size() <= prefix.size() + suffix.size())
        return std::nullopt;
    if (!fileName.starts_with(prefix) || !fileName.ends_with(suffix))
        return std::nullopt;
    return std::string{fileName.substr(prefix.size(), fileName.size() - prefix.size() - suffix.size())};
}

auto PathResolver::enumerate(std::string_view baseName) const -> std::vector<Candidate> {
    std::vector<Candidate> candidates;
    std::error_code        ec;
    std::filesystem::directory_iterator it(this->directory, ec);
    if (ec) {
        sk_warn("Failed to enumerate " + this->directory.string() + ": " + ec.message(), "PathResolver");
        return {};
    }

    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            sk_warn("Enumeration of " + this->directory.string() + " aborted: " + ec.message(), "PathResolver");
            return {};
        }
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc))
            continue;

        auto const fileName  = it->path().filename().string();
        auto       sessionId = this->sessionIdFromFileName(baseName, fileName);
        if (!sessionId)
            continue;

        auto modified = Io::modificationTime(it->path());
        if (!modified)
            continue;
        candidates.push_back(Candidate{it->path(), std::move(*sessionId), *modified});
    }
    if (ec) {
        sk_warn("Enumeration of " + this->directory.string() + " aborted: " + ec.message(), "PathResolver");
        return {};
    }
    return candidates;
}

auto PathResolver::sweepStale(std::string_view baseName, std::chrono::milliseconds maxAge) const -> std::size_t {
    auto const  now     = this->clock->now();
    std::size_t removed = 0;
    for (auto const& candidate : this->enumerate(baseName)) {
        if (now - candidate.modified <= maxAge)
            continue;
        std::error_code ec;
        if (std::filesystem::remove(candidate.path, ec)) {
            ++removed;
        } else if (ec) {
            sk_warn("Failed to sweep " + candidate.path.string() + ": " + ec.message(), "PathResolver");
        }
    }
    if (removed > 0)
        sk_info("Swept " + std::to_string(removed) + " stale '" + std::string{baseName} + "' state files", "PathResolver");
    return removed;
}

auto PathResolver::listActive(std::string_view baseName, std::chrono::milliseconds ttl) const
    -> std::vector<std::string> {
    auto const               now = this->clock->now();
    std::vector<std::string> active;
    for (auto& candidate : this->enumerate(baseName)) {
        if (now - candidate.modified <= ttl)
            active.push_back(std::move(candidate.sessionId));
    }
    std::sort(active.begin(), active.end());
    active.erase(std::unique(active.begin(), active.end()), active.end());
    return active;
}

} // namespace SK
