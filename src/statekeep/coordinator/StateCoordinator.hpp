#pragma once

#include "config/CoordinatorOptions.hpp"
#include "coordinator/ActiveSessionCache.hpp"
#include "core/Clock.hpp"
#include "lock/LockManager.hpp"
#include "path/PathResolver.hpp"
#include "schema/StateSchema.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace SK {

/**
 * Entry point for callers that persist per-session state.
 *
 * Composition:
 * - PathResolver picks the file (session scoped, or a recently used legacy
 *   file on reads).
 * - LockManager serialises cooperating readers and writers with a bounded
 *   wait; a lock that cannot be obtained degrades to unlocked I/O.
 * - Io::writeFileAtomic replaces the file in one rename.
 * - SchemaRegistry gates what readers accept. Writers persist every record
 *   and only warn when it does not match its kind's schema.
 *
 * None of the operations throw. Failures are logged through the tagged logger
 * and surface as "no state" (reads) or a skipped write.
 */
class StateCoordinator {
public:
    StateCoordinator();
    explicit StateCoordinator(CoordinatorOptions options,
                              SchemaRegistry schemas             = SchemaRegistry::withBuiltinKinds(),
                              std::shared_ptr<Clock> clockSource = systemClock());

    [[nodiscard]] auto readState(std::string_view kind,
                                 std::string_view baseName,
                                 std::optional<std::string> const& sessionId = std::nullopt)
        -> std::optional<nlohmann::json>;

    void writeState(std::string_view kind,
                    std::string_view baseName,
                    std::optional<std::string> const& sessionId,
                    nlohmann::json const& content);
    void writeState(std::string_view kind, std::string_view baseName, nlohmann::json const& content) {
        this->writeState(kind, baseName, std::nullopt, content);
    }

    [[nodiscard]] auto listActiveSessions(std::string_view baseName,
                                          std::optional<std::chrono::milliseconds> ttl = std::nullopt)
        -> std::vector<std::string>;

    auto sweepStale(std::string_view baseName, std::optional<std::chrono::milliseconds> maxAge = std::nullopt)
        -> std::size_t;

    [[nodiscard]] auto sessionId(std::optional<std::string> const& explicitId = std::nullopt) const -> std::string;

    [[nodiscard]] auto options() const -> CoordinatorOptions const& { return opts; }
    [[nodiscard]] auto paths() const -> PathResolver const& { return resolver; }
    [[nodiscard]] auto locks() -> LockManager& { return lockManager; }
    [[nodiscard]] auto schemas() -> SchemaRegistry& { return registry; }

private:
    [[nodiscard]] auto acceptBaseName(std::string_view baseName, std::string_view operation) const -> bool;

    CoordinatorOptions     opts;
    SchemaRegistry         registry;
    std::shared_ptr<Clock> clock;
    PathResolver           resolver;
    LockManager            lockManager;
    ActiveSessionCache     activeCache;
};

} // namespace SK
