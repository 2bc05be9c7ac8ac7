#include "coordinator/StateCoordinator.hpp"

#include "io/AtomicFile.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>
#include <system_error>
#include <utility>

namespace SK {

namespace {

auto makeResolverOptions(CoordinatorOptions const& options) -> PathResolver::Options {
    PathResolver::Options resolverOptions;
    resolverOptions.scratchDir         = options.scratch_dir;
    resolverOptions.productNamespace   = options.product_namespace;
    resolverOptions.extension          = options.extension;
    resolverOptions.maxSessionIdLength = options.session_id_max_length;
    resolverOptions.legacyGraceWindow  = std::chrono::milliseconds{options.legacy_grace_window_ms};
    return resolverOptions;
}

auto makeLockOptions(CoordinatorOptions const& options) -> LockManager::Options {
    LockManager::Options lockOptions;
    lockOptions.staleAfter    = std::chrono::milliseconds{options.lock_stale_ms};
    lockOptions.retryInterval = std::chrono::milliseconds{options.lock_retry_interval_ms};
    return lockOptions;
}

} // namespace

StateCoordinator::StateCoordinator()
    : StateCoordinator(CoordinatorOptions{}) {}

StateCoordinator::StateCoordinator(CoordinatorOptions options, SchemaRegistry schemas, std::shared_ptr<Clock> clockSource)
    : opts(std::move(options)),
      registry(std::move(schemas)),
      clock(clockSource ? std::move(clockSource) : systemClock()),
      resolver(makeResolverOptions(opts), clock),
      lockManager(makeLockOptions(opts), clock),
      activeCache(std::chrono::milliseconds{opts.active_sessions_cache_ttl_ms}, clock) {
    if (auto problem = validateOptions(this->opts))
        sk_warn("Coordinator options are inconsistent: " + *problem, "StateCoordinator");
}

auto StateCoordinator::sessionId(std::optional<std::string> const& explicitId) const -> std::string {
    if (explicitId && !explicitId->empty())
        return *explicitId;
    return resolveSessionId(this->opts.session_id_override, this->opts.session_env_var);
}

auto StateCoordinator::acceptBaseName(std::string_view baseName, std::string_view operation) const -> bool {
    if (isValidNamePart(baseName))
        return true;
    sk_warn(std::string{operation} + " rejected base name '" + std::string{baseName} + "'", "StateCoordinator");
    return false;
}

auto StateCoordinator::readState(std::string_view kind,
                                 std::string_view baseName,
                                 std::optional<std::string> const& sessionId) -> std::optional<nlohmann::json> {
    if (!this->acceptBaseName(baseName, "readState"))
        return std::nullopt;

    try {
        auto const sid   = this->sessionId(sessionId);
        auto const path  = this->resolver.resolveWithMigration(baseName, sid);
        auto       guard = this->lockManager.lock(path, std::chrono::milliseconds{this->opts.read_lock_timeout_ms});
        if (!guard)
            sk_debug("Reading " + path.string() + " without lock", "StateCoordinator");

        auto raw = Io::readTextFile(path);
        if (!raw) {
            if (raw.error().code != Error::Code::NotFound)
                sk_warn("Failed to read state " + path.string() + ": " + describeError(raw.error()), "StateCoordinator");
            return std::nullopt;
        }

        auto parsed = nlohmann::json::parse(*raw, nullptr, false);
        if (parsed.is_discarded()) {
            sk_warn("Discarding unparseable '" + std::string{kind} + "' state in " + path.string(), "StateCoordinator");
            return std::nullopt;
        }

        auto valid = this->registry.validate(kind, parsed);
        if (!valid)
            return std::nullopt;

        if (auto const* schema = this->registry.find(kind); schema && isExpired(*schema, *valid, this->clock->now())) {
            sk_info("Ignoring expired '" + std::string{kind} + "' state in " + path.string(), "StateCoordinator");
            return std::nullopt;
        }
        return std::move(*valid);
    } catch (std::exception const& e) {
        sk_error("readState(" + std::string{kind} + ", " + std::string{baseName} + ") failed: " + e.what(),
                 "StateCoordinator");
        return std::nullopt;
    }
}

void StateCoordinator::writeState(std::string_view kind,
                                  std::string_view baseName,
                                  std::optional<std::string> const& sessionId,
                                  nlohmann::json const& content) {
    if (!this->acceptBaseName(baseName, "writeState"))
        return;

    try {
        // Persisted either way; readers discard records that fail this check.
        if (!this->registry.validate(kind, content))
            sk_debug("Persisting '" + std::string{kind} + "' state that readers will discard", "StateCoordinator");

        auto const sid  = this->sessionId(sessionId);
        auto const path = this->resolver.sessionPath(baseName, sid);

        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            sk_warn("Failed to create " + path.parent_path().string() + ": " + ec.message(), "StateCoordinator");

        auto guard = this->lockManager.lock(path, std::chrono::milliseconds{this->opts.write_lock_timeout_ms});
        if (!guard)
            sk_debug("Writing " + path.string() + " without lock", "StateCoordinator");

        auto serialized = content.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (auto written = Io::writeFileAtomic(path, serialized, this->opts.fsync_writes); !written) {
            sk_error("Failed to write state " + path.string() + ": " + describeError(written.error()),
                     "StateCoordinator");
            return;
        }
        this->activeCache.invalidate(baseName);
    } catch (std::exception const& e) {
        sk_error("writeState(" + std::string{kind} + ", " + std::string{baseName} + ") failed: " + e.what(),
                 "StateCoordinator");
    }
}

auto StateCoordinator::listActiveSessions(std::string_view baseName, std::optional<std::chrono::milliseconds> ttl)
    -> std::vector<std::string> {
    if (!this->acceptBaseName(baseName, "listActiveSessions"))
        return {};

    auto const window = ttl.value_or(std::chrono::milliseconds{this->opts.active_session_ttl_ms});
    try {
        if (auto cached = this->activeCache.get(baseName, window))
            return std::move(*cached);
        auto active = this->resolver.listActive(baseName, window);
        this->activeCache.put(baseName, window, active);
        return active;
    } catch (std::exception const& e) {
        sk_error("listActiveSessions(" + std::string{baseName} + ") failed: " + e.what(), "StateCoordinator");
        return {};
    }
}

auto StateCoordinator::sweepStale(std::string_view baseName, std::optional<std::chrono::milliseconds> maxAge)
    -> std::size_t {
    if (!this->acceptBaseName(baseName, "sweepStale"))
        return 0;

    auto const limit = maxAge.value_or(std::chrono::milliseconds{this->opts.sweep_max_age_ms});
    try {
        auto removed = this->resolver.sweepStale(baseName, limit);
        if (removed > 0)
            this->activeCache.invalidate(baseName);
        return removed;
    } catch (std::exception const& e) {
        sk_error("sweepStale(" + std::string{baseName} + ") failed: " + e.what(), "StateCoordinator");
        return 0;
    }
}

} // namespace SK
