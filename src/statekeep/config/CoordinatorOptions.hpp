#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace SK {

struct CoordinatorOptions {
    // Empty means the system temporary directory.
    std::string scratch_dir;
    std::string product_namespace{"claude"};
    std::string extension{"json"};
    // Read once per process and variable name; later changes to its value
    // are not observed.
    std::string session_env_var{"STATEKEEP_SESSION_ID"};
    std::optional<std::string> session_id_override;
    std::size_t  session_id_max_length{64};
    std::int64_t lock_stale_ms{10'000};
    std::int64_t lock_retry_interval_ms{50};
    std::int64_t read_lock_timeout_ms{200};
    std::int64_t write_lock_timeout_ms{1'000};
    std::int64_t legacy_grace_window_ms{60 * 60 * 1000};
    std::int64_t active_session_ttl_ms{60 * 60 * 1000};
    std::int64_t sweep_max_age_ms{24 * 60 * 60 * 1000};
    // Zero disables caching of listActiveSessions results.
    std::int64_t active_sessions_cache_ttl_ms{0};
    bool         fsync_writes{false};
};

// Applies STATEKEEP_* environment variables on top of the given options.
// Prints a message to stderr and returns false on the first invalid value.
bool applyEnvOverrides(CoordinatorOptions& options);

auto validateOptions(CoordinatorOptions const& options) -> std::optional<std::string>;

[[nodiscard]] auto isValidNamePart(std::string_view value) -> bool;

} // namespace SK
