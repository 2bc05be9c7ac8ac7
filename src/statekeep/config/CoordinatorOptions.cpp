#include "config/CoordinatorOptions.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>

namespace SK {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

auto apply_millis_env(char const* key, std::int64_t min, std::int64_t& target) -> bool {
    return apply_env(key, [&](std::string_view value) {
        std::int64_t parsed = target;
        if (!parse_integer_in_range<std::int64_t>(value, min, std::numeric_limits<std::int64_t>::max(), parsed)) {
            std::cerr << key << " must be an integer >= " << min << "\n";
            return false;
        }
        target = parsed;
        return true;
    });
}

} // namespace

auto isValidNamePart(std::string_view value) -> bool {
    if (value.empty()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.';
    });
}

auto validateOptions(CoordinatorOptions const& options) -> std::optional<std::string> {
    if (!isValidNamePart(options.product_namespace)) {
        return std::string{"product namespace must be non-empty and contain only letters, digits, '.', '-', '_'"};
    }
    if (!isValidNamePart(options.extension) || options.extension.front() == '.') {
        return std::string{"extension must be a bare suffix such as 'json'"};
    }
    if (options.session_id_max_length == 0) {
        return std::string{"session id max length must be > 0"};
    }
    if (options.lock_stale_ms <= 0) {
        return std::string{"lock staleness threshold must be > 0"};
    }
    if (options.lock_retry_interval_ms <= 0) {
        return std::string{"lock retry interval must be > 0"};
    }
    if (options.read_lock_timeout_ms < 0 || options.write_lock_timeout_ms < 0) {
        return std::string{"lock timeouts must be >= 0"};
    }
    if (options.legacy_grace_window_ms < 0) {
        return std::string{"legacy grace window must be >= 0"};
    }
    if (options.active_session_ttl_ms <= 0) {
        return std::string{"active session ttl must be > 0"};
    }
    if (options.sweep_max_age_ms <= 0) {
        return std::string{"sweep max age must be > 0"};
    }
    if (options.active_sessions_cache_ttl_ms < 0) {
        return std::string{"active session cache ttl must be >= 0"};
    }
    return std::nullopt;
}

bool applyEnvOverrides(CoordinatorOptions& options) {
    if (!apply_env("STATEKEEP_SCRATCH_DIR", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "STATEKEEP_SCRATCH_DIR must not be empty\n";
                return false;
            }
            options.scratch_dir = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("STATEKEEP_NAMESPACE", [&](std::string_view value) {
            if (!isValidNamePart(value)) {
                std::cerr << "STATEKEEP_NAMESPACE must contain only letters, digits, '.', '-', '_'\n";
                return false;
            }
            options.product_namespace = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_millis_env("STATEKEEP_LOCK_STALE_MS", 1, options.lock_stale_ms))
        return false;
    if (!apply_millis_env("STATEKEEP_LOCK_RETRY_MS", 1, options.lock_retry_interval_ms))
        return false;
    if (!apply_millis_env("STATEKEEP_READ_TIMEOUT_MS", 0, options.read_lock_timeout_ms))
        return false;
    if (!apply_millis_env("STATEKEEP_WRITE_TIMEOUT_MS", 0, options.write_lock_timeout_ms))
        return false;
    if (!apply_millis_env("STATEKEEP_LEGACY_GRACE_MS", 0, options.legacy_grace_window_ms))
        return false;

    if (!apply_env("STATEKEEP_FSYNC", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << "STATEKEEP_FSYNC must be a boolean (1/0, true/false, yes/no, on/off)\n";
                return false;
            }
            options.fsync_writes = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

} // namespace SK
