#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace SK {

inline constexpr std::size_t      kDefaultSessionIdMaxLength = 64;
inline constexpr std::string_view kDefaultSessionEnvVar      = "STATEKEEP_SESSION_ID";

// Maps every byte outside [A-Za-z0-9_-] to '_' and truncates to maxLength.
// An empty result becomes "unknown" so that it can always be embedded in a
// file name.
[[nodiscard]] auto sanitizeSessionId(std::string_view raw,
                                     std::size_t maxLength = kDefaultSessionIdMaxLength) -> std::string;

[[nodiscard]] auto hostIdentifier() -> std::string;

// Pure selection rule: explicit override, else environment value, else
// "<host>-<pid>". Empty strings count as absent.
[[nodiscard]] auto composeSessionId(std::optional<std::string_view> override,
                                    std::optional<std::string_view> environmentValue,
                                    std::string_view host,
                                    std::int64_t pid) -> std::string;

// Returns the override when given. Otherwise returns the identifier of this
// process for envVar: read from that variable (or derived from host and pid)
// on the first call naming it, then stable for the process lifetime. Distinct
// variable names resolve independently.
[[nodiscard]] auto resolveSessionId(std::optional<std::string> const& override = std::nullopt,
                                    std::string_view envVar = kDefaultSessionEnvVar) -> std::string;

} // namespace SK
