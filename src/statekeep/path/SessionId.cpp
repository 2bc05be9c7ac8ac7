#include "path/SessionId.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include <parallel_hashmap/phmap.h>

#include <unistd.h>

namespace SK {

namespace {

auto nonEmpty(std::optional<std::string_view> value) -> bool {
    return value.has_value() && !value->empty();
}

} // namespace

auto sanitizeSessionId(std::string_view raw, std::size_t maxLength) -> std::string {
    std::string out;
    out.reserve(std::min(raw.size(), maxLength));
    for (char ch : raw) {
        if (out.size() >= maxLength)
            break;
        auto const uch = static_cast<unsigned char>(ch);
        out.push_back((std::isalnum(uch) || ch == '-' || ch == '_') ? ch : '_');
    }
    if (out.empty())
        out = "unknown";
    return out;
}

auto hostIdentifier() -> std::string {
    std::array<char, 256> buffer{};
    if (::gethostname(buffer.data(), buffer.size() - 1) != 0 || buffer[0] == '\0')
        return "localhost";
    return std::string{buffer.data()};
}

auto composeSessionId(std::optional<std::string_view> override,
                      std::optional<std::string_view> environmentValue,
                      std::string_view host,
                      std::int64_t pid) -> std::string {
    if (nonEmpty(override))
        return std::string{*override};
    if (nonEmpty(environmentValue))
        return std::string{*environmentValue};
    return sanitizeSessionId(host) + "-" + std::to_string(pid);
}

auto resolveSessionId(std::optional<std::string> const& override, std::string_view envVar) -> std::string {
    if (override && !override->empty())
        return *override;

    // One identifier per variable name, fixed on its first lookup.
    static std::mutex                                       cacheMutex;
    static phmap::flat_hash_map<std::string, std::string> processSessionIds;

    std::string const           name{envVar};
    std::lock_guard<std::mutex> lock(cacheMutex);
    if (auto it = processSessionIds.find(name); it != processSessionIds.end())
        return it->second;

    std::optional<std::string_view> fromEnv;
    if (auto const* value = std::getenv(name.c_str()))
        fromEnv = std::string_view{value};
    auto id = composeSessionId(std::nullopt, fromEnv, hostIdentifier(), static_cast<std::int64_t>(::getpid()));
    processSessionIds.emplace(name, id);
    return id;
}

} // namespace SK
