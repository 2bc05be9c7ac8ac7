#pragma once

#include "core/Clock.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace SK {

// Short-lived memo of listActiveSessions() results keyed by base name. Entries
// expire `ttl` after insertion according to the injected clock.
class ActiveSessionCache {
public:
    explicit ActiveSessionCache(std::chrono::milliseconds entryTtl, std::shared_ptr<Clock> clockSource = systemClock());

    [[nodiscard]] auto get(std::string_view baseName, std::chrono::milliseconds activityTtl)
        -> std::optional<std::vector<std::string>>;
    void put(std::string_view baseName, std::chrono::milliseconds activityTtl, std::vector<std::string> sessions);
    void invalidate(std::string_view baseName);
    void clear();

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto enabled() const -> bool { return this->ttl.count() > 0; }

private:
    struct Entry {
        std::vector<std::string>              sessions;
        std::chrono::milliseconds             activityTtl;
        std::chrono::system_clock::time_point expiresAt;
    };

    std::chrono::milliseconds                ttl;
    std::shared_ptr<Clock>                   clock;
    phmap::flat_hash_map<std::string, Entry> entries;
    mutable std::mutex                       mutex;
};

} // namespace SK
