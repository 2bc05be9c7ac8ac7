#include "coordinator/ActiveSessionCache.hpp"

#include <utility>

namespace SK {

ActiveSessionCache::ActiveSessionCache(std::chrono::milliseconds entryTtl, std::shared_ptr<Clock> clockSource)
    : ttl(entryTtl), clock(clockSource ? std::move(clockSource) : systemClock()) {}

auto ActiveSessionCache::get(std::string_view baseName, std::chrono::milliseconds activityTtl)
    -> std::optional<std::vector<std::string>> {
    if (!this->enabled())
        return std::nullopt;

    std::lock_guard<std::mutex> lock(this->mutex);
    auto                        it = this->entries.find(std::string{baseName});
    if (it == this->entries.end())
        return std::nullopt;
    if (this->clock->now() >= it->second.expiresAt) {
        this->entries.erase(it);
        return std::nullopt;
    }
    if (it->second.activityTtl != activityTtl)
        return std::nullopt;
    return it->second.sessions;
}

void ActiveSessionCache::put(std::string_view baseName,
                             std::chrono::milliseconds activityTtl,
                             std::vector<std::string> sessions) {
    if (!this->enabled())
        return;

    std::lock_guard<std::mutex> lock(this->mutex);
    this->entries.insert_or_assign(std::string{baseName},
                                   Entry{std::move(sessions), activityTtl, this->clock->now() + this->ttl});
}

void ActiveSessionCache::invalidate(std::string_view baseName) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->entries.erase(std::string{baseName});
}

void ActiveSessionCache::clear() {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->entries.clear();
}

auto ActiveSessionCache::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->entries.size();
}

} // namespace SK
