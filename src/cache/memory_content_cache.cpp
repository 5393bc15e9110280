#include "photo_triage/cache/content_cache.hpp"
#include "photo_triage/core/errors.hpp"
#include "photo_triage/core/utils.hpp"

#include <mutex>

namespace photo_triage::cache {

InMemoryContentCache::InMemoryContentCache(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return core::unix_time_now(); };
    }
}

std::optional<CacheEntry> InMemoryContentCache::get(const std::string& fingerprint, EntryKind kind,
                                                    const std::string& version) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(Key{fingerprint, kind});
    if (it == entries_.end() || it->second.producer_version != version) {
        misses_.fetch_add(1);
        return std::nullopt;
    }
    hits_.fetch_add(1);
    return it->second;
}

PutResult InMemoryContentCache::put(const std::string& fingerprint, EntryKind kind,
                                    const std::string& version, const CachePayload& payload) {
    if (fingerprint.empty()) {
        throw CacheIOError("invalid fingerprint: ''");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(Key{fingerprint, kind});
    if (it != entries_.end() && it->second.producer_version == version &&
        it->second.payload == payload) {
        return PutResult::UNCHANGED;
    }

    CacheEntry entry;
    entry.fingerprint = fingerprint;
    entry.kind = kind;
    entry.producer_version = version;
    entry.created_at = clock_();
    entry.payload = payload;
    entries_[Key{fingerprint, kind}] = std::move(entry);
    writes_.fetch_add(1);
    return PutResult::WRITTEN;
}

size_t InMemoryContentCache::prune(std::chrono::seconds max_age) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const int64_t now = clock_();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.created_at > max_age.count()) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t InMemoryContentCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

} // namespace photo_triage::cache
