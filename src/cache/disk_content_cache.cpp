#include "photo_triage/cache/content_cache.hpp"
#include "photo_triage/cache/fingerprint.hpp"
#include "photo_triage/core/errors.hpp"
#include "photo_triage/core/utils.hpp"

#include <system_error>

namespace photo_triage::cache {

namespace {

EntryKind entry_kind_from_string(const std::string& s) {
    if (s == "embedding") return EntryKind::EMBEDDING;
    if (s == "quality_score") return EntryKind::QUALITY_SCORE;
    throw CacheIOError("unknown entry kind: " + s);
}

Clock default_clock(Clock clock) {
    if (clock) return clock;
    return [] { return core::unix_time_now(); };
}

} // namespace

nlohmann::json entry_to_json(const CacheEntry& entry) {
    nlohmann::json payload = {
        {"values", entry.payload.values},
        {"metadata", entry.payload.metadata}
    };
    if (entry.payload.score) {
        payload["score"] = *entry.payload.score;
    } else {
        payload["score"] = nullptr;
    }

    return {
        {"fingerprint", entry.fingerprint},
        {"kind", entry_kind_to_string(entry.kind)},
        {"producer_version", entry.producer_version},
        {"created_at", entry.created_at},
        {"payload", payload}
    };
}

CacheEntry entry_from_json(const nlohmann::json& j) {
    CacheEntry entry;
    entry.fingerprint = j.at("fingerprint").get<std::string>();
    entry.kind = entry_kind_from_string(j.at("kind").get<std::string>());
    entry.producer_version = j.at("producer_version").get<std::string>();
    entry.created_at = j.at("created_at").get<int64_t>();

    const auto& payload = j.at("payload");
    entry.payload.values = payload.at("values").get<std::vector<float>>();
    if (payload.contains("score") && !payload["score"].is_null()) {
        entry.payload.score = payload["score"].get<double>();
    }
    if (payload.contains("metadata")) {
        entry.payload.metadata = payload["metadata"];
    }
    return entry;
}

DiskContentCache::DiskContentCache(const fs::path& root, Clock clock)
    : root_(root), clock_(default_clock(std::move(clock))) {}

void DiskContentCache::open() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw CacheIOError("cannot create " + root_.string() + ": " + ec.message());
    }
    if (!fs::is_directory(root_)) {
        throw CacheIOError("not a directory: " + root_.string());
    }

    const fs::path write_check = root_ / ".write_check";
    try {
        core::write_text_atomic(write_check, "ok");
    } catch (const IOError& e) {
        throw CacheIOError("store not writable: " + std::string(e.what()));
    }
    fs::remove(write_check, ec);

    open_.store(true);
}

void DiskContentCache::close() {
    open_.store(false);
}

void DiskContentCache::require_open() const {
    if (!open_.load()) {
        throw CacheIOError("store not open: " + root_.string());
    }
}

fs::path DiskContentCache::entry_path(const std::string& fingerprint, EntryKind kind) const {
    const std::string shard = fingerprint.size() >= 2 ? fingerprint.substr(0, 2) : "__";
    return root_ / entry_kind_to_string(kind) / shard / (fingerprint + ".json");
}

std::optional<CacheEntry> DiskContentCache::read_entry(const fs::path& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    try {
        auto j = nlohmann::json::parse(core::read_text(path));
        return entry_from_json(j);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;   // corrupt entry
    } catch (const IOError&) {
        return std::nullopt;   // unreadable entry or unknown kind
    }
}

std::optional<CacheEntry> DiskContentCache::get(const std::string& fingerprint, EntryKind kind,
                                                const std::string& version) {
    if (!is_valid_fingerprint(fingerprint)) {
        return std::nullopt;
    }
    auto entry = read_entry(entry_path(fingerprint, kind));
    if (!entry) {
        return std::nullopt;
    }
    if (entry->fingerprint != fingerprint || entry->kind != kind ||
        entry->producer_version != version) {
        return std::nullopt;
    }
    return entry;
}

PutResult DiskContentCache::put(const std::string& fingerprint, EntryKind kind,
                                const std::string& version, const CachePayload& payload) {
    require_open();
    if (!is_valid_fingerprint(fingerprint)) {
        throw CacheIOError("invalid fingerprint: '" + fingerprint + "'");
    }

    const fs::path path = entry_path(fingerprint, kind);
    auto existing = read_entry(path);
    if (existing && existing->fingerprint == fingerprint && existing->kind == kind &&
        existing->producer_version == version && existing->payload == payload) {
        return PutResult::UNCHANGED;
    }

    CacheEntry entry;
    entry.fingerprint = fingerprint;
    entry.kind = kind;
    entry.producer_version = version;
    entry.created_at = clock_();
    entry.payload = payload;

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw CacheIOError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    try {
        core::write_text_atomic(path, entry_to_json(entry).dump());
    } catch (const IOError& e) {
        throw CacheIOError(e.what());
    }
    return PutResult::WRITTEN;
}

size_t DiskContentCache::prune(std::chrono::seconds max_age) {
    require_open();
    const int64_t now = clock_();
    size_t removed = 0;

    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root_, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const fs::path p = it->path();
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || p.extension() != ".json") {
            continue;
        }
        auto entry = read_entry(p);
        if (!entry) {
            continue;
        }
        if (now - entry->created_at > max_age.count()) {
            std::error_code rm_ec;
            if (fs::remove(p, rm_ec)) {
                ++removed;
            }
        }
    }
    if (ec) {
        throw CacheIOError("cannot scan " + root_.string() + ": " + ec.message());
    }
    return removed;
}

std::string DiskContentCache::describe() const {
    return "disk:" + root_.string();
}

} // namespace photo_triage::cache
