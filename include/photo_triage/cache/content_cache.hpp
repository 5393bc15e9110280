#pragma once

#include "photo_triage/core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace photo_triage::cache {

namespace fs = std::filesystem;

enum class EntryKind {
  EMBEDDING,
  QUALITY_SCORE
};

inline std::string entry_kind_to_string(EntryKind kind) {
  switch (kind) {
  case EntryKind::EMBEDDING:
    return "embedding";
  case EntryKind::QUALITY_SCORE:
    return "quality_score";
  default:
    return "unknown";
  }
}

struct CachePayload {
  std::vector<float> values;       // embedding vector
  std::optional<double> score;     // quality score
  nlohmann::json metadata = nlohmann::json::object();

  bool operator==(const CachePayload &o) const {
    return values == o.values && score == o.score && metadata == o.metadata;
  }
  bool operator!=(const CachePayload &o) const { return !(*this == o); }
};

struct CacheEntry {
  std::string fingerprint;
  EntryKind kind = EntryKind::EMBEDDING;
  std::string producer_version;
  int64_t created_at = 0;          // unix seconds
  CachePayload payload;
};

enum class PutResult {
  WRITTEN,
  UNCHANGED
};

// Fingerprint-keyed, version-tagged store. A miss is std::nullopt, never an
// exception. Implementations are safe to share between worker threads.
class ContentCache {
public:
  virtual ~ContentCache() = default;

  virtual void open() {}
  virtual void close() {}

  virtual std::optional<CacheEntry> get(const std::string &fingerprint,
                                        EntryKind kind,
                                        const std::string &version) = 0;

  // Throws CacheIOError when the entry cannot be written.
  virtual PutResult put(const std::string &fingerprint, EntryKind kind,
                        const std::string &version,
                        const CachePayload &payload) = 0;

  virtual size_t prune(std::chrono::seconds max_age) = 0;

  virtual bool persistent() const { return true; }
  virtual std::string describe() const = 0;
};

using Clock = std::function<int64_t()>;

// One JSON document per (fingerprint, kind):
//   <root>/<kind>/<fp[0..1]>/<fp>.json
class DiskContentCache : public ContentCache {
public:
  explicit DiskContentCache(const fs::path &root, Clock clock = {});

  void open() override;
  void close() override;

  std::optional<CacheEntry> get(const std::string &fingerprint, EntryKind kind,
                                const std::string &version) override;
  PutResult put(const std::string &fingerprint, EntryKind kind,
                const std::string &version,
                const CachePayload &payload) override;
  size_t prune(std::chrono::seconds max_age) override;

  std::string describe() const override;

  fs::path entry_path(const std::string &fingerprint, EntryKind kind) const;
  const fs::path &root() const { return root_; }

private:
  std::optional<CacheEntry> read_entry(const fs::path &path) const;
  void require_open() const;

  fs::path root_;
  Clock clock_;
  std::atomic<bool> open_{false};
};

class InMemoryContentCache : public ContentCache {
public:
  explicit InMemoryContentCache(Clock clock = {});

  void open() override { opens_.fetch_add(1); }
  void close() override { closes_.fetch_add(1); }

  std::optional<CacheEntry> get(const std::string &fingerprint, EntryKind kind,
                                const std::string &version) override;
  PutResult put(const std::string &fingerprint, EntryKind kind,
                const std::string &version,
                const CachePayload &payload) override;
  size_t prune(std::chrono::seconds max_age) override;

  bool persistent() const override { return false; }
  std::string describe() const override { return "memory"; }

  size_t size() const;
  size_t hits() const { return hits_.load(); }
  size_t misses() const { return misses_.load(); }
  size_t writes() const { return writes_.load(); }
  size_t opens() const { return opens_.load(); }
  size_t closes() const { return closes_.load(); }

private:
  using Key = std::pair<std::string, EntryKind>;

  Clock clock_;
  mutable std::shared_mutex mutex_;
  std::map<Key, CacheEntry> entries_;
  std::atomic<size_t> hits_{0};
  std::atomic<size_t> misses_{0};
  std::atomic<size_t> writes_{0};
  std::atomic<size_t> opens_{0};
  std::atomic<size_t> closes_{0};
};

// Always misses and drops writes. Used when the store cannot be opened.
class NullContentCache : public ContentCache {
public:
  std::optional<CacheEntry> get(const std::string &, EntryKind,
                                const std::string &) override {
    return std::nullopt;
  }
  PutResult put(const std::string &, EntryKind, const std::string &,
                const CachePayload &) override {
    return PutResult::UNCHANGED;
  }
  size_t prune(std::chrono::seconds) override { return 0; }

  bool persistent() const override { return false; }
  std::string describe() const override { return "disabled"; }
};

nlohmann::json entry_to_json(const CacheEntry &entry);
CacheEntry entry_from_json(const nlohmann::json &j);

} // namespace photo_triage::cache
