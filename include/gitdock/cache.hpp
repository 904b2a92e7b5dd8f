#pragma once
#include "gitdock/hash.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gitdock {

enum class ViewKind : std::uint8_t { TreeListing, CommitLog, CommitDiff };

struct CacheKey {
  std::string repository;
  oid object;
  ViewKind kind;

  bool operator==(const CacheKey &) const = default;
};

struct CacheKeyHash {
  std::size_t operator()(const CacheKey &k) const noexcept {
    const std::size_t h = std::hash<std::string>{}(k.repository) ^ OidHash{}(k.object);
    return h ^ (static_cast<std::size_t>(k.kind) << 1);
  }
};

// Cached values are immutable and shared, so readers never copy them under
// the cache lock.
using CachedBytes = std::shared_ptr<const std::string>;

/**
 * Memoizes derived views (listings, log walks, rendered diffs).
 *
 * At most one computation runs per key; concurrent callers for that key
 * wait on the same shared_future. A computation that throws is not cached
 * and its exception reaches every waiter. invalidate() bumps the
 * repository's generation, so a computation that started before it never
 * lands in the cache. Total payload size is bounded; the least recently
 * used entries go first.
 */
class ViewCache {
public:
  explicit ViewCache(std::size_t budget_bytes) : budget_(budget_bytes) {}

  CachedBytes get_or_compute(const CacheKey &key, const std::function<std::string()> &compute);

  // Drop every entry of `repository`.
  void invalidate(std::string_view repository);

  [[nodiscard]] bool contains(const CacheKey &key) const;
  [[nodiscard]] std::size_t size_bytes() const;
  [[nodiscard]] std::size_t entry_count() const;

  struct Stats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
  };
  [[nodiscard]] Stats stats() const;

private:
  struct Entry {
    CachedBytes value;
    std::list<CacheKey>::iterator lru;
  };
  struct InFlight {
    std::shared_future<CachedBytes> result;
    std::uint64_t generation;
  };

  void insert_locked(const CacheKey &key, CachedBytes value);
  void evict_locked();

  mutable std::mutex mu_;
  std::unordered_map<CacheKey, Entry, CacheKeyHash> entries_;
  std::list<CacheKey> lru_; // front = most recently used
  std::unordered_map<CacheKey, InFlight, CacheKeyHash> inflight_;
  std::unordered_map<std::string, std::uint64_t> generations_;
  std::size_t budget_;
  std::size_t used_{0};
  Stats stats_;
};

} // namespace gitdock
