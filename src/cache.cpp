#include "gitdock/cache.hpp"

#include <exception>

namespace gitdock {

CachedBytes ViewCache::get_or_compute(const CacheKey &key,
                                      const std::function<std::string()> &compute) {
  std::unique_lock lock(mu_);
  if (auto it = entries_.find(key); it != entries_.end()) {
    lru_.splice(lru_.begin(), lru_, it->second.lru);
    ++stats_.hits;
    return it->second.value;
  }
  if (auto it = inflight_.find(key); it != inflight_.end()) {
    auto pending = it->second.result;
    ++stats_.hits;
    lock.unlock();
    return pending.get();
  }

  ++stats_.misses;
  const std::uint64_t generation = generations_[key.repository];
  std::promise<CachedBytes> promise;
  inflight_.emplace(key, InFlight{promise.get_future().share(), generation});
  lock.unlock();

  CachedBytes value;
  try {
    value = std::make_shared<const std::string>(compute());
  } catch (...) {
    lock.lock();
    if (auto it = inflight_.find(key); it != inflight_.end() && it->second.generation == generation) {
      inflight_.erase(it);
    }
    lock.unlock();
    promise.set_exception(std::current_exception());
    throw;
  }

  lock.lock();
  if (auto it = inflight_.find(key); it != inflight_.end() && it->second.generation == generation) {
    inflight_.erase(it);
  }
  if (generations_[key.repository] == generation) {
    insert_locked(key, value);
  }
  lock.unlock();
  promise.set_value(value);
  return value;
}

void ViewCache::insert_locked(const CacheKey &key, CachedBytes value) {
  const std::size_t size = value->size();
  if (size > budget_) {
    return;
  }
  if (auto it = entries_.find(key); it != entries_.end()) {
    used_ -= it->second.value->size();
    lru_.erase(it->second.lru);
    entries_.erase(it);
  }
  lru_.push_front(key);
  entries_.emplace(key, Entry{std::move(value), lru_.begin()});
  used_ += size;
  evict_locked();
}

void ViewCache::evict_locked() {
  while (used_ > budget_ && !lru_.empty()) {
    const auto it = entries_.find(lru_.back());
    used_ -= it->second.value->size();
    entries_.erase(it);
    lru_.pop_back();
    ++stats_.evictions;
  }
}

void ViewCache::invalidate(std::string_view repository) {
  const std::string repo(repository);
  std::lock_guard lock(mu_);
  ++generations_[repo];
  for (auto it = lru_.begin(); it != lru_.end();) {
    if (it->repository == repo) {
      const auto e = entries_.find(*it);
      used_ -= e->second.value->size();
      entries_.erase(e);
      it = lru_.erase(it);
    } else {
      ++it;
    }
  }
  // New callers must not join computations that started before this point.
  std::erase_if(inflight_, [&](const auto &kv) { return kv.first.repository == repo; });
}

bool ViewCache::contains(const CacheKey &key) const {
  std::lock_guard lock(mu_);
  return entries_.contains(key);
}

std::size_t ViewCache::size_bytes() const {
  std::lock_guard lock(mu_);
  return used_;
}

std::size_t ViewCache::entry_count() const {
  std::lock_guard lock(mu_);
  return entries_.size();
}

ViewCache::Stats ViewCache::stats() const {
  std::lock_guard lock(mu_);
  return stats_;
}

} // namespace gitdock
