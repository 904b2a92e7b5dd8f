#pragma once
#include "gitdock/cache.hpp"
#include "gitdock/hash.hpp"
#include "gitdock/repo.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gitdock {

// Commits shown by one log page.
inline constexpr std::size_t kLogPageSize = 50;

/**
 * Read-only views for the web mirror, rendered as text and memoized in the
 * shared ViewCache under (repository, input id, view kind). Only reads the
 * repository; ref updates reach these views through ViewCache::invalidate().
 */
class MirrorView {
public:
  MirrorView(const Repository &repo, std::string name, ViewCache &cache)
      : repo_(repo), name_(std::move(name)), cache_(cache) {}

  // "HEAD", "main", "refs/tags/v1" ... to a commit id. Throws RefMissing.
  [[nodiscard]] oid resolve(std::string_view ref) const;

  // One "<mode> <type> <hex>\t<name>" line per entry. Accepts a tree or a
  // commit (its root tree is listed).
  CachedBytes tree_listing(const oid &id) const;

  // "<hex> <unix time> <subject>" for up to kLogPageSize commits reachable
  // from `start`, newest committer time first.
  CachedBytes commit_log(const oid &start) const;

  // git-style patch of `commit` against its first parent (against an empty
  // tree for a root commit).
  CachedBytes commit_diff(const oid &commit) const;

  // Raw blob content; never cached.
  [[nodiscard]] std::vector<std::uint8_t> blob_bytes(const oid &id) const;

private:
  std::string render_tree(const oid &id) const;
  std::string render_log(const oid &start) const;
  std::string render_diff(const oid &commit) const;

  const Repository &repo_;
  std::string name_;
  ViewCache &cache_;
};

} // namespace gitdock
