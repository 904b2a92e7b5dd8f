#include "gitdock/graph.hpp"

#include "gitdock/consts.hpp"
#include "gitdock/error.hpp"

#include <deque>
#include <stdexcept>

namespace gitdock {

std::vector<oid> referenced_ids(const Object &obj) {
  std::vector<oid> out;
  if (obj.type == consts::kTypeCommit) {
    const auto c = parse_commit(obj.data);
    out.reserve(1 + c.parents.size());
    out.push_back(c.tree);
    out.insert(out.end(), c.parents.begin(), c.parents.end());
  } else if (obj.type == consts::kTypeTree) {
    for (const auto &e : parse_tree(obj.data)) {
      if (!e.is_gitlink()) {
        out.push_back(e.id);
      }
    }
  } else if (obj.type == consts::kTypeTag) {
    out.push_back(parse_tag(obj.data).object);
  } else if (obj.type != consts::kTypeBlob) {
    throw std::runtime_error("unknown object type '" + obj.type + "'");
  }
  return out;
}

OidSet reachable(const ObjectReader &store, std::span<const oid> roots) {
  OidSet seen;
  std::deque<oid> queue;
  for (const auto &r : roots) {
    if (store.contains(r) && seen.insert(r).second) {
      queue.push_back(r);
    }
  }
  while (!queue.empty()) {
    const oid cur = queue.front();
    queue.pop_front();
    for (const auto &next : referenced_ids(store.get(cur))) {
      if (!seen.contains(next) && store.contains(next)) {
        seen.insert(next);
        queue.push_back(next);
      }
    }
  }
  return seen;
}

std::vector<oid> objects_to_send(const ObjectReader &store, std::span<const oid> wants,
                                 std::span<const oid> haves) {
  OidSet marked = reachable(store, haves);

  std::vector<oid> out;
  std::deque<oid> queue;
  for (const auto &w : wants) {
    if (marked.insert(w).second) {
      queue.push_back(w);
    }
  }
  while (!queue.empty()) {
    const oid cur = queue.front();
    queue.pop_front();
    out.push_back(cur);
    // get() throws ObjectMissing for a broken want.
    for (const auto &next : referenced_ids(store.get(cur))) {
      if (marked.insert(next).second) {
        queue.push_back(next);
      }
    }
  }
  return out;
}

std::optional<oid> find_missing_reference(const ObjectReader &store,
                                          std::span<const oid> incoming) {
  for (const auto &id : incoming) {
    for (const auto &ref : referenced_ids(store.get(id))) {
      if (!store.contains(ref)) {
        return ref;
      }
    }
  }
  return std::nullopt;
}

} // namespace gitdock
