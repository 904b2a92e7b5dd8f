#pragma once
#include "gitdock/hash.hpp"
#include "gitdock/object_store.hpp"

#include <optional>
#include <span>
#include <unordered_set>
#include <vector>

namespace gitdock {

using OidSet = std::unordered_set<oid, OidHash>;

// Ids `obj` points at: commit -> tree + parents, tree -> entries (gitlinks
// excluded), tag -> tagged object, blob -> nothing.
std::vector<oid> referenced_ids(const Object &obj);

// Closure of `roots` over the object DAG. Roots the reader does not have
// are skipped, as are objects below them that are missing.
OidSet reachable(const ObjectReader &store, std::span<const oid> roots);

/**
 * Objects reachable from `wants` but not from `haves`, in breadth-first
 * discovery order. The haves' closure is marked first; the wants'
 * traversal stops at marked objects. Duplicate wants count once; unknown
 * haves are ignored; a want (or anything below it) that is missing throws
 * Error(ObjectMissing).
 */
std::vector<oid> objects_to_send(const ObjectReader &store, std::span<const oid> wants,
                                 std::span<const oid> haves);

// First id referenced by one of `incoming` that `store` cannot provide.
std::optional<oid> find_missing_reference(const ObjectReader &store,
                                          std::span<const oid> incoming);

} // namespace gitdock
