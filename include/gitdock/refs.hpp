#pragma once
#include "gitdock/hash.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace gitdock {

using RefTable = std::map<std::string, oid>; // refname -> commit id

enum class RefUpdate : std::uint8_t { Ok, Conflict };

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);

// Subset of git check-ref-format: "refs/..." with no "..", "//", "@{",
// control characters, leading-dot components, or ".lock" suffix. Names
// holding the temp-file marker ".tmp-" are refused too.
bool valid_ref_name(std::string_view name);

// One file per ref under "<git_dir>/refs", holding 40 hex + '\n'.
class RefStore {
public:
  explicit RefStore(std::filesystem::path git_dir) : git_dir_(std::move(git_dir)) {}

  std::optional<oid> find(std::string_view refname) const;

  // Like find(), but throws Error(RefMissing). "HEAD" follows the symbolic ref.
  oid resolve(std::string_view refname) const;

  // Whole table, sorted by name. Lock files and half-written refs are skipped.
  RefTable list() const;

  /**
   * Atomic compare-and-swap of a single ref.
   * `expected_old` null: the ref must not exist yet.
   * `new_value` null: delete the ref.
   * Returns Conflict when the current value differs or another writer holds
   * the ref's lock. Refs are locked individually, so unrelated refs never
   * contend.
   */
  RefUpdate compare_and_swap(std::string_view refname, const oid &expected_old,
                             const oid &new_value);

  // Raw HEAD ("ref: refs/heads/main\n" or 40-hex); nullopt if missing.
  std::optional<std::string> read_head() const;
  void set_head_symbolic(std::string_view refname);

private:
  std::filesystem::path ref_path(std::string_view refname) const;

  std::filesystem::path git_dir_;
};

} // namespace gitdock
