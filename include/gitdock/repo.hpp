#pragma once
#include "gitdock/consts.hpp"
#include "gitdock/hash.hpp"
#include "gitdock/object_store.hpp"
#include "gitdock/refs.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitdock {

// A bare repository: HEAD, objects/, refs/ directly under root().
class Repository {
public:
  explicit Repository(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return root_ / consts::kObjectsDir;
  }
  [[nodiscard]] auto refs_dir() const -> std::filesystem::path { return root_ / consts::kRefsDir; }
  [[nodiscard]] auto heads_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kHeadsDir;
  }
  [[nodiscard]] auto tags_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kTagsDir;
  }
  [[nodiscard]] auto head_file() const -> std::filesystem::path {
    return root_ / consts::kHeadFile;
  }

  // Create the empty layout under root_ (empty ref table, empty object store).
  // Fails if a repository already exists there.
  void init() const;

  // HEAD and objects/ present?
  [[nodiscard]] auto is_initialized() const -> bool;

  [[nodiscard]] const ObjectStore &objects() const { return objects_; }
  [[nodiscard]] RefStore &refs() { return refs_; }
  [[nodiscard]] const RefStore &refs() const { return refs_; }

  // Object store contract
  oid put(std::string_view type, std::span<const std::uint8_t> bytes) const {
    return objects_.put(type, bytes);
  }
  [[nodiscard]] Object get(const oid &id) const { return objects_.get(id); }
  [[nodiscard]] oid resolve_ref(std::string_view name) const { return refs_.resolve(name); }
  RefUpdate update_ref(std::string_view name, const oid &expected_old, const oid &new_value) {
    return refs_.compare_and_swap(name, expected_old, new_value);
  }

  // Object plumbing
  oid write_blob(std::string_view bytes) const;
  oid write_tree(const std::vector<TreeEntry> &entries) const;
  oid write_commit(const oid &tree, const std::vector<oid> &parents,
                   std::string_view author_line, std::string_view committer_line,
                   std::string_view message) const;

  // Typed, type-checked reads; throw std::runtime_error on a type mismatch.
  [[nodiscard]] std::vector<std::uint8_t> read_blob(const oid &id) const;
  [[nodiscard]] std::vector<TreeEntry> read_tree(const oid &id) const;
  [[nodiscard]] CommitView read_commit(const oid &id) const;

private:
  std::filesystem::path root_;
  ObjectStore objects_;
  RefStore refs_;
};

} // namespace gitdock
