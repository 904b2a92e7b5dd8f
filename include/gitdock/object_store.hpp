#pragma once
#include "gitdock/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitdock {

struct Object {
  std::string type;               // "blob" | "tree" | "commit" | "tag"
  std::vector<std::uint8_t> data; // payload bytes (no header)
};

struct TreeEntry {
  std::uint32_t mode; // octal, e.g. consts::kModeFile
  std::string name;   // no '/'
  oid id;

  [[nodiscard]] bool is_tree() const;
  // Submodule commits live in another repository and are never traversed.
  [[nodiscard]] bool is_gitlink() const;
};

struct CommitView {
  oid tree{};
  std::vector<oid> parents;
  std::string author;    // full line after "author "
  std::string committer; // full line after "committer "
  std::int64_t timestamp{0}; // committer time, seconds since epoch
  std::string message;
};

struct TagView {
  oid object{};
  std::string type; // type of the tagged object
  std::string name;
  std::string message;
};

// Typed views, computed from the payload on every call.
CommitView parse_commit(std::span<const std::uint8_t> payload);
std::vector<TreeEntry> parse_tree(std::span<const std::uint8_t> payload);
TagView parse_tag(std::span<const std::uint8_t> payload);

std::string format_tree(std::vector<TreeEntry> entries);
std::string format_commit(const oid &tree, const std::vector<oid> &parents,
                          std::string_view author_line, std::string_view committer_line,
                          std::string_view message);

// Read side of a store; graph traversal works against this so it can see a
// push quarantine and the main store as one.
class ObjectReader {
public:
  virtual ~ObjectReader() = default;

  // Throws Error(ObjectMissing) when absent.
  [[nodiscard]] virtual Object get(const oid &id) const = 0;
  [[nodiscard]] virtual bool contains(const oid &id) const = 0;
};

class ObjectStore : public ObjectReader {
public:
  // `objects_dir` is the fan-out root ("<repo>/objects").
  explicit ObjectStore(std::filesystem::path objects_dir) : dir_(std::move(objects_dir)) {}

  [[nodiscard]] Object get(const oid &id) const override;
  [[nodiscard]] bool contains(const oid &id) const override;

  // Idempotent: identical bytes give the identical id and no second write.
  oid put(std::string_view type, std::span<const std::uint8_t> payload) const;
  oid put(std::string_view type, std::string_view payload) const {
    return put(type, std::span<const std::uint8_t>(
                         reinterpret_cast<const std::uint8_t *>(payload.data()), payload.size()));
  }

  [[nodiscard]] std::filesystem::path path_for_oid(const oid &object_id) const;
  [[nodiscard]] const std::filesystem::path &dir() const { return dir_; }

  // Visit every object id in this store (fan-out directories only).
  void for_each_id(const std::function<void(const oid &)> &fn) const;

  // Move every object of `staging` into this store and delete its directory.
  void absorb(const ObjectStore &staging) const;

private:
  std::filesystem::path dir_;
};

// Staging area for a push. Objects land in "objects/incoming-XXXXXX" and
// only reach the main store through promote(); otherwise the directory is
// removed on destruction.
class Quarantine : public ObjectReader {
public:
  explicit Quarantine(const ObjectStore &main);
  ~Quarantine() override;
  Quarantine(const Quarantine &) = delete;
  Quarantine &operator=(const Quarantine &) = delete;

  [[nodiscard]] Object get(const oid &id) const override;
  [[nodiscard]] bool contains(const oid &id) const override;

  oid put(std::string_view type, std::span<const std::uint8_t> payload) const {
    return staging_.put(type, payload);
  }
  [[nodiscard]] const ObjectStore &staging() const { return staging_; }

  void promote();
  // Drop everything received so far.
  void discard() noexcept;

private:
  const ObjectStore &main_;
  ObjectStore staging_;
  bool done_{false};
};

} // namespace gitdock
