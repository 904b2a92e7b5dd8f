#include "gitdock/repo.hpp"

#include "gitdock/consts.hpp"
#include "gitdock/fs.hpp"

#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace stdfs = std::filesystem;

namespace gitdock {

Repository::Repository(stdfs::path root)
    : root_(std::move(root)), objects_(root_ / consts::kObjectsDir), refs_(root_) {}

auto Repository::is_initialized() const -> bool {
  return fs::exists(head_file()) && fs::exists(objects_dir());
}

void Repository::init() const {
  if (is_initialized()) {
    throw std::runtime_error("a repository already exists at: " + root_.string());
  }

  std::error_code ec;
  stdfs::create_directories(objects_dir(), ec);
  if (ec) {
    throw std::runtime_error("create objects dir failed: " + ec.message());
  }
  stdfs::create_directories(heads_dir(), ec);
  if (ec) {
    throw std::runtime_error("create refs/heads dir failed: " + ec.message());
  }
  stdfs::create_directories(tags_dir(), ec);
  if (ec) {
    throw std::runtime_error("create refs/tags dir failed: " + ec.message());
  }
  RefStore{root_}.set_head_symbolic(heads_ref(consts::kDefaultBranch));
}

// Blobs

oid Repository::write_blob(std::string_view bytes) const {
  return objects_.put(consts::kTypeBlob, bytes);
}

std::vector<std::uint8_t> Repository::read_blob(const oid &id) const {
  auto [type, data] = objects_.get(id);
  if (type != consts::kTypeBlob) {
    throw std::runtime_error("object " + to_hex(id) + " is not a blob");
  }
  return std::move(data);
}

// Trees

oid Repository::write_tree(const std::vector<TreeEntry> &entries) const {
  return objects_.put(consts::kTypeTree, format_tree(entries));
}

std::vector<TreeEntry> Repository::read_tree(const oid &id) const {
  const auto obj = objects_.get(id);
  if (obj.type != consts::kTypeTree) {
    throw std::runtime_error("object " + to_hex(id) + " is not a tree");
  }
  return parse_tree(obj.data);
}

// Commits

oid Repository::write_commit(const oid &tree, const std::vector<oid> &parents,
                             std::string_view author_line, std::string_view committer_line,
                             std::string_view message) const {
  return objects_.put(consts::kTypeCommit,
                      format_commit(tree, parents, author_line, committer_line, message));
}

CommitView Repository::read_commit(const oid &id) const {
  const auto obj = objects_.get(id);
  if (obj.type != consts::kTypeCommit) {
    throw std::runtime_error("object " + to_hex(id) + " is not a commit");
  }
  return parse_commit(obj.data);
}

} // namespace gitdock
