#include "gitdock/views.hpp"

#include "gitdock/consts.hpp"
#include "gitdock/diff.hpp"
#include "gitdock/graph.hpp"

#include <cstdio>
#include <map>
#include <queue>
#include <sstream>

namespace gitdock {

namespace {

std::string mode_string(std::uint32_t mode) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%06o", mode);
  return buf;
}

std::string_view entry_type(const TreeEntry &e) {
  if (e.is_tree()) {
    return consts::kTypeTree;
  }
  return e.is_gitlink() ? consts::kTypeCommit : consts::kTypeBlob;
}

std::string_view subject_of(std::string_view message) {
  const auto nl = message.find(consts::kLF);
  return nl == std::string_view::npos ? message : message.substr(0, nl);
}

struct FileEntry {
  std::uint32_t mode;
  oid id;
};
using FlatTree = std::map<std::string, FileEntry>;

// Every non-tree entry below `tree`, keyed by its slash-separated path.
void flatten(const Repository &repo, const oid &tree, const std::string &prefix, FlatTree &out) {
  // Explicit stack keeps deep trees off the call stack.
  std::vector<std::pair<std::string, oid>> pending{{prefix, tree}};
  while (!pending.empty()) {
    auto [dir, id] = std::move(pending.back());
    pending.pop_back();
    for (auto &e : repo.read_tree(id)) {
      std::string path = dir.empty() ? e.name : dir + "/" + e.name;
      if (e.is_tree()) {
        pending.emplace_back(std::move(path), e.id);
      } else {
        out.emplace(std::move(path), FileEntry{e.mode, e.id});
      }
    }
  }
}

std::string content_of(const Repository &repo, const FileEntry &f) {
  if (f.mode == consts::kModeGitlink) {
    return "Subproject commit " + to_hex(f.id) + "\n";
  }
  const auto bytes = repo.read_blob(f.id);
  return {bytes.begin(), bytes.end()};
}

void write_file_diff(std::ostringstream &out, const Repository &repo, const std::string &path,
                     const FileEntry *before, const FileEntry *after) {
  out << "diff --git a/" << path << " b/" << path << "\n";
  if (before == nullptr) {
    out << "new file mode " << mode_string(after->mode) << "\n";
  } else if (after == nullptr) {
    out << "deleted file mode " << mode_string(before->mode) << "\n";
  } else if (before->mode != after->mode) {
    out << "old mode " << mode_string(before->mode) << "\n";
    out << "new mode " << mode_string(after->mode) << "\n";
  }
  const std::string old_text = before ? content_of(repo, *before) : std::string{};
  const std::string new_text = after ? content_of(repo, *after) : std::string{};
  if (diff::looks_binary(old_text) || diff::looks_binary(new_text)) {
    out << "Binary files " << (before ? "a/" + path : "/dev/null") << " and "
        << (after ? "b/" + path : "/dev/null") << " differ\n";
    return;
  }
  out << diff::unified_diff(diff::split_lines(old_text), diff::split_lines(new_text), path);
}

} // namespace

oid MirrorView::resolve(std::string_view ref) const {
  if (ref == consts::kHeadFile || ref.starts_with("refs/")) {
    return repo_.resolve_ref(ref);
  }
  if (auto id = repo_.refs().find(heads_ref(ref))) {
    return *id;
  }
  return repo_.resolve_ref("refs/tags/" + std::string(ref));
}

CachedBytes MirrorView::tree_listing(const oid &id) const {
  return cache_.get_or_compute(CacheKey{name_, id, ViewKind::TreeListing},
                               [&] { return render_tree(id); });
}

CachedBytes MirrorView::commit_log(const oid &start) const {
  return cache_.get_or_compute(CacheKey{name_, start, ViewKind::CommitLog},
                               [&] { return render_log(start); });
}

CachedBytes MirrorView::commit_diff(const oid &commit) const {
  return cache_.get_or_compute(CacheKey{name_, commit, ViewKind::CommitDiff},
                               [&] { return render_diff(commit); });
}

std::vector<std::uint8_t> MirrorView::blob_bytes(const oid &id) const {
  return repo_.read_blob(id);
}

std::string MirrorView::render_tree(const oid &id) const {
  auto obj = repo_.get(id);
  oid tree = id;
  if (obj.type == consts::kTypeCommit) {
    tree = parse_commit(obj.data).tree;
  }
  std::string out;
  for (const auto &e : repo_.read_tree(tree)) {
    out += mode_string(e.mode);
    out += ' ';
    out += entry_type(e);
    out += ' ';
    out += to_hex(e.id);
    out += '\t';
    out += e.name;
    out += '\n';
  }
  return out;
}

std::string MirrorView::render_log(const oid &start) const {
  struct Pending {
    std::int64_t timestamp;
    oid id;
    CommitView commit;
    bool operator<(const Pending &o) const { return timestamp < o.timestamp; }
  };
  std::priority_queue<Pending> queue;
  OidSet seen{start};
  {
    auto first = repo_.read_commit(start);
    const auto ts = first.timestamp;
    queue.push(Pending{ts, start, std::move(first)});
  }

  std::ostringstream out;
  std::size_t shown = 0;
  while (!queue.empty() && shown < kLogPageSize) {
    const Pending top = queue.top();
    queue.pop();
    out << to_hex(top.id) << ' ' << top.commit.timestamp << ' '
        << subject_of(top.commit.message) << "\n";
    ++shown;
    for (const auto &parent : top.commit.parents) {
      if (seen.insert(parent).second) {
        auto view = repo_.read_commit(parent);
        const auto ts = view.timestamp;
        queue.push(Pending{ts, parent, std::move(view)});
      }
    }
  }
  return out.str();
}

std::string MirrorView::render_diff(const oid &commit) const {
  const CommitView view = repo_.read_commit(commit);
  FlatTree before;
  if (!view.parents.empty()) {
    flatten(repo_, repo_.read_commit(view.parents.front()).tree, "", before);
  }
  FlatTree after;
  flatten(repo_, view.tree, "", after);

  std::ostringstream out;
  auto b = before.begin();
  auto a = after.begin();
  while (b != before.end() || a != after.end()) {
    if (a == after.end() || (b != before.end() && b->first < a->first)) {
      write_file_diff(out, repo_, b->first, &b->second, nullptr);
      ++b;
    } else if (b == before.end() || a->first < b->first) {
      write_file_diff(out, repo_, a->first, nullptr, &a->second);
      ++a;
    } else {
      if (b->second.id != a->second.id || b->second.mode != a->second.mode) {
        write_file_diff(out, repo_, a->first, &b->second, &a->second);
      }
      ++a;
      ++b;
    }
  }
  return out.str();
}

} // namespace gitdock
