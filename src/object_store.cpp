#include "gitdock/object_store.hpp"

#include "gitdock/consts.hpp"
#include "gitdock/error.hpp"
#include "gitdock/fs.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace gfs = gitdock::fs;

namespace gitdock {

namespace {

std::string mode_to_ascii_octal(std::uint32_t mode) {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

std::uint32_t ascii_octal_to_mode(std::string_view s) {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      throw std::runtime_error("tree parse: bad mode");
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

oid header_oid(std::string_view line, std::string_view prefix) {
  oid id{};
  if (!from_hex(line.substr(prefix.size()), id)) {
    throw std::runtime_error("object parse: bad id in '" + std::string(prefix) + "' header");
  }
  return id;
}

// "Name <email> 1714412345 +0300" -> 1714412345
std::int64_t signature_time(std::string_view sig) {
  const auto gt = sig.rfind('>');
  if (gt == std::string_view::npos) {
    return 0;
  }
  auto rest = sig.substr(gt + 1);
  while (!rest.empty() && rest.front() == consts::kSpace) {
    rest.remove_prefix(1);
  }
  std::int64_t t = 0;
  std::from_chars(rest.data(), rest.data() + rest.size(), t);
  return t;
}

// Calls fn(line) for each header line, returns the offset of the message.
template <typename Fn> std::size_t for_each_header(std::string_view text, Fn &&fn) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t nl = text.find(consts::kLF, pos);
    const std::string_view line =
        nl == std::string_view::npos ? text.substr(pos) : text.substr(pos, nl - pos);
    if (line.empty()) {
      return nl == std::string_view::npos ? text.size() : nl + 1;
    }
    fn(line);
    if (nl == std::string_view::npos) {
      return text.size();
    }
    pos = nl + 1;
  }
  return text.size();
}

std::string_view as_text(std::span<const std::uint8_t> bytes) {
  return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

} // namespace

bool TreeEntry::is_tree() const { return mode == consts::kModeTree; }
bool TreeEntry::is_gitlink() const { return mode == consts::kModeGitlink; }

CommitView parse_commit(std::span<const std::uint8_t> payload) {
  const std::string_view text = as_text(payload);
  CommitView info{};
  bool have_tree = false;
  const std::size_t body = for_each_header(text, [&](std::string_view line) {
    if (line.starts_with(consts::kTreePrefix)) {
      info.tree = header_oid(line, consts::kTreePrefix);
      have_tree = true;
    } else if (line.starts_with(consts::kParentPrefix)) {
      info.parents.push_back(header_oid(line, consts::kParentPrefix));
    } else if (line.starts_with(consts::kAuthorPrefix)) {
      info.author = std::string(line.substr(consts::kAuthorPrefix.size()));
    } else if (line.starts_with(consts::kCommitterPrefix)) {
      info.committer = std::string(line.substr(consts::kCommitterPrefix.size()));
      info.timestamp = signature_time(info.committer);
    }
  });
  if (!have_tree) {
    throw std::runtime_error("commit parse: missing tree header");
  }
  info.message = std::string(text.substr(body));
  return info;
}

std::vector<TreeEntry> parse_tree(std::span<const std::uint8_t> data) {
  std::vector<TreeEntry> out;
  auto p = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw std::runtime_error("tree parse: expected space");
    }
    const std::uint32_t mode = ascii_octal_to_mode(std::string(p, q_space));

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw std::runtime_error("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw std::runtime_error("tree parse: truncated oid");
    }

    TreeEntry e{};
    e.mode = mode;
    e.name = std::move(name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

TagView parse_tag(std::span<const std::uint8_t> payload) {
  const std::string_view text = as_text(payload);
  TagView tag{};
  bool have_object = false;
  const std::size_t body = for_each_header(text, [&](std::string_view line) {
    if (line.starts_with(consts::kObjectPrefix)) {
      tag.object = header_oid(line, consts::kObjectPrefix);
      have_object = true;
    } else if (line.starts_with("type ")) {
      tag.type = std::string(line.substr(5));
    } else if (line.starts_with("tag ")) {
      tag.name = std::string(line.substr(4));
    }
  });
  if (!have_object) {
    throw std::runtime_error("tag parse: missing object header");
  }
  tag.message = std::string(text.substr(body));
  return tag;
}

std::string format_tree(std::vector<TreeEntry> entries) {
  std::ranges::sort(entries,
                    [](const TreeEntry &a, const TreeEntry &b) { return a.name < b.name; });
  std::string data;
  for (const auto &e : entries) {
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char *>(e.id.data()), consts::kOidRawLen);
  }
  return data;
}

std::string format_commit(const oid &tree, const std::vector<oid> &parents,
                          std::string_view author_line, std::string_view committer_line,
                          std::string_view message) {
  std::string txt;
  txt += consts::kTreePrefix;
  txt += to_hex(tree);
  txt += consts::kLF;
  for (const auto &p : parents) {
    txt += consts::kParentPrefix;
    txt += to_hex(p);
    txt += consts::kLF;
  }
  txt += consts::kAuthorPrefix;
  txt += author_line;
  txt += consts::kLF;
  txt += consts::kCommitterPrefix;
  txt += committer_line;
  txt += "\n\n";
  txt += message;
  return txt;
}

// ObjectStore

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  return dir_ / hex.substr(0, consts::kFanoutDirHexLen) / hex.substr(consts::kFanoutDirHexLen);
}

bool ObjectStore::contains(const oid &id) const { return gfs::exists(path_for_oid(id)); }

Object ObjectStore::get(const oid &id) const {
  const auto path = path_for_oid(id);
  if (!gfs::exists(path)) {
    throw Error(Errc::ObjectMissing, "object " + to_hex(id) + " not found");
  }
  auto store = gfs::z_decompress(gfs::read_file(path));

  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(' '));
  if (it_space == store.end()) {
    throw std::runtime_error("object_store: invalid header");
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>('\0'));
  if (it_nul == store.end()) {
    throw std::runtime_error("object_store: invalid header");
  }
  std::string type(store.begin(), it_space);
  const std::string size_str(it_space + 1, it_nul);
  const std::size_t payload_off = (it_nul - store.begin()) + 1;
  if (std::to_string(store.size() - payload_off) != size_str) {
    throw std::runtime_error("object_store: size mismatch in " + to_hex(id));
  }
  return Object{.type = std::move(type), .data = {store.begin() + payload_off, store.end()}};
}

oid ObjectStore::put(std::string_view type, std::span<const std::uint8_t> payload) const {
  const std::string hdr = object_header(type, payload.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + payload.size());
  store.insert(store.end(), reinterpret_cast<const std::uint8_t *>(hdr.data()),
               reinterpret_cast<const std::uint8_t *>(hdr.data()) + hdr.size());
  store.insert(store.end(), payload.begin(), payload.end());

  const oid store_id = sha1(store);
  const auto path = path_for_oid(store_id);
  if (!gfs::exists(path)) {
    gfs::write_file_atomic(path, gfs::z_compress(store));
  }
  return store_id;
}

void ObjectStore::for_each_id(const std::function<void(const oid &)> &fn) const {
  if (!gfs::exists(dir_)) {
    return;
  }
  for (const auto &fan : std::filesystem::directory_iterator(dir_)) {
    const std::string prefix = fan.path().filename().string();
    if (!fan.is_directory() || prefix.size() != consts::kFanoutDirHexLen) {
      continue;
    }
    for (const auto &file : std::filesystem::directory_iterator(fan.path())) {
      oid id{};
      if (file.is_regular_file() && from_hex(prefix + file.path().filename().string(), id)) {
        fn(id);
      }
    }
  }
}

void ObjectStore::absorb(const ObjectStore &staging) const {
  staging.for_each_id([&](const oid &id) {
    const auto target = path_for_oid(id);
    if (gfs::exists(target)) {
      return;
    }
    gfs::ensure_parent_dir(target);
    std::error_code ec;
    std::filesystem::rename(staging.path_for_oid(id), target, ec);
    if (ec) {
      throw std::runtime_error("promote " + to_hex(id) + " failed: " + ec.message());
    }
  });
  std::filesystem::remove_all(staging.dir());
}

// Quarantine

Quarantine::Quarantine(const ObjectStore &main)
    : main_(main), staging_(gfs::make_temp_dir(main.dir(), consts::kIncomingPrefix)) {}

Quarantine::~Quarantine() { discard(); }

Object Quarantine::get(const oid &id) const {
  if (!done_ && staging_.contains(id)) {
    return staging_.get(id);
  }
  return main_.get(id);
}

bool Quarantine::contains(const oid &id) const {
  return (!done_ && staging_.contains(id)) || main_.contains(id);
}

void Quarantine::promote() {
  if (done_) {
    throw std::logic_error("quarantine already closed");
  }
  main_.absorb(staging_);
  done_ = true;
}

void Quarantine::discard() noexcept {
  if (done_) {
    return;
  }
  done_ = true;
  std::error_code ec;
  std::filesystem::remove_all(staging_.dir(), ec);
}

} // namespace gitdock
