#include "gitdock/refs.hpp"

#include "gitdock/consts.hpp"
#include "gitdock/error.hpp"
#include "gitdock/fs.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>

namespace gitdock {

namespace {

std::string strip_newlines(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
  return s;
}

// Holds "<ref>.lock" for the duration of one update. The lock file is
// created exclusively, so a second writer sees EEXIST.
class RefLock {
public:
  explicit RefLock(std::filesystem::path path) : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd_ < 0 && errno != EEXIST) {
      throw std::system_error(errno, std::generic_category(), "lock " + path_.string());
    }
    held_ = fd_ >= 0;
  }
  ~RefLock() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    if (held_) {
      ::unlink(path_.c_str());
    }
  }
  RefLock(const RefLock &) = delete;
  RefLock &operator=(const RefLock &) = delete;

  [[nodiscard]] bool acquired() const { return fd_ >= 0; }

  // Write the new value and rename the lock over `target`.
  void commit(const std::filesystem::path &target, std::string_view content) {
    const char *p = content.data();
    std::size_t n = content.size();
    while (n != 0) {
      const ssize_t w = ::write(fd_, p, n);
      if (w < 0) {
        if (errno == EINTR)
          continue;
        throw std::system_error(errno, std::generic_category(), "write " + path_.string());
      }
      p += w;
      n -= static_cast<std::size_t>(w);
    }
    if (::fsync(fd_) != 0) {
      throw std::system_error(errno, std::generic_category(), "fsync " + path_.string());
    }
    ::close(fd_);
    fd_ = -1;
    if (::rename(path_.c_str(), target.c_str()) != 0) {
      throw std::system_error(errno, std::generic_category(), "rename " + path_.string());
    }
    held_ = false;
  }

private:
  std::filesystem::path path_;
  int fd_{-1};
  bool held_{false};
};

} // namespace

std::string heads_ref(std::string_view branch) {
  return std::string("refs/heads/") + std::string(branch);
}

bool valid_ref_name(std::string_view name) {
  if (!name.starts_with("refs/") || name.ends_with("/") || name.ends_with(".") ||
      name.ends_with(consts::kLockSuffix)) {
    return false;
  }
  if (name.find("..") != std::string_view::npos || name.find("//") != std::string_view::npos ||
      name.find("@{") != std::string_view::npos || name.find("/.") != std::string_view::npos ||
      name.find(consts::kTmpMarker) != std::string_view::npos) {
    return false;
  }
  for (const char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7f || c == ' ' || c == '~' || c == '^' || c == ':' || c == '?' ||
        c == '*' || c == '[' || c == '\\') {
      return false;
    }
  }
  return true;
}

std::filesystem::path RefStore::ref_path(std::string_view refname) const {
  return git_dir_ / std::string(refname);
}

std::optional<oid> RefStore::find(std::string_view refname) const {
  if (!valid_ref_name(refname)) {
    return std::nullopt;
  }
  const auto p = ref_path(refname);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) {
    return std::nullopt;
  }
  auto bytes = fs::read_file(p);
  const std::string s = strip_newlines(std::string(bytes.begin(), bytes.end()));
  oid id{};
  if (!from_hex(s, id)) {
    throw std::runtime_error("corrupt ref " + std::string(refname));
  }
  return id;
}

oid RefStore::resolve(std::string_view refname) const {
  std::string name(refname);
  if (name == consts::kHeadFile) {
    const auto head = read_head();
    if (!head || !head->starts_with(consts::kRefPrefix)) {
      if (head) {
        if (auto id = parse_oid(*head)) {
          return *id;
        }
      }
      throw Error(Errc::RefMissing, "HEAD is not set");
    }
    name = head->substr(consts::kRefPrefix.size());
  }
  if (auto id = find(name)) {
    return *id;
  }
  throw Error(Errc::RefMissing, "ref " + name + " not found");
}

RefTable RefStore::list() const {
  RefTable out;
  const auto refs_dir = git_dir_ / consts::kRefsDir;
  if (!fs::exists(refs_dir)) {
    return out;
  }
  for (const auto &entry : std::filesystem::recursive_directory_iterator(refs_dir)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    const std::string name =
        std::filesystem::relative(entry.path(), git_dir_).generic_string();
    if (!valid_ref_name(name)) {
      continue;
    }
    // A ref deleted between listing and reading is simply absent.
    if (auto id = find(name)) {
      out.emplace(name, *id);
    }
  }
  return out;
}

RefUpdate RefStore::compare_and_swap(std::string_view refname, const oid &expected_old,
                                     const oid &new_value) {
  if (!valid_ref_name(refname)) {
    throw Error(Errc::Protocol, "invalid ref name '" + std::string(refname) + "'");
  }
  const auto target = ref_path(refname);
  fs::ensure_parent_dir(target);

  auto lock_path = target;
  lock_path += consts::kLockSuffix;
  RefLock lock{lock_path};
  if (!lock.acquired()) {
    return RefUpdate::Conflict;
  }

  const auto current = find(refname);
  const oid current_value = current.value_or(kNullOid);
  if (current_value != expected_old) {
    return RefUpdate::Conflict;
  }

  if (is_null(new_value)) {
    std::error_code ec;
    std::filesystem::remove(target, ec);
    if (ec) {
      throw std::runtime_error("delete ref " + std::string(refname) + ": " + ec.message());
    }
    return RefUpdate::Ok;
  }
  lock.commit(target, to_hex(new_value) + "\n");
  return RefUpdate::Ok;
}

std::optional<std::string> RefStore::read_head() const {
  const auto p = git_dir_ / consts::kHeadFile;
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  auto bytes = fs::read_file(p);
  return strip_newlines(std::string(bytes.begin(), bytes.end()));
}

void RefStore::set_head_symbolic(std::string_view refname) {
  fs::write_file_atomic(git_dir_ / consts::kHeadFile,
                        std::string(consts::kRefPrefix) + std::string(refname) + "\n");
}

} // namespace gitdock
