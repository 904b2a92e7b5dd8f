#include "gitdock/resolver.hpp"

#include "gitdock/error.hpp"
#include "gitdock/fs.hpp"
#include "gitdock/log.hpp"
#include "gitdock/repo.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <system_error>

namespace stdfs = std::filesystem;

namespace gitdock {

namespace {

// Same text for both cases so a client cannot tell a forbidden repository
// from a missing one.
constexpr std::string_view kNotFound = "repository not found or access denied";

constexpr std::string_view kStagingDir = ".gitdock-tmp";

} // namespace

RepositoryResolver::RepositoryResolver(const stdfs::path &root) {
  std::error_code ec;
  stdfs::create_directories(root, ec);
  if (ec) {
    throw std::runtime_error("create repository root " + root.string() + ": " + ec.message());
  }
  root_ = stdfs::canonical(root);
}

std::string RepositoryResolver::normalize(std::string_view client_path) const {
  std::string_view p = client_path;
  if (p.starts_with('/')) {
    p.remove_prefix(1);
  }
  if (p.ends_with('/')) {
    p.remove_suffix(1);
  }
  if (p.empty()) {
    throw Error(Errc::InvalidPath, "empty repository path");
  }
  for (const char c : p) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7f || c == '\\') {
      throw Error(Errc::InvalidPath, "invalid character in repository path");
    }
  }
  std::size_t start = 0;
  while (start <= p.size()) {
    const auto slash = p.find('/', start);
    const auto seg = p.substr(start, slash == std::string_view::npos ? p.npos : slash - start);
    if (seg.empty() || seg.front() == '.') {
      throw Error(Errc::InvalidPath, "invalid segment in repository path '" +
                                         std::string(client_path) + "'");
    }
    if (slash == std::string_view::npos) {
      break;
    }
    start = slash + 1;
  }
  return std::string(p);
}

void RepositoryResolver::check_inside_root(const stdfs::path &p) const {
  const auto resolved = stdfs::weakly_canonical(p);
  const auto mm = std::mismatch(root_.begin(), root_.end(), resolved.begin(), resolved.end());
  if (mm.first != root_.end() || resolved == root_) {
    throw Error(Errc::InvalidPath, "repository path escapes the root");
  }
}

ResolvedRepository RepositoryResolver::resolve(std::string_view client_path, Capability cap,
                                               bool create) const {
  ResolvedRepository out;
  out.name = normalize(client_path);
  out.path = root_ / out.name;
  check_inside_root(out.path);

  if (Repository{out.path}.is_initialized()) {
    return out;
  }
  if (!create || cap != Capability::ReadWrite) {
    throw Error(Errc::NotFound, std::string(kNotFound));
  }
  if (fs::exists(out.path) && !stdfs::is_empty(out.path)) {
    if (Repository{out.path}.is_initialized()) {
      return out; // created by a concurrent push since the check above
    }
    // A plain directory (e.g. a namespace holding other repositories).
    throw Error(Errc::NotFound, std::string(kNotFound));
  }

  stdfs::create_directories(out.path.parent_path());
  check_inside_root(out.path);

  // Build the repository privately, then publish it with one rename. A
  // losing racer's rename fails because the winner's directory is non-empty.
  const auto staging = fs::make_temp_dir(root_ / kStagingDir, "new-");
  try {
    Repository{staging}.init();
  } catch (...) {
    std::error_code ec;
    stdfs::remove_all(staging, ec);
    throw;
  }
  if (std::rename(staging.c_str(), out.path.c_str()) == 0) {
    out.created = true;
    log::info("created repository " + out.name);
    return out;
  }
  const int err = errno;
  std::error_code ec;
  stdfs::remove_all(staging, ec);
  if ((err == ENOTEMPTY || err == EEXIST) && Repository{out.path}.is_initialized()) {
    return out;
  }
  throw std::system_error(err, std::generic_category(), "create repository " + out.name);
}

} // namespace gitdock
