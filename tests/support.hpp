#pragma once
#include "gitdock/consts.hpp"
#include "gitdock/error.hpp"
#include "gitdock/hash.hpp"
#include "gitdock/repo.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace gitdock::test {

// Scratch directory under the system temp dir, removed on scope exit.
class TempDir {
public:
  explicit TempDir(const std::string &tag)
      : path_(std::filesystem::temp_directory_path() /
              ("gitdock_" + tag + "_" + std::to_string(std::random_device{}()))) {
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  std::filesystem::path operator/(const std::string &rel) const { return path_ / rel; }

private:
  std::filesystem::path path_;
};

inline void expect(bool cond, const std::string &what) {
  if (!cond) {
    throw std::runtime_error("expectation failed: " + what);
  }
}

// Runs `fn` and checks that it throws gitdock::Error with `code`.
inline void expect_error(Errc code, const std::function<void()> &fn, const std::string &what) {
  try {
    fn();
  } catch (const Error &e) {
    if (e.code() != code) {
      throw std::runtime_error(what + ": got '" + std::string(errc_name(e.code())) + "' (" +
                               e.what() + "), expected '" + std::string(errc_name(code)) + "'");
    }
    return;
  }
  throw std::runtime_error(what + ": no error, expected '" + std::string(errc_name(code)) + "'");
}

inline std::string signature(std::int64_t when) {
  return "Test User <test@example.com> " + std::to_string(when) + " +0000";
}

// Commit holding one file per (name, content) pair.
inline oid commit_files(const Repository &repo,
                        const std::vector<std::pair<std::string, std::string>> &files,
                        const std::vector<oid> &parents, const std::string &message,
                        std::int64_t when = 1714412345) {
  std::vector<TreeEntry> entries;
  for (const auto &[name, content] : files) {
    entries.push_back(TreeEntry{consts::kModeFile, name, repo.write_blob(content)});
  }
  const oid tree = repo.write_tree(entries);
  return repo.write_commit(tree, parents, signature(when), signature(when), message + "\n");
}

} // namespace gitdock::test
