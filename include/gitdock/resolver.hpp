#pragma once
#include "gitdock/config.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace gitdock {

struct ResolvedRepository {
  std::string name;            // normalized path, e.g. "team/app.git"
  std::filesystem::path path;  // location under the repository root
  bool created{false};         // this call created it
};

// Maps client-supplied repository paths to bare repositories under one root.
class RepositoryResolver {
public:
  // Creates `root` if missing.
  explicit RepositoryResolver(const std::filesystem::path &root);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

  // Throws Error(InvalidPath) for traversal segments, hidden segments,
  // control characters or an empty path.
  [[nodiscard]] std::string normalize(std::string_view client_path) const;

  /**
   * Locate the repository, creating an empty one when it is missing,
   * `create` is set and `cap` is ReadWrite. Creation is atomic: exactly one
   * of several concurrent creators gets `created == true`.
   * Throws InvalidPath (escapes the root, also through symlinks) or
   * NotFound.
   */
  ResolvedRepository resolve(std::string_view client_path, Capability cap, bool create) const;

private:
  void check_inside_root(const std::filesystem::path &p) const;

  std::filesystem::path root_;
};

} // namespace gitdock
