#pragma once
#include "gitdock/consts.hpp"
#include "gitdock/keys.hpp"
#include "gitdock/log.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitdock {

// Ordered: a higher value includes everything below it.
enum class Capability : std::uint8_t { None = 0, Read = 1, ReadWrite = 2 };

std::string_view capability_name(Capability cap);
std::optional<Capability> parse_capability(std::string_view text);

struct IdentityConfig {
  std::string name;
  PublicKey key;
};

// grant: <identity> <pattern> <read|read-write>
struct Grant {
  std::string identity;
  std::string pattern; // fnmatch(3) glob over the normalized repository path
  Capability capability;
};

// Loaded once at startup and never modified afterwards.
struct ServerConfig {
  std::string listen_address = "0.0.0.0";
  int port = consts::kDefaultPort;
  std::filesystem::path repo_root;
  std::size_t round_limit = consts::kDefaultRoundLimit;
  std::chrono::milliseconds round_timeout = consts::kDefaultRoundTimeout;
  std::size_t cache_budget_bytes = consts::kDefaultCacheBudget;
  LogLevel log_level = LogLevel::Info;
  bool allow_guest = false;
  std::vector<IdentityConfig> identities;
  std::vector<std::string> admins;
  std::vector<Grant> grants;
  std::vector<std::string> protected_refs;
};

// "key: value" lines; '#' starts a comment line. Throws std::runtime_error
// naming the offending line.
ServerConfig parse_server_config(std::string_view text);
ServerConfig load_server_config(const std::filesystem::path &path);

} // namespace gitdock
