#include "gitdock/config.hpp"

#include "gitdock/fs.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

// Split off the first whitespace-delimited word.
std::string_view next_word(std::string_view &sv) {
  while (!sv.empty() && sv.front() == ' ')
    sv.remove_prefix(1);
  const auto sp = sv.find(' ');
  const auto word = sv.substr(0, sp);
  sv = sp == std::string_view::npos ? std::string_view{} : sv.substr(sp + 1);
  return word;
}

template <typename T> T parse_number(std::string_view value, std::string_view key) {
  T out{};
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    throw std::invalid_argument("bad number for '" + std::string(key) + "'");
  }
  return out;
}

bool parse_bool(std::string_view value, std::string_view key) {
  if (value == "yes" || value == "true" || value == "1")
    return true;
  if (value == "no" || value == "false" || value == "0")
    return false;
  throw std::invalid_argument("bad boolean for '" + std::string(key) + "'");
}

} // namespace

namespace gitdock {

std::string_view capability_name(Capability cap) {
  switch (cap) {
  case Capability::None:
    return "none";
  case Capability::Read:
    return "read";
  case Capability::ReadWrite:
    return "read-write";
  }
  return "none";
}

std::optional<Capability> parse_capability(std::string_view text) {
  if (text == "none")
    return Capability::None;
  if (text == "read")
    return Capability::Read;
  if (text == "read-write")
    return Capability::ReadWrite;
  return std::nullopt;
}

ServerConfig parse_server_config(std::string_view text) {
  ServerConfig cfg;
  std::istringstream iss{std::string(text)};
  std::string line;
  int lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    const std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#')
      continue;
    const auto colon = trimmed.find(':');
    if (colon == std::string::npos) {
      throw std::runtime_error("config line " + std::to_string(lineno) + ": expected 'key: value'");
    }
    const std::string key = trim(std::string_view(trimmed).substr(0, colon));
    const std::string value = trim(std::string_view(trimmed).substr(colon + 1));

    try {
      if (key == "listen") {
        cfg.listen_address = value;
      } else if (key == "port") {
        cfg.port = parse_number<int>(value, key);
      } else if (key == "repo_root") {
        cfg.repo_root = value;
      } else if (key == "round_limit") {
        cfg.round_limit = parse_number<std::size_t>(value, key);
      } else if (key == "round_timeout_ms") {
        cfg.round_timeout = std::chrono::milliseconds(parse_number<long>(value, key));
      } else if (key == "cache_budget_bytes") {
        cfg.cache_budget_bytes = parse_number<std::size_t>(value, key);
      } else if (key == "log_level") {
        const auto level = parse_log_level(value);
        if (!level)
          throw std::invalid_argument("unknown log level '" + value + "'");
        cfg.log_level = *level;
      } else if (key == "allow_guest") {
        cfg.allow_guest = parse_bool(value, key);
      } else if (key == "identity") {
        std::string_view rest = value;
        const std::string name(next_word(rest));
        if (name.empty() || rest.empty())
          throw std::invalid_argument("expected 'identity: <name> <public key>'");
        cfg.identities.push_back(IdentityConfig{name, parse_openssh_public_key(rest)});
      } else if (key == "admin") {
        cfg.admins.push_back(value);
      } else if (key == "grant") {
        std::string_view rest = value;
        const std::string who(next_word(rest));
        const std::string pattern(next_word(rest));
        const auto cap = parse_capability(trim(rest));
        if (who.empty() || pattern.empty() || !cap)
          throw std::invalid_argument("expected 'grant: <identity> <pattern> <read|read-write>'");
        cfg.grants.push_back(Grant{who, pattern, *cap});
      } else if (key == "protect") {
        cfg.protected_refs.push_back(value);
      } else {
        throw std::invalid_argument("unknown key '" + key + "'");
      }
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error("config line " + std::to_string(lineno) + ": " + e.what());
    }
  }
  if (cfg.repo_root.empty()) {
    throw std::runtime_error("config: repo_root is required");
  }
  if (cfg.round_limit == 0) {
    throw std::runtime_error("config: round_limit must be positive");
  }
  return cfg;
}

ServerConfig load_server_config(const std::filesystem::path &path) {
  const auto bytes = fs::read_file(path);
  return parse_server_config(std::string_view(reinterpret_cast<const char *>(bytes.data()),
                                              bytes.size()));
}

} // namespace gitdock
