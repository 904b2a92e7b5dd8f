#pragma once
#include "gitdock/consts.hpp"
#include "gitdock/keys.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace gitdock::cli {

struct Endpoint {
  std::string host;
  int port = consts::kDefaultPort;
};

// "host", "host:port" or "[v6addr]:port"
inline Endpoint parse_endpoint(const std::string &arg) {
  Endpoint ep;
  std::string rest = arg;
  if (rest.starts_with('[')) {
    const auto close = rest.find(']');
    if (close == std::string::npos) {
      throw std::invalid_argument("bad address: " + arg);
    }
    ep.host = rest.substr(1, close - 1);
    rest = rest.substr(close + 1);
    if (rest.starts_with(':')) {
      ep.port = std::stoi(rest.substr(1));
    }
    return ep;
  }
  const auto colon = rest.rfind(':');
  ep.host = rest.substr(0, colon);
  if (colon != std::string::npos) {
    ep.port = std::stoi(rest.substr(colon + 1));
  }
  return ep;
}

// "-" selects guest access.
inline std::optional<PrivateKey> load_key_arg(const std::string &arg) {
  if (arg == "-") {
    return std::nullopt;
  }
  return PrivateKey::load(arg);
}

} // namespace gitdock::cli
