#pragma once
#include "gitdock/consts.hpp"
#include "gitdock/hash.hpp"
#include "gitdock/keys.hpp"
#include "gitdock/mux.hpp"
#include "gitdock/protocol.hpp"
#include "gitdock/refs.hpp"
#include "gitdock/repo.hpp"
#include "gitdock/stream.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitdock {

// Haves sent per negotiation round.
inline constexpr std::size_t kHavesPerRound = 32;

struct PushSpec {
  std::string ref;
  oid new_value{};                  // null deletes the ref
  std::optional<oid> expected_old;  // default: the value the server advertised
};

struct PushResult {
  std::vector<RefResult> refs;
  std::size_t objects_sent{0};

  [[nodiscard]] bool all_ok() const;
};

struct FetchResult {
  RefTable refs;                      // as advertised
  std::vector<std::string> updated;   // local refs that changed
  std::size_t objects_received{0};
};

// Client end of the transport. One authenticated connection; every call
// runs on a channel of its own, so calls from several threads proceed
// concurrently.
class Client {
public:
  // `key` null requests guest access.
  static Client connect(const std::string &host, int port, const PrivateKey *key,
                        std::chrono::milliseconds timeout = consts::kDefaultRoundTimeout);

  // Handshake over an already connected socket.
  Client(UniqueFd fd, const PrivateKey *key,
         std::chrono::milliseconds timeout = consts::kDefaultRoundTimeout);

  [[nodiscard]] const std::string &identity() const { return identity_; }

  RefTable ls_remote(std::string_view repository);

  // Download what `local` lacks and mirror the remote refs into it.
  FetchResult fetch(std::string_view repository, Repository &local);

  // Send the objects the server is missing, then ask it to apply `updates`.
  // Per-ref outcomes (Conflict, Rejected) come back in the result; errors
  // that end the channel are thrown as Error.
  PushResult push(std::string_view repository, const Repository &local,
                  const std::vector<PushSpec> &updates);

  // Drop the connection; the server cancels anything still running.
  void close();

private:
  std::string identity_;
  std::unique_ptr<Connection> conn_;
};

} // namespace gitdock
