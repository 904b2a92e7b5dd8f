#pragma once
#include "gitdock/auth.hpp"
#include "gitdock/keys.hpp"
#include "gitdock/mux.hpp"
#include "gitdock/protocol.hpp"
#include "gitdock/stream.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace gitdock {

/**
 * Handshake on the raw connection, in pkt-lines:
 *   C: hello <openssh public key>        (or "hello guest")
 *   S: challenge <hex of 32 random bytes>
 *   C: signature <hex ed25519 signature of kAuthContext + nonce>
 *   S: welcome <identity>                (or "ERR unauthenticated")
 * Guests skip the challenge.
 */
Identity accept_handshake(ByteStream &io, const Authenticator &auth);

// Client side; `key` null requests guest access. Returns the identity the
// server welcomed us as.
std::string offer_handshake(ByteStream &io, const PrivateKey *key);

// One accepted connection: handshake, then one engine thread per channel
// until the transport closes.
class Session {
public:
  Session(UniqueFd fd, const EngineContext &ctx, std::chrono::milliseconds round_timeout,
          std::uint64_t id);
  ~Session();
  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  // Blocks until the peer disconnects (or stop()) and every channel has
  // finished.
  void run();
  // Close the transport; running channels are cancelled.
  void stop() noexcept;

  // Channel threads started and not yet joined.
  [[nodiscard]] std::size_t channel_threads() const;

private:
  void serve_channel(const Identity &who, const std::shared_ptr<Channel> &ch);
  // Join the channel threads that have finished.
  void reap_finished();
  void join_workers();

  const EngineContext &ctx_;
  std::chrono::milliseconds round_timeout_;
  std::string label_;
  UniqueFd fd_;
  int raw_fd_;

  mutable std::mutex mu_;
  bool stopping_{false};
  std::unique_ptr<Connection> conn_;
  std::map<std::uint32_t, std::thread> workers_;
  std::vector<std::uint32_t> finished_;
};

} // namespace gitdock
