#pragma once
#include "gitdock/auth.hpp"
#include "gitdock/cache.hpp"
#include "gitdock/config.hpp"
#include "gitdock/protocol.hpp"
#include "gitdock/resolver.hpp"
#include "gitdock/session.hpp"
#include "gitdock/stream.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace gitdock {

// Accept loop plus the services shared by every session: authenticator,
// resolver, view cache and ref policy.
class Server {
public:
  explicit Server(ServerConfig config);
  ~Server();
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  // Bind the listening socket. port() is valid afterwards (useful with port 0).
  void listen();
  [[nodiscard]] int port() const { return port_; }

  // Accept connections until stop(); one thread per session.
  void run();
  // Stop accepting and close every session. Safe from any thread.
  void stop() noexcept;

  [[nodiscard]] ViewCache &cache() { return cache_; }
  [[nodiscard]] const RepositoryResolver &resolver() const { return resolver_; }
  [[nodiscard]] const EngineContext &context() const { return ctx_; }

private:
  void reap_finished();

  ServerConfig config_;
  Authenticator auth_;
  RepositoryResolver resolver_;
  ViewCache cache_;
  ProtectedRefPolicy policy_;
  EngineContext ctx_;

  UniqueFd listener_;
  int port_{0};
  std::atomic<bool> stopping_{false};

  std::mutex mu_;
  std::uint64_t next_session_{1};
  std::map<std::uint64_t, std::shared_ptr<Session>> sessions_;
  std::map<std::uint64_t, std::thread> threads_;
  std::vector<std::uint64_t> finished_;
};

} // namespace gitdock
