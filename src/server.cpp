#include "gitdock/server.hpp"

#include "gitdock/log.hpp"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <system_error>

namespace gitdock {

Server::Server(ServerConfig config)
    : config_(std::move(config)), auth_(config_), resolver_(config_.repo_root),
      cache_(config_.cache_budget_bytes), policy_(config_.protected_refs),
      ctx_{auth_, resolver_, cache_, policy_, config_.round_limit} {}

Server::~Server() {
  stop();
  std::map<std::uint64_t, std::thread> threads;
  {
    std::lock_guard lock(mu_);
    threads.swap(threads_);
  }
  for (auto &[id, t] : threads) {
    t.join();
  }
}

void Server::listen() {
  listener_ = listen_tcp(config_.listen_address, config_.port);
  port_ = bound_port(listener_.get());
  log::info("listening on " + config_.listen_address + ":" + std::to_string(port_) +
            ", repositories under " + resolver_.root().string());
}

void Server::run() {
  if (!listener_) {
    listen();
  }
  while (!stopping_) {
    const int fd = ::accept4(listener_.get(), nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
      if (stopping_) {
        break;
      }
      if (errno == EINTR || errno == ECONNABORTED || errno == EMFILE || errno == ENFILE) {
        log::warn(std::string("accept: ") + std::strerror(errno));
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "accept");
    }
    reap_finished();

    std::lock_guard lock(mu_);
    if (stopping_) {
      UniqueFd discard{fd};
      break;
    }
    const std::uint64_t id = next_session_++;
    auto session = std::make_shared<Session>(UniqueFd{fd}, ctx_, config_.round_timeout, id);
    sessions_.emplace(id, session);
    threads_.emplace(id, std::thread([this, id, session] {
                       try {
                         session->run();
                       } catch (const std::exception &e) {
                         log::error("session " + std::to_string(id) + ": " + e.what());
                       }
                       std::lock_guard done(mu_);
                       sessions_.erase(id);
                       finished_.push_back(id);
                     }));
  }
  log::info("server stopped");
}

void Server::reap_finished() {
  std::vector<std::thread> done;
  {
    std::lock_guard lock(mu_);
    for (const auto id : finished_) {
      if (auto it = threads_.find(id); it != threads_.end()) {
        done.push_back(std::move(it->second));
        threads_.erase(it);
      }
    }
    finished_.clear();
  }
  for (auto &t : done) {
    t.join();
  }
}

void Server::stop() noexcept {
  if (stopping_.exchange(true)) {
    return;
  }
  if (listener_) {
    ::shutdown(listener_.get(), SHUT_RDWR);
  }
  std::lock_guard lock(mu_);
  for (auto &[id, session] : sessions_) {
    session->stop();
  }
}

} // namespace gitdock
