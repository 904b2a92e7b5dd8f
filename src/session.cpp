#include "gitdock/session.hpp"

#include "gitdock/consts.hpp"
#include "gitdock/error.hpp"
#include "gitdock/hash.hpp"
#include "gitdock/log.hpp"
#include "gitdock/pktline.hpp"

#include <stdexcept>
#include <sys/socket.h>

namespace gitdock {

namespace {

constexpr std::string_view kHello = "hello ";
constexpr std::string_view kChallenge = "challenge ";
constexpr std::string_view kSignature = "signature ";
constexpr std::string_view kWelcome = "welcome ";

std::vector<std::uint8_t> signed_message(std::string_view nonce) {
  std::vector<std::uint8_t> msg(consts::kAuthContext.begin(), consts::kAuthContext.end());
  msg.insert(msg.end(), nonce.begin(), nonce.end());
  return msg;
}

std::span<const std::uint8_t> as_bytes(const std::string &s) {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

} // namespace

Identity accept_handshake(ByteStream &io, const Authenticator &auth) {
  PktReader in(io);
  PktWriter out(io);
  const std::string hello = in.read_line();
  if (!hello.starts_with(kHello)) {
    throw Error(Errc::Protocol, "expected hello");
  }
  const std::string_view offered = std::string_view(hello).substr(kHello.size());

  Identity who;
  if (offered == consts::kGuestUser) {
    who = auth.guest();
  } else {
    PublicKey key;
    try {
      key = parse_openssh_public_key(offered);
    } catch (const std::invalid_argument &e) {
      throw Error(Errc::Unauthenticated, std::string("malformed public key: ") + e.what());
    }
    const auto nonce = random_bytes(consts::kNonceLen);
    out.write_line(std::string(kChallenge) + bytes_to_hex(nonce));

    const std::string reply = in.read_line();
    std::string signature;
    if (!reply.starts_with(kSignature) ||
        !hex_to_bytes(std::string_view(reply).substr(kSignature.size()), signature)) {
      throw Error(Errc::Protocol, "expected signature");
    }
    const auto msg = signed_message(
        std::string_view(reinterpret_cast<const char *>(nonce.data()), nonce.size()));
    if (!verify_signature(key, msg, as_bytes(signature))) {
      throw Error(Errc::Unauthenticated, "signature does not verify");
    }
    who = auth.authenticate(key);
  }
  out.write_line(std::string(kWelcome) + who.name);
  return who;
}

std::string offer_handshake(ByteStream &io, const PrivateKey *key) {
  PktReader in(io);
  PktWriter out(io);
  if (key == nullptr) {
    out.write_line(std::string(kHello) + std::string(consts::kGuestUser));
  } else {
    out.write_line(std::string(kHello) + format_openssh_public_key(key->public_key()));
    const auto challenge = in.read_checked();
    std::string nonce;
    if (!challenge || !challenge->starts_with(kChallenge) ||
        !hex_to_bytes(std::string_view(*challenge).substr(kChallenge.size()), nonce) ||
        nonce.size() != consts::kNonceLen) {
      throw Error(Errc::Protocol, "expected challenge");
    }
    const auto sig = key->sign(signed_message(nonce));
    out.write_line(std::string(kSignature) + bytes_to_hex(sig));
  }
  const auto welcome = in.read_checked();
  if (!welcome || !welcome->starts_with(kWelcome)) {
    throw Error(Errc::Protocol, "expected welcome");
  }
  return welcome->substr(kWelcome.size());
}

Session::Session(UniqueFd fd, const EngineContext &ctx, std::chrono::milliseconds round_timeout,
                 std::uint64_t id)
    : ctx_(ctx), round_timeout_(round_timeout), label_("session " + std::to_string(id)),
      fd_(std::move(fd)), raw_fd_(fd_.get()) {}

Session::~Session() {
  stop();
  join_workers();
}

void Session::run() {
  Identity who;
  {
    FdStream io(raw_fd_, round_timeout_);
    try {
      who = accept_handshake(io, ctx_.auth);
    } catch (const Error &e) {
      log::warn(label_ + ": handshake failed: " + std::string(errc_name(e.code())) + ": " +
                e.what());
      if (e.code() != Errc::Cancelled) {
        // Never tell the peer which step of authentication failed.
        const std::string reply =
            e.code() == Errc::Unauthenticated ? std::string(errc_name(e.code())) : error_report(e);
        try {
          PktWriter(io).error(reply);
        } catch (const std::exception &w) {
          log::debug(label_ + ": error reply not delivered: " + w.what());
        }
      }
      return;
    } catch (const std::exception &e) {
      log::warn(label_ + ": handshake failed: " + e.what());
      return;
    }
  }
  log::info(label_ + ": authenticated as " + who.name);

  Connection *conn = nullptr;
  {
    std::lock_guard lock(mu_);
    if (stopping_) {
      return;
    }
    conn_ = std::make_unique<Connection>(std::move(fd_), round_timeout_);
    conn = conn_.get();
  }
  conn->start([this, who](std::shared_ptr<Channel> ch) {
    reap_finished();
    std::lock_guard lock(mu_);
    const std::uint32_t id = ch->id();
    workers_.emplace(id, std::thread([this, who, ch = std::move(ch)] { serve_channel(who, ch); }));
  });
  conn->wait_closed();
  join_workers();
  log::info(label_ + ": closed");
}

void Session::serve_channel(const Identity &who, const std::shared_ptr<Channel> &ch) {
  Engine engine(ctx_, who, *ch, label_ + " channel " + std::to_string(ch->id()));
  engine.run();
  ch->close();
  std::lock_guard lock(mu_);
  finished_.push_back(ch->id());
}

void Session::reap_finished() {
  std::vector<std::thread> done;
  {
    std::lock_guard lock(mu_);
    for (const auto id : finished_) {
      if (auto it = workers_.find(id); it != workers_.end()) {
        done.push_back(std::move(it->second));
        workers_.erase(it);
      }
    }
    finished_.clear();
  }
  for (auto &t : done) {
    t.join();
  }
}

void Session::join_workers() {
  std::map<std::uint32_t, std::thread> workers;
  {
    std::lock_guard lock(mu_);
    workers.swap(workers_);
    finished_.clear();
  }
  for (auto &[id, t] : workers) {
    if (t.joinable()) {
      t.join();
    }
  }
}

std::size_t Session::channel_threads() const {
  std::lock_guard lock(mu_);
  return workers_.size();
}

void Session::stop() noexcept {
  std::lock_guard lock(mu_);
  stopping_ = true;
  if (conn_) {
    conn_->shutdown();
  } else if (fd_) {
    ::shutdown(fd_.get(), SHUT_RDWR);
  }
}

} // namespace gitdock
