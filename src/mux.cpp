#include "gitdock/mux.hpp"

#include "gitdock/consts.hpp"
#include "gitdock/log.hpp"

#include <algorithm>
#include <array>
#include <sys/socket.h>
#include <system_error>

namespace gitdock {

namespace {

void put_u32(std::uint8_t *p, std::uint32_t v) {
  p[0] = static_cast<std::uint8_t>(v >> 24);
  p[1] = static_cast<std::uint8_t>(v >> 16);
  p[2] = static_cast<std::uint8_t>(v >> 8);
  p[3] = static_cast<std::uint8_t>(v);
}

std::uint32_t get_u32(const std::uint8_t *p) {
  return (std::uint32_t{p[0]} << 24) | (std::uint32_t{p[1]} << 16) | (std::uint32_t{p[2]} << 8) |
         std::uint32_t{p[3]};
}

} // namespace

// Channel

std::size_t Channel::read_some(std::uint8_t *dst, std::size_t n) {
  std::unique_lock lock(mu_);
  const auto ready = [&] { return !inbox_.empty() || eof_ || cancelled_ || closed_; };
  if (timeout_.count() > 0) {
    if (!readable_.wait_for(lock, timeout_, ready)) {
      throw Error(Errc::Timeout, "channel " + std::to_string(id_) + ": peer stalled");
    }
  } else {
    readable_.wait(lock, ready);
  }
  if (!inbox_.empty()) {
    auto &front = inbox_.front();
    const std::size_t take = std::min(n, front.size() - front_off_);
    std::copy_n(front.data() + front_off_, take, dst);
    front_off_ += take;
    buffered_ -= take;
    if (front_off_ == front.size()) {
      inbox_.pop_front();
      front_off_ = 0;
    }
    drained_.notify_all();
    return take;
  }
  if (cancelled_) {
    throw Error(Errc::Cancelled, *cancelled_);
  }
  return 0;
}

void Channel::write(std::span<const std::uint8_t> data) {
  while (!data.empty()) {
    const std::size_t take = std::min<std::size_t>(data.size(), consts::kMaxFramePayload);
    conn_.send_frame(id_, FrameType::Data, data.first(take));
    data = data.subspan(take);
  }
}

void Channel::close_write() {
  {
    std::lock_guard lock(mu_);
    if (wrote_eof_) {
      return;
    }
    wrote_eof_ = true;
  }
  conn_.send_frame(id_, FrameType::Eof, {});
}

void Channel::close() {
  {
    std::lock_guard lock(mu_);
    if (closed_) {
      return;
    }
    closed_ = true;
    inbox_.clear();
    buffered_ = 0;
  }
  readable_.notify_all();
  drained_.notify_all();
  conn_.forget(id_);
  if (!conn_.closed()) {
    try {
      conn_.send_frame(id_, FrameType::Close, {});
    } catch (const Error &e) {
      log::debug("channel " + std::to_string(id_) + ": close not sent: " + e.what());
    }
  }
}

void Channel::deliver(std::vector<std::uint8_t> data) {
  std::unique_lock lock(mu_);
  // Back-pressure: the connection reader waits until this channel catches up.
  drained_.wait(lock, [&] { return buffered_ < kChannelInboxLimit || closed_ || cancelled_; });
  if (closed_ || cancelled_ || data.empty()) {
    return;
  }
  buffered_ += data.size();
  inbox_.push_back(std::move(data));
  readable_.notify_all();
}

void Channel::deliver_eof() {
  {
    std::lock_guard lock(mu_);
    eof_ = true;
  }
  readable_.notify_all();
}

void Channel::cancel(const std::string &reason) {
  {
    std::lock_guard lock(mu_);
    if (!cancelled_) {
      cancelled_ = reason;
    }
  }
  readable_.notify_all();
  drained_.notify_all();
}

// Connection

Connection::Connection(UniqueFd fd, std::chrono::milliseconds channel_timeout)
    : fd_(std::move(fd)), channel_timeout_(channel_timeout) {}

Connection::~Connection() {
  shutdown();
  if (reader_.joinable()) {
    reader_.join();
  }
}

void Connection::start(OpenHandler on_open) {
  on_open_ = std::move(on_open);
  reader_ = std::thread([this] { reader_loop(); });
}

std::shared_ptr<Channel> Connection::open_channel() {
  std::shared_ptr<Channel> ch;
  {
    std::lock_guard lock(channels_mu_);
    const std::uint32_t id = next_id_;
    next_id_ += 2; // the opening side always uses odd ids
    ch = std::make_shared<Channel>(*this, id, channel_timeout_);
    channels_.emplace(id, ch);
  }
  send_frame(ch->id(), FrameType::Open, {});
  return ch;
}

void Connection::send_frame(std::uint32_t channel, FrameType type,
                            std::span<const std::uint8_t> payload) {
  std::array<std::uint8_t, kFrameHeaderLen> hdr{};
  put_u32(hdr.data(), channel);
  hdr[4] = static_cast<std::uint8_t>(type);
  put_u32(hdr.data() + 5, static_cast<std::uint32_t>(payload.size()));

  std::lock_guard lock(write_mu_);
  if (closed_) {
    throw Error(Errc::Cancelled, "connection closed");
  }
  FdStream out(fd_.get());
  try {
    out.write(hdr);
    if (!payload.empty()) {
      out.write(payload);
    }
  } catch (const std::system_error &e) {
    throw Error(Errc::Cancelled, std::string("connection lost: ") + e.what());
  }
}

void Connection::shutdown() noexcept {
  if (!closed_.exchange(true) && fd_) {
    ::shutdown(fd_.get(), SHUT_RDWR);
  }
}

void Connection::wait_closed() {
  if (reader_.joinable()) {
    reader_.join();
  }
}

void Connection::forget(std::uint32_t id) {
  std::lock_guard lock(channels_mu_);
  channels_.erase(id);
}

void Connection::cancel_all(const std::string &reason) {
  std::map<std::uint32_t, std::shared_ptr<Channel>> channels;
  {
    std::lock_guard lock(channels_mu_);
    channels.swap(channels_);
  }
  for (auto &[id, ch] : channels) {
    ch->cancel(reason);
  }
}

void Connection::reader_loop() {
  FdStream in(fd_.get());
  std::string reason = "connection closed by peer";
  try {
    for (;;) {
      std::array<std::uint8_t, kFrameHeaderLen> hdr{};
      if (in.read_some(hdr.data(), 1) == 0) {
        break;
      }
      read_exact(in, hdr.data() + 1, hdr.size() - 1);
      const std::uint32_t id = get_u32(hdr.data());
      const auto type = static_cast<FrameType>(hdr[4]);
      const std::uint32_t len = get_u32(hdr.data() + 5);
      if (len > consts::kMaxFramePayload) {
        throw Error(Errc::Protocol, "frame payload too large");
      }
      std::vector<std::uint8_t> payload(len);
      if (len > 0) {
        read_exact(in, payload.data(), len);
      }

      std::shared_ptr<Channel> ch;
      {
        std::lock_guard lock(channels_mu_);
        if (auto it = channels_.find(id); it != channels_.end()) {
          ch = it->second;
        }
      }
      switch (type) {
      case FrameType::Open:
        if (ch || !on_open_) {
          log::warn("refusing channel " + std::to_string(id));
          send_frame(id, FrameType::Close, {});
          break;
        }
        ch = std::make_shared<Channel>(*this, id, channel_timeout_);
        {
          std::lock_guard lock(channels_mu_);
          channels_.emplace(id, ch);
        }
        on_open_(ch);
        break;
      case FrameType::Data:
        if (ch) {
          ch->deliver(std::move(payload));
        }
        break;
      case FrameType::Eof:
        if (ch) {
          ch->deliver_eof();
        }
        break;
      case FrameType::Close:
        if (ch) {
          forget(id);
          ch->cancel("channel closed by peer");
        }
        break;
      default:
        throw Error(Errc::Protocol, "unknown frame type " + std::to_string(hdr[4]));
      }
    }
  } catch (const std::exception &e) {
    if (!closed_) {
      log::warn(std::string("connection: ") + e.what());
    }
    reason = e.what();
  }
  closed_ = true;
  // Wake writers blocked in send(); nothing more can be delivered.
  ::shutdown(fd_.get(), SHUT_RDWR);
  cancel_all(reason);
}

} // namespace gitdock
