#pragma once
#include "gitdock/error.hpp"
#include "gitdock/stream.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace gitdock {

/**
 * Frames on an authenticated connection:
 *   u32 channel | u8 type | u32 payload length | payload     (big-endian)
 * `open` and `close` carry no payload; `eof` ends one direction of a
 * channel; `close` ends both.
 */
enum class FrameType : std::uint8_t { Open = 1, Data = 2, Eof = 3, Close = 4 };

inline constexpr std::size_t kFrameHeaderLen = 9;
// Unread bytes a channel may hold before the connection reader waits for it.
inline constexpr std::size_t kChannelInboxLimit = 64U * 1024U * 1024U;

class Connection;

// One logical byte stream of a Connection. Reads block on frames delivered
// by the connection's reader thread; writes go straight to the socket.
class Channel : public ByteStream {
public:
  Channel(Connection &conn, std::uint32_t id, std::chrono::milliseconds read_timeout)
      : conn_(conn), id_(id), timeout_(read_timeout) {}

  [[nodiscard]] std::uint32_t id() const { return id_; }

  // Throws Error(Timeout) after the read timeout, Error(Cancelled) once the
  // transport is gone.
  std::size_t read_some(std::uint8_t *dst, std::size_t n) override;
  void write(std::span<const std::uint8_t> data) override;
  void close_write() override;
  using ByteStream::write;

  // Tell the peer we are done and stop accepting input. Idempotent.
  void close();

  // Reader-thread side
  void deliver(std::vector<std::uint8_t> data);
  void deliver_eof();
  void cancel(const std::string &reason);

private:
  Connection &conn_;
  std::uint32_t id_;
  std::chrono::milliseconds timeout_;

  std::mutex mu_;
  std::condition_variable readable_;
  std::condition_variable drained_;
  std::deque<std::vector<std::uint8_t>> inbox_;
  std::size_t front_off_{0};
  std::size_t buffered_{0};
  bool eof_{false};
  bool closed_{false};
  bool wrote_eof_{false};
  std::optional<std::string> cancelled_;
};

/**
 * Owns the socket after the handshake and multiplexes channels over it. A
 * reader thread demultiplexes incoming frames; any thread may write. When
 * the socket fails or closes, every open channel is cancelled.
 */
class Connection {
public:
  // Invoked on the reader thread for every channel the peer opens; must not
  // block (start a thread for the work).
  using OpenHandler = std::function<void(std::shared_ptr<Channel>)>;

  Connection(UniqueFd fd, std::chrono::milliseconds channel_timeout);
  ~Connection();
  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  // Start the reader thread. Without a handler, peer-opened channels are
  // refused with a close frame.
  void start(OpenHandler on_open = nullptr);

  // Client side: allocate an id and announce it to the peer.
  std::shared_ptr<Channel> open_channel();

  // Throws Error(Cancelled) once the transport is gone.
  void send_frame(std::uint32_t channel, FrameType type, std::span<const std::uint8_t> payload);

  // Tear the transport down; blocked readers on every channel are cancelled.
  void shutdown() noexcept;
  // Block until the reader thread has finished.
  void wait_closed();
  [[nodiscard]] bool closed() const { return closed_.load(); }

private:
  friend class Channel;

  void reader_loop();
  void forget(std::uint32_t id);
  void cancel_all(const std::string &reason);

  UniqueFd fd_;
  std::chrono::milliseconds channel_timeout_;
  std::thread reader_;
  OpenHandler on_open_;

  std::mutex write_mu_;
  std::mutex channels_mu_;
  std::map<std::uint32_t, std::shared_ptr<Channel>> channels_;
  std::uint32_t next_id_{1};
  std::atomic<bool> closed_{false};
};

} // namespace gitdock
