#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace gitdock {

// Ordered, reliable, bidirectional byte stream: a raw socket during the
// handshake, a multiplexed channel afterwards.
class ByteStream {
public:
  virtual ~ByteStream() = default;

  // Blocks until at least one byte is available; returns 0 at end of stream.
  virtual std::size_t read_some(std::uint8_t *dst, std::size_t n) = 0;
  virtual void write(std::span<const std::uint8_t> data) = 0;
  // Signal end of our outgoing direction.
  virtual void close_write() = 0;

  void write(std::string_view s) {
    write(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                        s.size()));
  }
};

// Fill `dst` completely; throws Error(Protocol) if the stream ends first.
void read_exact(ByteStream &in, std::uint8_t *dst, std::size_t n);

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
  auto operator=(UniqueFd &&other) noexcept -> UniqueFd & {
    if (this != &other) {
      close_if_open();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  ~UniqueFd() { close_if_open(); }

  [[nodiscard]] auto valid() const noexcept -> bool { return fd_ != -1; }
  [[nodiscard]] explicit operator bool() const noexcept { return valid(); }
  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  void reset(int fd = -1) noexcept {
    if (fd_ != fd) {
      close_if_open();
      fd_ = fd;
    }
  }

private:
  int fd_{-1};

  void close_if_open() noexcept;
};

// Blocking socket stream. A non-zero timeout bounds every read
// (Error(Timeout) when it expires).
class FdStream : public ByteStream {
public:
  explicit FdStream(int fd, std::chrono::milliseconds read_timeout = std::chrono::milliseconds{0})
      : fd_(fd), timeout_(read_timeout) {}

  std::size_t read_some(std::uint8_t *dst, std::size_t n) override;
  void write(std::span<const std::uint8_t> data) override;
  void close_write() override;
  using ByteStream::write;

private:
  int fd_;
  std::chrono::milliseconds timeout_;
};

[[nodiscard]] auto connect_tcp(const std::string &host, int port) -> UniqueFd;

// Bound, listening socket. Port 0 picks an ephemeral port; see bound_port().
[[nodiscard]] auto listen_tcp(const std::string &address, int port, int backlog = 64)
    -> UniqueFd;
[[nodiscard]] int bound_port(int fd);

} // namespace gitdock
