#pragma once
#include "gitdock/error.hpp"
#include "gitdock/stream.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace gitdock {

// "ERR" payloads carry "<errc name>: <message>" so the peer can rebuild the
// error code; anything else arrives as Errc::Protocol.
std::string error_report(const Error &e);
Error remote_error(std::string_view text);

/**
 * git pkt-line framing: four lowercase hex digits giving the total length
 * (header included), then the payload. "0000" is a flush packet and
 * carries no payload. A payload beginning with "ERR " is an error report
 * from the peer.
 */
class PktReader {
public:
  explicit PktReader(ByteStream &in) : in_(in) {}

  // Next packet payload, or nullopt for a flush packet.
  std::optional<std::string> read();

  // Next data packet with one trailing '\n' removed; a flush packet is a
  // protocol error here.
  std::string read_line();

  // Same as read() with '\n' stripped, and "ERR <code>: <msg>" raised as
  // remote_error() rebuilds it. Used on the client side.
  std::optional<std::string> read_checked();

private:
  ByteStream &in_;
};

class PktWriter {
public:
  explicit PktWriter(ByteStream &out) : out_(out) {}

  void write(std::span<const std::uint8_t> payload);
  void write(std::string_view payload) {
    write(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(payload.data()),
                                        payload.size()));
  }
  // Appends '\n'.
  void write_line(std::string_view line);
  void flush();
  void error(std::string_view message);

private:
  ByteStream &out_;
};

// Byte source over consecutive data packets, ending at a flush packet.
// Pack data travels this way so it is never buffered whole.
class PktDataReader {
public:
  explicit PktDataReader(PktReader &pkts) : pkts_(pkts) {}

  void read_exact(std::uint8_t *dst, std::size_t n);
  // Consume the terminating flush; throws if data remains.
  void expect_end();

private:
  bool fill();

  PktReader &pkts_;
  std::string buf_;
  std::size_t off_{0};
  bool started_{false};
  bool ended_{false};
};

// Byte sink that emits full-size data packets, then a flush on finish().
class PktDataWriter {
public:
  explicit PktDataWriter(PktWriter &pkts) : pkts_(pkts) {}

  void write(std::span<const std::uint8_t> data);
  void finish();

private:
  PktWriter &pkts_;
  std::string buf_;
};

} // namespace gitdock
