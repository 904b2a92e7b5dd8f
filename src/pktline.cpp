#include "gitdock/pktline.hpp"

#include "gitdock/consts.hpp"
#include "gitdock/error.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <stdexcept>

namespace gitdock {

namespace {

constexpr std::string_view kErrPrefix = "ERR ";

void strip_lf(std::string &s) {
  if (!s.empty() && s.back() == consts::kLF) {
    s.pop_back();
  }
}

} // namespace

Error remote_error(std::string_view text) {
  const auto colon = text.find(": ");
  if (const auto code = parse_errc(text.substr(0, colon))) {
    return Error(*code, std::string(colon == std::string_view::npos ? text
                                                                    : text.substr(colon + 2)));
  }
  return Error(Errc::Protocol, std::string(text));
}

std::string error_report(const Error &e) {
  return std::string(errc_name(e.code())) + ": " + e.what();
}

std::optional<std::string> PktReader::read() {
  std::array<std::uint8_t, consts::kPktHeaderLen> hdr{};
  read_exact(in_, hdr.data(), hdr.size());
  const auto *first = reinterpret_cast<const char *>(hdr.data());
  unsigned len = 0;
  const auto [ptr, ec] = std::from_chars(first, first + hdr.size(), len, 16);
  if (ec != std::errc{} || ptr != first + hdr.size()) {
    throw Error(Errc::Protocol, "bad pkt-line length header");
  }
  if (len == 0) {
    return std::nullopt;
  }
  if (len < consts::kPktHeaderLen || len > consts::kPktMaxPayload + consts::kPktHeaderLen) {
    throw Error(Errc::Protocol, "pkt-line length out of range");
  }
  std::string payload(len - consts::kPktHeaderLen, '\0');
  if (!payload.empty()) {
    read_exact(in_, reinterpret_cast<std::uint8_t *>(payload.data()), payload.size());
  }
  return payload;
}

std::string PktReader::read_line() {
  auto pkt = read();
  if (!pkt) {
    throw Error(Errc::Protocol, "unexpected flush packet");
  }
  strip_lf(*pkt);
  return std::move(*pkt);
}

std::optional<std::string> PktReader::read_checked() {
  auto pkt = read();
  if (!pkt) {
    return std::nullopt;
  }
  strip_lf(*pkt);
  if (std::string_view(*pkt).starts_with(kErrPrefix)) {
    throw remote_error(std::string_view(*pkt).substr(kErrPrefix.size()));
  }
  return pkt;
}

void PktWriter::write(std::span<const std::uint8_t> payload) {
  if (payload.size() > consts::kPktMaxPayload) {
    throw std::length_error("pkt-line payload too large");
  }
  std::array<char, consts::kPktHeaderLen + 1> hdr{};
  std::snprintf(hdr.data(), hdr.size(), "%04x",
                static_cast<unsigned>(payload.size() + consts::kPktHeaderLen));
  out_.write(std::string_view(hdr.data(), consts::kPktHeaderLen));
  out_.write(payload);
}

void PktWriter::write_line(std::string_view line) {
  std::string s(line);
  s.push_back(consts::kLF);
  write(s);
}

void PktWriter::flush() { out_.write(std::string_view("0000")); }

void PktWriter::error(std::string_view message) {
  write_line(std::string(kErrPrefix) + std::string(message));
}

bool PktDataReader::fill() {
  if (ended_) {
    return false;
  }
  auto pkt = pkts_.read();
  if (!pkt) {
    ended_ = true;
    return false;
  }
  // The sender may fail before the first byte of data; later packets are
  // opaque.
  if (!started_ && std::string_view(*pkt).starts_with(kErrPrefix)) {
    strip_lf(*pkt);
    throw remote_error(std::string_view(*pkt).substr(kErrPrefix.size()));
  }
  started_ = true;
  buf_ = std::move(*pkt);
  off_ = 0;
  return true;
}

void PktDataReader::read_exact(std::uint8_t *dst, std::size_t n) {
  while (n > 0) {
    if (off_ == buf_.size() && !fill()) {
      throw Error(Errc::Protocol, "pack data ended early");
    }
    const std::size_t take = std::min(n, buf_.size() - off_);
    std::copy_n(buf_.data() + off_, take, reinterpret_cast<char *>(dst));
    off_ += take;
    dst += take;
    n -= take;
  }
}

void PktDataReader::expect_end() {
  if (off_ != buf_.size() || fill()) {
    throw Error(Errc::Protocol, "trailing data after pack");
  }
}

void PktDataWriter::write(std::span<const std::uint8_t> data) {
  buf_.append(reinterpret_cast<const char *>(data.data()), data.size());
  while (buf_.size() >= consts::kPktMaxPayload) {
    pkts_.write(std::string_view(buf_).substr(0, consts::kPktMaxPayload));
    buf_.erase(0, consts::kPktMaxPayload);
  }
}

void PktDataWriter::finish() {
  if (!buf_.empty()) {
    pkts_.write(buf_);
    buf_.clear();
  }
  pkts_.flush();
}

} // namespace gitdock
