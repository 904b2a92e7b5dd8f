#include "gitdock/pack.hpp"

#include "gitdock/consts.hpp"
#include "gitdock/error.hpp"
#include "gitdock/fs.hpp"

#include <array>
#include <cstring>
#include <stdexcept>
#include <string>

namespace gitdock {

namespace {

// Largest object accepted from a peer.
constexpr std::uint32_t kMaxObjectSize = 512U * 1024U * 1024U;

void put_u32(std::uint8_t *p, std::uint32_t v) {
  p[0] = static_cast<std::uint8_t>(v >> 24);
  p[1] = static_cast<std::uint8_t>(v >> 16);
  p[2] = static_cast<std::uint8_t>(v >> 8);
  p[3] = static_cast<std::uint8_t>(v);
}

std::uint32_t get_u32(const std::uint8_t *p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

std::uint8_t type_code(std::string_view type) {
  if (type == consts::kTypeCommit) return 1;
  if (type == consts::kTypeTree) return 2;
  if (type == consts::kTypeBlob) return 3;
  if (type == consts::kTypeTag) return 4;
  throw std::runtime_error("pack: cannot encode object type '" + std::string(type) + "'");
}

std::string_view type_name(std::uint8_t code) {
  switch (code) {
  case 1:
    return consts::kTypeCommit;
  case 2:
    return consts::kTypeTree;
  case 3:
    return consts::kTypeBlob;
  case 4:
    return consts::kTypeTag;
  default:
    throw Error(Errc::Protocol, "pack: unknown object type code " + std::to_string(code));
  }
}

} // namespace

PackWriter::PackWriter(ByteSink sink, std::uint32_t count) : sink_(std::move(sink)), count_(count) {
  std::array<std::uint8_t, 12> hdr{};
  std::memcpy(hdr.data(), consts::kPackMagic.data(), consts::kPackMagic.size());
  put_u32(hdr.data() + 4, consts::kPackVersion);
  put_u32(hdr.data() + 8, count_);
  emit(hdr);
}

void PackWriter::emit(std::span<const std::uint8_t> bytes) {
  digest_.update(bytes);
  sink_(bytes);
}

void PackWriter::add(const Object &obj) {
  if (written_ == count_) {
    throw std::logic_error("pack: more objects than announced");
  }
  const auto compressed = fs::z_compress(obj.data);
  std::array<std::uint8_t, 9> hdr{};
  hdr[0] = type_code(obj.type);
  put_u32(hdr.data() + 1, static_cast<std::uint32_t>(obj.data.size()));
  put_u32(hdr.data() + 5, static_cast<std::uint32_t>(compressed.size()));
  emit(hdr);
  emit(compressed);
  ++written_;
}

void PackWriter::finish() {
  if (written_ != count_) {
    throw std::logic_error("pack: fewer objects than announced");
  }
  const oid trailer = digest_.finish();
  sink_(trailer);
}

PackReader::PackReader(ByteSource source) : source_(std::move(source)) {
  std::array<std::uint8_t, 12> hdr{};
  pull(hdr.data(), hdr.size());
  if (std::memcmp(hdr.data(), consts::kPackMagic.data(), consts::kPackMagic.size()) != 0) {
    throw Error(Errc::Protocol, "pack: bad magic");
  }
  if (get_u32(hdr.data() + 4) != consts::kPackVersion) {
    throw Error(Errc::Protocol, "pack: unsupported version");
  }
  count_ = get_u32(hdr.data() + 8);
}

void PackReader::pull(std::uint8_t *dst, std::size_t n) {
  source_(dst, n);
  digest_.update(std::span<const std::uint8_t>(dst, n));
}

std::optional<Object> PackReader::next() {
  if (done_) {
    return std::nullopt;
  }
  if (read_ == count_) {
    oid trailer{};
    source_(trailer.data(), trailer.size());
    done_ = true;
    if (digest_.finish() != trailer) {
      throw Error(Errc::Protocol, "pack: checksum mismatch");
    }
    return std::nullopt;
  }

  std::array<std::uint8_t, 9> hdr{};
  pull(hdr.data(), hdr.size());
  const std::string_view type = type_name(hdr[0]);
  const std::uint32_t size = get_u32(hdr.data() + 1);
  const std::uint32_t zsize = get_u32(hdr.data() + 5);
  if (size > kMaxObjectSize || zsize > kMaxObjectSize + 1024) {
    throw Error(Errc::Protocol, "pack: object too large");
  }
  std::vector<std::uint8_t> compressed(zsize);
  if (zsize != 0) {
    pull(compressed.data(), compressed.size());
  }
  Object obj{.type = std::string(type), .data = {}};
  try {
    obj.data = fs::z_decompress(compressed, size);
  } catch (const std::runtime_error &e) {
    throw Error(Errc::Protocol, std::string("pack: ") + e.what());
  }
  if (obj.data.size() != size) {
    throw Error(Errc::Protocol, "pack: object size mismatch");
  }
  ++read_;
  return obj;
}

} // namespace gitdock
