#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace gitdock {

// Raw 20-byte SHA-1 object id (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

// All-zero id; on the wire it means "no object" (ref creation/deletion).
inline constexpr oid kNullOid{};

[[nodiscard]] inline bool is_null(const oid &id) { return id == kNullOid; }

struct OidHash {
  std::size_t operator()(const oid &id) const noexcept {
    // SHA-1 output is uniformly distributed; the leading bytes are enough.
    std::size_t h = 0;
    std::memcpy(&h, id.data(), sizeof(h));
    return h;
  }
};

/**
 * Compute SHA-1 of arbitrary bytes.
 * Object ids hash the full "<type> <size>\\0" + data buffer; see
 * object_header().
 */
oid sha1(std::span<const std::uint8_t> data);

inline oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/**
 * Incremental SHA-1, used for the pack trailer where the input arrives in
 * chunks and is never held in memory at once.
 */
class Sha1Stream {
public:
  Sha1Stream();
  ~Sha1Stream();
  Sha1Stream(const Sha1Stream &) = delete;
  Sha1Stream &operator=(const Sha1Stream &) = delete;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view s) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                         s.size()));
  }
  // Finish and return the digest. The stream cannot be updated afterwards.
  oid finish();

private:
  evp_md_ctx_st *ctx_;
  bool finished_{false};
};

/** Convert binary oid to 40-char lowercase hex. */
std::string to_hex(const oid &id);

/**
 * Parse 40-char hex into binary oid.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, oid &out);

// Same as from_hex, for call sites that prefer an optional.
inline std::optional<oid> parse_oid(std::string_view hex) {
  oid out{};
  if (!from_hex(hex, out)) {
    return std::nullopt;
  }
  return out;
}

// Lowercase hex of arbitrary bytes (nonces, signatures).
std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
bool hex_to_bytes(std::string_view hex, std::string &out);

/**
 * Build the Git object header used for hashing:
 *   "<type> <size>\\0"
 */
inline std::string object_header(std::string_view type, std::size_t size) {
  std::string s;
  s.reserve(type.size() + 1 + 20 + 1);
  s.append(type);
  s.push_back(' ');
  s.append(std::to_string(size));
  s.push_back('\0');
  return s;
}

// Id an object would get in the store, without writing it.
oid object_id(std::string_view type, std::span<const std::uint8_t> payload);

} // namespace gitdock
