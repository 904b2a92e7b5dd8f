#pragma once
#include "gitdock/hash.hpp"
#include "gitdock/object_store.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>

namespace gitdock {

/**
 * Pack stream layout:
 *   "PACK" | u32 version (2) | u32 object count        (big-endian)
 *   per object: u8 type (1 commit, 2 tree, 3 blob, 4 tag)
 *               u32 uncompressed size | u32 compressed size | zlib bytes
 *   20-byte SHA-1 of everything before it
 * Ids are not transmitted; the receiver recomputes them from the content.
 * Only one object is held in memory at a time on either side.
 */

using ByteSink = std::function<void(std::span<const std::uint8_t>)>;
using ByteSource = std::function<void(std::uint8_t *, std::size_t)>; // fills exactly n bytes

class PackWriter {
public:
  PackWriter(ByteSink sink, std::uint32_t count);

  void add(const Object &obj);
  // Writes the trailer. Throws if fewer or more objects were added than announced.
  void finish();

private:
  void emit(std::span<const std::uint8_t> bytes);

  ByteSink sink_;
  Sha1Stream digest_;
  std::uint32_t count_;
  std::uint32_t written_{0};
};

class PackReader {
public:
  // Reads and checks the header immediately.
  explicit PackReader(ByteSource source);

  [[nodiscard]] std::uint32_t count() const { return count_; }

  // Next object, or nullopt once `count()` objects were read and the
  // trailer checksum matched. Corruption throws Error(Protocol).
  std::optional<Object> next();

private:
  void pull(std::uint8_t *dst, std::size_t n);

  ByteSource source_;
  Sha1Stream digest_;
  std::uint32_t count_{0};
  std::uint32_t read_{0};
  bool done_{false};
};

} // namespace gitdock
