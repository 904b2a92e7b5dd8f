#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gitdock {

enum class Errc : std::uint8_t {
  Unauthenticated,    // no identity matches the presented key; ends the session
  Forbidden,          // capability does not allow the operation
  InvalidPath,        // repository path escapes the root or is malformed
  NotFound,           // repository does not exist
  ObjectMissing,
  RefMissing,
  IncompleteTransfer, // pushed objects reference objects that never arrived
  Conflict,           // ref compare-and-swap lost
  Timeout,            // client stalled past the per-round deadline
  Protocol,           // malformed wire input
  Cancelled,          // transport went away
};

[[nodiscard]] std::string_view errc_name(Errc code) noexcept;
// Inverse of errc_name().
[[nodiscard]] std::optional<Errc> parse_errc(std::string_view name) noexcept;

class Error : public std::runtime_error {
public:
  Error(Errc code, const std::string &what) : std::runtime_error(what), code_(code) {}

  [[nodiscard]] Errc code() const noexcept { return code_; }

  // True when the failure must take the whole session down, not just a channel.
  [[nodiscard]] bool session_fatal() const noexcept {
    return code_ == Errc::Unauthenticated || code_ == Errc::Cancelled;
  }

private:
  Errc code_;
};

} // namespace gitdock
