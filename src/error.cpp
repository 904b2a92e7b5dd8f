#include "gitdock/error.hpp"

namespace gitdock {

std::string_view errc_name(Errc code) noexcept {
  switch (code) {
  case Errc::Unauthenticated:
    return "unauthenticated";
  case Errc::Forbidden:
    return "forbidden";
  case Errc::InvalidPath:
    return "invalid path";
  case Errc::NotFound:
    return "not found";
  case Errc::ObjectMissing:
    return "object missing";
  case Errc::RefMissing:
    return "ref missing";
  case Errc::IncompleteTransfer:
    return "incomplete transfer";
  case Errc::Conflict:
    return "conflict";
  case Errc::Timeout:
    return "timeout";
  case Errc::Protocol:
    return "protocol error";
  case Errc::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

std::optional<Errc> parse_errc(std::string_view name) noexcept {
  for (auto code = static_cast<std::uint8_t>(Errc::Unauthenticated);
       code <= static_cast<std::uint8_t>(Errc::Cancelled); ++code) {
    if (errc_name(static_cast<Errc>(code)) == name) {
      return static_cast<Errc>(code);
    }
  }
  return std::nullopt;
}

} // namespace gitdock
