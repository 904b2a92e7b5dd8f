#include "gitdock/auth.hpp"

#include "gitdock/consts.hpp"
#include "gitdock/error.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <openssl/crypto.h>

namespace gitdock {

Authenticator::Authenticator(const ServerConfig &config)
    : identities_(config.identities), admins_(config.admins), grants_(config.grants),
      allow_guest_(config.allow_guest) {}

Identity Authenticator::authenticate(const PublicKey &key) const {
  std::size_t match = identities_.size();
  for (std::size_t i = 0; i < identities_.size(); ++i) {
    const int differs =
        CRYPTO_memcmp(identities_[i].key.raw.data(), key.raw.data(), kEd25519KeyLen);
    // First match wins without leaving the loop.
    const bool take = (differs == 0) & (match == identities_.size());
    match = take ? i : match;
  }
  if (match == identities_.size()) {
    throw Error(Errc::Unauthenticated, "public key not recognized");
  }
  Identity who;
  who.name = identities_[match].name;
  who.admin = std::ranges::find(admins_, who.name) != admins_.end();
  return who;
}

Identity Authenticator::guest() const {
  if (!allow_guest_) {
    throw Error(Errc::Unauthenticated, "guest access is disabled");
  }
  Identity who;
  who.name = std::string(consts::kGuestUser);
  who.guest = true;
  return who;
}

Capability Authenticator::capability(const Identity &who, std::string_view repository) const {
  const std::string repo(repository);
  Capability best = Capability::None;
  for (const auto &g : grants_) {
    if (g.identity != who.name) {
      continue;
    }
    if (::fnmatch(g.pattern.c_str(), repo.c_str(), 0) == 0 && g.capability > best) {
      best = g.capability;
    }
  }
  if (who.guest && best > Capability::Read) {
    best = Capability::Read;
  }
  return best;
}

bool ProtectedRefPolicy::allows(const Identity &who, std::string_view /*repository*/,
                                std::string_view refname) const {
  if (who.admin) {
    return true;
  }
  return std::ranges::none_of(protected_, [&](const std::string &p) {
    if (p.ends_with('*')) {
      return refname.starts_with(std::string_view(p).substr(0, p.size() - 1));
    }
    return refname == p;
  });
}

} // namespace gitdock
