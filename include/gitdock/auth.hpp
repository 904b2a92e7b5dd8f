#pragma once
#include "gitdock/config.hpp"
#include "gitdock/keys.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace gitdock {

struct Identity {
  std::string name;
  bool admin{false};
  bool guest{false};
};

// Pure lookups against the identity table and grants loaded at startup.
class Authenticator {
public:
  explicit Authenticator(const ServerConfig &config);

  // Throws Error(Unauthenticated) when no identity holds `key`. Every
  // configured key is compared, with a constant-time compare, whatever
  // matches first.
  [[nodiscard]] Identity authenticate(const PublicKey &key) const;

  // The keyless guest identity; Error(Unauthenticated) if guests are disabled.
  [[nodiscard]] Identity guest() const;

  // Highest grant whose pattern matches `repository`, None when nothing
  // matches. Guests never get more than Read.
  [[nodiscard]] Capability capability(const Identity &who, std::string_view repository) const;

private:
  std::vector<IdentityConfig> identities_;
  std::vector<std::string> admins_;
  std::vector<Grant> grants_;
  bool allow_guest_;
};

// Per-ref update policy consulted while finalizing a push.
class RefPolicy {
public:
  virtual ~RefPolicy() = default;
  [[nodiscard]] virtual bool allows(const Identity &who, std::string_view repository,
                                    std::string_view refname) const = 0;
};

// Refs listed under "protect:" may only be updated by admins. A trailing
// '*' protects a whole namespace ("refs/tags/*").
class ProtectedRefPolicy : public RefPolicy {
public:
  explicit ProtectedRefPolicy(std::vector<std::string> protected_refs)
      : protected_(std::move(protected_refs)) {}

  [[nodiscard]] bool allows(const Identity &who, std::string_view repository,
                            std::string_view refname) const override;

private:
  std::vector<std::string> protected_;
};

} // namespace gitdock
