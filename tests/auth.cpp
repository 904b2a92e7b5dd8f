#include "gitdock/auth.hpp"
#include "gitdock/config.hpp"
#include "gitdock/error.hpp"
#include "gitdock/keys.hpp"
#include "support.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gitdock;
using test::expect;
using test::expect_error;

namespace {

std::vector<std::uint8_t> bytes_of(std::string_view s) {
  return {s.begin(), s.end()};
}

} // namespace

int main() {
  try {
    // Keys: sign/verify and the OpenSSH text form.
    const auto alice_key = PrivateKey::generate();
    const auto bob_key = PrivateKey::generate();
    const auto msg = bytes_of("nonce bytes");
    const auto sig = alice_key.sign(msg);
    expect(sig.size() == 64, "ed25519 signature length");
    expect(verify_signature(alice_key.public_key(), msg, sig), "own signature verifies");
    expect(!verify_signature(bob_key.public_key(), msg, sig), "other key rejects");
    auto tampered = sig;
    tampered[0] ^= 1;
    expect(!verify_signature(alice_key.public_key(), msg, tampered), "tampered signature rejected");

    auto pub = alice_key.public_key();
    pub.comment = "alice@laptop";
    const std::string line = format_openssh_public_key(pub);
    expect(line.starts_with("ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAI"), "openssh prefix");
    const auto parsed = parse_openssh_public_key(line);
    expect(parsed == pub && parsed.comment == "alice@laptop", "openssh text round trip");
    bool rejected = false;
    try {
      (void)parse_openssh_public_key("ssh-rsa AAAAB3NzaC1yc2E= x");
    } catch (const std::invalid_argument &) {
      rejected = true;
    }
    expect(rejected, "non-ed25519 key rejected");

    test::TempDir tmp("auth");
    alice_key.save(tmp / "id");
    expect(PrivateKey::load(tmp / "id").public_key() == alice_key.public_key(), "PEM round trip");

    // Authenticator
    ServerConfig cfg;
    cfg.repo_root = tmp / "repos";
    cfg.identities.push_back({"alice", alice_key.public_key()});
    cfg.identities.push_back({"bob", bob_key.public_key()});
    cfg.admins.push_back("alice");
    cfg.grants.push_back({"alice", "*", Capability::ReadWrite});
    cfg.grants.push_back({"bob", "team/*", Capability::Read});
    cfg.grants.push_back({"bob", "team/bob-*", Capability::ReadWrite});
    cfg.grants.push_back({"guest", "public/*", Capability::ReadWrite});

    {
      const Authenticator auth(cfg);
      const auto alice = auth.authenticate(alice_key.public_key());
      expect(alice.name == "alice" && alice.admin && !alice.guest, "alice identified as admin");
      const auto bob = auth.authenticate(bob_key.public_key());
      expect(bob.name == "bob" && !bob.admin, "bob identified");
      expect_error(Errc::Unauthenticated,
                   [&] { (void)auth.authenticate(PrivateKey::generate().public_key()); },
                   "unknown key");
      expect_error(Errc::Unauthenticated, [&] { (void)auth.guest(); }, "guests disabled");

      expect(auth.capability(alice, "anything/at/all.git") == Capability::ReadWrite, "alice rw");
      expect(auth.capability(bob, "team/app.git") == Capability::Read, "bob read on team");
      expect(auth.capability(bob, "team/bob-tools.git") == Capability::ReadWrite,
             "highest matching grant wins");
      expect(auth.capability(bob, "other/app.git") == Capability::None, "no grant means none");
    }
    {
      cfg.allow_guest = true;
      const Authenticator auth(cfg);
      const auto guest = auth.guest();
      expect(guest.guest && guest.name == "guest", "guest identity");
      expect(auth.capability(guest, "public/site.git") == Capability::Read, "guest capped at read");
      expect(auth.capability(guest, "team/app.git") == Capability::None, "guest outside grants");
    }

    // Ref protection
    const ProtectedRefPolicy policy({"refs/heads/main", "refs/tags/*"});
    const Identity admin{"alice", true, false};
    const Identity dev{"bob", false, false};
    expect(policy.allows(admin, "r", "refs/heads/main"), "admin bypasses protection");
    expect(!policy.allows(dev, "r", "refs/heads/main"), "exact protected ref");
    expect(!policy.allows(dev, "r", "refs/tags/v1.0"), "protected namespace");
    expect(policy.allows(dev, "r", "refs/heads/main2"), "exact match only");
    expect(policy.allows(dev, "r", "refs/heads/feature"), "unprotected ref");
  } catch (const std::exception &e) {
    std::cerr << "auth: " << e.what() << "\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
