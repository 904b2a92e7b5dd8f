#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct evp_pkey_st;

namespace gitdock {

inline constexpr std::string_view kEd25519KeyType = "ssh-ed25519";
inline constexpr std::size_t kEd25519KeyLen = 32;

// An ed25519 public key as written in authorized_keys / .pub files.
struct PublicKey {
  std::array<std::uint8_t, kEd25519KeyLen> raw{};
  std::string comment;

  bool operator==(const PublicKey &other) const { return raw == other.raw; }
};

// "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAI... comment"; throws std::invalid_argument.
PublicKey parse_openssh_public_key(std::string_view line);
std::string format_openssh_public_key(const PublicKey &key);

bool verify_signature(const PublicKey &key, std::span<const std::uint8_t> message,
                      std::span<const std::uint8_t> signature);

std::vector<std::uint8_t> random_bytes(std::size_t n);

// Owns an OpenSSL ed25519 private key.
class PrivateKey {
public:
  static PrivateKey generate();
  // PEM (PKCS#8) file, as written by save() or `openssl genpkey -algorithm ed25519`.
  static PrivateKey load(const std::filesystem::path &path);
  void save(const std::filesystem::path &path) const;

  [[nodiscard]] PublicKey public_key() const;
  [[nodiscard]] std::vector<std::uint8_t> sign(std::span<const std::uint8_t> message) const;

private:
  struct Deleter {
    void operator()(evp_pkey_st *p) const noexcept;
  };
  explicit PrivateKey(evp_pkey_st *pkey) : pkey_(pkey) {}

  std::unique_ptr<evp_pkey_st, Deleter> pkey_;
};

} // namespace gitdock
