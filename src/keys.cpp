#include "gitdock/keys.hpp"

#include "gitdock/fs.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>

#include <array>
#include <cstring>
#include <stdexcept>

namespace gitdock {

namespace {

std::string openssl_error(std::string_view what) {
  const unsigned long code = ERR_get_error();
  std::string msg(what);
  if (code != 0) {
    std::array<char, 256> buf{};
    ERR_error_string_n(code, buf.data(), buf.size());
    msg += ": ";
    msg += buf.data();
  }
  return msg;
}

struct MdCtxFree {
  void operator()(EVP_MD_CTX *p) const noexcept { EVP_MD_CTX_free(p); }
};
struct BioFree {
  void operator()(BIO *p) const noexcept { BIO_free(p); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;
using BioPtr = std::unique_ptr<BIO, BioFree>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

void put_ssh_string(std::string &out, std::string_view s) {
  const auto n = static_cast<std::uint32_t>(s.size());
  out.push_back(static_cast<char>(n >> 24));
  out.push_back(static_cast<char>(n >> 16));
  out.push_back(static_cast<char>(n >> 8));
  out.push_back(static_cast<char>(n));
  out.append(s);
}

std::string_view take_ssh_string(std::string_view &in) {
  if (in.size() < 4) {
    throw std::invalid_argument("public key blob truncated");
  }
  const auto *p = reinterpret_cast<const unsigned char *>(in.data());
  const std::uint32_t n = (static_cast<std::uint32_t>(p[0]) << 24) |
                          (static_cast<std::uint32_t>(p[1]) << 16) |
                          (static_cast<std::uint32_t>(p[2]) << 8) | p[3];
  in.remove_prefix(4);
  if (in.size() < n) {
    throw std::invalid_argument("public key blob truncated");
  }
  const auto s = in.substr(0, n);
  in.remove_prefix(n);
  return s;
}

std::string base64_decode(std::string_view b64) {
  if (b64.empty() || b64.size() % 4 != 0) {
    throw std::invalid_argument("public key: bad base64 length");
  }
  std::string out((b64.size() / 4) * 3, '\0');
  const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                                reinterpret_cast<const unsigned char *>(b64.data()),
                                static_cast<int>(b64.size()));
  if (n < 0) {
    throw std::invalid_argument("public key: bad base64");
  }
  // EVP_DecodeBlock keeps the bytes produced by '=' padding.
  std::size_t len = static_cast<std::size_t>(n);
  if (b64.ends_with("==")) {
    len -= 2;
  } else if (b64.ends_with("=")) {
    len -= 1;
  }
  out.resize(len);
  return out;
}

std::string base64_encode(std::string_view raw) {
  std::string out(((raw.size() + 2) / 3) * 4 + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                                reinterpret_cast<const unsigned char *>(raw.data()),
                                static_cast<int>(raw.size()));
  out.resize(static_cast<std::size_t>(n));
  return out;
}

} // namespace

PublicKey parse_openssh_public_key(std::string_view line) {
  while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
    line.remove_prefix(1);
  }
  const auto sp1 = line.find(' ');
  if (sp1 == std::string_view::npos || line.substr(0, sp1) != kEd25519KeyType) {
    throw std::invalid_argument("public key: only ssh-ed25519 keys are supported");
  }
  std::string_view rest = line.substr(sp1 + 1);
  const auto sp2 = rest.find(' ');
  const std::string_view b64 = rest.substr(0, sp2);

  PublicKey key;
  if (sp2 != std::string_view::npos) {
    auto comment = rest.substr(sp2 + 1);
    while (!comment.empty() && (comment.back() == ' ' || comment.back() == '\r')) {
      comment.remove_suffix(1);
    }
    key.comment = std::string(comment);
  }

  const std::string blob = base64_decode(b64);
  std::string_view in = blob;
  if (take_ssh_string(in) != kEd25519KeyType) {
    throw std::invalid_argument("public key: blob type does not match");
  }
  const auto raw = take_ssh_string(in);
  if (raw.size() != kEd25519KeyLen || !in.empty()) {
    throw std::invalid_argument("public key: bad ed25519 key length");
  }
  std::memcpy(key.raw.data(), raw.data(), kEd25519KeyLen);
  return key;
}

std::string format_openssh_public_key(const PublicKey &key) {
  std::string blob;
  put_ssh_string(blob, kEd25519KeyType);
  put_ssh_string(blob, std::string_view(reinterpret_cast<const char *>(key.raw.data()),
                                        key.raw.size()));
  std::string out(kEd25519KeyType);
  out += ' ';
  out += base64_encode(blob);
  if (!key.comment.empty()) {
    out += ' ';
    out += key.comment;
  }
  return out;
}

bool verify_signature(const PublicKey &key, std::span<const std::uint8_t> message,
                      std::span<const std::uint8_t> signature) {
  PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, key.raw.data(),
                                           key.raw.size()),
               &EVP_PKEY_free);
  if (!pkey) {
    throw std::runtime_error(openssl_error("EVP_PKEY_new_raw_public_key"));
  }
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
    throw std::runtime_error(openssl_error("EVP_DigestVerifyInit"));
  }
  const int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(),
                                  message.size());
  ERR_clear_error();
  return rc == 1;
}

std::vector<std::uint8_t> random_bytes(std::size_t n) {
  std::vector<std::uint8_t> out(n);
  if (RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
    throw std::runtime_error(openssl_error("RAND_bytes"));
  }
  return out;
}

void PrivateKey::Deleter::operator()(evp_pkey_st *p) const noexcept { EVP_PKEY_free(p); }

PrivateKey PrivateKey::generate() {
  EVP_PKEY *pkey = EVP_PKEY_Q_keygen(nullptr, nullptr, "ED25519");
  if (!pkey) {
    throw std::runtime_error(openssl_error("EVP_PKEY_Q_keygen(ED25519)"));
  }
  return PrivateKey(pkey);
}

PrivateKey PrivateKey::load(const std::filesystem::path &path) {
  const auto bytes = fs::read_file(path);
  BioPtr bio(BIO_new_mem_buf(bytes.data(), static_cast<int>(bytes.size())));
  if (!bio) {
    throw std::runtime_error(openssl_error("BIO_new_mem_buf"));
  }
  EVP_PKEY *pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (!pkey) {
    throw std::runtime_error(openssl_error("read private key " + path.string()));
  }
  if (EVP_PKEY_get_id(pkey) != EVP_PKEY_ED25519) {
    EVP_PKEY_free(pkey);
    throw std::runtime_error("private key " + path.string() + " is not ed25519");
  }
  return PrivateKey(pkey);
}

void PrivateKey::save(const std::filesystem::path &path) const {
  BioPtr bio(BIO_new(BIO_s_mem()));
  if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey_.get(), nullptr, nullptr, 0, nullptr,
                                       nullptr) != 1) {
    throw std::runtime_error(openssl_error("PEM_write_bio_PrivateKey"));
  }
  char *data = nullptr;
  const long len = BIO_get_mem_data(bio.get(), &data);
  fs::write_file_atomic(path, std::string_view(data, static_cast<std::size_t>(len)));
  std::filesystem::permissions(path, std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write);
}

PublicKey PrivateKey::public_key() const {
  PublicKey key;
  std::size_t len = key.raw.size();
  if (EVP_PKEY_get_raw_public_key(pkey_.get(), key.raw.data(), &len) != 1 ||
      len != kEd25519KeyLen) {
    throw std::runtime_error(openssl_error("EVP_PKEY_get_raw_public_key"));
  }
  return key;
}

std::vector<std::uint8_t> PrivateKey::sign(std::span<const std::uint8_t> message) const {
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey_.get()) != 1) {
    throw std::runtime_error(openssl_error("EVP_DigestSignInit"));
  }
  std::size_t len = 0;
  if (EVP_DigestSign(ctx.get(), nullptr, &len, message.data(), message.size()) != 1) {
    throw std::runtime_error(openssl_error("EVP_DigestSign"));
  }
  std::vector<std::uint8_t> sig(len);
  if (EVP_DigestSign(ctx.get(), sig.data(), &len, message.data(), message.size()) != 1) {
    throw std::runtime_error(openssl_error("EVP_DigestSign"));
  }
  sig.resize(len);
  return sig;
}

} // namespace gitdock
