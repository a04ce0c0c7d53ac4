#include "dropwire/integrity.hpp"
#include "dropwire/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <fstream>
#include <vector>

namespace dropwire {

Digest hash(const std::uint8_t* data, std::size_t n) {
  StreamHasher h;
  h.update(data, n);
  return h.finish();
}

Digest hash(const Bytes& data) {
  return hash(data.data(), data.size());
}

bool digest_equal(const Digest& a, const Digest& b) {
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool verify(const Bytes& data, const Digest& expected) {
  return digest_equal(hash(data), expected);
}

StreamHasher::StreamHasher() {
  ctx_ = EVP_MD_CTX_new();
  ensure(ctx_ != nullptr, ErrorKind::Crypto, "EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    fail(ErrorKind::Crypto, "DigestInit failed");
  }
}

StreamHasher::~StreamHasher() { EVP_MD_CTX_free(ctx_); }

void StreamHasher::update(const std::uint8_t* data, std::size_t n) {
  if (n == 0) return;
  ensure(EVP_DigestUpdate(ctx_, data, n) == 1, ErrorKind::Crypto, "DigestUpdate failed");
}

Digest StreamHasher::finish() {
  Digest out{};
  unsigned int len = 0;
  ensure(EVP_DigestFinal_ex(ctx_, out.data(), &len) == 1, ErrorKind::Crypto, "DigestFinal failed");
  ensure(len == out.size(), ErrorKind::Crypto, "sha256 length mismatch");
  ensure(EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) == 1, ErrorKind::Crypto, "DigestInit failed");
  return out;
}

Digest hash_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) fail(ErrorKind::Validation, "cannot open " + path);

  StreamHasher h;
  std::vector<char> buf(kChunkSize);
  while (f) {
    f.read(buf.data(), (std::streamsize)buf.size());
    std::streamsize n = f.gcount();
    if (n > 0) h.update((const std::uint8_t*)buf.data(), (std::size_t)n);
  }
  if (f.bad()) fail(ErrorKind::Validation, "read failed: " + path);
  return h.finish();
}

std::string to_hex(const Digest& d) {
  static const char kHex[] = "0123456789abcdef";
  std::string s;
  s.reserve(d.size() * 2);
  for (std::uint8_t b : d) {
    s.push_back(kHex[b >> 4]);
    s.push_back(kHex[b & 0x0F]);
  }
  return s;
}

} // namespace dropwire
