#include "dropwire/util.hpp"
#include "dropwire/errors.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/kdf.h>
#include <openssl/crypto.h>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace dropwire {

void secure_bzero(void* p, std::size_t n) {
  if (p && n) OPENSSL_cleanse(p, n);
}

SecureBytes::SecureBytes(std::size_t n) : b(n) {}
SecureBytes::~SecureBytes() { secure_bzero(b.data(), b.size()); }
SecureBytes::SecureBytes(SecureBytes&& o) noexcept : b(std::move(o.b)) {}
SecureBytes& SecureBytes::operator=(SecureBytes&& o) noexcept {
  if (this != &o) {
    secure_bzero(b.data(), b.size());
    b = std::move(o.b);
  }
  return *this;
}

void rand_bytes(std::uint8_t* out, std::size_t n) {
  ensure(RAND_bytes(out, (int)n) == 1, ErrorKind::Crypto, "RAND_bytes failed");
}

Bytes hkdf_extract_sha256(const Bytes& salt, const Bytes& ikm) {
  Bytes prk(32);
  EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
  ensure(pctx != nullptr, ErrorKind::Crypto, "HKDF ctx alloc failed");
  bool ok = EVP_PKEY_derive_init(pctx) == 1 &&
            EVP_PKEY_CTX_hkdf_mode(pctx, EVP_PKEY_HKDEF_MODE_EXTRACT_ONLY) == 1 &&
            EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) == 1 &&
            EVP_PKEY_CTX_set1_hkdf_salt(pctx, salt.data(), (int)salt.size()) == 1 &&
            EVP_PKEY_CTX_set1_hkdf_key(pctx, ikm.data(), (int)ikm.size()) == 1;

  size_t outlen = prk.size();
  ok = ok && EVP_PKEY_derive(pctx, prk.data(), &outlen) == 1;
  EVP_PKEY_CTX_free(pctx);
  ensure(ok, ErrorKind::Crypto, "HKDF extract failed");
  ensure(outlen == prk.size(), ErrorKind::Crypto, "HKDF extract length mismatch");
  return prk;
}

Bytes hkdf_expand_sha256(const Bytes& prk, const std::string& info, std::size_t out_len) {
  Bytes out(out_len);
  EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
  ensure(pctx != nullptr, ErrorKind::Crypto, "HKDF ctx alloc failed");
  bool ok = EVP_PKEY_derive_init(pctx) == 1 &&
            EVP_PKEY_CTX_hkdf_mode(pctx, EVP_PKEY_HKDEF_MODE_EXPAND_ONLY) == 1 &&
            EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) == 1 &&
            EVP_PKEY_CTX_set1_hkdf_key(pctx, prk.data(), (int)prk.size()) == 1 &&
            EVP_PKEY_CTX_add1_hkdf_info(pctx, (const unsigned char*)info.data(), (int)info.size()) == 1;

  size_t len = out.size();
  ok = ok && EVP_PKEY_derive(pctx, out.data(), &len) == 1;
  EVP_PKEY_CTX_free(pctx);
  ensure(ok, ErrorKind::Crypto, "HKDF expand failed");
  ensure(len == out.size(), ErrorKind::Crypto, "HKDF expand length mismatch");
  return out;
}

// ------------------------------ Big-endian fields ------------------------------

void append_u16(Bytes& out, std::uint16_t v) {
  out.push_back((std::uint8_t)((v >> 8) & 0xFF));
  out.push_back((std::uint8_t)(v & 0xFF));
}
void append_u32(Bytes& out, std::uint32_t v) {
  out.push_back((std::uint8_t)((v >> 24) & 0xFF));
  out.push_back((std::uint8_t)((v >> 16) & 0xFF));
  out.push_back((std::uint8_t)((v >> 8) & 0xFF));
  out.push_back((std::uint8_t)(v & 0xFF));
}
void append_u64(Bytes& out, std::uint64_t v) {
  for (int i = 7; i >= 0; --i) out.push_back((std::uint8_t)((v >> (8 * i)) & 0xFF));
}

std::uint8_t read_u8(const std::uint8_t*& p, const std::uint8_t* end) {
  ensure(p + 1 <= end, ErrorKind::Protocol, "parse overflow (u8)");
  return *p++;
}
std::uint16_t read_u16(const std::uint8_t*& p, const std::uint8_t* end) {
  ensure(p + 2 <= end, ErrorKind::Protocol, "parse overflow (u16)");
  std::uint16_t v = (std::uint16_t)((std::uint16_t(p[0]) << 8) | std::uint16_t(p[1]));
  p += 2;
  return v;
}
std::uint32_t read_u32(const std::uint8_t*& p, const std::uint8_t* end) {
  ensure(p + 4 <= end, ErrorKind::Protocol, "parse overflow (u32)");
  std::uint32_t v = (std::uint32_t(p[0]) << 24) |
                    (std::uint32_t(p[1]) << 16) |
                    (std::uint32_t(p[2]) << 8) |
                    (std::uint32_t(p[3]));
  p += 4;
  return v;
}
std::uint64_t read_u64(const std::uint8_t*& p, const std::uint8_t* end) {
  ensure(p + 8 <= end, ErrorKind::Protocol, "parse overflow (u64)");
  std::uint64_t v = 0;
  for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
  p += 8;
  return v;
}
Bytes read_vec(const std::uint8_t*& p, const std::uint8_t* end, std::size_t n) {
  ensure((std::size_t)(end - p) >= n, ErrorKind::Protocol, "parse overflow (vec)");
  Bytes out(p, p + n);
  p += n;
  return out;
}

bool parse_port(const std::string& s, std::uint16_t min_port, std::uint16_t& out) {
  if (s.empty() || s[0] == '-' || s[0] == '+' || s[0] == ' ') return false;
  char* end = nullptr;
  errno = 0;
  unsigned long v = std::strtoul(s.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || v < min_port || v > 65535) return false;
  out = (std::uint16_t)v;
  return true;
}

// ------------------------------ Logging ------------------------------

static std::atomic<bool> g_verbose{false};
static std::mutex g_log_mu;

void set_verbose(bool on) { g_verbose = on; }

void log_line(const char* tag, const std::string& msg) {
  if (!g_verbose) return;
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::cerr << "[" << tag << "] " << msg << "\n";
}

void log_warn(const char* tag, const std::string& msg) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::cerr << "[" << tag << "] warning: " << msg << "\n";
}

} // namespace dropwire
