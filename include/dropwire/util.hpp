#pragma once
#include "dropwire.hpp"
#include <string>
#include <cstddef>
#include <cstdint>

namespace dropwire {

struct SecureBytes {
  Bytes b;
  SecureBytes() = default;
  explicit SecureBytes(std::size_t n);
  ~SecureBytes();
  SecureBytes(const SecureBytes&) = delete;
  SecureBytes& operator=(const SecureBytes&) = delete;
  SecureBytes(SecureBytes&&) noexcept;
  SecureBytes& operator=(SecureBytes&&) noexcept;
};

void secure_bzero(void* p, std::size_t n);

void rand_bytes(std::uint8_t* out, std::size_t n);

Bytes hkdf_extract_sha256(const Bytes& salt, const Bytes& ikm);
Bytes hkdf_expand_sha256(const Bytes& prk, const std::string& info, std::size_t out_len);

// Big-endian field helpers shared by the codec and the crypto channel.
void append_u16(Bytes& out, std::uint16_t v);
void append_u32(Bytes& out, std::uint32_t v);
void append_u64(Bytes& out, std::uint64_t v);
std::uint8_t read_u8(const std::uint8_t*& p, const std::uint8_t* end);
std::uint16_t read_u16(const std::uint8_t*& p, const std::uint8_t* end);
std::uint32_t read_u32(const std::uint8_t*& p, const std::uint8_t* end);
std::uint64_t read_u64(const std::uint8_t*& p, const std::uint8_t* end);
Bytes read_vec(const std::uint8_t*& p, const std::uint8_t* end, std::size_t n);

// Whole-string decimal port in [min_port, 65535]; false otherwise.
bool parse_port(const std::string& s, std::uint16_t min_port, std::uint16_t& out);

// Tagged diagnostics on stderr: "[tag] message".
void set_verbose(bool on);
void log_line(const char* tag, const std::string& msg);   // verbose only
void log_warn(const char* tag, const std::string& msg);   // always

} // namespace dropwire
