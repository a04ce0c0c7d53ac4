#pragma once
#include "dropwire.hpp"
#include <array>
#include <string>

struct evp_md_ctx_st;

namespace dropwire {

using Digest = std::array<std::uint8_t, kDigestLen>;

// SHA-256 over the given bytes.
Digest hash(const std::uint8_t* data, std::size_t n);
Digest hash(const Bytes& data);

// Constant-time comparison of hash(data) against expected.
bool verify(const Bytes& data, const Digest& expected);
bool digest_equal(const Digest& a, const Digest& b);

// Incremental SHA-256, used for whole-file digests built chunk by chunk.
class StreamHasher {
public:
  StreamHasher();
  ~StreamHasher();
  StreamHasher(const StreamHasher&) = delete;
  StreamHasher& operator=(const StreamHasher&) = delete;

  void update(const std::uint8_t* data, std::size_t n);
  void update(const Bytes& data) { update(data.data(), data.size()); }

  // Returns the digest and resets the hasher for reuse.
  Digest finish();

private:
  evp_md_ctx_st* ctx_{nullptr};
};

// Streams a file from disk; throws Error(Validation) if it cannot be read.
Digest hash_file(const std::string& path);

std::string to_hex(const Digest& d);

} // namespace dropwire
