#pragma once
#include "dropwire.hpp"
#include "codec.hpp"
#include "util.hpp"
#include <array>
#include <cstdint>

namespace dropwire {

static constexpr std::size_t kKeyLen = 32;        // AES-256
static constexpr std::size_t kAeadNonceLen = 12;  // GCM nonce
static constexpr std::size_t kTagLen = 16;
static constexpr std::size_t kSeqLen = 8;

enum class Role { Sender, Receiver };

const char* to_string(Role r);

// Ephemeral X25519 key pair, raw encodings.
struct KeyPair {
  std::array<std::uint8_t, kPublicKeyLen> public_key{};
  SecureBytes private_key;
};

KeyPair generate_keypair();

// X25519(private, peer_public). Rejects all-zero results (low-order peer keys).
SecureBytes x25519_shared_secret(const SecureBytes& private_key,
                                 const std::array<std::uint8_t, kPublicKeyLen>& peer_public);

struct TrafficKeys {
  std::array<std::uint8_t, kKeyLen> s2r_key{};
  std::array<std::uint8_t, kKeyLen> r2s_key{};
  std::array<std::uint8_t, kAeadNonceLen> s2r_base_nonce{};
  std::array<std::uint8_t, kAeadNonceLen> r2s_base_nonce{};
};

TrafficKeys derive_traffic_keys(const SecureBytes& shared_secret,
                                const std::array<std::uint8_t, kPublicKeyLen>& sender_public,
                                const std::array<std::uint8_t, kPublicKeyLen>& receiver_public);

// AES-256-GCM over message payloads, one key and nonce sequence per direction.
// Sealed payload: seq(8, BE) || ciphertext || tag(16).
class CryptoChannel {
public:
  CryptoChannel(Role r, TrafficKeys tk);
  ~CryptoChannel();

  Bytes seal(MsgType type, const Bytes& plaintext);

  // Throws Error(Integrity) on authentication failure or a replayed seq.
  Bytes open(MsgType type, const Bytes& sealed);

private:
  Role role_;
  TrafficKeys keys_;
  std::uint64_t next_send_seq_{0};
  std::uint64_t next_recv_seq_{0};

  const std::array<std::uint8_t, kKeyLen>& send_key() const;
  const std::array<std::uint8_t, kKeyLen>& recv_key() const;
  const std::array<std::uint8_t, kAeadNonceLen>& send_base_nonce() const;
  const std::array<std::uint8_t, kAeadNonceLen>& recv_base_nonce() const;
};

} // namespace dropwire
