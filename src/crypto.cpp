// Ephemeral X25519 key agreement and AES-256-GCM payload protection.
// Dependencies: OpenSSL (libcrypto)

#include "dropwire/crypto.hpp"
#include "dropwire/errors.hpp"
#include "dropwire/integrity.hpp"

#include <openssl/evp.h>

#include <cstring>
#include <string>

namespace dropwire {

const char* to_string(Role r) {
  return r == Role::Sender ? "sender" : "receiver";
}

// ------------------------------ X25519 ------------------------------

KeyPair generate_keypair() {
  EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr);
  ensure(pctx != nullptr, ErrorKind::Crypto, "X25519 ctx alloc failed");

  EVP_PKEY* pkey = nullptr;
  bool ok = EVP_PKEY_keygen_init(pctx) == 1 && EVP_PKEY_keygen(pctx, &pkey) == 1;
  EVP_PKEY_CTX_free(pctx);
  ensure(ok && pkey != nullptr, ErrorKind::Crypto, "X25519 keygen failed");

  KeyPair kp;
  kp.private_key = SecureBytes(kKeyLen);
  size_t pub_len = kp.public_key.size();
  size_t priv_len = kp.private_key.b.size();
  ok = EVP_PKEY_get_raw_public_key(pkey, kp.public_key.data(), &pub_len) == 1 &&
       EVP_PKEY_get_raw_private_key(pkey, kp.private_key.b.data(), &priv_len) == 1;
  EVP_PKEY_free(pkey);
  ensure(ok && pub_len == kPublicKeyLen && priv_len == kKeyLen,
         ErrorKind::Crypto, "X25519 raw key export failed");
  return kp;
}

SecureBytes x25519_shared_secret(const SecureBytes& private_key,
                                 const std::array<std::uint8_t, kPublicKeyLen>& peer_public) {
  ensure(private_key.b.size() == kKeyLen, ErrorKind::Crypto, "X25519 private key length mismatch");

  EVP_PKEY* self = EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                                private_key.b.data(), private_key.b.size());
  ensure(self != nullptr, ErrorKind::Crypto, "X25519 private key import failed");
  EVP_PKEY* peer = EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                               peer_public.data(), peer_public.size());
  if (peer == nullptr) {
    EVP_PKEY_free(self);
    fail(ErrorKind::Protocol, "X25519 peer key import failed");
  }

  EVP_PKEY_CTX* dctx = EVP_PKEY_CTX_new(self, nullptr);
  SecureBytes ss(kKeyLen);
  size_t len = ss.b.size();
  bool ok = dctx != nullptr &&
            EVP_PKEY_derive_init(dctx) == 1 &&
            EVP_PKEY_derive_set_peer(dctx, peer) == 1 &&
            EVP_PKEY_derive(dctx, ss.b.data(), &len) == 1;
  EVP_PKEY_CTX_free(dctx);
  EVP_PKEY_free(peer);
  EVP_PKEY_free(self);

  // OpenSSL refuses an all-zero output, which is what a low-order peer key yields.
  ensure(ok && len == kKeyLen, ErrorKind::Protocol, "X25519 derive failed");
  return ss;
}

TrafficKeys derive_traffic_keys(const SecureBytes& shared_secret,
                                const std::array<std::uint8_t, kPublicKeyLen>& sender_public,
                                const std::array<std::uint8_t, kPublicKeyLen>& receiver_public) {
  // salt = SHA256("dropwire-v2-salt" || sender_pub || receiver_pub)
  Bytes salt;
  const char salt_dom[] = "dropwire-v2-salt";
  salt.insert(salt.end(), salt_dom, salt_dom + std::strlen(salt_dom));
  salt.insert(salt.end(), sender_public.begin(), sender_public.end());
  salt.insert(salt.end(), receiver_public.begin(), receiver_public.end());
  Digest salt_hash = hash(salt);

  Bytes prk = hkdf_extract_sha256(Bytes(salt_hash.begin(), salt_hash.end()), shared_secret.b);

  auto s2r_key   = hkdf_expand_sha256(prk, "dropwire-v2 s2r key",   kKeyLen);
  auto r2s_key   = hkdf_expand_sha256(prk, "dropwire-v2 r2s key",   kKeyLen);
  auto s2r_nonce = hkdf_expand_sha256(prk, "dropwire-v2 s2r nonce", kAeadNonceLen);
  auto r2s_nonce = hkdf_expand_sha256(prk, "dropwire-v2 r2s nonce", kAeadNonceLen);

  TrafficKeys tk{};
  std::memcpy(tk.s2r_key.data(), s2r_key.data(), kKeyLen);
  std::memcpy(tk.r2s_key.data(), r2s_key.data(), kKeyLen);
  std::memcpy(tk.s2r_base_nonce.data(), s2r_nonce.data(), kAeadNonceLen);
  std::memcpy(tk.r2s_base_nonce.data(), r2s_nonce.data(), kAeadNonceLen);

  secure_bzero(prk.data(), prk.size());
  secure_bzero(s2r_key.data(), s2r_key.size());
  secure_bzero(r2s_key.data(), r2s_key.size());
  return tk;
}

// ------------------------------ AEAD helpers ------------------------------

static std::array<std::uint8_t, kAeadNonceLen> make_record_nonce(
    const std::array<std::uint8_t, kAeadNonceLen>& base,
    std::uint64_t seq) {
  std::array<std::uint8_t, kAeadNonceLen> n = base;

  // XOR seq into last 8 bytes (big-endian interpretation)
  for (int i = 0; i < 8; i++) {
    std::uint8_t b = (std::uint8_t)((seq >> (56 - 8 * i)) & 0xFF);
    n[kAeadNonceLen - 8 + i] ^= b;
  }
  return n;
}

static Bytes aead_encrypt_aes256gcm(
    const std::uint8_t key[kKeyLen],
    const std::uint8_t nonce[kAeadNonceLen],
    const std::uint8_t* aad, std::size_t aad_len,
    const std::uint8_t* pt, std::size_t pt_len) {

  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  ensure(ctx != nullptr, ErrorKind::Crypto, "EVP_CIPHER_CTX_new failed");

  Bytes ct(pt_len + kTagLen);
  int tmp = 0, len1 = 0, len2 = 0;
  bool ok = EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
            EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, (int)kAeadNonceLen, nullptr) == 1 &&
            EVP_EncryptInit_ex(ctx, nullptr, nullptr, key, nonce) == 1 &&
            EVP_EncryptUpdate(ctx, nullptr, &tmp, aad, (int)aad_len) == 1 &&
            EVP_EncryptUpdate(ctx, ct.data(), &len1, pt, (int)pt_len) == 1 &&
            EVP_EncryptFinal_ex(ctx, ct.data() + len1, &len2) == 1 &&
            EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, (int)kTagLen,
                                ct.data() + len1 + len2) == 1;
  EVP_CIPHER_CTX_free(ctx);
  ensure(ok, ErrorKind::Crypto, "AES-GCM encrypt failed");

  ct.resize((std::size_t)len1 + (std::size_t)len2 + kTagLen);
  return ct;
}

static bool aead_decrypt_aes256gcm(
    const std::uint8_t key[kKeyLen],
    const std::uint8_t nonce[kAeadNonceLen],
    const std::uint8_t* aad, std::size_t aad_len,
    const std::uint8_t* ct, std::size_t ct_len,
    Bytes& pt) {

  if (ct_len < kTagLen) return false;
  const std::size_t msg_len = ct_len - kTagLen;
  const std::uint8_t* tag = ct + msg_len;

  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  ensure(ctx != nullptr, ErrorKind::Crypto, "EVP_CIPHER_CTX_new failed");

  // keep pt.data() non-null: a null output buffer turns DecryptUpdate into an AAD update
  pt.assign(msg_len ? msg_len : 1, 0);
  int tmp = 0, len1 = 0, len2 = 0;
  bool ok = EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
            EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, (int)kAeadNonceLen, nullptr) == 1 &&
            EVP_DecryptInit_ex(ctx, nullptr, nullptr, key, nonce) == 1 &&
            EVP_DecryptUpdate(ctx, nullptr, &tmp, aad, (int)aad_len) == 1 &&
            EVP_DecryptUpdate(ctx, pt.data(), &len1, ct, (int)msg_len) == 1 &&
            EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, (int)kTagLen, (void*)tag) == 1 &&
            EVP_DecryptFinal_ex(ctx, pt.data() + len1, &len2) == 1;
  EVP_CIPHER_CTX_free(ctx);

  if (!ok) {
    secure_bzero(pt.data(), pt.size());
    pt.clear();
    return false;
  }
  pt.resize((std::size_t)len1 + (std::size_t)len2);
  return true;
}

// AAD = type(1) || seq(8)
static Bytes record_aad(MsgType type, std::uint64_t seq) {
  Bytes aad;
  aad.push_back((std::uint8_t)type);
  append_u64(aad, seq);
  return aad;
}

// ------------------------------ CryptoChannel ------------------------------

CryptoChannel::CryptoChannel(Role r, TrafficKeys tk) : role_(r), keys_(tk) {}

CryptoChannel::~CryptoChannel() { secure_bzero(&keys_, sizeof(keys_)); }

const std::array<std::uint8_t, kKeyLen>& CryptoChannel::send_key() const {
  return (role_ == Role::Sender) ? keys_.s2r_key : keys_.r2s_key;
}
const std::array<std::uint8_t, kKeyLen>& CryptoChannel::recv_key() const {
  return (role_ == Role::Sender) ? keys_.r2s_key : keys_.s2r_key;
}
const std::array<std::uint8_t, kAeadNonceLen>& CryptoChannel::send_base_nonce() const {
  return (role_ == Role::Sender) ? keys_.s2r_base_nonce : keys_.r2s_base_nonce;
}
const std::array<std::uint8_t, kAeadNonceLen>& CryptoChannel::recv_base_nonce() const {
  return (role_ == Role::Sender) ? keys_.r2s_base_nonce : keys_.s2r_base_nonce;
}

Bytes CryptoChannel::seal(MsgType type, const Bytes& plaintext) {
  // every call consumes a fresh seq, retransmissions included
  std::uint64_t seq = next_send_seq_++;
  auto nonce = make_record_nonce(send_base_nonce(), seq);
  Bytes aad = record_aad(type, seq);

  Bytes ct = aead_encrypt_aes256gcm(
      send_key().data(), nonce.data(),
      aad.data(), aad.size(),
      plaintext.data(), plaintext.size());

  Bytes out;
  out.reserve(kSeqLen + ct.size());
  append_u64(out, seq);
  out.insert(out.end(), ct.begin(), ct.end());
  return out;
}

Bytes CryptoChannel::open(MsgType type, const Bytes& sealed) {
  ensure(sealed.size() >= kSeqLen + kTagLen, ErrorKind::Integrity, "sealed payload too short");

  const std::uint8_t* p = sealed.data();
  const std::uint64_t seq = read_u64(p, sealed.data() + sealed.size());

  // Frames may be dropped (rejected) but never replayed.
  ensure(seq >= next_recv_seq_, ErrorKind::Integrity, "replayed or stale sequence number");

  auto nonce = make_record_nonce(recv_base_nonce(), seq);
  Bytes aad = record_aad(type, seq);

  Bytes pt;
  bool ok = aead_decrypt_aes256gcm(
      recv_key().data(), nonce.data(),
      aad.data(), aad.size(),
      p, sealed.size() - kSeqLen, pt);
  ensure(ok, ErrorKind::Integrity, "AEAD auth failed");

  next_recv_seq_ = seq + 1;
  return pt;
}

} // namespace dropwire
