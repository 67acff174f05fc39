#include "internal/crypto/crypto.hpp"

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#include <limits>
#include <memory>

namespace mprisrelay::crypto {
namespace {

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using PkeyPtr      = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr   = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using MdCtxPtr     = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using KdfPtr       = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using KdfCtxPtr    = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;

[[noreturn]] void Fail(const std::string& msg) {
  throw CryptoError(msg);
}

void Check(int code, const char* msg) {
  if (code != 1) {
    Fail(msg);
  }
}

void CheckSize(std::size_t size, const char* label) {
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    Fail(std::string(label) + " too large");
  }
}

void CheckLength(std::span<const std::uint8_t> data, std::size_t expected, const char* label) {
  if (data.size() != expected) {
    Fail(std::string(label) + " must be " + std::to_string(expected) + " bytes");
  }
}

KeyPair GenerateKeyPair(const char* algorithm) {
  PkeyPtr pkey(EVP_PKEY_Q_keygen(nullptr, nullptr, algorithm), EVP_PKEY_free);
  if (!pkey) {
    Fail(std::string(algorithm) + " key generation failed");
  }

  Bytes  priv(kKeyLength);
  Bytes  pub(kKeyLength);
  size_t priv_len = priv.size();
  size_t pub_len  = pub.size();
  Check(EVP_PKEY_get_raw_private_key(pkey.get(), priv.data(), &priv_len), "private key export failed");
  Check(EVP_PKEY_get_raw_public_key(pkey.get(), pub.data(), &pub_len), "public key export failed");

  return KeyPair{SecretBytes(std::move(priv)), std::move(pub)};
}

PkeyPtr PrivateKey(int type, std::span<const std::uint8_t> raw) {
  CheckLength(raw, kKeyLength, "private key");
  PkeyPtr pkey(EVP_PKEY_new_raw_private_key(type, nullptr, raw.data(), raw.size()), EVP_PKEY_free);
  if (!pkey) {
    Fail("private key import failed");
  }
  return pkey;
}

PkeyPtr PublicKey(int type, std::span<const std::uint8_t> raw) {
  CheckLength(raw, kKeyLength, "public key");
  PkeyPtr pkey(EVP_PKEY_new_raw_public_key(type, nullptr, raw.data(), raw.size()), EVP_PKEY_free);
  if (!pkey) {
    Fail("public key import failed");
  }
  return pkey;
}

std::uint8_t Nibble(char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<std::uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<std::uint8_t>(10 + c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<std::uint8_t>(10 + c - 'A');
  }
  Fail("invalid hex character");
}

} // namespace

// ------------------------------------------------------------
// SecretBytes
// ------------------------------------------------------------

SecretBytes::SecretBytes(Bytes data) : data_(std::move(data)) {
}

SecretBytes::SecretBytes(SecretBytes&& other) noexcept : data_(std::move(other.data_)) {
}

SecretBytes& SecretBytes::operator=(SecretBytes&& other) noexcept {
  if (this != &other) {
    clear();
    data_ = std::move(other.data_);
  }
  return *this;
}

SecretBytes::~SecretBytes() {
  clear();
}

void SecretBytes::clear() {
  if (!data_.empty()) {
    OPENSSL_cleanse(data_.data(), data_.size());
    data_.clear();
  }
}

// ------------------------------------------------------------
// Key agreement / signatures
// ------------------------------------------------------------

KeyPair GenerateX25519KeyPair() {
  return GenerateKeyPair("X25519");
}

SecretBytes X25519Agree(std::span<const std::uint8_t> private_key, std::span<const std::uint8_t> peer_public_key) {
  auto priv = PrivateKey(EVP_PKEY_X25519, private_key);
  auto peer = PublicKey(EVP_PKEY_X25519, peer_public_key);

  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(priv.get(), nullptr), EVP_PKEY_CTX_free);
  if (!ctx) {
    Fail("derive context allocation failed");
  }
  Check(EVP_PKEY_derive_init(ctx.get()), "derive init failed");
  // Fails on low-order peer points (all-zero shared secret).
  Check(EVP_PKEY_derive_set_peer(ctx.get(), peer.get()), "peer key rejected");

  size_t len = 0;
  Check(EVP_PKEY_derive(ctx.get(), nullptr, &len), "derive size query failed");
  Bytes shared(len);
  Check(EVP_PKEY_derive(ctx.get(), shared.data(), &len), "key agreement failed");
  shared.resize(len);

  SecretBytes secret(std::move(shared));
  const Bytes zeros(secret.size(), 0);
  if (ConstantTimeEquals(secret.view(), zeros)) {
    Fail("key agreement produced an all-zero secret");
  }
  return secret;
}

KeyPair GenerateEd25519KeyPair() {
  return GenerateKeyPair("ED25519");
}

Bytes Ed25519Sign(std::span<const std::uint8_t> private_key, std::span<const std::uint8_t> message) {
  auto pkey = PrivateKey(EVP_PKEY_ED25519, private_key);

  MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx) {
    Fail("digest context allocation failed");
  }
  Check(EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()), "sign init failed");

  Bytes  signature(kSignatureLength);
  size_t sig_len = signature.size();
  Check(EVP_DigestSign(ctx.get(), signature.data(), &sig_len, message.data(), message.size()), "sign failed");
  signature.resize(sig_len);
  return signature;
}

bool Ed25519Verify(std::span<const std::uint8_t> public_key, std::span<const std::uint8_t> message,
                   std::span<const std::uint8_t> signature) {
  if (public_key.size() != kKeyLength || signature.size() != kSignatureLength) {
    return false;
  }
  auto pkey = PublicKey(EVP_PKEY_ED25519, public_key);

  MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx) {
    Fail("digest context allocation failed");
  }
  Check(EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()), "verify init failed");
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(), message.size()) == 1;
}

// ------------------------------------------------------------
// Hashing / derivation
// ------------------------------------------------------------

SecretBytes HkdfSha256(std::span<const std::uint8_t> ikm, std::span<const std::uint8_t> salt, std::string_view info,
                       std::size_t length) {
  KdfPtr kdf(EVP_KDF_fetch(nullptr, "HKDF", nullptr), EVP_KDF_free);
  if (!kdf) {
    Fail("hkdf unavailable");
  }
  KdfCtxPtr ctx(EVP_KDF_CTX_new(kdf.get()), EVP_KDF_CTX_free);
  if (!ctx) {
    Fail("hkdf context allocation failed");
  }

  char digest[] = "SHA256";
  OSSL_PARAM params[] = {
      OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest, 0),
      OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_KEY, const_cast<std::uint8_t*>(ikm.data()), ikm.size()),
      OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, const_cast<std::uint8_t*>(salt.data()), salt.size()),
      OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_INFO, const_cast<char*>(info.data()), info.size()),
      OSSL_PARAM_construct_end()};

  Bytes out(length);
  Check(EVP_KDF_derive(ctx.get(), out.data(), out.size(), params), "hkdf derive failed");
  return SecretBytes(std::move(out));
}

Bytes HmacSha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
  CheckSize(key.size(), "hmac key");

  Bytes        mac(EVP_MAX_MD_SIZE);
  unsigned int mac_len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data.data(), data.size(), mac.data(), &mac_len) ==
      nullptr) {
    Fail("hmac failed");
  }
  mac.resize(mac_len);
  return mac;
}

Bytes Sha256(std::span<const std::uint8_t> data) {
  Bytes        digest(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;
  Check(EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr), "sha256 failed");
  digest.resize(digest_len);
  return digest;
}

// ------------------------------------------------------------
// AEAD
// ------------------------------------------------------------

Sealed Seal(std::span<const std::uint8_t> key, std::span<const std::uint8_t> plaintext, std::span<const std::uint8_t> aad) {
  CheckLength(key, kKeyLength, "aead key");
  CheckSize(plaintext.size(), "plaintext");
  CheckSize(aad.size(), "aad");

  Sealed sealed;
  sealed.nonce = RandomBytes(kNonceLength);
  sealed.ciphertext.resize(plaintext.size());
  sealed.tag.resize(kTagLength);

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
  if (!ctx) {
    Fail("cipher context allocation failed");
  }
  Check(EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, key.data(), sealed.nonce.data()),
        "encrypt init failed");

  int out_len = 0;
  if (!aad.empty()) {
    Check(EVP_EncryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), static_cast<int>(aad.size())), "aad encrypt failed");
  }
  Check(EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &out_len, plaintext.data(), static_cast<int>(plaintext.size())),
        "encrypt failed");
  int fin_len = 0;
  Check(EVP_EncryptFinal_ex(ctx.get(), sealed.ciphertext.data() + out_len, &fin_len), "encrypt finalize failed");
  if (static_cast<std::size_t>(out_len + fin_len) != plaintext.size()) {
    Fail("unexpected ciphertext size");
  }
  Check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(kTagLength), sealed.tag.data()),
        "tag read failed");
  return sealed;
}

SecretBytes Open(std::span<const std::uint8_t> key, const Sealed& sealed, std::span<const std::uint8_t> aad) {
  CheckLength(key, kKeyLength, "aead key");
  CheckLength(sealed.nonce, kNonceLength, "nonce");
  CheckLength(sealed.tag, kTagLength, "tag");
  CheckSize(sealed.ciphertext.size(), "ciphertext");
  CheckSize(aad.size(), "aad");

  Bytes        plain(sealed.ciphertext.size());
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
  if (!ctx) {
    Fail("cipher context allocation failed");
  }
  Check(EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, key.data(), sealed.nonce.data()),
        "decrypt init failed");

  int out_len = 0;
  if (!aad.empty()) {
    Check(EVP_DecryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), static_cast<int>(aad.size())), "aad decrypt failed");
  }
  Check(EVP_DecryptUpdate(ctx.get(), plain.data(), &out_len, sealed.ciphertext.data(),
                          static_cast<int>(sealed.ciphertext.size())),
        "decrypt failed");

  auto tag = sealed.tag;
  Check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tag.size()), tag.data()), "tag setup failed");

  int fin_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + out_len, &fin_len) != 1) {
    OPENSSL_cleanse(plain.data(), plain.size());
    Fail("authentication failed");
  }
  return SecretBytes(std::move(plain));
}

// ------------------------------------------------------------
// Misc
// ------------------------------------------------------------

Bytes RandomBytes(std::size_t length) {
  CheckSize(length, "random length");
  Bytes out(length);
  if (length > 0) {
    Check(RAND_bytes(out.data(), static_cast<int>(out.size())), "random generation failed");
  }
  return out;
}

bool ConstantTimeEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) {
  if (a.size() != b.size()) {
    return false;
  }
  if (a.empty()) {
    return true;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string ToHex(std::span<const std::uint8_t> data) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (auto b : data) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

Bytes FromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    Fail("hex string has odd length");
  }
  Bytes out(hex.size() / 2);
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<std::uint8_t>((Nibble(hex[2 * i]) << 4) | Nibble(hex[2 * i + 1]));
  }
  return out;
}

std::span<const std::uint8_t> AsBytes(std::string_view data) {
  return {reinterpret_cast<const std::uint8_t*>(data.data()), data.size()};
}

std::string ToString(std::span<const std::uint8_t> data) {
  return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

Bytes Concat(std::initializer_list<std::span<const std::uint8_t>> parts) {
  Bytes out;
  for (const auto& part : parts) {
    out.insert(out.end(), part.begin(), part.end());
  }
  return out;
}

} // namespace mprisrelay::crypto
