#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mprisrelay::crypto {

/*
  Thin OpenSSL (libcrypto) wrappers used by pairing and relay auth.

  Primitives:
    X25519             ephemeral key agreement
    Ed25519            long-term client identity
    HKDF-SHA256        key / SAS derivation
    HMAC-SHA256        proofs and key confirmation
    ChaCha20-Poly1305  sealing the enrollment during pairing

  All failures throw CryptoError; callers decide whether that is a
  protocol failure or an internal error.
*/

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::size_t kKeyLength       = 32;
inline constexpr std::size_t kNonceLength     = 12;
inline constexpr std::size_t kTagLength       = 16;
inline constexpr std::size_t kSignatureLength = 64;

class CryptoError : public std::runtime_error {
 public:
  explicit CryptoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Owns secret material and wipes it on destruction or reassignment.
class SecretBytes {
 public:
  SecretBytes() = default;
  explicit SecretBytes(Bytes data);
  SecretBytes(SecretBytes&& other) noexcept;
  SecretBytes& operator=(SecretBytes&& other) noexcept;
  ~SecretBytes();

  SecretBytes(const SecretBytes&)            = delete;
  SecretBytes& operator=(const SecretBytes&) = delete;

  std::span<const std::uint8_t> view() const {
    return data_;
  }
  std::size_t size() const {
    return data_.size();
  }
  bool empty() const {
    return data_.empty();
  }

  // Copies out; the caller takes over responsibility for the copy.
  Bytes copy() const {
    return data_;
  }

  void clear();

 private:
  Bytes data_;
};

struct KeyPair {
  SecretBytes private_key;
  Bytes       public_key;
};

struct Sealed {
  Bytes nonce;
  Bytes ciphertext;
  Bytes tag;
};

KeyPair     GenerateX25519KeyPair();
SecretBytes X25519Agree(std::span<const std::uint8_t> private_key, std::span<const std::uint8_t> peer_public_key);

KeyPair GenerateEd25519KeyPair();
Bytes   Ed25519Sign(std::span<const std::uint8_t> private_key, std::span<const std::uint8_t> message);
bool    Ed25519Verify(std::span<const std::uint8_t> public_key, std::span<const std::uint8_t> message,
                      std::span<const std::uint8_t> signature);

SecretBytes HkdfSha256(std::span<const std::uint8_t> ikm, std::span<const std::uint8_t> salt, std::string_view info,
                       std::size_t length);
Bytes       HmacSha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);
Bytes       Sha256(std::span<const std::uint8_t> data);

Sealed      Seal(std::span<const std::uint8_t> key, std::span<const std::uint8_t> plaintext, std::span<const std::uint8_t> aad);
SecretBytes Open(std::span<const std::uint8_t> key, const Sealed& sealed, std::span<const std::uint8_t> aad);

Bytes RandomBytes(std::size_t length);

bool ConstantTimeEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b);

std::string ToHex(std::span<const std::uint8_t> data);
Bytes       FromHex(std::string_view hex);

// protobuf `bytes` fields are std::string; these bridge the two.
std::span<const std::uint8_t> AsBytes(std::string_view data);
std::string                   ToString(std::span<const std::uint8_t> data);

Bytes Concat(std::initializer_list<std::span<const std::uint8_t>> parts);

} // namespace mprisrelay::crypto
