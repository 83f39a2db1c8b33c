#ifndef DDSLEDGER_IDENTITY_KEYS_HPP
#define DDSLEDGER_IDENTITY_KEYS_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>

/*
  keys.hpp
  ----------------------------------------------------------------
  ECDSA P-256 key management and sign/verify primitives.

  Encodings:
    - Private key bytes: SEC1 "EC PRIVATE KEY" DER.
    - Public key bytes:  65-byte uncompressed SEC1 point [0x04][X(32)][Y(32)].
    - Signature:         64 bytes, r || s, each big-endian and left-padded with zeros to
                         the 32-byte coordinate width of the curve.
    - Address:           lowercase hex SHA-256 of the public key bytes.

  Sign() takes an already computed digest and signs it as-is (no second hashing pass),
  so callers hash their message once with util::hashing::sha256Raw().

  Uses the OpenSSL 3 EVP interface; no deprecated EC_KEY calls.
*/

namespace ddsledger {
namespace identity {

/// Width in bytes of one P-256 coordinate / scalar.
constexpr size_t kCoordinateSize = 32;
/// Length of a fixed-width r||s signature.
constexpr size_t kSignatureSize = 2 * kCoordinateSize;
/// Length of an uncompressed public key point.
constexpr size_t kPublicKeySize = 1 + 2 * kCoordinateSize;

/**
 * @brief Owning handle to a P-256 private key. Copies share the underlying key.
 */
class PrivateKey
{
public:
    PrivateKey() = default;

    /// Generate a fresh key from the OpenSSL CSPRNG.
    static PrivateKey Generate();

    /// Parse SEC1 DER bytes. Throws MalformedInputError if empty, unparsable or not P-256.
    static PrivateKey FromBytes(const std::vector<uint8_t> &der);

    /// SEC1 DER encoding of the key.
    std::vector<uint8_t> ToBytes() const;

    /// Uncompressed public point matching this key.
    std::vector<uint8_t> PublicKeyBytes() const;

    bool IsNull() const { return !m_key; }

    EVP_PKEY* Get() const { return m_key.get(); }

private:
    explicit PrivateKey(EVP_PKEY *raw);

    std::shared_ptr<EVP_PKEY> m_key;
};

/**
 * @brief A generated identity: private key plus its derived public key and address.
 */
struct KeyPair
{
    PrivateKey           privateKey;
    std::vector<uint8_t> publicKey;
    std::string          address;
};

KeyPair GenerateKeyPair();

/**
 * @brief hex(SHA-256(publicKeyBytes)).
 * @throw MalformedInputError if the bytes are not a valid uncompressed P-256 point.
 */
std::string PublicKeyToAddress(const std::vector<uint8_t> &publicKey);

/**
 * @brief Sign a digest.
 * @return 64-byte fixed-width r||s signature.
 * @throw MalformedInputError on a null key or empty digest.
 */
std::vector<uint8_t> Sign(const PrivateKey &key, const std::vector<uint8_t> &hash);

/**
 * @brief Verify an r||s signature over a digest.
 * @return true only for a valid signature by the holder of publicKey.
 * @throw MalformedInputError if publicKey is empty or unparsable, hash is empty, or the
 *        signature is not exactly kSignatureSize bytes.
 */
bool VerifySignature(const std::vector<uint8_t> &publicKey,
                     const std::vector<uint8_t> &hash,
                     const std::vector<uint8_t> &signature);

std::vector<uint8_t> PrivateKeyToBytes(const PrivateKey &key);
PrivateKey BytesToPrivateKey(const std::vector<uint8_t> &der);

std::vector<uint8_t> PublicKeyToBytes(const PrivateKey &key);

/**
 * @brief Build a verification key from uncompressed point bytes.
 * @throw MalformedInputError if the bytes are not a point on P-256.
 */
std::shared_ptr<EVP_PKEY> BytesToPublicKey(const std::vector<uint8_t> &publicKey);

} // namespace identity
} // namespace ddsledger

#endif // DDSLEDGER_IDENTITY_KEYS_HPP
