#include "identity/keys.hpp"

#include <cstring>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/param_build.h>
#include <openssl/x509.h>

#include "util/errors.hpp"
#include "util/hashing.hpp"

namespace ddsledger {
namespace identity {

using util::MalformedInputError;

namespace {

const char *kCurveName = "prime256v1";

struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX *p) const { EVP_PKEY_CTX_free(p); } };
struct SigDeleter { void operator()(ECDSA_SIG *p) const { ECDSA_SIG_free(p); } };
struct ParamBldDeleter { void operator()(OSSL_PARAM_BLD *p) const { OSSL_PARAM_BLD_free(p); } };
struct ParamDeleter { void operator()(OSSL_PARAM *p) const { OSSL_PARAM_free(p); } };

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using SigPtr = std::unique_ptr<ECDSA_SIG, SigDeleter>;

std::shared_ptr<EVP_PKEY> wrap(EVP_PKEY *raw)
{
    return std::shared_ptr<EVP_PKEY>(raw, EVP_PKEY_free);
}

// Accept only EC keys on P-256; other curves would break the fixed signature width.
bool isP256(EVP_PKEY *pkey)
{
    if (!pkey || !EVP_PKEY_is_a(pkey, "EC")) {
        return false;
    }
    char group[64] = {0};
    size_t len = 0;
    if (EVP_PKEY_get_utf8_string_param(pkey, OSSL_PKEY_PARAM_GROUP_NAME,
                                       group, sizeof(group), &len) != 1) {
        return false;
    }
    return std::strcmp(group, kCurveName) == 0;
}

void forceUncompressed(EVP_PKEY *pkey)
{
    // Only fails for non-EC keys, which callers have already excluded.
    EVP_PKEY_set_utf8_string_param(pkey, OSSL_PKEY_PARAM_EC_POINT_CONVERSION_FORMAT,
                                   "uncompressed");
}

void requireUncompressedPoint(const std::vector<uint8_t> &publicKey)
{
    if (publicKey.empty()) {
        throw MalformedInputError("identity: public key bytes cannot be empty");
    }
    if (publicKey.size() != kPublicKeySize || publicKey[0] != 0x04) {
        throw MalformedInputError("identity: public key must be a 65-byte uncompressed P-256 point, got "
                                  + std::to_string(publicKey.size()) + " bytes");
    }
}

} // namespace

PrivateKey::PrivateKey(EVP_PKEY *raw)
    : m_key(wrap(raw))
{
}

PrivateKey PrivateKey::Generate()
{
    EVP_PKEY *raw = EVP_EC_gen(kCurveName);
    if (!raw) {
        throw std::runtime_error("identity: P-256 key generation failed");
    }
    forceUncompressed(raw);
    return PrivateKey(raw);
}

PrivateKey PrivateKey::FromBytes(const std::vector<uint8_t> &der)
{
    if (der.empty()) {
        throw MalformedInputError("identity: private key bytes cannot be empty");
    }
    const unsigned char *p = der.data();
    EVP_PKEY *raw = d2i_PrivateKey(EVP_PKEY_EC, nullptr, &p, static_cast<long>(der.size()));
    if (!raw) {
        throw MalformedInputError("identity: failed to parse private key DER");
    }
    PrivateKey key(raw);
    if (!isP256(raw)) {
        throw MalformedInputError("identity: private key is not on curve P-256");
    }
    forceUncompressed(raw);
    return key;
}

std::vector<uint8_t> PrivateKey::ToBytes() const
{
    if (!m_key) {
        throw MalformedInputError("identity: private key is null");
    }
    unsigned char *out = nullptr;
    int len = i2d_PrivateKey(m_key.get(), &out);
    if (len <= 0 || !out) {
        throw std::runtime_error("identity: failed to encode private key");
    }
    std::vector<uint8_t> der(out, out + len);
    OPENSSL_free(out);
    return der;
}

std::vector<uint8_t> PrivateKey::PublicKeyBytes() const
{
    if (!m_key) {
        throw MalformedInputError("identity: private key is null");
    }
    std::vector<uint8_t> pub(kPublicKeySize);
    size_t len = 0;
    if (EVP_PKEY_get_octet_string_param(m_key.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                        pub.data(), pub.size(), &len) != 1
        || len != kPublicKeySize)
    {
        throw std::runtime_error("identity: failed to export public key");
    }
    return pub;
}

KeyPair GenerateKeyPair()
{
    KeyPair kp;
    kp.privateKey = PrivateKey::Generate();
    kp.publicKey = kp.privateKey.PublicKeyBytes();
    kp.address = PublicKeyToAddress(kp.publicKey);
    return kp;
}

std::string PublicKeyToAddress(const std::vector<uint8_t> &publicKey)
{
    // Parsing proves the bytes name a real point before we derive an address from them.
    BytesToPublicKey(publicKey);
    return util::hashing::sha256(publicKey);
}

std::vector<uint8_t> Sign(const PrivateKey &key, const std::vector<uint8_t> &hash)
{
    if (key.IsNull()) {
        throw MalformedInputError("identity: private key cannot be null");
    }
    if (hash.empty()) {
        throw MalformedInputError("identity: hash to sign cannot be empty");
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(key.Get(), nullptr));
    if (!ctx || EVP_PKEY_sign_init(ctx.get()) != 1) {
        throw std::runtime_error("identity: EVP_PKEY_sign_init failed");
    }

    size_t derLen = 0;
    if (EVP_PKEY_sign(ctx.get(), nullptr, &derLen, hash.data(), hash.size()) != 1) {
        throw std::runtime_error("identity: EVP_PKEY_sign (size query) failed");
    }
    std::vector<uint8_t> der(derLen);
    if (EVP_PKEY_sign(ctx.get(), der.data(), &derLen, hash.data(), hash.size()) != 1) {
        throw std::runtime_error("identity: EVP_PKEY_sign failed");
    }

    const unsigned char *p = der.data();
    SigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(derLen)));
    if (!sig) {
        throw std::runtime_error("identity: failed to decode DER signature");
    }
    const BIGNUM *r = nullptr;
    const BIGNUM *s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    std::vector<uint8_t> out(kSignatureSize);
    if (BN_bn2binpad(r, out.data(), kCoordinateSize) != static_cast<int>(kCoordinateSize)
        || BN_bn2binpad(s, out.data() + kCoordinateSize, kCoordinateSize) != static_cast<int>(kCoordinateSize))
    {
        throw std::runtime_error("identity: signature component exceeds coordinate width");
    }
    return out;
}

bool VerifySignature(const std::vector<uint8_t> &publicKey,
                     const std::vector<uint8_t> &hash,
                     const std::vector<uint8_t> &signature)
{
    if (hash.empty()) {
        throw MalformedInputError("identity: hash to verify cannot be empty");
    }
    if (signature.size() != kSignatureSize) {
        throw MalformedInputError("identity: signature must be " + std::to_string(kSignatureSize)
                                  + " bytes (r || s), got " + std::to_string(signature.size()));
    }
    std::shared_ptr<EVP_PKEY> pub = BytesToPublicKey(publicKey);

    SigPtr sig(ECDSA_SIG_new());
    BIGNUM *r = BN_bin2bn(signature.data(), kCoordinateSize, nullptr);
    BIGNUM *s = BN_bin2bn(signature.data() + kCoordinateSize, kCoordinateSize, nullptr);
    if (!sig || !r || !s || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
        BN_free(r);
        BN_free(s);
        throw std::runtime_error("identity: failed to build ECDSA_SIG");
    }

    unsigned char *der = nullptr;
    int derLen = i2d_ECDSA_SIG(sig.get(), &der);
    if (derLen <= 0 || !der) {
        throw std::runtime_error("identity: failed to DER-encode signature");
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(pub.get(), nullptr));
    int rc = -1;
    if (ctx && EVP_PKEY_verify_init(ctx.get()) == 1) {
        rc = EVP_PKEY_verify(ctx.get(), der, static_cast<size_t>(derLen), hash.data(), hash.size());
    }
    OPENSSL_free(der);
    return rc == 1;
}

std::vector<uint8_t> PrivateKeyToBytes(const PrivateKey &key)
{
    return key.ToBytes();
}

PrivateKey BytesToPrivateKey(const std::vector<uint8_t> &der)
{
    return PrivateKey::FromBytes(der);
}

std::vector<uint8_t> PublicKeyToBytes(const PrivateKey &key)
{
    return key.PublicKeyBytes();
}

std::shared_ptr<EVP_PKEY> BytesToPublicKey(const std::vector<uint8_t> &publicKey)
{
    requireUncompressedPoint(publicKey);

    std::unique_ptr<OSSL_PARAM_BLD, ParamBldDeleter> bld(OSSL_PARAM_BLD_new());
    if (!bld
        || OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, kCurveName, 0) != 1
        || OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                            publicKey.data(), publicKey.size()) != 1)
    {
        throw std::runtime_error("identity: failed to build public key parameters");
    }
    std::unique_ptr<OSSL_PARAM, ParamDeleter> params(OSSL_PARAM_BLD_to_param(bld.get()));
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
    if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
        throw std::runtime_error("identity: failed to initialise public key import");
    }

    EVP_PKEY *raw = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params.get()) != 1 || !raw) {
        throw MalformedInputError("identity: public key bytes are not a point on P-256");
    }
    return wrap(raw);
}

} // namespace identity
} // namespace ddsledger
