#ifndef DDSLEDGER_IDENTITY_WALLET_HPP
#define DDSLEDGER_IDENTITY_WALLET_HPP

#include <string>
#include <utility>
#include <vector>
#include "identity/keys.hpp"
#include "util/logger.hpp"

/*
  wallet.hpp
  ----------------------------------------------------------------
  A signing identity held by an application collaborator.

  Required Methods:
    static Wallet Create()                                   // fresh P-256 key pair
    static Wallet FromPrivateKeyBytes(const std::vector<uint8_t> &der)
    const std::string& GetAddress() const                   // hex sha256(public key)
    const std::vector<uint8_t>& GetPublicKeyBytes() const   // 65-byte uncompressed point
    std::vector<uint8_t> GetPrivateKeyBytes() const         // SEC1 DER, for local persistence only
    std::vector<uint8_t> SignData(const std::vector<uint8_t> &hash) const

  The private key never leaves the wallet except through GetPrivateKeyBytes(), which is
  meant for storing the key on the holder's own disk, or for Transaction::Sign().
*/

namespace ddsledger {
namespace identity {

class Wallet
{
public:
    static Wallet Create()
    {
        Wallet w(GenerateKeyPair());
        util::logger::debug("[Wallet] Created wallet " + w.GetAddress());
        return w;
    }

    /// @throw MalformedInputError if the DER bytes are empty or not a P-256 key.
    static Wallet FromPrivateKeyBytes(const std::vector<uint8_t> &der)
    {
        KeyPair kp;
        kp.privateKey = BytesToPrivateKey(der);
        kp.publicKey = kp.privateKey.PublicKeyBytes();
        kp.address = PublicKeyToAddress(kp.publicKey);
        return Wallet(std::move(kp));
    }

    const std::string& GetAddress() const
    {
        return m_keys.address;
    }

    const std::vector<uint8_t>& GetPublicKeyBytes() const
    {
        return m_keys.publicKey;
    }

    std::vector<uint8_t> GetPrivateKeyBytes() const
    {
        return PrivateKeyToBytes(m_keys.privateKey);
    }

    /// Sign an already computed digest; returns a 64-byte r||s signature.
    std::vector<uint8_t> SignData(const std::vector<uint8_t> &hash) const
    {
        return Sign(m_keys.privateKey, hash);
    }

private:
    explicit Wallet(KeyPair keys)
        : m_keys(std::move(keys))
    {
    }

    KeyPair m_keys;
};

} // namespace identity
} // namespace ddsledger

#endif // DDSLEDGER_IDENTITY_WALLET_HPP
