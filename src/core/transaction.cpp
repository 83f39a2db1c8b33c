#include "core/transaction.hpp"

#include <chrono>

#include "identity/keys.hpp"
#include "util/errors.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace ddsledger {
namespace core {

const char* TransactionTypeName(TransactionType type)
{
    switch (type) {
        case TransactionType::Generic:        return "GENERIC";
        case TransactionType::PostCreated:    return "POST_CREATED";
        case TransactionType::FollowUser:     return "FOLLOW_USER";
        case TransactionType::ProfileUpdated: return "PROFILE_UPDATED";
    }
    return "GENERIC";
}

TransactionType ParseTransactionType(const std::string &name)
{
    if (name == "GENERIC")         return TransactionType::Generic;
    if (name == "POST_CREATED")    return TransactionType::PostCreated;
    if (name == "FOLLOW_USER")     return TransactionType::FollowUser;
    if (name == "PROFILE_UPDATED") return TransactionType::ProfileUpdated;
    throw util::MalformedInputError("Transaction: unknown type '" + name + "'");
}

Transaction Transaction::NewTransaction(const std::string &senderAddress,
                                        TransactionType type,
                                        const std::vector<uint8_t> &payload)
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    int64_t ts = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
    return NewTransaction(senderAddress, type, payload, ts);
}

Transaction Transaction::NewTransaction(const std::string &senderAddress,
                                        TransactionType type,
                                        const std::vector<uint8_t> &payload,
                                        int64_t timestamp)
{
    if (senderAddress.empty()) {
        throw util::MalformedInputError("Transaction: sender address cannot be empty");
    }
    Transaction tx;
    tx.m_timestamp = timestamp;
    tx.m_type = type;
    tx.m_senderAddress = senderAddress;
    tx.m_payload = payload;
    tx.m_id = util::hashing::toHex(tx.CalculateHash());
    return tx;
}

Transaction Transaction::NewTransaction(const std::string &senderAddress,
                                        TransactionType type,
                                        const std::string &payload)
{
    return NewTransaction(senderAddress, type, std::vector<uint8_t>(payload.begin(), payload.end()));
}

std::vector<uint8_t> Transaction::CalculateHash() const
{
    std::string material = std::to_string(m_timestamp)
                         + TransactionTypeName(m_type)
                         + m_senderAddress
                         + util::hashing::toHex(m_payload);
    return util::hashing::sha256Raw(material);
}

void Transaction::Sign(const std::vector<uint8_t> &privateKeyBytes)
{
    if (privateKeyBytes.empty()) {
        throw util::MalformedInputError("Transaction: private key bytes cannot be empty");
    }
    identity::PrivateKey key = identity::BytesToPrivateKey(privateKeyBytes);
    std::vector<uint8_t> pub = identity::PublicKeyToBytes(key);
    if (identity::PublicKeyToAddress(pub) != m_senderAddress) {
        throw util::MalformedInputError("Transaction: signing key does not belong to sender "
                                        + m_senderAddress);
    }

    m_senderPublicKey = pub;
    m_signature = identity::Sign(key, CalculateHash());
}

bool Transaction::VerifySignature() const
{
    if (m_senderPublicKey.empty() || m_signature.empty()) {
        return false;
    }
    try {
        if (identity::PublicKeyToAddress(m_senderPublicKey) != m_senderAddress) {
            return false;
        }
        return identity::VerifySignature(m_senderPublicKey, CalculateHash(), m_signature);
    }
    catch (const util::MalformedInputError &ex) {
        util::logger::debug(std::string("[Transaction] Malformed signature data on ") + m_id + ": " + ex.what());
        return false;
    }
}

} // namespace core
} // namespace ddsledger
