#ifndef DDSLEDGER_CORE_TRANSACTION_HPP
#define DDSLEDGER_CORE_TRANSACTION_HPP

#include <cstdint>
#include <string>
#include <vector>

/*
  transaction.hpp
  ----------------------------------------------------------------
  A signed claim recorded on the ledger, e.g. "address X published content C".

  Public Methods (must remain):
    static Transaction NewTransaction(sender, type, payload)
    std::vector<uint8_t> CalculateHash() const
    void Sign(const std::vector<uint8_t> &privateKeyBytes)
    bool VerifySignature() const
    getters / setters for every field

  Explanation:
   - The signing hash is SHA-256 over
       decimal(timestamp) + typeName + senderAddress + hex(payload)
     and the ID is its hex form, fixed at creation. Signature, public key and ID are
     not part of the hash.
   - Sign() takes SEC1 DER private key bytes, stores the matching 65-byte public key and
     a 64-byte r||s signature. The key must belong to the sender address.
   - VerifySignature() recomputes the hash from the current fields, so changing any of
     timestamp, type, sender or payload after signing makes it return false. It never throws.
*/

namespace ddsledger {
namespace core {

enum class TransactionType
{
    Generic,
    PostCreated,
    FollowUser,
    ProfileUpdated
};

/// Stable wire name: GENERIC, POST_CREATED, FOLLOW_USER, PROFILE_UPDATED.
const char* TransactionTypeName(TransactionType type);

/// @throw MalformedInputError for an unknown name.
TransactionType ParseTransactionType(const std::string &name);

class Transaction
{
public:
    Transaction() = default;

    /**
     * @brief Create an unsigned transaction stamped with the current time (Unix ns).
     * @throw MalformedInputError if senderAddress is empty.
     */
    static Transaction NewTransaction(const std::string &senderAddress,
                                      TransactionType type,
                                      const std::vector<uint8_t> &payload);

    /// Same, with an explicit timestamp.
    static Transaction NewTransaction(const std::string &senderAddress,
                                      TransactionType type,
                                      const std::vector<uint8_t> &payload,
                                      int64_t timestamp);

    static Transaction NewTransaction(const std::string &senderAddress,
                                      TransactionType type,
                                      const std::string &payload);

    /// Raw 32-byte signing hash of the current fields.
    std::vector<uint8_t> CalculateHash() const;

    /**
     * @throw MalformedInputError if the key bytes are empty, unparsable, or do not belong to
     *        the sender address.
     */
    void Sign(const std::vector<uint8_t> &privateKeyBytes);

    bool VerifySignature() const;

    bool IsSigned() const { return !m_signature.empty() && !m_senderPublicKey.empty(); }

    const std::string& GetID() const { return m_id; }

    int64_t GetTimestamp() const { return m_timestamp; }
    void SetTimestamp(int64_t ts) { m_timestamp = ts; }

    TransactionType GetType() const { return m_type; }
    void SetType(TransactionType type) { m_type = type; }

    const std::string& GetSenderAddress() const { return m_senderAddress; }
    void SetSenderAddress(const std::string &addr) { m_senderAddress = addr; }

    const std::vector<uint8_t>& GetPayload() const { return m_payload; }
    void SetPayload(const std::vector<uint8_t> &data) { m_payload = data; }
    std::string GetPayloadAsString() const { return std::string(m_payload.begin(), m_payload.end()); }

    const std::vector<uint8_t>& GetSenderPublicKey() const { return m_senderPublicKey; }
    void SetSenderPublicKey(const std::vector<uint8_t> &pub) { m_senderPublicKey = pub; }

    const std::vector<uint8_t>& GetSignature() const { return m_signature; }
    void SetSignature(const std::vector<uint8_t> &sig) { m_signature = sig; }

private:
    std::string           m_id;
    int64_t               m_timestamp{0};
    TransactionType       m_type{TransactionType::Generic};
    std::string           m_senderAddress;
    std::vector<uint8_t>  m_payload;
    std::vector<uint8_t>  m_senderPublicKey;
    std::vector<uint8_t>  m_signature;
};

} // namespace core
} // namespace ddsledger

#endif // DDSLEDGER_CORE_TRANSACTION_HPP
