#ifndef DDSLEDGER_CORE_BLOCK_HPP
#define DDSLEDGER_CORE_BLOCK_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "core/transaction.hpp"
#include "util/errors.hpp"
#include "util/hashing.hpp"

/**
 * @file block.hpp
 * @brief Block structure of the ddsledger chain and its validation rules.
 *
 *   - BlockHeader: index, timestamp, link to the previous block, commitment to the transactions.
 *   - Block: header + ordered signed transactions + the cached header hash.
 *
 * Key Points:
 *   - The block hash covers the header fields only. Transactions are committed through
 *     merkleRoot, so editing a transaction's ID list changes the hash indirectly.
 *   - merkleRoot is a flat SHA-256 over the concatenated transaction IDs in block order (empty
 *     string for a block without transactions). It is order-sensitive, not a binary tree.
 */

namespace ddsledger {
namespace core {

/**
 * @brief Essential header fields.
 *  - index: position in the chain (genesis is 0)
 *  - timestamp: creation time, Unix nanoseconds
 *  - previousHash: hash of the block at index-1 (empty for genesis)
 *  - merkleRoot: commitment to the ordered transaction IDs
 */
struct BlockHeader
{
    int64_t     index{0};
    int64_t     timestamp{0};
    std::string previousHash;
    std::string merkleRoot;
};

class Block
{
public:
    BlockHeader header;
    std::vector<Transaction> transactions;
    std::string hash;

public:
    Block() = default;

    /**
     * @brief Build a block, computing merkleRoot and hash.
     * @throw MalformedInputError if index is negative.
     */
    static Block NewBlock(int64_t index,
                          const std::string &previousHash,
                          std::vector<Transaction> txs,
                          int64_t timestamp = currentTimestamp())
    {
        if (index < 0) {
            throw util::MalformedInputError("Block: index cannot be negative");
        }
        Block blk;
        blk.header.index = index;
        blk.header.timestamp = timestamp;
        blk.header.previousHash = previousHash;
        blk.transactions = std::move(txs);
        blk.header.merkleRoot = CalculateMerkleRoot(blk.transactions);
        blk.hash = blk.CalculateBlockHash();
        return blk;
    }

    /**
     * @brief Hex SHA-256 over decimal(index) + decimal(timestamp) + previousHash + merkleRoot.
     */
    inline std::string CalculateBlockHash() const
    {
        std::string material = std::to_string(header.index)
                             + std::to_string(header.timestamp)
                             + header.previousHash
                             + header.merkleRoot;
        return util::hashing::sha256(material);
    }

    static std::string CalculateMerkleRoot(const std::vector<Transaction> &txs)
    {
        if (txs.empty()) {
            return "";
        }
        std::string joined;
        for (const auto &tx : txs) {
            joined += tx.GetID();
        }
        return util::hashing::sha256(joined);
    }

    /**
     * @brief Validate this block against its predecessor (nullptr means "this is genesis").
     *
     * Genesis: index 0, empty previousHash.
     * Otherwise: index == prev->index + 1 and previousHash == prev->hash.
     * Always: stored merkleRoot and hash match the recomputed ones; each transaction's ID matches
     * its fields and its signature verifies.
     *
     * @throw ChainLinkageError on index/hash/merkle mismatches.
     * @throw InvalidSignatureError on the first transaction that does not verify.
     */
    inline void Validate(const Block *prev) const
    {
        if (prev == nullptr) {
            if (header.index != 0) {
                throw util::ChainLinkageError("Block: genesis must have index 0, got "
                                              + std::to_string(header.index));
            }
            if (!header.previousHash.empty()) {
                throw util::ChainLinkageError("Block: genesis must have an empty previous hash");
            }
        }
        else {
            if (header.index != prev->header.index + 1) {
                throw util::ChainLinkageError("Block " + std::to_string(header.index)
                                              + ": expected index "
                                              + std::to_string(prev->header.index + 1));
            }
            if (header.previousHash != prev->hash) {
                throw util::ChainLinkageError("Block " + std::to_string(header.index)
                                              + ": previous hash " + header.previousHash
                                              + " does not match " + prev->hash);
            }
        }

        std::string merkle = CalculateMerkleRoot(transactions);
        if (merkle != header.merkleRoot) {
            throw util::ChainLinkageError("Block " + std::to_string(header.index)
                                          + ": merkle root mismatch");
        }
        std::string computed = CalculateBlockHash();
        if (computed != hash) {
            throw util::ChainLinkageError("Block " + std::to_string(header.index)
                                          + ": stored hash " + hash + " but header hashes to " + computed);
        }

        for (const auto &tx : transactions) {
            if (tx.GetID() != util::hashing::toHex(tx.CalculateHash())) {
                throw util::InvalidSignatureError("Block " + std::to_string(header.index)
                                                  + ": transaction " + tx.GetID()
                                                  + " does not match its fields");
            }
            if (!tx.VerifySignature()) {
                throw util::InvalidSignatureError("Block " + std::to_string(header.index)
                                                  + ": transaction " + tx.GetID()
                                                  + " has an invalid signature");
            }
        }
    }

    /**
     * @brief Non-throwing form of Validate().
     * @param reason receives the failure description when not null.
     */
    inline bool IsBlockValid(const Block *prev, std::string *reason = nullptr) const
    {
        try {
            Validate(prev);
            return true;
        }
        catch (const util::DdsLedgerError &ex) {
            if (reason) {
                *reason = ex.what();
            }
            return false;
        }
    }

    static int64_t currentTimestamp()
    {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
    }
};

} // namespace core
} // namespace ddsledger

#endif // DDSLEDGER_CORE_BLOCK_HPP
