#ifndef DDSLEDGER_CORE_BLOCKCHAIN_HPP
#define DDSLEDGER_CORE_BLOCKCHAIN_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include "config/chainparams.hpp"
#include "core/block.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

/**
 * @file blockchain.hpp
 * @brief Append-only, hash-linked sequence of blocks starting at a fixed genesis block.
 *
 * Responsibilities:
 *   - Create the genesis block (index 0, empty previous hash, no transactions, timestamp from
 *     ChainParams so every node agrees on its hash).
 *   - Accept new blocks only after every transaction signature and the block linkage validate.
 *   - Answer queries by index and transaction ID, and re-validate the whole chain on demand.
 *
 * Reads take a shared lock, appends an exclusive one; the sequence is never reordered or
 * truncated. A rejected append leaves the chain length unchanged. Appended blocks are only
 * handed out as shared_ptr<const Block>.
 *
 * Minimal usage:
 *   @code
 *     Blockchain chain;
 *     auto tx = Transaction::NewTransaction(wallet.GetAddress(), TransactionType::PostCreated, cid);
 *     tx.Sign(wallet.GetPrivateKeyBytes());
 *     auto blk = chain.AddBlock({tx});
 *   @endcode
 */

namespace ddsledger {
namespace core {

class Blockchain
{
public:
    explicit Blockchain(const config::ChainParams &params = config::getDefaultParams())
        : m_params(params)
    {
        auto genesis = std::make_shared<Block>(
            Block::NewBlock(0, "", {}, m_params.genesisTimestamp));
        m_blocks.push_back(genesis);
        util::logger::info("[Blockchain] Genesis " + genesis->hash + " on " + m_params.networkID);
    }

    Blockchain(const Blockchain &) = delete;
    Blockchain &operator=(const Blockchain &) = delete;

    /**
     * @brief Build a block from txs on top of the current head and append it.
     * @return The appended block.
     * @throw MalformedInputError if ChainParams limits are exceeded.
     * @throw InvalidSignatureError if any transaction is unsigned or does not verify.
     * @throw ChainLinkageError if the built block fails validation against the head.
     */
    std::shared_ptr<const Block> AddBlock(const std::vector<Transaction> &txs)
    {
        checkLimits(txs);
        for (const auto &tx : txs) {
            if (!tx.IsSigned()) {
                throw util::InvalidSignatureError("Blockchain: transaction " + tx.GetID() + " is not signed");
            }
            if (!tx.VerifySignature()) {
                throw util::InvalidSignatureError("Blockchain: transaction " + tx.GetID()
                                                  + " has an invalid signature");
            }
        }

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        const Block &head = *m_blocks.back();
        auto blk = std::make_shared<Block>(Block::NewBlock(head.header.index + 1, head.hash, txs));
        blk->Validate(&head);
        m_blocks.push_back(blk);
        util::logger::info("[Blockchain] Appended block " + std::to_string(blk->header.index)
                           + " (" + std::to_string(txs.size()) + " txs) " + blk->hash);
        return blk;
    }

    /**
     * @brief Append a block built elsewhere (e.g. received from a peer).
     * @throw ChainLinkageError / InvalidSignatureError if it does not extend the head.
     */
    std::shared_ptr<const Block> AppendBlock(const Block &blk)
    {
        checkLimits(blk.transactions);
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        blk.Validate(m_blocks.back().get());
        auto stored = std::make_shared<Block>(blk);
        m_blocks.push_back(stored);
        util::logger::info("[Blockchain] Accepted block " + std::to_string(blk.header.index)
                           + " " + blk.hash);
        return stored;
    }

    std::shared_ptr<const Block> GetLatestBlock() const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_blocks.back();
    }

    /// @throw NotFoundError when index is out of range.
    std::shared_ptr<const Block> GetBlockByIndex(int64_t index) const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        if (index < 0 || static_cast<uint64_t>(index) >= m_blocks.size()) {
            throw util::NotFoundError("Blockchain: no block at index " + std::to_string(index));
        }
        return m_blocks[static_cast<size_t>(index)];
    }

    /// Searches newest blocks first. @throw NotFoundError when absent.
    Transaction GetTransactionByID(const std::string &txId) const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (auto it = m_blocks.rbegin(); it != m_blocks.rend(); ++it) {
            for (const auto &tx : (*it)->transactions) {
                if (tx.GetID() == txId) {
                    return tx;
                }
            }
        }
        throw util::NotFoundError("Blockchain: no transaction " + txId);
    }

    /// Every transaction sent by senderAddress, oldest first.
    std::vector<Transaction> GetTransactionsBySender(const std::string &senderAddress) const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        std::vector<Transaction> out;
        for (const auto &blk : m_blocks) {
            for (const auto &tx : blk->transactions) {
                if (tx.GetSenderAddress() == senderAddress) {
                    out.push_back(tx);
                }
            }
        }
        return out;
    }

    /// Index of the head block (0 for a fresh chain).
    int64_t GetHeight() const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_blocks.back()->header.index;
    }

    /// Number of blocks including genesis.
    size_t GetLength() const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_blocks.size();
    }

    const config::ChainParams &GetParams() const { return m_params; }

    /**
     * @brief Walk from genesis, validating each block against its predecessor.
     *        Stops at the first fault.
     * @param reason receives the fault description when not null.
     */
    bool IsChainValid(std::string *reason = nullptr) const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        const Block *prev = nullptr;
        for (const auto &blk : m_blocks) {
            std::string why;
            if (!blk->IsBlockValid(prev, &why)) {
                util::logger::error("[Blockchain] Chain invalid at block "
                                    + std::to_string(blk->header.index) + ": " + why);
                if (reason) {
                    *reason = why;
                }
                return false;
            }
            prev = blk.get();
        }
        return true;
    }

protected:
    /// Edit a stored block in place under the writer lock. Only subclasses used to
    /// exercise validation of a damaged chain reach this.
    void rewriteBlock(int64_t index, const std::function<void(Block &)> &edit)
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (index < 0 || static_cast<uint64_t>(index) >= m_blocks.size()) {
            throw util::NotFoundError("Blockchain: no block at index " + std::to_string(index));
        }
        edit(*m_blocks[static_cast<size_t>(index)]);
    }

private:
    void checkLimits(const std::vector<Transaction> &txs) const
    {
        if (m_params.maxTransactionsPerBlock > 0 && txs.size() > m_params.maxTransactionsPerBlock) {
            throw util::MalformedInputError("Blockchain: " + std::to_string(txs.size())
                                            + " transactions exceed the per-block limit of "
                                            + std::to_string(m_params.maxTransactionsPerBlock));
        }
        if (m_params.maxPayloadBytes > 0) {
            for (const auto &tx : txs) {
                if (tx.GetPayload().size() > m_params.maxPayloadBytes) {
                    throw util::MalformedInputError("Blockchain: payload of " + tx.GetID()
                                                    + " exceeds " + std::to_string(m_params.maxPayloadBytes)
                                                    + " bytes");
                }
            }
        }
    }

    config::ChainParams m_params;
    mutable std::shared_mutex m_mutex;
    std::vector<std::shared_ptr<Block>> m_blocks;
};

} // namespace core
} // namespace ddsledger

#endif // DDSLEDGER_CORE_BLOCKCHAIN_HPP
