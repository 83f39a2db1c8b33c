#ifndef DDSLEDGER_CONFIG_CHAINPARAMS_HPP
#define DDSLEDGER_CONFIG_CHAINPARAMS_HPP

#include <cstdint>
#include <string>

/**
 * @file chainparams.hpp
 * @brief Ledger-wide parameters shared by every node of one network.
 *
 * Example usage:
 *  @code
 *    ddsledger::core::Blockchain chain(ddsledger::config::getDefaultParams());
 *  @endcode
 */

namespace ddsledger {
namespace config {

/**
 * @struct ChainParams
 * @brief Parameters that must agree across nodes for their chains to be comparable.
 */
struct ChainParams
{
    // Identifies the network: "mainnet", "testnet", "devnet", ...
    std::string networkID;

    // Timestamp (Unix nanoseconds) written into the genesis header. Fixed so that
    // every node derives the same genesis hash.
    int64_t genesisTimestamp;

    // Upper bound on transactions accepted into one block (0 = unlimited).
    uint64_t maxTransactionsPerBlock;

    // Upper bound on a single transaction payload in bytes (0 = unlimited).
    uint64_t maxPayloadBytes;
};

inline ChainParams getDefaultParams()
{
    ChainParams params;
    params.networkID = "mainnet";
    params.genesisTimestamp = 0;
    params.maxTransactionsPerBlock = 1000;
    params.maxPayloadBytes = 64 * 1024;
    return params;
}

inline ChainParams getTestnetParams()
{
    ChainParams params = getDefaultParams();
    params.networkID = "testnet";
    params.maxTransactionsPerBlock = 0;
    return params;
}

} // namespace config
} // namespace ddsledger

#endif // DDSLEDGER_CONFIG_CHAINPARAMS_HPP
