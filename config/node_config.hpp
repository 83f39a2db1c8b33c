#ifndef DDSLEDGER_CONFIG_NODE_CONFIG_HPP
#define DDSLEDGER_CONFIG_NODE_CONFIG_HPP

#include <cstdint>
#include <string>

/**
 * @file node_config.hpp
 * @brief Configuration for a single ddsledger node (local storage, chunking, peer requests, logging).
 *
 * USAGE:
 *   - Populated manually or through util/config_parser.hpp.
 *   - Consumed by node::DdsNode::InitializeNode().
 */

namespace ddsledger {
namespace config {

/**
 * @struct NodeConfig
 * @brief Holds the local settings of one node:
 *   - nodeName / nodeAddress / nodeWeight: how this node presents itself to peers.
 *   - dataDirectory: where the sqlite store lives when storageBackend == "sqlite".
 *   - chunkSize: fixed chunk size used by the chunker (bytes, > 0).
 *   - storageBackend: "memory" or "sqlite".
 *   - compressChunks: zlib-compress chunk bodies in the sqlite store.
 *   - requestTimeoutMs / requestWorkers: per-peer request deadline (0 disables it).
 *   - logLevel / logFile: logger settings; an empty logFile keeps console output only.
 */
struct NodeConfig
{
    NodeConfig()
        : nodeName("ddsledger_node"),
          nodeAddress("127.0.0.1:7400"),
          nodeWeight(100),
          dataDirectory("./ddsledger_data"),
          chunkSize(1024),
          storageBackend("memory"),
          compressChunks(false),
          requestTimeoutMs(2000),
          requestWorkers(4),
          logLevel("INFO"),
          logFile("")
    {
    }

    /// Identifier announced to peers. Also used as the PeerNode ID.
    std::string nodeName;

    /// Network-reachable endpoint announced to peers.
    std::string nodeAddress;

    /// Priority used when peers order candidates (higher is preferred).
    uint64_t nodeWeight;

    std::string dataDirectory;

    uint64_t chunkSize;

    std::string storageBackend;

    bool compressChunks;

    uint64_t requestTimeoutMs;

    uint64_t requestWorkers;

    std::string logLevel;

    std::string logFile;
};

} // namespace config
} // namespace ddsledger

#endif // DDSLEDGER_CONFIG_NODE_CONFIG_HPP
