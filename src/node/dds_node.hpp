#ifndef DDSLEDGER_NODE_DDS_NODE_HPP
#define DDSLEDGER_NODE_DDS_NODE_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "config/node_config.hpp"
#include "dds/chunker.hpp"
#include "dds/dds_service.hpp"
#include "dds/originator.hpp"
#include "dds/retriever.hpp"
#include "dds/sqlite_storage.hpp"
#include "dds/storage_backend.hpp"
#include "network/content_server.hpp"
#include "network/discovery.hpp"
#include "network/network_service.hpp"
#include "network/peer_node.hpp"
#include "network/timeout_transport.hpp"
#include "network/transport.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

namespace ddsledger {
namespace node {

/*
  DdsNode
  --------------------------------
  One DDS participant wired from a NodeConfig:
    storage (memory | sqlite) -> chunker -> PeerNode -> [TimeoutTransport] -> NetworkService
    -> NetworkViewDiscovery -> NetworkRetriever -> NetworkOriginator -> DdsCoreService,
  plus a ContentServer answering peers from the same storage.

  The transport passed to InitializeNode() is shared between nodes and must outlive them.
  Serving is the transport's business: a LoopbackTransport needs
  RegisterServer(node.GetId(), node.GetContentServer()).

  ConnectPeer() seeds both network views and subscribes both services to each other's
  advertisements. Connections are dropped again when either node is destroyed.
*/
class DdsNode {
  public:
    DdsNode() = default;

    DdsNode(const DdsNode&) = delete;
    DdsNode& operator=(const DdsNode&) = delete;

    ~DdsNode() {
        std::vector<DdsNode*> peers;
        {
            std::lock_guard<std::mutex> lock(m_nodeMutex);
            peers.swap(m_connected);
        }
        for (DdsNode* peer : peers) {
            peer->forget(*this);
        }
    }

    /**
     * Builds every component from config. May be called once.
     * @throw MalformedInputError on a bad chunk size, backend name or node identity.
     * @throw StorageError if the sqlite store cannot be opened.
     */
    void InitializeNode(const config::NodeConfig& config, network::ITransport& transport) {
        std::lock_guard<std::mutex> lock(m_nodeMutex);
        if (m_service) {
            throw util::DdsLedgerError("DdsNode: " + m_config.nodeName + " is already initialized");
        }
        m_config = config;

        m_storage = makeStorage(m_config);
        if (m_config.chunkSize == 0) {
            throw util::MalformedInputError("DdsNode: chunkSize must be positive");
        }
        m_chunker = std::make_unique<dds::FixedSizeChunker>(static_cast<int64_t>(m_config.chunkSize));
        m_localNode = network::PeerNode(m_config.nodeName, m_config.nodeAddress, m_config.nodeWeight);

        network::ITransport* effective = &transport;
        if (m_config.requestTimeoutMs > 0) {
            m_timeoutTransport = std::make_unique<network::TimeoutTransport>(
                transport, std::chrono::milliseconds(m_config.requestTimeoutMs),
                static_cast<size_t>(m_config.requestWorkers));
            effective = m_timeoutTransport.get();
        }

        m_service = std::make_unique<network::NetworkService>(m_localNode, *effective);
        m_discovery = std::make_unique<network::NetworkViewDiscovery>(*m_service);
        m_retriever = std::make_unique<dds::NetworkRetriever>(*m_service, *m_discovery);
        m_originator = std::make_unique<dds::NetworkOriginator>(*m_service);
        m_dds = std::make_unique<dds::DdsCoreService>(*m_chunker, *m_storage, *m_originator,
                                                      m_retriever.get());
        m_server = std::make_unique<network::ContentServer>(m_config.nodeName, *m_storage);

        util::logger::info("[DdsNode] " + m_localNode.ToString() + " ready (" +
                           m_config.storageBackend + " storage, chunk size " +
                           std::to_string(m_config.chunkSize) + ")");
    }

    dds::ContentID Publish(const std::vector<uint8_t>& data) { return ddsService().Publish(data); }
    dds::ContentID Publish(const std::string& data) { return ddsService().Publish(data); }

    std::vector<uint8_t> Retrieve(const dds::ContentID& id) { return ddsService().Retrieve(id); }
    std::string RetrieveString(const dds::ContentID& id) { return ddsService().RetrieveString(id); }

    void ConnectPeer(DdsNode& other) {
        if (&other == this) {
            throw util::MalformedInputError("DdsNode: cannot connect a node to itself");
        }
        network::NetworkService& mine = service();
        network::NetworkService& theirs = other.service();

        mine.AddPeerToNetworkView(theirs.GetLocalNode());
        theirs.AddPeerToNetworkView(mine.GetLocalNode());
        mine.Subscribe(theirs);
        theirs.Subscribe(mine);

        remember(other);
        other.remember(*this);
        util::logger::info("[DdsNode] Connected " + mine.GetLocalId() + " <-> " + theirs.GetLocalId());
    }

    bool IsInitialized() const { return m_service != nullptr; }
    const std::string& GetId() const { return m_config.nodeName; }
    const config::NodeConfig& GetConfig() const { return m_config; }

    dds::IStorageBackend& GetStorage() { return *require(m_storage.get(), "storage"); }
    network::NetworkService& GetNetworkService() { return service(); }
    const network::ContentServer& GetContentServer() const {
        return *require(m_server.get(), "content server");
    }
    dds::DdsCoreService& GetDdsService() { return ddsService(); }

  private:
    static std::unique_ptr<dds::IStorageBackend> makeStorage(const config::NodeConfig& config) {
        if (config.storageBackend == "memory") {
            return std::make_unique<dds::InMemoryStorage>();
        }
        if (config.storageBackend == "sqlite") {
            std::filesystem::path dir(config.dataDirectory);
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                throw util::StorageError("DdsNode: cannot create data directory " +
                                         config.dataDirectory + ": " + ec.message());
            }
            std::string path = (dir / (config.nodeName + ".sqlite")).string();
            return std::make_unique<dds::SqliteStorage>(path, config.compressChunks);
        }
        throw util::MalformedInputError("DdsNode: unknown storage backend '" +
                                        config.storageBackend + "'");
    }

    template <typename T>
    T* require(T* ptr, const char* what) const {
        if (!ptr) {
            throw util::DdsLedgerError(std::string("DdsNode: ") + what +
                                       " used before InitializeNode()");
        }
        return ptr;
    }

    network::NetworkService& service() { return *require(m_service.get(), "network service"); }
    dds::DdsCoreService& ddsService() { return *require(m_dds.get(), "DDS service"); }

    void remember(DdsNode& other) {
        std::lock_guard<std::mutex> lock(m_nodeMutex);
        if (std::find(m_connected.begin(), m_connected.end(), &other) == m_connected.end()) {
            m_connected.push_back(&other);
        }
    }

    // other is going away: stop pushing to it and drop it from the view
    void forget(DdsNode& other) {
        {
            std::lock_guard<std::mutex> lock(m_nodeMutex);
            m_connected.erase(std::remove(m_connected.begin(), m_connected.end(), &other),
                              m_connected.end());
        }
        if (m_service && other.m_service) {
            m_service->Unsubscribe(*other.m_service);
            m_service->RemovePeer(other.m_service->GetLocalId());
        }
    }

    std::mutex m_nodeMutex;
    config::NodeConfig m_config;
    std::unique_ptr<dds::IStorageBackend> m_storage;
    std::unique_ptr<dds::FixedSizeChunker> m_chunker;
    network::PeerNode m_localNode;
    std::unique_ptr<network::TimeoutTransport> m_timeoutTransport;
    std::unique_ptr<network::NetworkService> m_service;
    std::unique_ptr<network::NetworkViewDiscovery> m_discovery;
    std::unique_ptr<dds::NetworkRetriever> m_retriever;
    std::unique_ptr<dds::NetworkOriginator> m_originator;
    std::unique_ptr<dds::DdsCoreService> m_dds;
    std::unique_ptr<network::ContentServer> m_server;
    std::vector<DdsNode*> m_connected;
};

} // namespace node
} // namespace ddsledger

#endif // DDSLEDGER_NODE_DDS_NODE_HPP
