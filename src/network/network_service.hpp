#ifndef DDSLEDGER_NETWORK_NETWORK_SERVICE_HPP
#define DDSLEDGER_NETWORK_NETWORK_SERVICE_HPP

#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "network/peer_node.hpp"
#include "network/transport.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

namespace ddsledger {
namespace network {

/*
  NetworkService
  --------------------------------
  Owns a node's view of the network and issues requests through a pluggable transport.

  Required Methods:
    NetworkService(PeerNode &localNode, ITransport &transport)
    void Advertise(const ContentID &id)
    void AddPeerToNetworkView(const PeerNode &peer)
    void RemovePeer(const std::string &peerId)
    void UpdatePeerAdvertisement(const std::string &peerId, const ContentID &id)
    std::vector<PeerNode> GetNetworkView() const
    std::vector<ContentID> GetLocalAdvertisedContent() const
    dds::Manifest RequestManifest(const PeerNode &peer, const ContentID &id)
    dds::Chunk RequestChunk(const PeerNode &peer, const ContentID &id)
    void Subscribe(NetworkService &peerService) / Unsubscribe(...)

  - The local node's AdvertisedContent is mutated only through Advertise().
  - The network view holds copies of other nodes; they go stale until refreshed with
    AddPeerToNetworkView() or UpdatePeerAdvertisement().
  - Subscribe() stands in for gossip: every later Advertise() is pushed to the subscribed
    services as UpdatePeerAdvertisement(localId, id). A failed push is logged and skipped.
  - Request* calls only throw DdsLedgerError subclasses; anything else the transport
    throws is reported as TransportError.
*/
class NetworkService {
  public:
    NetworkService(PeerNode& localNode, ITransport& transport)
        : m_localNode(localNode), m_transport(transport) {
        if (m_localNode.ID.empty()) {
            throw util::MalformedInputError("NetworkService: local node needs an ID");
        }
    }

    NetworkService(const NetworkService&) = delete;
    NetworkService& operator=(const NetworkService&) = delete;

    void Advertise(const dds::ContentID& id) {
        if (id.empty()) {
            throw util::MalformedInputError("NetworkService: cannot advertise an empty content ID");
        }
        std::vector<NetworkService*> subscribers;
        std::string localId;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_localNode.AddAdvertisedContent(id);
            subscribers = m_subscribers;
            localId = m_localNode.ID;
        }
        util::logger::info("[NetworkService] " + localId + " advertising " + id);

        // outside our lock so two services can push to each other
        for (NetworkService* sub : subscribers) {
            try {
                sub->UpdatePeerAdvertisement(localId, id);
            } catch (const util::DdsLedgerError& ex) {
                util::logger::warn("[NetworkService] Could not push advertisement of " + id +
                                   " to " + sub->GetLocalId() + ": " + ex.what());
            }
        }
    }

    void AddPeerToNetworkView(const PeerNode& peer) {
        if (peer.ID.empty()) {
            throw util::MalformedInputError("NetworkService: peer ID cannot be empty");
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        if (peer.ID == m_localNode.ID) {
            throw util::MalformedInputError("NetworkService: cannot add the local node " +
                                            peer.ID + " as a peer");
        }
        m_networkView[peer.ID] = peer;
        util::logger::debug("[NetworkService] " + m_localNode.ID + " knows " + peer.ToString());
    }

    void RemovePeer(const std::string& peerId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_networkView.erase(peerId);
    }

    /// @throw NotFoundError if peerId is not in the view.
    void UpdatePeerAdvertisement(const std::string& peerId, const dds::ContentID& id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_networkView.find(peerId);
        if (it == m_networkView.end()) {
            throw util::NotFoundError("NetworkService: peer " + peerId + " is not in the view of " +
                                      m_localNode.ID);
        }
        it->second.AddAdvertisedContent(id);
    }

    std::vector<PeerNode> GetNetworkView() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<PeerNode> view;
        view.reserve(m_networkView.size());
        for (const auto& entry : m_networkView) {
            view.push_back(entry.second);
        }
        return view;
    }

    std::vector<dds::ContentID> GetLocalAdvertisedContent() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::vector<dds::ContentID>(m_localNode.AdvertisedContent.begin(),
                                           m_localNode.AdvertisedContent.end());
    }

    PeerNode GetLocalNode() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_localNode;
    }

    std::string GetLocalId() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_localNode.ID;
    }

    void Subscribe(NetworkService& peerService) {
        if (&peerService == this) {
            return;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        if (std::find(m_subscribers.begin(), m_subscribers.end(), &peerService) ==
            m_subscribers.end()) {
            m_subscribers.push_back(&peerService);
        }
    }

    void Unsubscribe(NetworkService& peerService) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscribers.erase(std::remove(m_subscribers.begin(), m_subscribers.end(), &peerService),
                            m_subscribers.end());
    }

    dds::Manifest RequestManifest(const PeerNode& peer, const dds::ContentID& id) {
        try {
            return m_transport.RequestManifest(peer, id);
        } catch (const util::DdsLedgerError&) {
            throw;
        } catch (const std::exception& ex) {
            throw util::TransportError("NetworkService: manifest request to " + peer.ID +
                                       " failed: " + ex.what());
        }
    }

    dds::Chunk RequestChunk(const PeerNode& peer, const dds::ContentID& id) {
        try {
            return m_transport.RequestChunk(peer, id);
        } catch (const util::DdsLedgerError&) {
            throw;
        } catch (const std::exception& ex) {
            throw util::TransportError("NetworkService: chunk request to " + peer.ID +
                                       " failed: " + ex.what());
        }
    }

  private:
    PeerNode& m_localNode;
    ITransport& m_transport;
    mutable std::mutex m_mutex;
    std::map<std::string, PeerNode> m_networkView;
    std::vector<NetworkService*> m_subscribers;
};

} // namespace network
} // namespace ddsledger

#endif // DDSLEDGER_NETWORK_NETWORK_SERVICE_HPP
