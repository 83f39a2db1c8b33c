#ifndef DDSLEDGER_NETWORK_DISCOVERY_HPP
#define DDSLEDGER_NETWORK_DISCOVERY_HPP

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "network/network_service.hpp"
#include "network/peer_node.hpp"

namespace ddsledger {
namespace network {

/*
  discovery.hpp
  --------------------------------
  Finds candidate peers for a request.

  Required Methods:
    std::vector<PeerNode> FindPeers(const DiscoveryCriteria &criteria) const

  Results pass the selection policy, are ordered by Weight (highest first) and then by ID,
  and are cut to maxPeers when it is non-zero. The default policy keeps peers known to
  advertise criteria.contentId with at least minWeight.
*/

struct DiscoveryCriteria {
    DiscoveryCriteria() : advertisedOnly(true), minWeight(0), maxPeers(0) {}

    explicit DiscoveryCriteria(const dds::ContentID& id)
        : contentId(id), advertisedOnly(true), minWeight(0), maxPeers(0) {}

    dds::ContentID contentId;
    // Only peers whose (cached) AdvertisedContent holds contentId.
    bool advertisedOnly;
    uint64_t minWeight;
    // 0 = no limit
    size_t maxPeers;
};

using PeerSelectionPolicy = std::function<bool(const PeerNode&, const DiscoveryCriteria&)>;

inline bool DefaultSelectionPolicy(const PeerNode& peer, const DiscoveryCriteria& criteria) {
    if (peer.Weight < criteria.minWeight) {
        return false;
    }
    if (criteria.advertisedOnly && !criteria.contentId.empty()) {
        return peer.Advertises(criteria.contentId);
    }
    return true;
}

inline std::vector<PeerNode> SelectPeers(const std::vector<PeerNode>& candidates,
                                         const DiscoveryCriteria& criteria,
                                         const PeerSelectionPolicy& policy) {
    std::vector<PeerNode> selected;
    for (const auto& peer : candidates) {
        if (policy(peer, criteria)) {
            selected.push_back(peer);
        }
    }
    std::sort(selected.begin(), selected.end(), [](const PeerNode& a, const PeerNode& b) {
        if (a.Weight != b.Weight) {
            return a.Weight > b.Weight;
        }
        return a.ID < b.ID;
    });
    if (criteria.maxPeers > 0 && selected.size() > criteria.maxPeers) {
        selected.resize(criteria.maxPeers);
    }
    return selected;
}

class IDiscovery {
  public:
    virtual ~IDiscovery() = default;
    virtual std::vector<PeerNode> FindPeers(const DiscoveryCriteria& criteria) const = 0;
};

/*
  Discovers from a NetworkService's current view (the default for a node).
*/
class NetworkViewDiscovery : public IDiscovery {
  public:
    explicit NetworkViewDiscovery(const NetworkService& service,
                                  PeerSelectionPolicy policy = DefaultSelectionPolicy)
        : m_service(service), m_policy(std::move(policy)) {}

    std::vector<PeerNode> FindPeers(const DiscoveryCriteria& criteria) const override {
        return SelectPeers(m_service.GetNetworkView(), criteria, m_policy);
    }

  private:
    const NetworkService& m_service;
    PeerSelectionPolicy m_policy;
};

/*
  Discovers from a fixed bootstrap list, e.g. peers named in configuration.
*/
class StaticDiscovery : public IDiscovery {
  public:
    explicit StaticDiscovery(std::vector<PeerNode> peers,
                             PeerSelectionPolicy policy = DefaultSelectionPolicy)
        : m_peers(std::move(peers)), m_policy(std::move(policy)) {}

    std::vector<PeerNode> FindPeers(const DiscoveryCriteria& criteria) const override {
        return SelectPeers(m_peers, criteria, m_policy);
    }

  private:
    std::vector<PeerNode> m_peers;
    PeerSelectionPolicy m_policy;
};

} // namespace network
} // namespace ddsledger

#endif // DDSLEDGER_NETWORK_DISCOVERY_HPP
