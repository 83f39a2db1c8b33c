#ifndef DDSLEDGER_NETWORK_PEER_NODE_HPP
#define DDSLEDGER_NETWORK_PEER_NODE_HPP

#include <cstdint>
#include <set>
#include <sstream>
#include <string>
#include "dds/content_types.hpp"
#include "util/errors.hpp"

namespace ddsledger {
namespace network {

/*
  PeerNode
  --------------------------------
  Identity of one node on the DDS network plus the content it advertises.

  Required Methods:
    PeerNode(const std::string &id, const std::string &address, uint64_t weight)
    void AddAdvertisedContent(const ContentID &id)   // monotonic, duplicates ignored
    bool Advertises(const ContentID &id) const
    std::string ToString() const

  A node owns its AdvertisedContent set. Copies held by other nodes (their network view)
  are snapshots and may be stale.
*/
struct PeerNode {
    PeerNode() : Weight(0) {}

    PeerNode(const std::string& id, const std::string& address, uint64_t weight)
        : ID(id), Address(address), Weight(weight) {
        if (ID.empty()) {
            throw util::MalformedInputError("PeerNode: ID cannot be empty");
        }
        if (Address.empty()) {
            throw util::MalformedInputError("PeerNode: address cannot be empty");
        }
    }

    void AddAdvertisedContent(const dds::ContentID& id) {
        if (id.empty()) {
            throw util::MalformedInputError("PeerNode: cannot advertise an empty content ID");
        }
        AdvertisedContent.insert(id);
    }

    bool Advertises(const dds::ContentID& id) const { return AdvertisedContent.count(id) > 0; }

    std::string ToString() const {
        std::ostringstream oss;
        oss << "PeerNode{ID: " << ID << ", Address: " << Address << ", Weight: " << Weight
            << ", Advertised: " << AdvertisedContent.size() << "}";
        return oss.str();
    }

    std::string ID;
    std::string Address;
    uint64_t Weight;
    std::set<dds::ContentID> AdvertisedContent;
};

} // namespace network
} // namespace ddsledger

#endif // DDSLEDGER_NETWORK_PEER_NODE_HPP
