#ifndef DDSLEDGER_NETWORK_TRANSPORT_HPP
#define DDSLEDGER_NETWORK_TRANSPORT_HPP

#include "dds/content_types.hpp"
#include "network/peer_node.hpp"

namespace ddsledger {
namespace network {

/*
  ITransport
  --------------------------------
  The pluggable request layer between nodes. A production binding would issue RPCs;
  the implementations here are in-process (HandlerTransport, LoopbackTransport) plus
  a deadline decorator (TimeoutTransport).

  Contract:
    - Return the object the peer sent, unverified. Callers check content addressing.
    - Throw NotFoundError if the peer answered that it does not hold the ID.
    - Throw TransportError for every other failure (unreachable, timeout, unhandled request,
      malformed response).
*/
class ITransport {
  public:
    virtual ~ITransport() = default;

    virtual dds::Manifest RequestManifest(const PeerNode& peer, const dds::ContentID& id) = 0;
    virtual dds::Chunk RequestChunk(const PeerNode& peer, const dds::ContentID& id) = 0;
};

} // namespace network
} // namespace ddsledger

#endif // DDSLEDGER_NETWORK_TRANSPORT_HPP
