#ifndef DDSLEDGER_NETWORK_LOOPBACK_TRANSPORT_HPP
#define DDSLEDGER_NETWORK_LOOPBACK_TRANSPORT_HPP

#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include "network/content_server.hpp"
#include "network/protocol_messages.hpp"
#include "network/transport.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

namespace ddsledger {
namespace network {

/*
  LoopbackTransport
  --------------------------------
  In-process network: each request is framed with EncodeMessage(), handed to the
  ContentServer registered for the target peer ID, and the framed reply is decoded.
  This exercises the same framing a socket binding would, without opening sockets.

  Required Methods:
    void RegisterServer(const std::string &peerId, const ContentServer &server)
    void UnregisterServer(const std::string &peerId)   // simulates the peer going offline
    dds::Manifest RequestManifest(peer, id)
    dds::Chunk RequestChunk(peer, id)

  Registered servers must outlive the transport or be unregistered first. UnregisterServer()
  waits for requests already inside that server to return, so the server may be destroyed
  as soon as it returns.
*/
class LoopbackTransport : public ITransport {
  public:
    void RegisterServer(const std::string& peerId, const ContentServer& server) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_servers[peerId] = &server;
        util::logger::debug("[LoopbackTransport] Registered server for " + peerId);
    }

    void UnregisterServer(const std::string& peerId) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_servers.erase(peerId);
        m_idle.wait(lock, [this, &peerId] { return m_inFlight.count(peerId) == 0; });
    }

    dds::Manifest RequestManifest(const PeerNode& peer, const dds::ContentID& id) override {
        return ManifestFromResponse(roundTrip(peer, MakeMessage(msg::GET_MANIFEST, id)), peer.ID,
                                    id);
    }

    dds::Chunk RequestChunk(const PeerNode& peer, const dds::ContentID& id) override {
        return ChunkFromResponse(roundTrip(peer, MakeMessage(msg::GET_CHUNK, id)), peer.ID, id);
    }

  private:
    // Counts a request against its server while it runs inside it.
    class InFlight {
      public:
        InFlight(LoopbackTransport& owner, const std::string& peerId)
            : m_owner(owner), m_peerId(peerId) {
            ++m_owner.m_inFlight[m_peerId];
        }

        ~InFlight() {
            std::lock_guard<std::mutex> lock(m_owner.m_mutex);
            auto it = m_owner.m_inFlight.find(m_peerId);
            if (--it->second == 0) {
                m_owner.m_inFlight.erase(it);
                m_owner.m_idle.notify_all();
            }
        }

        InFlight(const InFlight&) = delete;
        InFlight& operator=(const InFlight&) = delete;

      private:
        LoopbackTransport& m_owner;
        std::string m_peerId;
    };

    ProtocolMessage roundTrip(const PeerNode& peer, const ProtocolMessage& request) {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto it = m_servers.find(peer.ID);
        if (it == m_servers.end()) {
            throw util::TransportError("LoopbackTransport: peer " + peer.ID + " at " +
                                       peer.Address + " is unreachable");
        }
        const ContentServer* server = it->second;
        InFlight guard(*this, peer.ID);
        lock.unlock();

        std::vector<uint8_t> reply = server->HandleFrame(EncodeMessage(request));
        try {
            return DecodeMessage(reply);
        } catch (const util::MalformedInputError& ex) {
            throw util::TransportError("LoopbackTransport: bad reply from " + peer.ID + ": " +
                                       ex.what());
        }
    }

    std::mutex m_mutex;
    std::condition_variable m_idle;
    std::map<std::string, const ContentServer*> m_servers;
    std::map<std::string, size_t> m_inFlight;
};

} // namespace network
} // namespace ddsledger

#endif // DDSLEDGER_NETWORK_LOOPBACK_TRANSPORT_HPP
