#ifndef DDSLEDGER_NETWORK_HANDLER_TRANSPORT_HPP
#define DDSLEDGER_NETWORK_HANDLER_TRANSPORT_HPP

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>
#include "dds/content_codec.hpp"
#include "network/protocol_messages.hpp"
#include "network/transport.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

namespace ddsledger {
namespace network {

/*
  HandlerTransport
  --------------------------------
  A programmable ITransport. Responses are registered per (peer ID, request type, content ID),
  where the request type is msg::GET_MANIFEST or msg::GET_CHUNK, and an optional catch-all
  handler answers everything else.

  Required Methods:
    void SetHandler(peerId, requestType, id, Handler)
    void SetCatchAll(Handler)
    void ServeManifest(peerId, manifest) / ServeChunk(peerId, chunk)
    void ServeNotFound(peerId, requestType, id) / ServeError(peerId, requestType, id, reason)
    dds::Manifest RequestManifest(peer, id)
    dds::Chunk RequestChunk(peer, id)

  A request matching no entry and no catch-all throws TransportError; it never yields an
  empty result.
*/
class HandlerTransport : public ITransport {
  public:
    using Handler = std::function<ProtocolMessage(const PeerNode& peer,
                                                  const std::string& requestType,
                                                  const dds::ContentID& id)>;

    void SetHandler(const std::string& peerId, const std::string& requestType,
                    const dds::ContentID& id, Handler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handlers[std::make_tuple(peerId, requestType, id)] = std::move(handler);
    }

    void SetCatchAll(Handler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_catchAll = std::move(handler);
    }

    void ServeManifest(const std::string& peerId, const dds::Manifest& manifest) {
        ProtocolMessage resp = MakeMessage(msg::MANIFEST, dds::codec::EncodeManifest(manifest));
        SetHandler(peerId, msg::GET_MANIFEST, manifest.id,
                   [resp](const PeerNode&, const std::string&, const dds::ContentID&) {
                       return resp;
                   });
    }

    void ServeChunk(const std::string& peerId, const dds::Chunk& chunk) {
        ProtocolMessage resp = MakeMessage(msg::CHUNK, dds::codec::EncodeChunk(chunk));
        SetHandler(peerId, msg::GET_CHUNK, chunk.id,
                   [resp](const PeerNode&, const std::string&, const dds::ContentID&) {
                       return resp;
                   });
    }

    void ServeNotFound(const std::string& peerId, const std::string& requestType,
                       const dds::ContentID& id) {
        SetHandler(peerId, requestType, id,
                   [](const PeerNode&, const std::string&, const dds::ContentID& cid) {
                       return MakeMessage(msg::NOT_FOUND, cid);
                   });
    }

    void ServeError(const std::string& peerId, const std::string& requestType,
                    const dds::ContentID& id, const std::string& reason) {
        SetHandler(peerId, requestType, id,
                   [reason](const PeerNode&, const std::string&, const dds::ContentID&) {
                       return MakeMessage(msg::ERROR, reason);
                   });
    }

    dds::Manifest RequestManifest(const PeerNode& peer, const dds::ContentID& id) override {
        return ManifestFromResponse(dispatch(peer, msg::GET_MANIFEST, id), peer.ID, id);
    }

    dds::Chunk RequestChunk(const PeerNode& peer, const dds::ContentID& id) override {
        return ChunkFromResponse(dispatch(peer, msg::GET_CHUNK, id), peer.ID, id);
    }

    size_t GetRequestCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requestCount;
    }

  private:
    using Key = std::tuple<std::string, std::string, dds::ContentID>;

    ProtocolMessage dispatch(const PeerNode& peer, const std::string& requestType,
                             const dds::ContentID& id) {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_requestCount;
            auto it = m_handlers.find(std::make_tuple(peer.ID, requestType, id));
            if (it != m_handlers.end()) {
                handler = it->second;
            } else {
                handler = m_catchAll;
            }
        }
        if (!handler) {
            throw util::TransportError("HandlerTransport: no handler for (" + peer.ID + ", " +
                                       requestType + ", " + id + ")");
        }
        return handler(peer, requestType, id);
    }

    mutable std::mutex m_mutex;
    std::map<Key, Handler> m_handlers;
    Handler m_catchAll;
    size_t m_requestCount = 0;
};

} // namespace network
} // namespace ddsledger

#endif // DDSLEDGER_NETWORK_HANDLER_TRANSPORT_HPP
