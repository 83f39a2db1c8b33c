#ifndef DDSLEDGER_NETWORK_CONTENT_SERVER_HPP
#define DDSLEDGER_NETWORK_CONTENT_SERVER_HPP

#include <string>
#include <vector>
#include "dds/content_codec.hpp"
#include "dds/storage_backend.hpp"
#include "network/protocol_messages.hpp"
#include "util/logger.hpp"

namespace ddsledger {
namespace network {

/*
  ContentServer
  --------------------------------
  Serving side of the DDS protocol: answers GET_MANIFEST / GET_CHUNK from a node's
  storage backend.

  Required Methods:
    ContentServer(const std::string &nodeId, const dds::IStorageBackend &storage)
    ProtocolMessage HandleMessage(const ProtocolMessage &request) const
    std::vector<uint8_t> HandleFrame(const std::vector<uint8_t> &frame) const

  Never throws for a bad request: unknown types and malformed frames get an ERROR reply,
  absent content gets NOT_FOUND.
*/
class ContentServer {
  public:
    ContentServer(const std::string& nodeId, const dds::IStorageBackend& storage)
        : m_nodeId(nodeId), m_storage(storage) {}

    ProtocolMessage HandleMessage(const ProtocolMessage& request) const {
        const std::string id = request.PayloadAsString();
        try {
            if (request.type == msg::GET_MANIFEST) {
                return MakeMessage(msg::MANIFEST,
                                   dds::codec::EncodeManifest(m_storage.GetManifest(id)));
            }
            if (request.type == msg::GET_CHUNK) {
                return MakeMessage(msg::CHUNK, dds::codec::EncodeChunk(m_storage.GetChunk(id)));
            }
            util::logger::warn("[ContentServer] " + m_nodeId + " got unknown request type " +
                               request.type);
            return MakeMessage(msg::ERROR, "unknown request type " + request.type);
        } catch (const util::NotFoundError&) {
            util::logger::debug("[ContentServer] " + m_nodeId + " has no " + id);
            return MakeMessage(msg::NOT_FOUND, id);
        } catch (const util::DdsLedgerError& ex) {
            util::logger::error("[ContentServer] " + m_nodeId + " failed to serve " + id + ": " +
                                ex.what());
            return MakeMessage(msg::ERROR, ex.what());
        }
    }

    std::vector<uint8_t> HandleFrame(const std::vector<uint8_t>& frame) const {
        ProtocolMessage request;
        try {
            request = DecodeMessage(frame);
        } catch (const util::MalformedInputError& ex) {
            return EncodeMessage(MakeMessage(msg::ERROR, std::string("bad frame: ") + ex.what()));
        }
        try {
            return EncodeMessage(HandleMessage(request));
        } catch (const util::MalformedInputError& ex) {
            // reply too large for one frame
            return EncodeMessage(MakeMessage(msg::ERROR, ex.what()));
        }
    }

    const std::string& GetNodeId() const { return m_nodeId; }

  private:
    std::string m_nodeId;
    const dds::IStorageBackend& m_storage;
};

} // namespace network
} // namespace ddsledger

#endif // DDSLEDGER_NETWORK_CONTENT_SERVER_HPP
