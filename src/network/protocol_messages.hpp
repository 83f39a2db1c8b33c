#ifndef DDSLEDGER_NETWORK_PROTOCOL_MESSAGES_HPP
#define DDSLEDGER_NETWORK_PROTOCOL_MESSAGES_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "dds/content_codec.hpp"
#include "util/errors.hpp"

namespace ddsledger {
namespace network {

/*
  protocol_messages.hpp
  --------------------------------
  Request/response messages exchanged between DDS peers, and their framing.

  Message types:
   - GET_MANIFEST  payload: manifest ContentID (UTF-8)
   - GET_CHUNK     payload: chunk ContentID (UTF-8)
   - MANIFEST      payload: codec::EncodeManifest()
   - CHUNK         payload: codec::EncodeChunk()
   - NOT_FOUND     payload: the requested ContentID
   - ERROR         payload: human readable reason

  Frame layout (big-endian):
   [u32 typeLen][type][u32 payloadLen][payload]
  Payloads above kMaxPayloadSize are rejected on both encode and decode.
*/

namespace msg {
constexpr const char* GET_MANIFEST = "GET_MANIFEST";
constexpr const char* GET_CHUNK = "GET_CHUNK";
constexpr const char* MANIFEST = "MANIFEST";
constexpr const char* CHUNK = "CHUNK";
constexpr const char* NOT_FOUND = "NOT_FOUND";
constexpr const char* ERROR = "ERROR";
} // namespace msg

constexpr size_t kMaxPayloadSize = 10 * 1024 * 1024;

struct ProtocolMessage {
    // A short string describing the message type (see msg::*).
    std::string type;

    // The raw serialized data payload for this message.
    std::vector<uint8_t> payload;

    std::string PayloadAsString() const { return std::string(payload.begin(), payload.end()); }
};

inline ProtocolMessage MakeMessage(const std::string& type, const std::string& text) {
    ProtocolMessage m;
    m.type = type;
    m.payload.assign(text.begin(), text.end());
    return m;
}

inline ProtocolMessage MakeMessage(const std::string& type, std::vector<uint8_t> payload) {
    ProtocolMessage m;
    m.type = type;
    m.payload = std::move(payload);
    return m;
}

inline std::vector<uint8_t> EncodeMessage(const ProtocolMessage& m) {
    if (m.type.empty()) {
        throw util::MalformedInputError("ProtocolMessage: type cannot be empty");
    }
    if (m.payload.size() > kMaxPayloadSize) {
        throw util::MalformedInputError("ProtocolMessage: payload of " +
                                        std::to_string(m.payload.size()) +
                                        " bytes exceeds the frame limit");
    }
    dds::codec::Writer w;
    w.PutString(m.type);
    w.PutBytes(m.payload);
    return w.Take();
}

inline ProtocolMessage DecodeMessage(const std::vector<uint8_t>& frame) {
    dds::codec::Reader r(frame, "protocol message");
    ProtocolMessage m;
    m.type = r.GetString();
    if (m.type.empty()) {
        throw util::MalformedInputError("ProtocolMessage: frame has an empty type");
    }
    m.payload = r.GetBytes();
    if (m.payload.size() > kMaxPayloadSize) {
        throw util::MalformedInputError("ProtocolMessage: payload exceeds the frame limit");
    }
    r.ExpectEnd();
    return m;
}

/*
  Response decoding shared by the transports. A NOT_FOUND answer becomes NotFoundError;
  ERROR, an unexpected type or an undecodable payload become TransportError.
*/
inline void CheckResponse(const ProtocolMessage& resp, const char* expectedType,
                          const std::string& peerId, const dds::ContentID& id) {
    if (resp.type == msg::NOT_FOUND) {
        throw util::NotFoundError("peer " + peerId + " does not hold " + id);
    }
    if (resp.type == msg::ERROR) {
        throw util::TransportError("peer " + peerId + " failed request for " + id + ": " +
                                   resp.PayloadAsString());
    }
    if (resp.type != expectedType) {
        throw util::TransportError("peer " + peerId + " answered " + resp.type + " where " +
                                   expectedType + " was expected");
    }
}

inline dds::Manifest ManifestFromResponse(const ProtocolMessage& resp, const std::string& peerId,
                                          const dds::ContentID& id) {
    CheckResponse(resp, msg::MANIFEST, peerId, id);
    try {
        return dds::codec::DecodeManifest(resp.payload);
    } catch (const util::MalformedInputError& ex) {
        throw util::TransportError("peer " + peerId + " sent a malformed manifest: " + ex.what());
    }
}

inline dds::Chunk ChunkFromResponse(const ProtocolMessage& resp, const std::string& peerId,
                                    const dds::ContentID& id) {
    CheckResponse(resp, msg::CHUNK, peerId, id);
    try {
        return dds::codec::DecodeChunk(resp.payload);
    } catch (const util::MalformedInputError& ex) {
        throw util::TransportError("peer " + peerId + " sent a malformed chunk: " + ex.what());
    }
}

} // namespace network
} // namespace ddsledger

#endif // DDSLEDGER_NETWORK_PROTOCOL_MESSAGES_HPP
