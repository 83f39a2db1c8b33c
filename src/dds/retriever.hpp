#ifndef DDSLEDGER_DDS_RETRIEVER_HPP
#define DDSLEDGER_DDS_RETRIEVER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "dds/content_types.hpp"
#include "dds/storage_backend.hpp"
#include "network/discovery.hpp"
#include "network/network_service.hpp"
#include "network/peer_node.hpp"

namespace ddsledger {
namespace dds {

/*
  retriever.hpp
  --------------------------------------------------------
  Sources for manifests and chunks.

  Required Methods (IRetriever):
    Manifest FetchManifest(const ContentID &id)
    Chunk FetchChunk(const ContentID &id)

  Implementations:
    LocalRetriever    - a storage backend; NotFoundError when absent.
    NetworkRetriever  - discovery + NetworkService; tries candidate peers in order and
                        verifies content addressing of every answer.
    FallbackRetriever - primary first, secondary on NotFoundError / TransportError.

  LocalRetriever returns what the backend holds. NetworkRetriever only ever returns
  verified objects: a peer whose answer does not hash to the requested ID is skipped.
*/

class IRetriever {
  public:
    virtual ~IRetriever() = default;

    virtual Manifest FetchManifest(const ContentID& id) = 0;
    virtual Chunk FetchChunk(const ContentID& id) = 0;
};

class LocalRetriever : public IRetriever {
  public:
    explicit LocalRetriever(const IStorageBackend& storage) : m_storage(storage) {}

    Manifest FetchManifest(const ContentID& id) override { return m_storage.GetManifest(id); }
    Chunk FetchChunk(const ContentID& id) override { return m_storage.GetChunk(id); }

  private:
    const IStorageBackend& m_storage;
};

/// A verified manifest together with the peer that served it.
struct ManifestSource {
    Manifest manifest;
    network::PeerNode peer;
};

class NetworkRetriever : public IRetriever {
  public:
    NetworkRetriever(network::NetworkService& service, const network::IDiscovery& discovery)
        : m_service(service), m_discovery(discovery) {}

    /// Peers advertising the manifest id, in priority order.
    std::vector<network::PeerNode> FindCandidates(const ContentID& manifestId) const;

    /**
     * @throw ContentUnavailableError if no candidates are given, or all of them answered NOT_FOUND.
     * @throw TransportError if every candidate failed and at least one failed otherwise.
     */
    ManifestSource FetchManifestFrom(const std::vector<network::PeerNode>& candidates,
                                     const ContentID& id);

    /// Same failure rules as FetchManifestFrom().
    Chunk FetchChunkFrom(const std::vector<network::PeerNode>& candidates, const ContentID& id);

    Manifest FetchManifest(const ContentID& id) override;

    // Chunks are not advertised individually, so every known peer is a candidate.
    Chunk FetchChunk(const ContentID& id) override;

  private:
    network::NetworkService& m_service;
    const network::IDiscovery& m_discovery;
};

class FallbackRetriever : public IRetriever {
  public:
    FallbackRetriever(IRetriever& primary, IRetriever& secondary)
        : m_primary(primary), m_secondary(secondary) {}

    Manifest FetchManifest(const ContentID& id) override;
    Chunk FetchChunk(const ContentID& id) override;

  private:
    IRetriever& m_primary;
    IRetriever& m_secondary;
};

/// @throw IntegrityError unless manifest.id == requestedId, every chunk ID and the content hash
///        are SHA-256 hex, and the ID matches the fields.
void VerifyManifest(const Manifest& manifest, const ContentID& requestedId);

/// @throw IntegrityError unless chunk.id == requestedId == sha256(chunk.data).
void VerifyChunk(const Chunk& chunk, const ContentID& requestedId);

/**
 * @brief Concatenate chunks (already in manifest order) and check the result against
 *        manifest.totalSize and manifest.originalContentHash.
 * @throw IntegrityError on any mismatch.
 */
std::vector<uint8_t> Reassemble(const Manifest& manifest, const std::vector<Chunk>& chunks);

/**
 * @brief Fetch, verify and reassemble content through any retriever.
 */
std::vector<uint8_t> ReadContent(IRetriever& retriever, const ContentID& manifestId);

} // namespace dds
} // namespace ddsledger

#endif // DDSLEDGER_DDS_RETRIEVER_HPP
