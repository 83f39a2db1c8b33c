#include "dds/retriever.hpp"
#include "util/errors.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace ddsledger {
namespace dds {

namespace {

// Try each candidate in order; the first verified answer wins.
template <typename T, typename Fetch>
T tryCandidates(const std::vector<network::PeerNode>& candidates, const ContentID& id,
                const std::string& what, Fetch fetch) {
    if (candidates.empty()) {
        throw util::ContentUnavailableError("NetworkRetriever: no peers to ask for " + what + " " +
                                            id);
    }

    std::string failures;
    bool onlyNotFound = true;
    for (const auto& peer : candidates) {
        try {
            return fetch(peer);
        } catch (const util::NotFoundError& ex) {
            failures += "\n  " + peer.ID + ": " + ex.what();
            util::logger::info("[NetworkRetriever] " + peer.ID + " does not have " + what + " " + id);
        } catch (const util::TransportError& ex) {
            onlyNotFound = false;
            failures += "\n  " + peer.ID + ": " + ex.what();
            util::logger::warn("[NetworkRetriever] " + what + " " + id + " from " + peer.ID +
                               " failed: " + ex.what());
        } catch (const util::IntegrityError& ex) {
            onlyNotFound = false;
            failures += "\n  " + peer.ID + ": " + ex.what();
            util::logger::warn("[NetworkRetriever] " + peer.ID + " served bad " + what + ": " +
                               ex.what());
        }
    }

    std::string msg = "NetworkRetriever: " + what + " " + id + " could not be fetched from " +
                      std::to_string(candidates.size()) + " peer(s):" + failures;
    if (onlyNotFound) {
        throw util::ContentUnavailableError(msg);
    }
    throw util::TransportError(msg);
}

} // namespace

std::vector<network::PeerNode> NetworkRetriever::FindCandidates(const ContentID& manifestId) const {
    return m_discovery.FindPeers(network::DiscoveryCriteria(manifestId));
}

ManifestSource NetworkRetriever::FetchManifestFrom(
    const std::vector<network::PeerNode>& candidates, const ContentID& id) {
    return tryCandidates<ManifestSource>(candidates, id, "manifest",
                                         [this, &id](const network::PeerNode& peer) {
                                             Manifest m = m_service.RequestManifest(peer, id);
                                             VerifyManifest(m, id);
                                             return ManifestSource{m, peer};
                                         });
}

Chunk NetworkRetriever::FetchChunkFrom(const std::vector<network::PeerNode>& candidates,
                                       const ContentID& id) {
    return tryCandidates<Chunk>(candidates, id, "chunk",
                                [this, &id](const network::PeerNode& peer) {
                                    Chunk c = m_service.RequestChunk(peer, id);
                                    VerifyChunk(c, id);
                                    return c;
                                });
}

Manifest NetworkRetriever::FetchManifest(const ContentID& id) {
    return FetchManifestFrom(FindCandidates(id), id).manifest;
}

Chunk NetworkRetriever::FetchChunk(const ContentID& id) {
    network::DiscoveryCriteria criteria(id);
    criteria.advertisedOnly = false;
    return FetchChunkFrom(m_discovery.FindPeers(criteria), id);
}

Manifest FallbackRetriever::FetchManifest(const ContentID& id) {
    try {
        return m_primary.FetchManifest(id);
    } catch (const util::NotFoundError&) {
        util::logger::info("[FallbackRetriever] manifest " + id + " not in primary source");
    } catch (const util::TransportError& ex) {
        util::logger::warn("[FallbackRetriever] primary source failed for manifest " + id + ": " +
                           ex.what());
    }
    return m_secondary.FetchManifest(id);
}

Chunk FallbackRetriever::FetchChunk(const ContentID& id) {
    try {
        return m_primary.FetchChunk(id);
    } catch (const util::NotFoundError&) {
        util::logger::info("[FallbackRetriever] chunk " + id + " not in primary source");
    } catch (const util::TransportError& ex) {
        util::logger::warn("[FallbackRetriever] primary source failed for chunk " + id + ": " +
                           ex.what());
    }
    return m_secondary.FetchChunk(id);
}

void VerifyManifest(const Manifest& manifest, const ContentID& requestedId) {
    if (manifest.id != requestedId) {
        throw util::IntegrityError("manifest " + manifest.id + " returned for request " +
                                   requestedId);
    }
    for (size_t i = 0; i < manifest.chunkIds.size(); ++i) {
        if (!util::hashing::isSha256Hex(manifest.chunkIds[i])) {
            throw util::IntegrityError("manifest " + manifest.id + ": chunk " + std::to_string(i) +
                                       " is not a content ID");
        }
    }
    if (!util::hashing::isSha256Hex(manifest.originalContentHash)) {
        throw util::IntegrityError("manifest " + manifest.id +
                                   ": original content hash is not a content ID");
    }
    ContentID computed = manifest.ComputeId();
    if (computed != manifest.id) {
        throw util::IntegrityError("manifest " + manifest.id + " fields hash to " + computed);
    }
}

void VerifyChunk(const Chunk& chunk, const ContentID& requestedId) {
    if (chunk.id != requestedId) {
        throw util::IntegrityError("chunk " + chunk.id + " returned for request " + requestedId);
    }
    ContentID computed = util::hashing::sha256(chunk.data);
    if (computed != chunk.id) {
        throw util::IntegrityError("chunk " + chunk.id + " data hashes to " + computed);
    }
}

std::vector<uint8_t> Reassemble(const Manifest& manifest, const std::vector<Chunk>& chunks) {
    if (chunks.size() != manifest.chunkIds.size()) {
        throw util::IntegrityError("manifest " + manifest.id + " lists " +
                                   std::to_string(manifest.chunkIds.size()) + " chunks, got " +
                                   std::to_string(chunks.size()));
    }
    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(manifest.totalSize));
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].id != manifest.chunkIds[i]) {
            throw util::IntegrityError("chunk " + std::to_string(i) + " of manifest " +
                                       manifest.id + " is out of order");
        }
        out.insert(out.end(), chunks[i].data.begin(), chunks[i].data.end());
    }
    if (out.size() != manifest.totalSize) {
        throw util::IntegrityError("manifest " + manifest.id + " declares " +
                                   std::to_string(manifest.totalSize) + " bytes, reassembled " +
                                   std::to_string(out.size()));
    }
    ContentID contentHash = util::hashing::sha256(out);
    if (contentHash != manifest.originalContentHash) {
        throw util::IntegrityError("content of manifest " + manifest.id + " hashes to " +
                                   contentHash + ", expected " + manifest.originalContentHash);
    }
    return out;
}

std::vector<uint8_t> ReadContent(IRetriever& retriever, const ContentID& manifestId) {
    Manifest manifest = retriever.FetchManifest(manifestId);
    VerifyManifest(manifest, manifestId);

    std::vector<Chunk> chunks;
    chunks.reserve(manifest.chunkIds.size());
    for (const auto& chunkId : manifest.chunkIds) {
        Chunk chunk = retriever.FetchChunk(chunkId);
        VerifyChunk(chunk, chunkId);
        chunks.push_back(std::move(chunk));
    }
    return Reassemble(manifest, chunks);
}

} // namespace dds
} // namespace ddsledger
