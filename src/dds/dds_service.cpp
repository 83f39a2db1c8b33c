#include "dds/dds_service.hpp"

#include <algorithm>

#include "util/errors.hpp"
#include "util/logger.hpp"

namespace ddsledger {
namespace dds {

DdsCoreService::DdsCoreService(IChunker& chunker, IStorageBackend& storage,
                               IOriginator& originator, NetworkRetriever* remote)
    : m_chunker(chunker), m_storage(storage), m_originator(originator), m_remote(remote),
      m_local(storage) {}

ContentID DdsCoreService::Publish(const std::vector<uint8_t>& data) {
    std::vector<Chunk> chunks = m_chunker.ChunkContent(data);
    Manifest manifest = m_chunker.GenerateManifest(chunks, data);

    for (const auto& chunk : chunks) {
        m_storage.StoreChunk(chunk);
    }
    // the manifest makes the content retrievable, so it is written last
    m_storage.StoreManifest(manifest);
    util::logger::info("[DdsCoreService] Stored " + manifest.id + " (" +
                       std::to_string(manifest.totalSize) + " bytes, " +
                       std::to_string(chunks.size()) + " chunks)");

    try {
        m_originator.AdvertiseContent(manifest.id);
    } catch (const util::DdsLedgerError& ex) {
        util::logger::warn("[DdsCoreService] Advertising " + manifest.id +
                           " failed, content is local only: " + ex.what());
    }
    return manifest.id;
}

ContentID DdsCoreService::Publish(const std::string& data) {
    return Publish(std::vector<uint8_t>(data.begin(), data.end()));
}

std::vector<uint8_t> DdsCoreService::Retrieve(const ContentID& manifestId) {
    if (manifestId.empty()) {
        throw util::MalformedInputError("DdsCoreService: content ID cannot be empty");
    }
    std::vector<uint8_t> out;
    if (retrieveLocal(manifestId, out)) {
        return out;
    }
    return retrieveRemote(manifestId);
}

std::string DdsCoreService::RetrieveString(const ContentID& manifestId) {
    std::vector<uint8_t> bytes = Retrieve(manifestId);
    return std::string(bytes.begin(), bytes.end());
}

bool DdsCoreService::retrieveLocal(const ContentID& manifestId, std::vector<uint8_t>& out) {
    Manifest manifest;
    try {
        manifest = m_local.FetchManifest(manifestId);
    } catch (const util::NotFoundError&) {
        util::logger::info("[DdsCoreService] " + manifestId + " not found locally");
        return false;
    }
    VerifyManifest(manifest, manifestId);

    std::vector<Chunk> chunks;
    chunks.reserve(manifest.chunkIds.size());
    for (const auto& chunkId : manifest.chunkIds) {
        try {
            chunks.push_back(m_local.FetchChunk(chunkId));
        } catch (const util::NotFoundError&) {
            util::logger::warn("[DdsCoreService] Chunk " + chunkId + " of " + manifestId +
                               " missing locally, trying peers");
            return false;
        }
        VerifyChunk(chunks.back(), chunkId);
    }

    out = Reassemble(manifest, chunks);
    util::logger::debug("[DdsCoreService] " + manifestId + " served from local storage");
    return true;
}

std::vector<uint8_t> DdsCoreService::retrieveRemote(const ContentID& manifestId) {
    if (!m_remote) {
        throw util::ContentUnavailableError("DdsCoreService: " + manifestId +
                                            " is not local and no network is configured");
    }

    std::vector<network::PeerNode> candidates = m_remote->FindCandidates(manifestId);
    if (candidates.empty()) {
        throw util::ContentUnavailableError("DdsCoreService: no peer advertises " + manifestId);
    }

    std::string failures;
    size_t next = 0;
    while (next < candidates.size()) {
        std::vector<network::PeerNode> remaining(candidates.begin() + next, candidates.end());
        ManifestSource source = fetchManifest(remaining, manifestId, failures);
        auto served = std::find_if(candidates.begin() + next, candidates.end(),
                                   [&source](const network::PeerNode& p) {
                                       return p.ID == source.peer.ID;
                                   });
        next = static_cast<size_t>(served - candidates.begin()) + 1;

        // serving peer first, the other candidates as backups
        std::vector<network::PeerNode> order;
        order.reserve(candidates.size());
        order.push_back(source.peer);
        for (const auto& peer : candidates) {
            if (peer.ID != source.peer.ID) {
                order.push_back(peer);
            }
        }

        try {
            std::vector<Chunk> chunks;
            chunks.reserve(source.manifest.chunkIds.size());
            for (const auto& chunkId : source.manifest.chunkIds) {
                chunks.push_back(m_remote->FetchChunkFrom(order, chunkId));
            }
            std::vector<uint8_t> data = Reassemble(source.manifest, chunks);
            util::logger::info("[DdsCoreService] Retrieved " + manifestId +
                               " from the network (manifest from " + source.peer.ID + ")");
            cacheLocally(source.manifest, chunks);
            return data;
        } catch (const util::NotFoundError& ex) {
            failures += "\n  " + source.peer.ID + ": " + ex.what();
        } catch (const util::TransportError& ex) {
            failures += "\n  " + source.peer.ID + ": " + ex.what();
        } catch (const util::IntegrityError& ex) {
            failures += "\n  " + source.peer.ID + ": " + ex.what();
        }
        util::logger::warn("[DdsCoreService] Content of " + manifestId + " via " + source.peer.ID +
                           " could not be completed");
    }
    throw util::TransportError("DdsCoreService: " + manifestId + " could not be assembled from " +
                               std::to_string(candidates.size()) + " peer(s):" + failures);
}

// A manifest from the remaining candidates. Once an earlier candidate failed partway, running
// out of manifests is a transport failure rather than plain unavailability.
ManifestSource DdsCoreService::fetchManifest(const std::vector<network::PeerNode>& candidates,
                                             const ContentID& manifestId,
                                             const std::string& failures) {
    if (failures.empty()) {
        return m_remote->FetchManifestFrom(candidates, manifestId);
    }
    try {
        return m_remote->FetchManifestFrom(candidates, manifestId);
    } catch (const util::NotFoundError& ex) {
        throw util::TransportError("DdsCoreService: " + manifestId +
                                   " could not be assembled:" + failures + "\n  " + ex.what());
    }
}

void DdsCoreService::cacheLocally(const Manifest& manifest, const std::vector<Chunk>& chunks) {
    try {
        for (const auto& chunk : chunks) {
            m_storage.StoreChunk(chunk);
        }
        m_storage.StoreManifest(manifest);
    } catch (const util::DdsLedgerError& ex) {
        util::logger::warn("[DdsCoreService] Could not cache " + manifest.id + " locally: " +
                           ex.what());
    }
}

} // namespace dds
} // namespace ddsledger
