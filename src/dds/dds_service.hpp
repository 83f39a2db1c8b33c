#ifndef DDSLEDGER_DDS_DDS_SERVICE_HPP
#define DDSLEDGER_DDS_DDS_SERVICE_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "dds/chunker.hpp"
#include "dds/content_types.hpp"
#include "dds/originator.hpp"
#include "dds/retriever.hpp"
#include "dds/storage_backend.hpp"

namespace ddsledger {
namespace dds {

/*
  DdsCoreService
  --------------------------------------------------------
  Publish/Retrieve over chunker + local storage + originator, with local-first,
  peer-fallback retrieval.

  Required Methods:
    ContentID Publish(const std::vector<uint8_t> &data)
    std::vector<uint8_t> Retrieve(const ContentID &manifestId)

  Publish:
    chunk -> store every chunk -> store manifest (last write) -> advertise.
    Storage errors abort and propagate. An advertise failure is logged and the ID is still
    returned, since the content is already durable locally.

  Retrieve:
    1. Manifest and every chunk in local storage: verify and reassemble. A local
       integrity failure is an IntegrityError; a missing local chunk falls through to 2.
    2. Without a network retriever, or with no peer advertising the ID:
       ContentUnavailableError.
    3. Fetch the verified manifest from the first candidate that serves it, then each chunk
       from that peer first and the remaining candidates after it. Every chunk is
       hash-verified, so a retrieval may combine chunks from several peers. If the chunks
       cannot be completed or reassembled, the manifest is taken from the next candidate
       after the one that served it, until candidates run out (TransportError).
    4. Cache the chunks, then the manifest, in local storage (failures only logged).
*/
class DdsCoreService {
  public:
    DdsCoreService(IChunker& chunker, IStorageBackend& storage, IOriginator& originator,
                   NetworkRetriever* remote = nullptr);

    ContentID Publish(const std::vector<uint8_t>& data);
    ContentID Publish(const std::string& data);

    std::vector<uint8_t> Retrieve(const ContentID& manifestId);
    std::string RetrieveString(const ContentID& manifestId);

  private:
    bool retrieveLocal(const ContentID& manifestId, std::vector<uint8_t>& out);
    std::vector<uint8_t> retrieveRemote(const ContentID& manifestId);
    ManifestSource fetchManifest(const std::vector<network::PeerNode>& candidates,
                                 const ContentID& manifestId, const std::string& failures);
    void cacheLocally(const Manifest& manifest, const std::vector<Chunk>& chunks);

    IChunker& m_chunker;
    IStorageBackend& m_storage;
    IOriginator& m_originator;
    NetworkRetriever* m_remote;
    LocalRetriever m_local;
};

} // namespace dds
} // namespace ddsledger

#endif // DDSLEDGER_DDS_DDS_SERVICE_HPP
