#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "dds/chunker.hpp"
#include "dds/content_codec.hpp"
#include "dds/retriever.hpp"
#include "dds/storage_backend.hpp"
#include "network/discovery.hpp"
#include "network/handler_transport.hpp"
#include "network/network_service.hpp"
#include "network/peer_node.hpp"
#include "network/protocol_messages.hpp"
#include "util/errors.hpp"

using namespace ddsledger;
using network::PeerNode;

namespace {

struct Content {
    std::vector<uint8_t> data;
    std::vector<dds::Chunk> chunks;
    dds::Manifest manifest;
};

Content makeContent(const std::string& text) {
    Content c;
    c.data.assign(text.begin(), text.end());
    dds::FixedSizeChunker chunker(5);
    c.chunks = chunker.ChunkContent(c.data);
    c.manifest = chunker.GenerateManifest(c.chunks, c.data);
    return c;
}

void serveAll(network::HandlerTransport& transport, const std::string& peerId, const Content& c) {
    transport.ServeManifest(peerId, c.manifest);
    for (const auto& chunk : c.chunks) {
        transport.ServeChunk(peerId, chunk);
    }
}

// A retriever wired to a HandlerTransport and a list of advertising peers.
class NetworkRetrieverTest : public ::testing::Test {
  protected:
    NetworkRetrieverTest()
        : local_("local", "addr-local", 1), service_(local_, transport_) {}

    void addPeer(const std::string& id, uint64_t weight, const dds::ContentID& advertised) {
        PeerNode peer(id, "addr-" + id, weight);
        if (!advertised.empty()) {
            peer.AddAdvertisedContent(advertised);
        }
        service_.AddPeerToNetworkView(peer);
    }

    network::HandlerTransport transport_;
    PeerNode local_;
    network::NetworkService service_;
};

} // namespace

TEST(VerifyTest, DetectsTampering) {
    Content c = makeContent("verification sample");
    EXPECT_NO_THROW(dds::VerifyManifest(c.manifest, c.manifest.id));
    EXPECT_NO_THROW(dds::VerifyChunk(c.chunks[0], c.chunks[0].id));

    EXPECT_THROW(dds::VerifyManifest(c.manifest, "other"), util::IntegrityError);
    dds::Manifest bad = c.manifest;
    bad.totalSize++;
    EXPECT_THROW(dds::VerifyManifest(bad, bad.id), util::IntegrityError);

    dds::Chunk badChunk = c.chunks[0];
    badChunk.data[0] ^= 0x20;
    EXPECT_THROW(dds::VerifyChunk(badChunk, badChunk.id), util::IntegrityError);
    EXPECT_THROW(dds::VerifyChunk(c.chunks[0], c.chunks[1].id), util::IntegrityError);
}

TEST(VerifyTest, JoinedChunkIdsDoNotShareTheManifestId) {
    Content c = makeContent("several chunks of text to join");
    ASSERT_GE(c.chunks.size(), (size_t)3);

    dds::Manifest joined = c.manifest;
    std::string all;
    for (size_t i = 0; i < c.manifest.chunkIds.size(); ++i) {
        all += (i > 0 ? "," : "") + c.manifest.chunkIds[i];
    }
    joined.chunkIds = {all};
    EXPECT_NE(joined.ComputeId(), c.manifest.id);
    EXPECT_THROW(dds::VerifyManifest(joined, c.manifest.id), util::IntegrityError);

    // self-consistent, but the chunk entry is not a content ID
    joined.id = joined.ComputeId();
    EXPECT_THROW(dds::VerifyManifest(joined, joined.id), util::IntegrityError);

    dds::Manifest noHash = c.manifest;
    noHash.originalContentHash = "not-a-hash";
    noHash.id = noHash.ComputeId();
    EXPECT_THROW(dds::VerifyManifest(noHash, noHash.id), util::IntegrityError);
}

TEST(ReassembleTest, EnforcesOrderSizeAndHash) {
    Content c = makeContent("reassembly in manifest order");
    EXPECT_EQ(dds::Reassemble(c.manifest, c.chunks), c.data);

    auto swapped = c.chunks;
    std::swap(swapped[0], swapped[1]);
    EXPECT_THROW(dds::Reassemble(c.manifest, swapped), util::IntegrityError);

    auto missing = c.chunks;
    missing.pop_back();
    EXPECT_THROW(dds::Reassemble(c.manifest, missing), util::IntegrityError);

    dds::Manifest lying = c.manifest;
    lying.originalContentHash = std::string(64, '0');
    EXPECT_THROW(dds::Reassemble(lying, c.chunks), util::IntegrityError);
}

TEST(LocalRetrieverTest, ReadsFromStorage) {
    Content c = makeContent("local retriever");
    dds::InMemoryStorage store;
    for (const auto& chunk : c.chunks) {
        store.StoreChunk(chunk);
    }
    store.StoreManifest(c.manifest);

    dds::LocalRetriever local(store);
    EXPECT_EQ(dds::ReadContent(local, c.manifest.id), c.data);
    EXPECT_THROW(local.FetchManifest("absent"), util::NotFoundError);
}

TEST_F(NetworkRetrieverTest, PrefersHeavierPeer) {
    Content c = makeContent("weighted retrieval");
    addPeer("light", 1, c.manifest.id);
    addPeer("heavy", 9, c.manifest.id);
    serveAll(transport_, "light", c);
    serveAll(transport_, "heavy", c);

    network::NetworkViewDiscovery discovery(service_);
    dds::NetworkRetriever retriever(service_, discovery);

    auto candidates = retriever.FindCandidates(c.manifest.id);
    ASSERT_EQ(candidates.size(), (size_t)2);
    auto source = retriever.FetchManifestFrom(candidates, c.manifest.id);
    EXPECT_EQ(source.peer.ID, "heavy");
    EXPECT_EQ(source.manifest, c.manifest);
    EXPECT_EQ(dds::ReadContent(retriever, c.manifest.id), c.data);
}

TEST_F(NetworkRetrieverTest, SkipsFailingAndLyingPeers) {
    Content c = makeContent("skip the bad peers please");
    addPeer("down", 30, c.manifest.id);
    addPeer("liar", 20, c.manifest.id);
    addPeer("honest", 10, c.manifest.id);

    transport_.ServeError("down", network::msg::GET_MANIFEST, c.manifest.id, "overloaded");
    dds::Manifest forged = c.manifest;
    forged.totalSize = 1;
    transport_.SetHandler("liar", network::msg::GET_MANIFEST, c.manifest.id,
                          [forged](const PeerNode&, const std::string&, const dds::ContentID&) {
                              return network::MakeMessage(network::msg::MANIFEST,
                                                          dds::codec::EncodeManifest(forged));
                          });
    serveAll(transport_, "honest", c);

    network::NetworkViewDiscovery discovery(service_);
    dds::NetworkRetriever retriever(service_, discovery);
    auto source = retriever.FetchManifestFrom(retriever.FindCandidates(c.manifest.id), c.manifest.id);
    EXPECT_EQ(source.peer.ID, "honest");
}

TEST_F(NetworkRetrieverTest, AggregateFailureClasses) {
    Content c = makeContent("nobody has it");
    addPeer("p1", 1, c.manifest.id);
    addPeer("p2", 1, c.manifest.id);
    network::NetworkViewDiscovery discovery(service_);
    dds::NetworkRetriever retriever(service_, discovery);
    auto candidates = retriever.FindCandidates(c.manifest.id);

    transport_.ServeNotFound("p1", network::msg::GET_MANIFEST, c.manifest.id);
    transport_.ServeNotFound("p2", network::msg::GET_MANIFEST, c.manifest.id);
    EXPECT_THROW(retriever.FetchManifestFrom(candidates, c.manifest.id),
                 util::ContentUnavailableError);

    transport_.ServeError("p2", network::msg::GET_MANIFEST, c.manifest.id, "timeout");
    EXPECT_THROW(retriever.FetchManifestFrom(candidates, c.manifest.id), util::TransportError);

    EXPECT_THROW(retriever.FetchManifestFrom({}, c.manifest.id), util::ContentUnavailableError);
    EXPECT_THROW(retriever.FetchManifest("not-advertised"), util::ContentUnavailableError);
}

TEST_F(NetworkRetrieverTest, ChunksAreAskedFromEveryKnownPeer) {
    Content c = makeContent("chunk discovery");
    addPeer("quiet", 1, "");
    transport_.ServeChunk("quiet", c.chunks[0]);

    network::NetworkViewDiscovery discovery(service_);
    dds::NetworkRetriever retriever(service_, discovery);
    EXPECT_EQ(retriever.FetchChunk(c.chunks[0].id).data, c.chunks[0].data);
}

TEST_F(NetworkRetrieverTest, FallbackUsesSecondaryOnMiss) {
    Content c = makeContent("fallback composition");
    addPeer("remote", 1, c.manifest.id);
    serveAll(transport_, "remote", c);

    dds::InMemoryStorage empty;
    dds::LocalRetriever local(empty);
    network::NetworkViewDiscovery discovery(service_);
    dds::NetworkRetriever remote(service_, discovery);
    dds::FallbackRetriever both(local, remote);

    EXPECT_EQ(dds::ReadContent(both, c.manifest.id), c.data);
}
