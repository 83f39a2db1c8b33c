#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config/node_config.hpp"
#include "dds/chunker.hpp"
#include "dds/content_codec.hpp"
#include "dds/dds_service.hpp"
#include "dds/originator.hpp"
#include "dds/retriever.hpp"
#include "dds/storage_backend.hpp"
#include "network/discovery.hpp"
#include "network/handler_transport.hpp"
#include "network/loopback_transport.hpp"
#include "network/network_service.hpp"
#include "node/dds_node.hpp"
#include "util/errors.hpp"

using namespace ddsledger;

namespace {

config::NodeConfig nodeConfig(const std::string& name, uint64_t weight = 100) {
    config::NodeConfig cfg;
    cfg.nodeName = name;
    cfg.nodeAddress = "loop://" + name;
    cfg.nodeWeight = weight;
    cfg.chunkSize = 10;
    cfg.requestTimeoutMs = 0;
    return cfg;
}

// Nodes on one loopback network, each registered as a server.
class LoopbackNetworkTest : public ::testing::Test {
  protected:
    void start(node::DdsNode& n, const config::NodeConfig& cfg) {
        n.InitializeNode(cfg, network_);
        network_.RegisterServer(n.GetId(), n.GetContentServer());
    }

    void TearDown() override {
        for (const char* id : {"alice", "bob", "carol"}) {
            network_.UnregisterServer(id);
        }
    }

    network::LoopbackTransport network_;
};

} // namespace

TEST_F(LoopbackNetworkTest, RetrievesFromPeerAndCaches) {
    node::DdsNode alice;
    node::DdsNode bob;
    start(alice, nodeConfig("alice"));
    start(bob, nodeConfig("bob"));
    alice.ConnectPeer(bob);

    const std::string post = "This is my first decentralized post...";
    dds::ContentID id = alice.Publish(post);
    EXPECT_FALSE(bob.GetStorage().HasManifest(id));

    EXPECT_EQ(bob.RetrieveString(id), post);
    EXPECT_TRUE(bob.GetStorage().HasManifest(id));

    // served from bob's cache once alice is gone
    network_.UnregisterServer("alice");
    EXPECT_EQ(bob.RetrieveString(id), post);
}

TEST_F(LoopbackNetworkTest, EmptyContentThroughPeer) {
    node::DdsNode alice;
    node::DdsNode bob;
    start(alice, nodeConfig("alice"));
    start(bob, nodeConfig("bob"));
    alice.ConnectPeer(bob);

    dds::ContentID id = alice.Publish(std::vector<uint8_t>{});
    ASSERT_FALSE(bob.GetStorage().HasManifest(id));

    EXPECT_TRUE(bob.Retrieve(id).empty());
    EXPECT_EQ(bob.RetrieveString(id), "");
    EXPECT_TRUE(bob.GetStorage().HasManifest(id));
    EXPECT_TRUE(bob.GetStorage().GetManifest(id).chunkIds.empty());
}

TEST_F(LoopbackNetworkTest, SameBytesSameIdAcrossNodes) {
    node::DdsNode alice;
    node::DdsNode bob;
    start(alice, nodeConfig("alice"));
    start(bob, nodeConfig("bob"));
    EXPECT_EQ(alice.Publish(std::string("identical")), bob.Publish(std::string("identical")));
}

TEST_F(LoopbackNetworkTest, NoAdvertisingPeerIsNotFound) {
    node::DdsNode alice;
    node::DdsNode bob;
    start(alice, nodeConfig("alice"));
    start(bob, nodeConfig("bob"));
    alice.ConnectPeer(bob);

    dds::ContentID unknown = std::string(64, 'c');
    EXPECT_THROW(bob.Retrieve(unknown), util::NotFoundError);
    EXPECT_THROW(bob.Retrieve(unknown), util::ContentUnavailableError);
}

TEST_F(LoopbackNetworkTest, OfflinePeerFallsBackToNextCandidate) {
    node::DdsNode alice;
    node::DdsNode bob;
    node::DdsNode carol;
    start(alice, nodeConfig("alice", 50));
    start(bob, nodeConfig("bob", 10));
    start(carol, nodeConfig("carol", 1));
    alice.ConnectPeer(carol);
    bob.ConnectPeer(carol);

    dds::ContentID id = alice.Publish(std::string("replicated on two peers"));
    bob.Publish(std::string("replicated on two peers"));

    // alice is preferred by weight but unreachable
    network_.UnregisterServer("alice");
    EXPECT_EQ(carol.RetrieveString(id), "replicated on two peers");
}

TEST_F(LoopbackNetworkTest, IncompleteLocalCopyFallsThroughToPeers) {
    node::DdsNode alice;
    node::DdsNode bob;
    start(alice, nodeConfig("alice"));
    start(bob, nodeConfig("bob"));
    alice.ConnectPeer(bob);

    dds::ContentID id = alice.Publish(std::string("bob only has the manifest of this"));
    bob.GetStorage().StoreManifest(alice.GetStorage().GetManifest(id));

    EXPECT_EQ(bob.RetrieveString(id), "bob only has the manifest of this");
}

TEST_F(LoopbackNetworkTest, DisconnectOnDestruction) {
    node::DdsNode bob;
    start(bob, nodeConfig("bob"));
    {
        node::DdsNode alice;
        start(alice, nodeConfig("alice"));
        alice.ConnectPeer(bob);
        EXPECT_EQ(bob.GetNetworkService().GetNetworkView().size(), (size_t)1);
        network_.UnregisterServer("alice");
    }
    EXPECT_TRUE(bob.GetNetworkService().GetNetworkView().empty());
    EXPECT_NO_THROW(bob.Publish(std::string("nobody to tell")));
}

TEST_F(LoopbackNetworkTest, SqliteNodeWithRequestTimeout) {
    auto dir = std::filesystem::temp_directory_path() / "ddsledger_p2p_test";
    std::filesystem::remove_all(dir);

    config::NodeConfig aliceCfg = nodeConfig("alice");
    aliceCfg.storageBackend = "sqlite";
    aliceCfg.dataDirectory = dir.string();
    aliceCfg.compressChunks = true;
    config::NodeConfig bobCfg = nodeConfig("bob");
    bobCfg.requestTimeoutMs = 2000;
    bobCfg.requestWorkers = 2;

    {
        node::DdsNode alice;
        node::DdsNode bob;
        start(alice, aliceCfg);
        start(bob, bobCfg);
        alice.ConnectPeer(bob);

        dds::ContentID id = alice.Publish(std::string(300, 'z'));
        EXPECT_TRUE(std::filesystem::exists(dir / "alice.sqlite"));
        EXPECT_EQ(bob.RetrieveString(id), std::string(300, 'z'));
        network_.UnregisterServer("alice");
        network_.UnregisterServer("bob");
    }
    std::filesystem::remove_all(dir);
}

TEST(DdsNodeTest, RejectsBadConfiguration) {
    network::LoopbackTransport network;
    config::NodeConfig cfg = nodeConfig("bad");

    node::DdsNode uninitialised;
    EXPECT_FALSE(uninitialised.IsInitialized());
    EXPECT_THROW(uninitialised.Publish(std::string("x")), util::DdsLedgerError);

    cfg.storageBackend = "tape";
    node::DdsNode n1;
    EXPECT_THROW(n1.InitializeNode(cfg, network), util::MalformedInputError);

    cfg = nodeConfig("bad");
    cfg.chunkSize = 0;
    node::DdsNode n2;
    EXPECT_THROW(n2.InitializeNode(cfg, network), util::MalformedInputError);

    cfg = nodeConfig("");
    node::DdsNode n3;
    EXPECT_THROW(n3.InitializeNode(cfg, network), util::MalformedInputError);

    node::DdsNode ok;
    ok.InitializeNode(nodeConfig("ok"), network);
    EXPECT_THROW(ok.InitializeNode(nodeConfig("ok"), network), util::DdsLedgerError);
    EXPECT_THROW(ok.ConnectPeer(ok), util::MalformedInputError);
}

// Seeded peers on a programmable transport: one has the manifest and part of the chunks,
// another has the rest. Every chunk is verified, so the retrieval may combine them.
TEST(SeededPeerTest, ChunksFromSeveralPeers) {
    std::string text = "content split between two partially seeded peers";
    std::vector<uint8_t> data(text.begin(), text.end());
    dds::FixedSizeChunker chunker(10);
    auto chunks = chunker.ChunkContent(data);
    dds::Manifest manifest = chunker.GenerateManifest(chunks, data);
    ASSERT_GE(chunks.size(), (size_t)3);

    network::HandlerTransport transport;
    transport.ServeManifest("partial", manifest);
    transport.ServeChunk("partial", chunks[0]);
    transport.SetCatchAll([](const network::PeerNode&, const std::string&, const dds::ContentID& id) {
        return network::MakeMessage(network::msg::NOT_FOUND, id);
    });
    for (size_t i = 1; i < chunks.size(); ++i) {
        transport.ServeChunk("rest", chunks[i]);
    }
    // "rest" also answers with a corrupted copy of chunk 0, which must never be used
    dds::Chunk corrupted = chunks[0];
    corrupted.data[0] ^= 0xff;
    transport.SetHandler("rest", network::msg::GET_CHUNK, chunks[0].id,
                         [corrupted](const network::PeerNode&, const std::string&, const dds::ContentID&) {
                             return network::MakeMessage(network::msg::CHUNK,
                                                         dds::codec::EncodeChunk(corrupted));
                         });

    network::PeerNode local("reader", "addr", 1);
    network::NetworkService service(local, transport);
    network::PeerNode partial("partial", "addr-p", 10);
    network::PeerNode rest("rest", "addr-r", 5);
    partial.AddAdvertisedContent(manifest.id);
    rest.AddAdvertisedContent(manifest.id);
    service.AddPeerToNetworkView(partial);
    service.AddPeerToNetworkView(rest);

    network::NetworkViewDiscovery discovery(service);
    dds::NetworkRetriever retriever(service, discovery);
    dds::NetworkOriginator originator(service);
    dds::InMemoryStorage empty;
    dds::DdsCoreService dds(chunker, empty, originator, &retriever);

    EXPECT_EQ(dds.Retrieve(manifest.id), data);
    EXPECT_EQ(empty.GetChunk(chunks[0].id).data, chunks[0].data);
}

TEST(SeededPeerTest, EveryPeerServingBadDataFails) {
    std::string text = "nobody serves this correctly";
    std::vector<uint8_t> data(text.begin(), text.end());
    dds::FixedSizeChunker chunker(10);
    auto chunks = chunker.ChunkContent(data);
    dds::Manifest manifest = chunker.GenerateManifest(chunks, data);

    network::HandlerTransport transport;
    transport.ServeManifest("p", manifest);
    dds::Chunk corrupted = chunks[1];
    corrupted.data.push_back('!');
    transport.ServeChunk("p", chunks[0]);
    transport.SetHandler("p", network::msg::GET_CHUNK, chunks[1].id,
                         [corrupted](const network::PeerNode&, const std::string&, const dds::ContentID&) {
                             return network::MakeMessage(network::msg::CHUNK,
                                                         dds::codec::EncodeChunk(corrupted));
                         });

    network::PeerNode local("reader", "addr", 1);
    network::NetworkService service(local, transport);
    network::PeerNode p("p", "addr-p", 1);
    p.AddAdvertisedContent(manifest.id);
    service.AddPeerToNetworkView(p);

    network::NetworkViewDiscovery discovery(service);
    dds::NetworkRetriever retriever(service, discovery);
    dds::NetworkOriginator originator(service);
    dds::InMemoryStorage storage;
    dds::DdsCoreService dds(chunker, storage, originator, &retriever);

    EXPECT_THROW(dds.Retrieve(manifest.id), util::TransportError);
    EXPECT_FALSE(storage.HasManifest(manifest.id));
}

// A heavier peer answers with a manifest whose single chunk entry is every real chunk ID
// joined by commas. It must be rejected and the lighter peer's copy used.
TEST(SeededPeerTest, JoinedChunkListManifestIsSkipped) {
    std::string text = "an honest peer holds all of this content";
    std::vector<uint8_t> data(text.begin(), text.end());
    dds::FixedSizeChunker chunker(10);
    auto chunks = chunker.ChunkContent(data);
    dds::Manifest manifest = chunker.GenerateManifest(chunks, data);
    ASSERT_GE(chunks.size(), (size_t)3);

    dds::Manifest joined = manifest;
    std::string all;
    for (size_t i = 0; i < manifest.chunkIds.size(); ++i) {
        all += (i > 0 ? "," : "") + manifest.chunkIds[i];
    }
    joined.chunkIds = {all};
    ASSERT_NE(joined.ComputeId(), manifest.id);

    network::HandlerTransport transport;
    transport.ServeManifest("heavy", joined);
    transport.ServeManifest("honest", manifest);
    for (const auto& chunk : chunks) {
        transport.ServeChunk("honest", chunk);
    }
    transport.SetCatchAll([](const network::PeerNode&, const std::string&, const dds::ContentID& id) {
        return network::MakeMessage(network::msg::NOT_FOUND, id);
    });

    network::PeerNode local("reader", "addr", 1);
    network::NetworkService service(local, transport);
    network::PeerNode heavy("heavy", "addr-h", 10);
    network::PeerNode honest("honest", "addr-o", 5);
    heavy.AddAdvertisedContent(manifest.id);
    honest.AddAdvertisedContent(manifest.id);
    service.AddPeerToNetworkView(heavy);
    service.AddPeerToNetworkView(honest);

    network::NetworkViewDiscovery discovery(service);
    dds::NetworkRetriever retriever(service, discovery);
    dds::NetworkOriginator originator(service);
    dds::InMemoryStorage storage;
    dds::DdsCoreService dds(chunker, storage, originator, &retriever);

    EXPECT_EQ(dds.Retrieve(manifest.id), data);
    EXPECT_EQ(storage.GetManifest(manifest.id).chunkIds, manifest.chunkIds);
}

// The first candidate's manifest cannot be completed; the next candidate's manifest is used.
TEST(SeededPeerTest, IncompleteCandidateFallsThroughToNextManifest) {
    std::string text = "second candidate finishes the job";
    std::vector<uint8_t> data(text.begin(), text.end());
    dds::FixedSizeChunker chunker(10);
    auto chunks = chunker.ChunkContent(data);
    dds::Manifest manifest = chunker.GenerateManifest(chunks, data);

    network::HandlerTransport transport;
    transport.ServeManifest("first", manifest);
    transport.SetCatchAll([](const network::PeerNode&, const std::string&, const dds::ContentID& id) {
        return network::MakeMessage(network::msg::NOT_FOUND, id);
    });

    // "second" serves chunks only after its own manifest was requested
    auto opened = std::make_shared<bool>(false);
    network::ProtocolMessage manifestResp =
        network::MakeMessage(network::msg::MANIFEST, dds::codec::EncodeManifest(manifest));
    transport.SetHandler("second", network::msg::GET_MANIFEST, manifest.id,
                         [opened, manifestResp](const network::PeerNode&, const std::string&,
                                                const dds::ContentID&) {
                             *opened = true;
                             return manifestResp;
                         });
    for (const auto& chunk : chunks) {
        network::ProtocolMessage chunkResp =
            network::MakeMessage(network::msg::CHUNK, dds::codec::EncodeChunk(chunk));
        transport.SetHandler("second", network::msg::GET_CHUNK, chunk.id,
                             [opened, chunkResp](const network::PeerNode&, const std::string&,
                                                 const dds::ContentID& id) {
                                 if (!*opened) {
                                     return network::MakeMessage(network::msg::ERROR, "busy " + id);
                                 }
                                 return chunkResp;
                             });
    }

    network::PeerNode local("reader", "addr", 1);
    network::NetworkService service(local, transport);
    network::PeerNode first("first", "addr-1", 10);
    network::PeerNode second("second", "addr-2", 5);
    first.AddAdvertisedContent(manifest.id);
    second.AddAdvertisedContent(manifest.id);
    service.AddPeerToNetworkView(first);
    service.AddPeerToNetworkView(second);

    network::NetworkViewDiscovery discovery(service);
    dds::NetworkRetriever retriever(service, discovery);
    dds::NetworkOriginator originator(service);
    dds::InMemoryStorage storage;
    dds::DdsCoreService dds(chunker, storage, originator, &retriever);

    EXPECT_EQ(dds.Retrieve(manifest.id), data);
    EXPECT_TRUE(*opened);
}
