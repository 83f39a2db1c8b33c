#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "config/chainparams.hpp"
#include "config/node_config.hpp"
#include "core/blockchain.hpp"
#include "core/transaction.hpp"
#include "identity/wallet.hpp"
#include "network/loopback_transport.hpp"
#include "node/dds_node.hpp"
#include "util/errors.hpp"

using namespace ddsledger;
using core::Transaction;
using core::TransactionType;

namespace {

config::NodeConfig nodeConfig(const std::string& name) {
    config::NodeConfig cfg;
    cfg.nodeName = name;
    cfg.nodeAddress = "loop://" + name;
    cfg.chunkSize = 10;
    cfg.requestTimeoutMs = 0;
    return cfg;
}

class TamperableChain : public core::Blockchain {
  public:
    using Blockchain::Blockchain;
    using Blockchain::rewriteBlock;
};

} // namespace

// Wallet A posts a content ID; replacing the payload afterwards breaks the signature.
TEST(LedgerFlowTest, TwoWalletTamperScenario) {
    identity::Wallet a = identity::Wallet::Create();
    identity::Wallet b = identity::Wallet::Create();
    core::Blockchain chain;

    Transaction txA = Transaction::NewTransaction(a.GetAddress(), TransactionType::PostCreated,
                                                  std::string(64, 'a'));
    txA.Sign(a.GetPrivateKeyBytes());
    auto blk = chain.AddBlock({txA});
    EXPECT_EQ(blk->header.index, 1);
    EXPECT_TRUE(chain.IsChainValid());

    std::string replacement = "content id chosen by " + b.GetAddress();
    txA.SetPayload(std::vector<uint8_t>(replacement.begin(), replacement.end()));
    EXPECT_FALSE(txA.VerifySignature());

    // B cannot re-sign A's claim, and the tampered claim cannot enter the chain
    EXPECT_THROW(txA.Sign(b.GetPrivateKeyBytes()), util::MalformedInputError);
    EXPECT_THROW(chain.AddBlock({txA}), util::InvalidSignatureError);
    EXPECT_EQ(chain.GetLength(), (size_t)2);

    // the copy stored in the chain is untouched
    EXPECT_TRUE(chain.GetTransactionByID(txA.GetID()).VerifySignature());
}

TEST(LedgerFlowTest, TamperingInsideTheChainIsDetected) {
    identity::Wallet a = identity::Wallet::Create();
    TamperableChain chain;
    Transaction tx = Transaction::NewTransaction(a.GetAddress(), TransactionType::ProfileUpdated,
                                                 "display name: a");
    tx.Sign(a.GetPrivateKeyBytes());
    chain.AddBlock({tx});
    ASSERT_TRUE(chain.IsChainValid());

    chain.rewriteBlock(1, [](core::Block& blk) { blk.transactions[0].SetPayload({'x'}); });
    std::string reason;
    EXPECT_FALSE(chain.IsChainValid(&reason));
    EXPECT_FALSE(reason.empty());
}

// publish -> sign claim -> append -> read claim -> retrieve from another node
TEST(LedgerFlowTest, PublishRecordAndRetrieveThroughPeer) {
    network::LoopbackTransport network;
    node::DdsNode publisher;
    node::DdsNode reader;
    publisher.InitializeNode(nodeConfig("publisher"), network);
    reader.InitializeNode(nodeConfig("reader"), network);
    network.RegisterServer("publisher", publisher.GetContentServer());
    network.RegisterServer("reader", reader.GetContentServer());
    publisher.ConnectPeer(reader);

    identity::Wallet author = identity::Wallet::Create();
    identity::Wallet follower = identity::Wallet::Create();
    core::Blockchain chain(config::getTestnetParams());

    const std::string post = "This is my first decentralized post...";
    dds::ContentID cid = publisher.Publish(post);

    Transaction postTx = Transaction::NewTransaction(author.GetAddress(), TransactionType::PostCreated, cid);
    postTx.Sign(author.GetPrivateKeyBytes());
    Transaction followTx = Transaction::NewTransaction(follower.GetAddress(), TransactionType::FollowUser,
                                                       author.GetAddress());
    followTx.Sign(follower.GetPrivateKeyBytes());
    chain.AddBlock({postTx, followTx});
    ASSERT_TRUE(chain.IsChainValid());

    Transaction recorded = chain.GetTransactionByID(postTx.GetID());
    ASSERT_EQ(recorded.GetType(), TransactionType::PostCreated);
    EXPECT_EQ(reader.RetrieveString(recorded.GetPayloadAsString()), post);

    network.UnregisterServer("publisher");
    network.UnregisterServer("reader");
}
