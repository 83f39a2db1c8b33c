#include <exception>
#include <iostream>
#include <string>

#include "config/chainparams.hpp"
#include "config/node_config.hpp"
#include "core/blockchain.hpp"
#include "core/transaction.hpp"
#include "identity/wallet.hpp"
#include "network/loopback_transport.hpp"
#include "node/dds_node.hpp"
#include "user/profile.hpp"
#include "user/profile_manager.hpp"
#include "util/config_parser.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

namespace logger = ddsledger::util::logger;

int main(int argc, char** argv) {
    // 1. Parse configuration
    ddsledger::config::NodeConfig nodeConfig;
    ddsledger::util::ConfigParser configParser(nodeConfig);

    std::string configPath = "ddsledger_node.conf";
    if (argc > 1) {
        configPath = argv[1];
    }

    try {
        configParser.loadFromFile(configPath);
        logger::setLogLevel(logger::parseLogLevel(nodeConfig.logLevel));
    } catch (const ddsledger::util::MalformedInputError& ex) {
        logger::critical(std::string("[main] Bad configuration: ") + ex.what());
        return 1;
    }
    if (!nodeConfig.logFile.empty() && !logger::enableFileOutput(nodeConfig.logFile, true)) {
        logger::warn("[main] Continuing without log file " + nodeConfig.logFile);
    }

    logger::info("[main] ddsledger node starting...");

    try {
        // 2. Two nodes on one in-process network. The second one shares the config but
        //    never persists anything, so it has to fetch from the first.
        ddsledger::network::LoopbackTransport network;

        ddsledger::config::NodeConfig publisherConfig = nodeConfig;
        ddsledger::config::NodeConfig readerConfig = nodeConfig;
        readerConfig.nodeName = nodeConfig.nodeName + "-reader";
        readerConfig.storageBackend = "memory";

        ddsledger::node::DdsNode publisher;
        ddsledger::node::DdsNode reader;
        publisher.InitializeNode(publisherConfig, network);
        reader.InitializeNode(readerConfig, network);
        network.RegisterServer(publisher.GetId(), publisher.GetContentServer());
        network.RegisterServer(reader.GetId(), reader.GetContentServer());
        publisher.ConnectPeer(reader);

        // 3. Publish a post
        ddsledger::identity::Wallet alice = ddsledger::identity::Wallet::Create();
        const std::string post = "This is my first decentralized post...";
        ddsledger::dds::ContentID cid = publisher.Publish(post);
        logger::info("[main] Published post as " + cid);

        // 4. Record the claim on the ledger
        ddsledger::core::Blockchain chain(ddsledger::config::getDefaultParams());
        auto tx = ddsledger::core::Transaction::NewTransaction(
            alice.GetAddress(), ddsledger::core::TransactionType::PostCreated, cid);
        tx.Sign(alice.GetPrivateKeyBytes());
        auto blk = chain.AddBlock({tx});
        logger::info("[main] Transaction " + tx.GetID() + " recorded in block " +
                     std::to_string(blk->header.index));

        std::string reason;
        if (!chain.IsChainValid(&reason)) {
            logger::critical("[main] Ledger failed validation: " + reason);
            return 1;
        }

        // 5. Read the claim back and fetch the content through the other node
        auto recorded = chain.GetTransactionByID(tx.GetID());
        std::string fetched = reader.RetrieveString(recorded.GetPayloadAsString());
        if (fetched != post) {
            logger::critical("[main] Retrieved content differs from the published post");
            return 1;
        }

        // 6. Profile versions: published by the first node, followed by the second via the ledger
        ddsledger::user::ProfileManager publisherProfiles(publisher.GetDdsService(), chain);
        ddsledger::user::ProfileManager readerProfiles(reader.GetDdsService(), chain);
        auto v1 = publisherProfiles.PublishAndRecord(
            ddsledger::user::Profile::NewProfile(alice.GetAddress(), "alice"), alice);
        publisherProfiles.UpdateAndPublishProfile(v1.profile, "", "first post is up", "", alice);
        ddsledger::user::Profile profile = readerProfiles.GetLatestProfile(alice.GetAddress());

        std::cout << "Block " << blk->header.index << " " << blk->hash << "\n"
                  << "  " << ddsledger::core::TransactionTypeName(recorded.GetType()) << " by "
                  << recorded.GetSenderAddress() << "\n"
                  << "  content " << cid << ": \"" << fetched << "\"\n"
                  << "Profile of " << profile.displayName << " v" << profile.version << ": \""
                  << profile.bio << "\"" << std::endl;

        network.UnregisterServer(reader.GetId());
        network.UnregisterServer(publisher.GetId());
    } catch (const ddsledger::util::DdsLedgerError& ex) {
        logger::critical(std::string("[main] ") + ex.what());
        return 1;
    }

    logger::info("[main] ddsledger node exiting.");
    return 0;
}
