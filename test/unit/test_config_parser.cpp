#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "config/chainparams.hpp"
#include "config/node_config.hpp"
#include "util/config_parser.hpp"
#include "util/errors.hpp"

using ddsledger::config::NodeConfig;
using ddsledger::util::ConfigParser;
using ddsledger::util::MalformedInputError;

TEST(ConfigParserTest, DefaultsWhenFileMissing) {
    NodeConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_FALSE(parser.loadFromFile("definitely_missing_ddsledger.conf"));
    EXPECT_EQ(cfg.chunkSize, (uint64_t)1024);
    EXPECT_EQ(cfg.storageBackend, "memory");
    EXPECT_FALSE(cfg.compressChunks);
}

TEST(ConfigParserTest, ReadsAllKeys) {
    std::istringstream in(
        "# node settings\n"
        "nodeName = alice\n"
        "  nodeAddress=10.0.0.1:7400  \n"
        "nodeWeight = 7\n"
        "\n"
        "dataDirectory = /tmp/alice\n"
        "chunkSize = 10\n"
        "storageBackend = sqlite\n"
        "compressChunks = yes\n"
        "requestTimeoutMs = 0\n"
        "requestWorkers = 2\n"
        "logLevel = debug\n"
        "logFile = alice.log\n"
        "someFutureKey = ignored\n");

    NodeConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromStream(in);

    EXPECT_EQ(cfg.nodeName, "alice");
    EXPECT_EQ(cfg.nodeAddress, "10.0.0.1:7400");
    EXPECT_EQ(cfg.nodeWeight, (uint64_t)7);
    EXPECT_EQ(cfg.dataDirectory, "/tmp/alice");
    EXPECT_EQ(cfg.chunkSize, (uint64_t)10);
    EXPECT_EQ(cfg.storageBackend, "sqlite");
    EXPECT_TRUE(cfg.compressChunks);
    EXPECT_EQ(cfg.requestTimeoutMs, (uint64_t)0);
    EXPECT_EQ(cfg.requestWorkers, (uint64_t)2);
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.logFile, "alice.log");
}

TEST(ConfigParserTest, RejectsMalformedInput) {
    NodeConfig cfg;
    ConfigParser parser(cfg);

    std::istringstream noEquals("chunkSize 10\n");
    EXPECT_THROW(parser.loadFromStream(noEquals), MalformedInputError);

    std::istringstream zeroChunk("chunkSize = 0\n");
    EXPECT_THROW(parser.loadFromStream(zeroChunk), MalformedInputError);

    std::istringstream negative("nodeWeight = -3\n");
    EXPECT_THROW(parser.loadFromStream(negative), MalformedInputError);

    std::istringstream suffix("requestTimeoutMs = 20ms\n");
    EXPECT_THROW(parser.loadFromStream(suffix), MalformedInputError);

    std::istringstream backend("storageBackend = redis\n");
    EXPECT_THROW(parser.loadFromStream(backend), MalformedInputError);

    std::istringstream level("logLevel = loud\n");
    EXPECT_THROW(parser.loadFromStream(level), MalformedInputError);

    std::istringstream flag("compressChunks = maybe\n");
    EXPECT_THROW(parser.loadFromStream(flag), MalformedInputError);
}

TEST(ChainParamsTest, NetworksAgreeOnGenesisTimestamp) {
    auto mainnet = ddsledger::config::getDefaultParams();
    auto testnet = ddsledger::config::getTestnetParams();
    EXPECT_EQ(mainnet.networkID, "mainnet");
    EXPECT_EQ(testnet.networkID, "testnet");
    EXPECT_EQ(mainnet.genesisTimestamp, testnet.genesisTimestamp);
    EXPECT_EQ(testnet.maxTransactionsPerBlock, (uint64_t)0);
}
