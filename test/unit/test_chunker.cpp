#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "dds/chunker.hpp"
#include "dds/content_types.hpp"
#include "util/errors.hpp"
#include "util/hashing.hpp"

using namespace ddsledger;

namespace {

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST(ChunkerTest, SplitsIntoFixedSizePieces) {
    dds::FixedSizeChunker chunker(10);
    auto data = bytesOf("This is my first decentralized post...");
    auto chunks = chunker.ChunkContent(data);

    ASSERT_EQ(chunks.size(), (data.size() + 9) / 10);
    for (size_t i = 0; i + 1 < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].data.size(), (size_t)10);
    }
    EXPECT_EQ(chunks.back().data.size(), data.size() % 10 == 0 ? 10 : data.size() % 10);
    for (const auto& chunk : chunks) {
        EXPECT_TRUE(chunk.IsValid());
        EXPECT_EQ(chunk.id, util::hashing::sha256(chunk.data));
    }
}

TEST(ChunkerTest, ExactMultipleHasNoShortTail) {
    dds::FixedSizeChunker chunker(4);
    auto chunks = chunker.ChunkContent(bytesOf("abcdefgh"));
    ASSERT_EQ(chunks.size(), (size_t)2);
    EXPECT_EQ(chunks[1].data, bytesOf("efgh"));
}

TEST(ChunkerTest, EmptyContentHasNoChunksButAValidManifest) {
    dds::FixedSizeChunker chunker(8);
    std::vector<uint8_t> empty;
    auto chunks = chunker.ChunkContent(empty);
    EXPECT_TRUE(chunks.empty());

    dds::Manifest m = chunker.GenerateManifest(chunks, empty);
    EXPECT_TRUE(m.chunkIds.empty());
    EXPECT_EQ(m.totalSize, (uint64_t)0);
    EXPECT_EQ(m.originalContentHash, util::hashing::sha256(empty));
    EXPECT_TRUE(m.IsValid());
}

TEST(ChunkerTest, ManifestIsDeterministic) {
    auto data = bytesOf("This is my first decentralized post...");
    dds::FixedSizeChunker a(10);
    dds::FixedSizeChunker b(10);
    dds::Manifest m1 = a.GenerateManifest(a.ChunkContent(data), data);
    dds::Manifest m2 = b.GenerateManifest(b.ChunkContent(data), data);

    EXPECT_EQ(m1, m2);
    EXPECT_EQ(m1.totalSize, data.size());
    EXPECT_TRUE(util::hashing::isSha256Hex(m1.id));

    // a different chunk size is a different manifest for the same bytes
    dds::FixedSizeChunker c(16);
    EXPECT_NE(c.GenerateManifest(c.ChunkContent(data), data).id, m1.id);
}

TEST(ChunkerTest, ManifestIdCoversEveryField) {
    auto data = bytesOf("0123456789abcdef");
    dds::FixedSizeChunker chunker(5);
    dds::Manifest m = chunker.GenerateManifest(chunker.ChunkContent(data), data);

    dds::Manifest changed = m;
    changed.totalSize += 1;
    EXPECT_FALSE(changed.IsValid());

    changed = m;
    std::swap(changed.chunkIds[0], changed.chunkIds[1]);
    EXPECT_FALSE(changed.IsValid());

    changed = m;
    changed.originalContentHash = util::hashing::sha256(std::string("other"));
    EXPECT_FALSE(changed.IsValid());
}

TEST(ChunkerTest, RejectsBadInput) {
    EXPECT_THROW(dds::FixedSizeChunker(0), util::MalformedInputError);
    EXPECT_THROW(dds::FixedSizeChunker(-5), util::MalformedInputError);

    dds::FixedSizeChunker chunker(4);
    auto data = bytesOf("abcdefgh");
    auto chunks = chunker.ChunkContent(data);
    chunks.pop_back();
    EXPECT_THROW(chunker.GenerateManifest(chunks, data), util::MalformedInputError);
}
