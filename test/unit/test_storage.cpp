#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "dds/chunker.hpp"
#include "dds/sqlite_storage.hpp"
#include "dds/storage_backend.hpp"
#include "util/errors.hpp"

using namespace ddsledger;

namespace {

struct Sample {
    std::vector<dds::Chunk> chunks;
    dds::Manifest manifest;
};

Sample makeSample(const std::string& text, int64_t chunkSize = 6) {
    std::vector<uint8_t> data(text.begin(), text.end());
    dds::FixedSizeChunker chunker(chunkSize);
    Sample s;
    s.chunks = chunker.ChunkContent(data);
    s.manifest = chunker.GenerateManifest(s.chunks, data);
    return s;
}

// Behaviour every backend must share.
void exerciseBackend(dds::IStorageBackend& store) {
    Sample s = makeSample("storage backend contract sample");

    EXPECT_FALSE(store.HasManifest(s.manifest.id));
    EXPECT_THROW(store.GetManifest(s.manifest.id), util::NotFoundError);
    EXPECT_THROW(store.GetChunk(s.chunks[0].id), util::NotFoundError);

    for (const auto& c : s.chunks) {
        store.StoreChunk(c);
    }
    store.StoreManifest(s.manifest);

    EXPECT_TRUE(store.HasManifest(s.manifest.id));
    EXPECT_EQ(store.GetManifest(s.manifest.id), s.manifest);
    for (const auto& c : s.chunks) {
        EXPECT_TRUE(store.HasChunk(c.id));
        EXPECT_EQ(store.GetChunk(c.id).data, c.data);
    }

    // idempotent: storing again changes nothing
    EXPECT_NO_THROW(store.StoreChunk(s.chunks[0]));
    EXPECT_NO_THROW(store.StoreManifest(s.manifest));
    EXPECT_EQ(store.GetChunk(s.chunks[0].id).data, s.chunks[0].data);

    dds::Chunk empty;
    EXPECT_THROW(store.StoreChunk(empty), util::MalformedInputError);
    dds::Manifest blank;
    EXPECT_THROW(store.StoreManifest(blank), util::MalformedInputError);
}

} // namespace

TEST(InMemoryStorageTest, SatisfiesBackendContract) {
    dds::InMemoryStorage store;
    exerciseBackend(store);
    EXPECT_GT(store.ChunkCount(), (size_t)0);
    EXPECT_EQ(store.ManifestCount(), (size_t)1);
}

TEST(InMemoryStorageTest, FirstWriteWins) {
    dds::InMemoryStorage store;
    dds::Chunk c;
    c.id = "same-id";
    c.data = {1, 2, 3};
    store.StoreChunk(c);
    c.data = {9};
    store.StoreChunk(c);
    EXPECT_EQ(store.GetChunk("same-id").data, (std::vector<uint8_t>{1, 2, 3}));
}

TEST(SqliteStorageTest, SatisfiesBackendContract) {
    dds::SqliteStorage store(":memory:");
    exerciseBackend(store);
}

TEST(SqliteStorageTest, SatisfiesBackendContractCompressed) {
    dds::SqliteStorage store(":memory:", true);
    exerciseBackend(store);
}

TEST(SqliteStorageTest, EmptyChunkBodyIsKept) {
    dds::SqliteStorage store(":memory:", true);
    dds::Chunk c;
    c.id = "empty-body";
    store.StoreChunk(c);
    EXPECT_TRUE(store.GetChunk("empty-body").data.empty());
}

TEST(SqliteStorageTest, PersistsAcrossReopen) {
    auto path = (std::filesystem::temp_directory_path() / "ddsledger_storage_test.sqlite").string();
    std::remove(path.c_str());

    Sample s = makeSample(std::string(500, 'a') + "tail that does not compress much", 64);
    {
        dds::SqliteStorage writer(path, true);
        for (const auto& c : s.chunks) {
            writer.StoreChunk(c);
        }
        writer.StoreManifest(s.manifest);
    }

    // compression is a per-row property, so a reader without it still decodes them
    dds::SqliteStorage reader(path, false);
    EXPECT_EQ(reader.GetPath(), path);
    EXPECT_EQ(reader.GetManifest(s.manifest.id), s.manifest);
    for (const auto& c : s.chunks) {
        EXPECT_EQ(reader.GetChunk(c.id).data, c.data);
    }
    std::remove(path.c_str());
}

TEST(SqliteStorageTest, UnopenablePathIsStorageError) {
    EXPECT_THROW(dds::SqliteStorage("/nonexistent-dir/for/sure/db.sqlite"), util::StorageError);
}
