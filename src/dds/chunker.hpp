#ifndef DDSLEDGER_DDS_CHUNKER_HPP
#define DDSLEDGER_DDS_CHUNKER_HPP

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include "dds/content_types.hpp"
#include "util/errors.hpp"
#include "util/hashing.hpp"

/*
  chunker.hpp
  ----------------------------------------------------------------
  Splits content into content-addressed chunks and builds the manifest that reassembles it.

  Required Methods:
    std::vector<Chunk> ChunkContent(const std::vector<uint8_t> &data) const
    Manifest GenerateManifest(const std::vector<Chunk> &chunks,
                              const std::vector<uint8_t> &originalData) const

  FixedSizeChunker:
    - chunk i covers bytes [i*chunkSize, min((i+1)*chunkSize, len)); the last chunk may be short.
    - Empty input yields zero chunks and a manifest with totalSize 0, which is still valid.
    - chunkSize <= 0 is rejected in the constructor.
*/

namespace ddsledger {
namespace dds {

class IChunker
{
public:
    virtual ~IChunker() = default;

    virtual std::vector<Chunk> ChunkContent(const std::vector<uint8_t> &data) const = 0;

    virtual Manifest GenerateManifest(const std::vector<Chunk> &chunks,
                                      const std::vector<uint8_t> &originalData) const = 0;
};

class FixedSizeChunker : public IChunker
{
public:
    /// @throw MalformedInputError if chunkSize <= 0.
    explicit FixedSizeChunker(int64_t chunkSize)
    {
        if (chunkSize <= 0) {
            throw util::MalformedInputError("FixedSizeChunker: chunk size must be positive, got "
                                            + std::to_string(chunkSize));
        }
        chunkSize_ = static_cast<size_t>(chunkSize);
    }

    size_t GetChunkSize() const { return chunkSize_; }

    std::vector<Chunk> ChunkContent(const std::vector<uint8_t> &data) const override
    {
        std::vector<Chunk> chunks;
        chunks.reserve((data.size() + chunkSize_ - 1) / chunkSize_);
        for (size_t offset = 0; offset < data.size(); offset += chunkSize_) {
            size_t end = std::min(offset + chunkSize_, data.size());
            Chunk chunk;
            chunk.data.assign(data.begin() + static_cast<std::ptrdiff_t>(offset),
                              data.begin() + static_cast<std::ptrdiff_t>(end));
            chunk.id = util::hashing::sha256(chunk.data);
            chunks.push_back(std::move(chunk));
        }
        return chunks;
    }

    /**
     * @brief Build the manifest for chunks produced from originalData.
     * @throw MalformedInputError if the chunk sizes do not add up to originalData.
     */
    Manifest GenerateManifest(const std::vector<Chunk> &chunks,
                              const std::vector<uint8_t> &originalData) const override
    {
        Manifest manifest;
        manifest.chunkIds.reserve(chunks.size());
        for (const auto &chunk : chunks) {
            manifest.chunkIds.push_back(chunk.id);
            manifest.totalSize += chunk.data.size();
        }
        if (manifest.totalSize != originalData.size()) {
            throw util::MalformedInputError("FixedSizeChunker: chunks cover "
                                            + std::to_string(manifest.totalSize)
                                            + " bytes but original content has "
                                            + std::to_string(originalData.size()));
        }
        manifest.originalContentHash = util::hashing::sha256(originalData);
        manifest.id = manifest.ComputeId();
        return manifest;
    }

private:
    size_t chunkSize_;
};

} // namespace dds
} // namespace ddsledger

#endif // DDSLEDGER_DDS_CHUNKER_HPP
