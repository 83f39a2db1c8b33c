#ifndef DDSLEDGER_DDS_CONTENT_TYPES_HPP
#define DDSLEDGER_DDS_CONTENT_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "util/hashing.hpp"

/**
 * @file content_types.hpp
 * @brief Content-addressed value types: Chunk and Manifest.
 *
 * ContentIDs are lowercase hex SHA-256 strings (see util/hashing.hpp).
 *
 *   Chunk.id    = sha256(chunk bytes)
 *   Manifest.id = sha256("dds-manifest-v2|" totalSize "|" n "|" len(chunkId_0) ":" chunkId_0
 *                        ... len(chunkId_n-1) ":" chunkId_n-1 "|" len(hash) ":" originalContentHash)
 *
 * Every variable-length field is length-prefixed and the chunk count is included, so two
 * different chunk lists never share material. The manifest ID commits to the chunk order and
 * size without re-reading chunk data, and the original content hash lets a reader verify the
 * reassembled bytes.
 */

namespace ddsledger {
namespace dds {

using ContentID = std::string;

struct Chunk
{
    ContentID            id;
    std::vector<uint8_t> data;

    /// True if id is the hash of data.
    bool IsValid() const
    {
        return id == util::hashing::sha256(data);
    }
};

struct Manifest
{
    ContentID              id;
    std::vector<ContentID> chunkIds;
    uint64_t               totalSize{0};
    ContentID              originalContentHash;

    /// Recompute the manifest ID from the other fields.
    ContentID ComputeId() const
    {
        std::string material = "dds-manifest-v2|" + std::to_string(totalSize) + "|"
                             + std::to_string(chunkIds.size()) + "|";
        for (const auto &chunkId : chunkIds) {
            material += std::to_string(chunkId.size()) + ":" + chunkId;
        }
        material += "|" + std::to_string(originalContentHash.size()) + ":" + originalContentHash;
        return util::hashing::sha256(material);
    }

    bool IsValid() const
    {
        return id == ComputeId();
    }

    bool operator==(const Manifest &other) const
    {
        return id == other.id
            && chunkIds == other.chunkIds
            && totalSize == other.totalSize
            && originalContentHash == other.originalContentHash;
    }

    bool operator!=(const Manifest &other) const
    {
        return !(*this == other);
    }
};

} // namespace dds
} // namespace ddsledger

#endif // DDSLEDGER_DDS_CONTENT_TYPES_HPP
