#ifndef DDSLEDGER_DDS_CONTENT_CODEC_HPP
#define DDSLEDGER_DDS_CONTENT_CODEC_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "dds/content_types.hpp"
#include "util/errors.hpp"

/**
 * @file content_codec.hpp
 * @brief Binary encoding of chunks and manifests for the wire and the sqlite store.
 *
 * All integers are big-endian. Strings and byte arrays are prefixed with a u32 length.
 *
 *   Chunk:    id, data
 *   Manifest: id, u64 totalSize, originalContentHash, u32 count, chunkId * count
 *
 * Decoders reject truncated input, lengths that run past the end of the buffer and
 * trailing bytes with MalformedInputError.
 */

namespace ddsledger {
namespace dds {
namespace codec {

class Writer
{
public:
    void PutU32(uint32_t v)
    {
        for (int shift = 24; shift >= 0; shift -= 8) {
            buf_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
        }
    }

    void PutU64(uint64_t v)
    {
        for (int shift = 56; shift >= 0; shift -= 8) {
            buf_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
        }
    }

    void PutBytes(const uint8_t *data, size_t len)
    {
        if (len > UINT32_MAX) {
            throw util::MalformedInputError("codec: field of " + std::to_string(len)
                                            + " bytes exceeds u32 length prefix");
        }
        PutU32(static_cast<uint32_t>(len));
        buf_.insert(buf_.end(), data, data + len);
    }

    void PutBytes(const std::vector<uint8_t> &v) { PutBytes(v.data(), v.size()); }

    void PutString(const std::string &s)
    {
        PutBytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    std::vector<uint8_t> Take() { return std::move(buf_); }

private:
    std::vector<uint8_t> buf_;
};

class Reader
{
public:
    Reader(const std::vector<uint8_t> &buf, const char *what)
        : buf_(buf), pos_(0), what_(what)
    {
    }

    uint32_t GetU32()
    {
        require(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v = (v << 8) | buf_[pos_++];
        }
        return v;
    }

    uint64_t GetU64()
    {
        require(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v = (v << 8) | buf_[pos_++];
        }
        return v;
    }

    std::vector<uint8_t> GetBytes()
    {
        uint32_t len = GetU32();
        require(len);
        std::vector<uint8_t> out(buf_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                 buf_.begin() + static_cast<std::ptrdiff_t>(pos_ + len));
        pos_ += len;
        return out;
    }

    std::string GetString()
    {
        uint32_t len = GetU32();
        require(len);
        std::string out(reinterpret_cast<const char*>(buf_.data()) + pos_, len);
        pos_ += len;
        return out;
    }

    size_t Remaining() const { return buf_.size() - pos_; }

    void ExpectEnd() const
    {
        if (pos_ != buf_.size()) {
            throw util::MalformedInputError(std::string("codec: ") + what_ + " has "
                                            + std::to_string(buf_.size() - pos_)
                                            + " trailing bytes");
        }
    }

private:
    void require(size_t n) const
    {
        if (buf_.size() - pos_ < n) {
            throw util::MalformedInputError(std::string("codec: truncated ") + what_ + ", needed "
                                            + std::to_string(n) + " bytes at offset "
                                            + std::to_string(pos_));
        }
    }

    const std::vector<uint8_t> &buf_;
    size_t pos_;
    const char *what_;
};

inline std::vector<uint8_t> EncodeChunk(const Chunk &chunk)
{
    Writer w;
    w.PutString(chunk.id);
    w.PutBytes(chunk.data);
    return w.Take();
}

inline Chunk DecodeChunk(const std::vector<uint8_t> &bytes)
{
    Reader r(bytes, "chunk");
    Chunk chunk;
    chunk.id = r.GetString();
    chunk.data = r.GetBytes();
    r.ExpectEnd();
    return chunk;
}

inline std::vector<uint8_t> EncodeManifest(const Manifest &manifest)
{
    Writer w;
    w.PutString(manifest.id);
    w.PutU64(manifest.totalSize);
    w.PutString(manifest.originalContentHash);
    w.PutU32(static_cast<uint32_t>(manifest.chunkIds.size()));
    for (const auto &id : manifest.chunkIds) {
        w.PutString(id);
    }
    return w.Take();
}

inline Manifest DecodeManifest(const std::vector<uint8_t> &bytes)
{
    Reader r(bytes, "manifest");
    Manifest manifest;
    manifest.id = r.GetString();
    manifest.totalSize = r.GetU64();
    manifest.originalContentHash = r.GetString();
    uint32_t count = r.GetU32();
    // each entry carries at least its own 4-byte length prefix
    if (static_cast<uint64_t>(count) * 4 > r.Remaining()) {
        throw util::MalformedInputError("codec: manifest claims " + std::to_string(count)
                                        + " chunk IDs but only " + std::to_string(r.Remaining())
                                        + " bytes remain");
    }
    manifest.chunkIds.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        manifest.chunkIds.push_back(r.GetString());
    }
    r.ExpectEnd();
    return manifest;
}

} // namespace codec
} // namespace dds
} // namespace ddsledger

#endif // DDSLEDGER_DDS_CONTENT_CODEC_HPP
