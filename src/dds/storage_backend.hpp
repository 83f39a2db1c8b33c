#ifndef DDSLEDGER_DDS_STORAGE_BACKEND_HPP
#define DDSLEDGER_DDS_STORAGE_BACKEND_HPP

#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "dds/content_types.hpp"
#include "util/errors.hpp"

/*
  storage_backend.hpp
  ----------------------------------------------------------------
  Content-addressed persistence for chunks and manifests.

  Required Methods:
    void StoreChunk(const Chunk &chunk)
    Chunk GetChunk(const ContentID &id) const          // throws NotFoundError
    bool HasChunk(const ContentID &id) const
    void StoreManifest(const Manifest &manifest)
    Manifest GetManifest(const ContentID &id) const    // throws NotFoundError
    bool HasManifest(const ContentID &id) const

  Stores are idempotent: a second store under an existing ID keeps the first value and
  succeeds. Backends do not verify that IDs match content; readers do that.
  There is no eviction.
*/

namespace ddsledger {
namespace dds {

class IStorageBackend
{
public:
    virtual ~IStorageBackend() = default;

    virtual void StoreChunk(const Chunk &chunk) = 0;
    virtual Chunk GetChunk(const ContentID &id) const = 0;
    virtual bool HasChunk(const ContentID &id) const = 0;

    virtual void StoreManifest(const Manifest &manifest) = 0;
    virtual Manifest GetManifest(const ContentID &id) const = 0;
    virtual bool HasManifest(const ContentID &id) const = 0;
};

/**
 * @brief Map-backed store guarded by a reader/writer lock.
 */
class InMemoryStorage : public IStorageBackend
{
public:
    void StoreChunk(const Chunk &chunk) override
    {
        if (chunk.id.empty()) {
            throw util::MalformedInputError("InMemoryStorage: chunk ID cannot be empty");
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        chunks_.emplace(chunk.id, chunk);
    }

    Chunk GetChunk(const ContentID &id) const override
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = chunks_.find(id);
        if (it == chunks_.end()) {
            throw util::NotFoundError("InMemoryStorage: chunk " + id + " not found");
        }
        return it->second;
    }

    bool HasChunk(const ContentID &id) const override
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return chunks_.count(id) > 0;
    }

    void StoreManifest(const Manifest &manifest) override
    {
        if (manifest.id.empty()) {
            throw util::MalformedInputError("InMemoryStorage: manifest ID cannot be empty");
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        manifests_.emplace(manifest.id, manifest);
    }

    Manifest GetManifest(const ContentID &id) const override
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = manifests_.find(id);
        if (it == manifests_.end()) {
            throw util::NotFoundError("InMemoryStorage: manifest " + id + " not found");
        }
        return it->second;
    }

    bool HasManifest(const ContentID &id) const override
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return manifests_.count(id) > 0;
    }

    size_t ChunkCount() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return chunks_.size();
    }

    size_t ManifestCount() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return manifests_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<ContentID, Chunk> chunks_;
    std::unordered_map<ContentID, Manifest> manifests_;
};

} // namespace dds
} // namespace ddsledger

#endif // DDSLEDGER_DDS_STORAGE_BACKEND_HPP
