#ifndef DDSLEDGER_DDS_SQLITE_STORAGE_HPP
#define DDSLEDGER_DDS_SQLITE_STORAGE_HPP

#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>
#include "dds/storage_backend.hpp"

namespace ddsledger {
namespace dds {

/*
  SqliteStorage
  --------------------------------------------------------
  Persistent IStorageBackend on a single SQLite database file.

  Schema:
    chunks(id TEXT PRIMARY KEY, data BLOB, size INTEGER, compressed INTEGER)
    manifests(id TEXT PRIMARY KEY, body BLOB)         -- body is codec::EncodeManifest()

  - Stores use INSERT OR IGNORE, so repeated stores are no-ops.
  - With compressChunks the chunk body is zlib-compressed; the original size is kept in
    the size column for decompression. Rows written either way can be read back.
  - ":memory:" opens a private in-memory database.
  - All calls are serialised on one connection by an internal mutex.
  - Failures of the database itself raise StorageError.
*/
class SqliteStorage : public IStorageBackend
{
  public:
    SqliteStorage(const std::string& path, bool compressChunks = false);
    ~SqliteStorage() override;

    SqliteStorage(const SqliteStorage&) = delete;
    SqliteStorage& operator=(const SqliteStorage&) = delete;

    void StoreChunk(const Chunk& chunk) override;
    Chunk GetChunk(const ContentID& id) const override;
    bool HasChunk(const ContentID& id) const override;

    void StoreManifest(const Manifest& manifest) override;
    Manifest GetManifest(const ContentID& id) const override;
    bool HasManifest(const ContentID& id) const override;

    const std::string& GetPath() const { return m_path; }

  private:
    void exec(const char* sql);
    bool exists(const char* sql, const ContentID& id) const;
    [[noreturn]] void fail(const std::string& what) const;

    static std::vector<uint8_t> compress(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> decompress(const std::vector<uint8_t>& data, size_t originalSize);

    std::string m_path;
    bool m_compress;
    sqlite3* m_db;
    mutable std::mutex m_mutex;
};

} // namespace dds
} // namespace ddsledger

#endif // DDSLEDGER_DDS_SQLITE_STORAGE_HPP
