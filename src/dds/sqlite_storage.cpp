#include "dds/sqlite_storage.hpp"
#include "dds/content_codec.hpp"
#include "util/logger.hpp"
#include <zlib.h>

namespace ddsledger {
namespace dds {

namespace {

// Finalizes on scope exit so every early throw releases the statement.
class Statement {
  public:
    Statement(sqlite3* db, const char* sql) : m_stmt(nullptr) {
        m_rc = sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr);
    }
    ~Statement() {
        if (m_stmt)
            sqlite3_finalize(m_stmt);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return m_rc == SQLITE_OK && m_stmt; }
    sqlite3_stmt* get() const { return m_stmt; }

  private:
    sqlite3_stmt* m_stmt;
    int m_rc;
};

int bindBlob(sqlite3_stmt* stmt, int idx, const std::vector<uint8_t>& data) {
    // A null pointer would bind SQL NULL rather than an empty blob.
    static const uint8_t empty = 0;
    const void* p = data.empty() ? static_cast<const void*>(&empty) : data.data();
    return sqlite3_bind_blob(stmt, idx, p, static_cast<int>(data.size()), SQLITE_TRANSIENT);
}

std::vector<uint8_t> columnBlob(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int len = sqlite3_column_bytes(stmt, col);
    std::vector<uint8_t> out;
    if (blob && len > 0) {
        const uint8_t* p = static_cast<const uint8_t*>(blob);
        out.assign(p, p + len);
    }
    return out;
}

} // namespace

SqliteStorage::SqliteStorage(const std::string& path, bool compressChunks)
    : m_path(path), m_compress(compressChunks), m_db(nullptr) {
    if (sqlite3_open(m_path.c_str(), &m_db) != SQLITE_OK || !m_db) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        if (m_db)
            sqlite3_close(m_db);
        m_db = nullptr;
        throw util::StorageError("SqliteStorage: cannot open " + m_path + ": " + msg);
    }
    try {
        exec("CREATE TABLE IF NOT EXISTS chunks ("
             "id TEXT PRIMARY KEY, data BLOB NOT NULL, size INTEGER NOT NULL, "
             "compressed INTEGER NOT NULL);");
        exec("CREATE TABLE IF NOT EXISTS manifests (id TEXT PRIMARY KEY, body BLOB NOT NULL);");
    } catch (const util::StorageError&) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
    util::logger::info("[SqliteStorage] Opened " + m_path + (m_compress ? " (zlib chunks)" : ""));
}

SqliteStorage::~SqliteStorage() {
    if (m_db)
        sqlite3_close(m_db);
}

void SqliteStorage::StoreChunk(const Chunk& chunk) {
    if (chunk.id.empty()) {
        throw util::MalformedInputError("SqliteStorage: chunk ID cannot be empty");
    }
    bool packed = m_compress && !chunk.data.empty();
    std::vector<uint8_t> body = packed ? compress(chunk.data) : chunk.data;

    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db, "INSERT OR IGNORE INTO chunks (id, data, size, compressed) "
                         "VALUES (?, ?, ?, ?);");
    if (!stmt.ok())
        fail("prepare chunk insert");
    if (sqlite3_bind_text(stmt.get(), 1, chunk.id.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
        bindBlob(stmt.get(), 2, body) != SQLITE_OK ||
        sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(chunk.data.size())) !=
            SQLITE_OK ||
        sqlite3_bind_int(stmt.get(), 4, packed ? 1 : 0) != SQLITE_OK)
        fail("bind chunk " + chunk.id);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        fail("insert chunk " + chunk.id);
}

Chunk SqliteStorage::GetChunk(const ContentID& id) const {
    std::vector<uint8_t> body;
    size_t size = 0;
    bool packed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "SELECT data, size, compressed FROM chunks WHERE id = ?;");
        if (!stmt.ok())
            fail("prepare chunk select");
        if (sqlite3_bind_text(stmt.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK)
            fail("bind " + id);
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE)
            throw util::NotFoundError("SqliteStorage: chunk " + id + " not found");
        if (rc != SQLITE_ROW)
            fail("select chunk " + id);
        body = columnBlob(stmt.get(), 0);
        size = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 1));
        packed = sqlite3_column_int(stmt.get(), 2) != 0;
    }

    Chunk chunk;
    chunk.id = id;
    chunk.data = packed ? decompress(body, size) : std::move(body);
    return chunk;
}

bool SqliteStorage::HasChunk(const ContentID& id) const {
    return exists("SELECT 1 FROM chunks WHERE id = ?;", id);
}

void SqliteStorage::StoreManifest(const Manifest& manifest) {
    if (manifest.id.empty()) {
        throw util::MalformedInputError("SqliteStorage: manifest ID cannot be empty");
    }
    std::vector<uint8_t> body = codec::EncodeManifest(manifest);

    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db, "INSERT OR IGNORE INTO manifests (id, body) VALUES (?, ?);");
    if (!stmt.ok())
        fail("prepare manifest insert");
    if (sqlite3_bind_text(stmt.get(), 1, manifest.id.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
        bindBlob(stmt.get(), 2, body) != SQLITE_OK)
        fail("bind manifest " + manifest.id);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        fail("insert manifest " + manifest.id);
}

Manifest SqliteStorage::GetManifest(const ContentID& id) const {
    std::vector<uint8_t> body;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "SELECT body FROM manifests WHERE id = ?;");
        if (!stmt.ok())
            fail("prepare manifest select");
        if (sqlite3_bind_text(stmt.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK)
            fail("bind " + id);
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE)
            throw util::NotFoundError("SqliteStorage: manifest " + id + " not found");
        if (rc != SQLITE_ROW)
            fail("select manifest " + id);
        body = columnBlob(stmt.get(), 0);
    }
    try {
        return codec::DecodeManifest(body);
    } catch (const util::MalformedInputError& ex) {
        throw util::StorageError("SqliteStorage: stored manifest " + id + " is corrupt: " +
                                 ex.what());
    }
}

bool SqliteStorage::HasManifest(const ContentID& id) const {
    return exists("SELECT 1 FROM manifests WHERE id = ?;", id);
}

void SqliteStorage::exec(const char* sql) {
    char* errMsg = nullptr;
    if (sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "unknown error";
        sqlite3_free(errMsg);
        throw util::StorageError("SqliteStorage: " + msg);
    }
}

bool SqliteStorage::exists(const char* sql, const ContentID& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db, sql);
    if (!stmt.ok())
        fail("prepare lookup");
    if (sqlite3_bind_text(stmt.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK)
        fail("bind " + id);
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW)
        return true;
    if (rc != SQLITE_DONE)
        fail("lookup " + id);
    return false;
}

void SqliteStorage::fail(const std::string& what) const {
    throw util::StorageError("SqliteStorage: " + what + " failed: " + sqlite3_errmsg(m_db));
}

std::vector<uint8_t> SqliteStorage::compress(const std::vector<uint8_t>& data) {
    uLongf outSize = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> out(outSize);
    if (compress2(out.data(), &outSize, data.data(), static_cast<uLong>(data.size()),
                  Z_BEST_COMPRESSION) != Z_OK) {
        throw util::StorageError("SqliteStorage: zlib compression failed");
    }
    out.resize(outSize);
    return out;
}

std::vector<uint8_t> SqliteStorage::decompress(const std::vector<uint8_t>& data,
                                               size_t originalSize) {
    uLongf outSize = static_cast<uLongf>(originalSize);
    std::vector<uint8_t> out(originalSize);
    int rc = uncompress(out.data(), &outSize, data.data(), static_cast<uLong>(data.size()));
    if (rc != Z_OK || outSize != originalSize) {
        throw util::StorageError("SqliteStorage: zlib decompression failed (rc=" +
                                 std::to_string(rc) + ")");
    }
    return out;
}

} // namespace dds
} // namespace ddsledger
