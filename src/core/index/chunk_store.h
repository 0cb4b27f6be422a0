#pragma once

#include "core/shared/chunk.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

#include <sqlite3.h>

namespace ild {

// ChunkStore: owner of the SQLite database holding documents, per-page
// extraction results and chunks. The dense label map and the sparse
// postings live in the same file and share the handle via rawDb().
//
// Writes are not internally serialized; callers hold one writer at a time.
// Reads prepare their own statements and may run concurrently.
class ChunkStore {
public:
    ~ChunkStore();

    ChunkStore(ChunkStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    ChunkStore& operator=(ChunkStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    // Open or create the database. ":memory:" gives a private in-memory store.
    static std::optional<ChunkStore> open(const QString& dbPath);

    // ── Documents ───────────────────────────────────────────

    struct PageRow {
        PageResult page;
        PageOffset offset;
    };

    // Inserts the document row and one row per page. pages and offsets are
    // matched by page index.
    bool insertDocument(const Document& doc,
                        const QString& documentText,
                        const std::vector<PageResult>& pages,
                        const std::vector<PageOffset>& offsets);
    bool updateChunkCounts(const QString& documentId, int chunkCount, int embeddedChunkCount);

    std::optional<Document> getDocument(const QString& documentId);
    std::vector<Document> listDocuments();
    std::vector<PageRow> pagesForDocument(const QString& documentId);
    std::optional<QString> documentText(const QString& documentId);
    QStringList documentsWithHash(const QString& contentHash);
    int documentCount();

    // Cascades to pages and chunks.
    bool deleteDocument(const QString& documentId);

    // ── Chunks ──────────────────────────────────────────────

    bool insertChunks(const std::vector<Chunk>& chunks);

    std::optional<Chunk> getChunk(const QString& chunkId);
    // Missing ids are skipped; order follows the input.
    std::vector<Chunk> getChunks(const std::vector<QString>& chunkIds);
    std::vector<QString> chunkIdsForDocument(const QString& documentId);
    // Ordered by document ingestion time, then sequence index.
    std::vector<Chunk> allChunks();
    int chunkCount();

    // ── Transactions ────────────────────────────────────────

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    sqlite3* rawDb() const { return m_db; }

private:
    ChunkStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);
    std::optional<int> singleInt(const char* sql);

    sqlite3* m_db = nullptr;
};

} // namespace ild
