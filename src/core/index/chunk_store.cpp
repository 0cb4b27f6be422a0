#include "core/index/chunk_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QFile>

#include <unordered_map>

namespace ild {

namespace {

QString columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

constexpr const char* kChunkColumns =
    "chunk_id, document_id, sequence_index, token_start, token_count, "
    "char_start, char_end, page_start, page_end, text";

Chunk readChunk(sqlite3_stmt* stmt)
{
    Chunk chunk;
    chunk.chunkId = columnText(stmt, 0);
    chunk.documentId = columnText(stmt, 1);
    chunk.sequenceIndex = sqlite3_column_int(stmt, 2);
    chunk.tokenStart = sqlite3_column_int(stmt, 3);
    chunk.tokenCount = sqlite3_column_int(stmt, 4);
    chunk.charStart = sqlite3_column_int(stmt, 5);
    chunk.charEnd = sqlite3_column_int(stmt, 6);
    chunk.pageStart = sqlite3_column_int(stmt, 7);
    chunk.pageEnd = sqlite3_column_int(stmt, 8);
    chunk.text = columnText(stmt, 9);
    return chunk;
}

constexpr const char* kDocumentColumns =
    "id, filename, page_count, ingested_at, content_hash, chunk_count, embedded_chunk_count";

Document readDocument(sqlite3_stmt* stmt)
{
    Document doc;
    doc.id = columnText(stmt, 0);
    doc.filename = columnText(stmt, 1);
    doc.pageCount = sqlite3_column_int(stmt, 2);
    doc.ingestedAt = QDateTime::fromMSecsSinceEpoch(
        static_cast<qint64>(sqlite3_column_double(stmt, 3) * 1000.0)).toUTC();
    doc.contentHash = columnText(stmt, 4);
    doc.chunkCount = sqlite3_column_int(stmt, 5);
    doc.embeddedChunkCount = sqlite3_column_int(stmt, 6);
    return doc;
}

} // namespace

ChunkStore::~ChunkStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<ChunkStore> ChunkStore::open(const QString& dbPath)
{
    ChunkStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool ChunkStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(ildIndex, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(ildIndex, "Failed to set connection pragmas");
        return false;
    }

    const std::optional<int> existingTables = singleInt(
        "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='documents'");
    const bool schemaExists = existingTables.value_or(0) > 0;

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(ildIndex, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kSchemaV1)) {
            LOG_ERROR(ildIndex, "Failed to create schema");
            return false;
        }
    } else {
        const int version = singleInt("PRAGMA user_version").value_or(0);
        if (version > kCurrentSchemaVersion) {
            LOG_ERROR(ildIndex, "Database schema v%d is newer than supported v%d",
                      version, kCurrentSchemaVersion);
            return false;
        }
    }

    if (dbPath != QLatin1String(":memory:")) {
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(ildIndex, "Database opened: %s", dbPath.toUtf8().constData());
    return true;
}

bool ChunkStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(ildIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

std::optional<int> ChunkStore::singleInt(const char* sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ildIndex, "prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    std::optional<int> value;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

// ── Documents ───────────────────────────────────────────────

bool ChunkStore::insertDocument(const Document& doc,
                                const QString& documentText,
                                const std::vector<PageResult>& pages,
                                const std::vector<PageOffset>& offsets)
{
    if (!execSql("SAVEPOINT insert_document")) return false;

    auto fail = [this](const char* what) {
        LOG_ERROR(ildIndex, "%s: %s", what, sqlite3_errmsg(m_db));
        execSql("ROLLBACK TO SAVEPOINT insert_document");
        execSql("RELEASE SAVEPOINT insert_document");
        return false;
    };

    {
        const char* sql = R"(
            INSERT INTO documents (id, filename, page_count, ingested_at, content_hash,
                                   document_text, chunk_count, embedded_chunk_count)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
        )";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return fail("document insert prepare");
        }
        const QByteArray idUtf8 = doc.id.toUtf8();
        const QByteArray nameUtf8 = doc.filename.toUtf8();
        const QByteArray hashUtf8 = doc.contentHash.toUtf8();
        const QByteArray textUtf8 = documentText.toUtf8();
        sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, nameUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 3, doc.pageCount);
        sqlite3_bind_double(stmt, 4, static_cast<double>(doc.ingestedAt.toMSecsSinceEpoch()) / 1000.0);
        sqlite3_bind_text(stmt, 5, hashUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 6, textUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 7, doc.chunkCount);
        sqlite3_bind_int(stmt, 8, doc.embeddedChunkCount);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return fail("document insert");
        }
    }

    std::unordered_map<int, PageOffset> offsetByPage;
    for (const PageOffset& offset : offsets) {
        offsetByPage[offset.pageIndex] = offset;
    }

    const char* pageSql = R"(
        INSERT INTO pages (document_id, page_index, backend, confidence, outcome,
                           attempted_backends, char_start, char_end, duration_ms)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, pageSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail("page insert prepare");
    }
    const QByteArray idUtf8 = doc.id.toUtf8();
    for (const PageResult& page : pages) {
        const PageOffset offset = offsetByPage.count(page.pageIndex)
            ? offsetByPage[page.pageIndex]
            : PageOffset{page.pageIndex, 0, 0};
        const QByteArray backendUtf8 = page.backendName.toUtf8();
        const QByteArray outcomeUtf8 = pageOutcomeToString(page.outcome).toUtf8();
        const QByteArray attemptedUtf8 = page.attemptedBackends.join(QLatin1Char(',')).toUtf8();
        sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 2, page.pageIndex);
        sqlite3_bind_text(stmt, 3, backendUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt, 4, page.confidence);
        sqlite3_bind_text(stmt, 5, outcomeUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 6, attemptedUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 7, offset.charStart);
        sqlite3_bind_int(stmt, 8, offset.charEnd);
        sqlite3_bind_int(stmt, 9, page.durationMs);
        const int rc = sqlite3_step(stmt);
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        if (rc != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            return fail("page insert");
        }
    }
    sqlite3_finalize(stmt);

    return execSql("RELEASE SAVEPOINT insert_document");
}

bool ChunkStore::updateChunkCounts(const QString& documentId, int chunkCount,
                                   int embeddedChunkCount)
{
    const char* sql =
        "UPDATE documents SET chunk_count = ?1, embedded_chunk_count = ?2 WHERE id = ?3";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    const QByteArray idUtf8 = documentId.toUtf8();
    sqlite3_bind_int(stmt, 1, chunkCount);
    sqlite3_bind_int(stmt, 2, embeddedChunkCount);
    sqlite3_bind_text(stmt, 3, idUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) == 1;
}

std::optional<Document> ChunkStore::getDocument(const QString& documentId)
{
    const QString sql = QStringLiteral("SELECT %1 FROM documents WHERE id = ?1")
                            .arg(QLatin1String(kDocumentColumns));
    const QByteArray sqlUtf8 = sql.toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlUtf8.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray idUtf8 = documentId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<Document> doc;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        doc = readDocument(stmt);
    }
    sqlite3_finalize(stmt);

    if (doc) {
        for (const PageRow& row : pagesForDocument(doc->id)) {
            doc->pageConfidences.push_back(row.page.confidence);
            doc->pageBackends.append(row.page.backendName);
        }
    }
    return doc;
}

std::vector<Document> ChunkStore::listDocuments()
{
    std::vector<Document> docs;
    const QString sql = QStringLiteral("SELECT %1 FROM documents ORDER BY ingested_at, id")
                            .arg(QLatin1String(kDocumentColumns));
    const QByteArray sqlUtf8 = sql.toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlUtf8.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ildIndex, "listDocuments prepare: %s", sqlite3_errmsg(m_db));
        return docs;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        docs.push_back(readDocument(stmt));
    }
    sqlite3_finalize(stmt);

    for (Document& doc : docs) {
        for (const PageRow& row : pagesForDocument(doc.id)) {
            doc.pageConfidences.push_back(row.page.confidence);
            doc.pageBackends.append(row.page.backendName);
        }
    }
    return docs;
}

std::vector<ChunkStore::PageRow> ChunkStore::pagesForDocument(const QString& documentId)
{
    std::vector<PageRow> rows;
    const char* sql = R"(
        SELECT page_index, backend, confidence, outcome, attempted_backends,
               char_start, char_end, duration_ms
        FROM pages WHERE document_id = ?1 ORDER BY page_index
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return rows;
    }
    const QByteArray idUtf8 = documentId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        PageRow row;
        row.page.pageIndex = sqlite3_column_int(stmt, 0);
        row.page.backendName = columnText(stmt, 1);
        row.page.confidence = sqlite3_column_double(stmt, 2);
        row.page.outcome = pageOutcomeFromString(columnText(stmt, 3));
        const QString attempted = columnText(stmt, 4);
        if (!attempted.isEmpty()) {
            row.page.attemptedBackends = attempted.split(QLatin1Char(','));
        }
        row.offset = PageOffset{row.page.pageIndex, sqlite3_column_int(stmt, 5),
                                sqlite3_column_int(stmt, 6)};
        row.page.durationMs = sqlite3_column_int(stmt, 7);
        rows.push_back(std::move(row));
    }
    sqlite3_finalize(stmt);
    return rows;
}

std::optional<QString> ChunkStore::documentText(const QString& documentId)
{
    const char* sql = "SELECT document_text FROM documents WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray idUtf8 = documentId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    std::optional<QString> text;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        text = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return text;
}

QStringList ChunkStore::documentsWithHash(const QString& contentHash)
{
    QStringList ids;
    const char* sql = "SELECT id FROM documents WHERE content_hash = ?1 ORDER BY ingested_at";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return ids;
    }
    const QByteArray hashUtf8 = contentHash.toUtf8();
    sqlite3_bind_text(stmt, 1, hashUtf8.constData(), -1, SQLITE_STATIC);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.append(columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ids;
}

int ChunkStore::documentCount()
{
    return singleInt("SELECT COUNT(*) FROM documents").value_or(0);
}

bool ChunkStore::deleteDocument(const QString& documentId)
{
    const char* sql = "DELETE FROM documents WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    const QByteArray idUtf8 = documentId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(ildIndex, "deleteDocument(%s) failed: %s", qUtf8Printable(documentId),
                  sqlite3_errmsg(m_db));
        return false;
    }
    return sqlite3_changes(m_db) > 0;
}

// ── Chunks ──────────────────────────────────────────────────

bool ChunkStore::insertChunks(const std::vector<Chunk>& chunks)
{
    if (!execSql("SAVEPOINT insert_chunks")) return false;

    const QString sql = QStringLiteral("INSERT INTO chunks (%1) VALUES "
                                       "(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)")
                            .arg(QLatin1String(kChunkColumns));
    const QByteArray sqlUtf8 = sql.toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlUtf8.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ildIndex, "chunk insert prepare: %s", sqlite3_errmsg(m_db));
        execSql("ROLLBACK TO SAVEPOINT insert_chunks");
        execSql("RELEASE SAVEPOINT insert_chunks");
        return false;
    }

    for (const Chunk& chunk : chunks) {
        const QByteArray chunkIdUtf8 = chunk.chunkId.toUtf8();
        const QByteArray docIdUtf8 = chunk.documentId.toUtf8();
        const QByteArray textUtf8 = chunk.text.toUtf8();
        sqlite3_bind_text(stmt, 1, chunkIdUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, docIdUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 3, chunk.sequenceIndex);
        sqlite3_bind_int(stmt, 4, chunk.tokenStart);
        sqlite3_bind_int(stmt, 5, chunk.tokenCount);
        sqlite3_bind_int(stmt, 6, chunk.charStart);
        sqlite3_bind_int(stmt, 7, chunk.charEnd);
        sqlite3_bind_int(stmt, 8, chunk.pageStart);
        sqlite3_bind_int(stmt, 9, chunk.pageEnd);
        sqlite3_bind_text(stmt, 10, textUtf8.constData(), -1, SQLITE_STATIC);
        const int rc = sqlite3_step(stmt);
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(ildIndex, "chunk insert failed for %s: %s",
                      qUtf8Printable(chunk.chunkId), sqlite3_errmsg(m_db));
            sqlite3_finalize(stmt);
            execSql("ROLLBACK TO SAVEPOINT insert_chunks");
            execSql("RELEASE SAVEPOINT insert_chunks");
            return false;
        }
    }
    sqlite3_finalize(stmt);
    return execSql("RELEASE SAVEPOINT insert_chunks");
}

std::optional<Chunk> ChunkStore::getChunk(const QString& chunkId)
{
    const QString sql = QStringLiteral("SELECT %1 FROM chunks WHERE chunk_id = ?1")
                            .arg(QLatin1String(kChunkColumns));
    const QByteArray sqlUtf8 = sql.toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlUtf8.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray idUtf8 = chunkId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    std::optional<Chunk> chunk;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        chunk = readChunk(stmt);
    }
    sqlite3_finalize(stmt);
    return chunk;
}

std::vector<Chunk> ChunkStore::getChunks(const std::vector<QString>& chunkIds)
{
    std::vector<Chunk> chunks;
    chunks.reserve(chunkIds.size());
    for (const QString& chunkId : chunkIds) {
        if (auto chunk = getChunk(chunkId)) {
            chunks.push_back(std::move(*chunk));
        }
    }
    return chunks;
}

std::vector<QString> ChunkStore::chunkIdsForDocument(const QString& documentId)
{
    std::vector<QString> ids;
    const char* sql =
        "SELECT chunk_id FROM chunks WHERE document_id = ?1 ORDER BY sequence_index";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return ids;
    }
    const QByteArray idUtf8 = documentId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ids;
}

std::vector<Chunk> ChunkStore::allChunks()
{
    std::vector<Chunk> chunks;
    const QString sql = QStringLiteral(
        "SELECT c.%1 FROM chunks c JOIN documents d ON d.id = c.document_id "
        "ORDER BY d.ingested_at, d.id, c.sequence_index")
                            .arg(QString::fromLatin1(kChunkColumns)
                                     .replace(QLatin1String(", "), QLatin1String(", c.")));
    const QByteArray sqlUtf8 = sql.toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlUtf8.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ildIndex, "allChunks prepare: %s", sqlite3_errmsg(m_db));
        return chunks;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        chunks.push_back(readChunk(stmt));
    }
    sqlite3_finalize(stmt);
    return chunks;
}

int ChunkStore::chunkCount()
{
    return singleInt("SELECT COUNT(*) FROM chunks").value_or(0);
}

// ── Transactions ────────────────────────────────────────────

bool ChunkStore::beginTransaction()
{
    return execSql("BEGIN TRANSACTION");
}

bool ChunkStore::commitTransaction()
{
    return execSql("COMMIT");
}

bool ChunkStore::rollbackTransaction()
{
    return execSql("ROLLBACK");
}

} // namespace ild
