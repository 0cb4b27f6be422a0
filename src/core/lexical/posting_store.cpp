#include "core/lexical/posting_store.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

namespace ild {

namespace {

constexpr const char* kCreateSparseTablesSql = R"(
    CREATE TABLE IF NOT EXISTS sparse_postings (
        term TEXT NOT NULL,
        chunk_id TEXT NOT NULL,
        tf INTEGER NOT NULL,
        PRIMARY KEY (term, chunk_id)
    );
    CREATE INDEX IF NOT EXISTS idx_sparse_postings_chunk ON sparse_postings(chunk_id);
    CREATE TABLE IF NOT EXISTS sparse_lengths (
        chunk_id TEXT PRIMARY KEY,
        length INTEGER NOT NULL
    );
)";

constexpr const char* kInsertPostingSql =
    "INSERT OR REPLACE INTO sparse_postings (term, chunk_id, tf) VALUES (?1, ?2, ?3)";
constexpr const char* kInsertLengthSql =
    "INSERT OR REPLACE INTO sparse_lengths (chunk_id, length) VALUES (?1, ?2)";
constexpr const char* kDeletePostingsSql = "DELETE FROM sparse_postings WHERE chunk_id = ?1";
constexpr const char* kDeleteLengthSql = "DELETE FROM sparse_lengths WHERE chunk_id = ?1";

void resetStatement(sqlite3_stmt* stmt)
{
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

} // namespace

PostingStore::PostingStore(sqlite3* db)
    : m_db(db)
{
    m_ready = prepareStatements();
    if (!m_ready) {
        LOG_ERROR(ildIndex, "PostingStore: failed to prepare sparse statements");
    }
}

PostingStore::~PostingStore()
{
    for (sqlite3_stmt* stmt : {m_insertPostingStmt, m_insertLengthStmt,
                               m_deletePostingsStmt, m_deleteLengthStmt}) {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
}

bool PostingStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(ildIndex, "PostingStore SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool PostingStore::prepareStatements()
{
    if (!m_db || !execSql(kCreateSparseTablesSql)) {
        return false;
    }

    const std::pair<const char*, sqlite3_stmt**> statements[] = {
        {kInsertPostingSql, &m_insertPostingStmt},
        {kInsertLengthSql, &m_insertLengthStmt},
        {kDeletePostingsSql, &m_deletePostingsStmt},
        {kDeleteLengthSql, &m_deleteLengthStmt},
    };
    for (const auto& [sql, stmt] : statements) {
        if (sqlite3_prepare_v2(m_db, sql, -1, stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(ildIndex, "PostingStore prepare failed: %s", sqlite3_errmsg(m_db));
            return false;
        }
    }
    return true;
}

bool PostingStore::removeChunkRows(const QString& chunkId)
{
    const QByteArray chunkUtf8 = chunkId.toUtf8();
    for (sqlite3_stmt* stmt : {m_deletePostingsStmt, m_deleteLengthStmt}) {
        sqlite3_bind_text(stmt, 1, chunkUtf8.constData(), -1, SQLITE_STATIC);
        const int rc = sqlite3_step(stmt);
        resetStatement(stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(ildIndex, "PostingStore delete failed for %s: %s",
                      qUtf8Printable(chunkId), sqlite3_errmsg(m_db));
            return false;
        }
    }
    return true;
}

bool PostingStore::addChunk(const QString& chunkId,
                            const std::unordered_map<QString, int>& termFreqs, int length)
{
    if (!m_ready || !execSql("SAVEPOINT add_postings")) {
        return false;
    }

    auto fail = [this]() {
        execSql("ROLLBACK TO SAVEPOINT add_postings");
        execSql("RELEASE SAVEPOINT add_postings");
        return false;
    };

    if (!removeChunkRows(chunkId)) {
        return fail();
    }

    const QByteArray chunkUtf8 = chunkId.toUtf8();
    for (const auto& [term, tf] : termFreqs) {
        const QByteArray termUtf8 = term.toUtf8();
        sqlite3_bind_text(m_insertPostingStmt, 1, termUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(m_insertPostingStmt, 2, chunkUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(m_insertPostingStmt, 3, tf);
        const int rc = sqlite3_step(m_insertPostingStmt);
        resetStatement(m_insertPostingStmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(ildIndex, "PostingStore insert failed: %s", sqlite3_errmsg(m_db));
            return fail();
        }
    }

    sqlite3_bind_text(m_insertLengthStmt, 1, chunkUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(m_insertLengthStmt, 2, length);
    const int rc = sqlite3_step(m_insertLengthStmt);
    resetStatement(m_insertLengthStmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(ildIndex, "PostingStore length insert failed: %s", sqlite3_errmsg(m_db));
        return fail();
    }

    return execSql("RELEASE SAVEPOINT add_postings");
}

bool PostingStore::removeChunk(const QString& chunkId)
{
    return m_ready && removeChunkRows(chunkId);
}

std::optional<PostingStore::Snapshot> PostingStore::loadAll()
{
    if (!m_ready) {
        return std::nullopt;
    }

    Snapshot snapshot;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT chunk_id, length FROM sparse_lengths", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        snapshot.lengths.emplace(columnText(stmt, 0), sqlite3_column_int(stmt, 1));
    }
    sqlite3_finalize(stmt);

    stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT term, chunk_id, tf FROM sparse_postings", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        snapshot.postings.push_back(
            Posting{columnText(stmt, 0), columnText(stmt, 1), sqlite3_column_int(stmt, 2)});
    }
    sqlite3_finalize(stmt);
    return snapshot;
}

int PostingStore::chunkCount()
{
    if (!m_ready) {
        return 0;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM sparse_lengths", -1, &stmt, nullptr)
        != SQLITE_OK) {
        return 0;
    }
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

bool PostingStore::clearAll()
{
    return m_ready && execSql("DELETE FROM sparse_postings; DELETE FROM sparse_lengths;");
}

} // namespace ild
