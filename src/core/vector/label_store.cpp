#include "core/vector/label_store.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <QDateTime>

namespace ild {

namespace {

constexpr const char* kCreateVectorMapSql = R"(
    CREATE TABLE IF NOT EXISTS vector_map (
        chunk_id TEXT PRIMARY KEY,
        hnsw_label INTEGER NOT NULL UNIQUE,
        model_id TEXT NOT NULL,
        generation_id TEXT NOT NULL DEFAULT 'v1',
        embedded_at REAL NOT NULL
    )
)";

constexpr const char* kAddSql = R"(
    INSERT OR REPLACE INTO vector_map (chunk_id, hnsw_label, model_id, generation_id, embedded_at)
    VALUES (?1, ?2, ?3, ?4, ?5)
)";
constexpr const char* kRemoveSql = "DELETE FROM vector_map WHERE chunk_id = ?1";
constexpr const char* kGetLabelSql = "SELECT hnsw_label FROM vector_map WHERE chunk_id = ?1";
constexpr const char* kCountSql = "SELECT COUNT(*) FROM vector_map";
constexpr const char* kGetAllSql = "SELECT chunk_id, hnsw_label FROM vector_map ORDER BY hnsw_label";
constexpr const char* kClearSql = "DELETE FROM vector_map";

bool execSql(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(ildIndex, "LabelStore SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

} // namespace

LabelStore::LabelStore(sqlite3* db)
    : m_db(db)
{
    m_ready = prepareStatements();
    if (!m_ready) {
        LOG_ERROR(ildIndex, "LabelStore: failed to prepare vector_map statements");
    }
}

LabelStore::~LabelStore()
{
    for (sqlite3_stmt* stmt : {m_addStmt, m_removeStmt, m_getLabelStmt,
                               m_countStmt, m_getAllStmt, m_clearStmt}) {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
}

bool LabelStore::addMapping(const QString& chunkId, uint64_t hnswLabel,
                            const QString& modelId, const QString& generationId)
{
    if (!m_ready) {
        return false;
    }

    const QByteArray chunkUtf8 = chunkId.toUtf8();
    const QByteArray modelUtf8 = modelId.toUtf8();
    const QByteArray generationUtf8 = generationId.toUtf8();
    sqlite3_bind_text(m_addStmt, 1, chunkUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(m_addStmt, 2, static_cast<sqlite3_int64>(hnswLabel));
    sqlite3_bind_text(m_addStmt, 3, modelUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(m_addStmt, 4, generationUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(m_addStmt, 5, static_cast<double>(QDateTime::currentSecsSinceEpoch()));

    const int rc = sqlite3_step(m_addStmt);
    resetStatement(m_addStmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(ildIndex, "LabelStore::addMapping failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool LabelStore::removeMapping(const QString& chunkId)
{
    if (!m_ready) {
        return false;
    }

    const QByteArray chunkUtf8 = chunkId.toUtf8();
    sqlite3_bind_text(m_removeStmt, 1, chunkUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(m_removeStmt);
    resetStatement(m_removeStmt);
    return rc == SQLITE_DONE;
}

std::optional<uint64_t> LabelStore::getLabel(const QString& chunkId)
{
    if (!m_ready) {
        return std::nullopt;
    }

    const QByteArray chunkUtf8 = chunkId.toUtf8();
    sqlite3_bind_text(m_getLabelStmt, 1, chunkUtf8.constData(), -1, SQLITE_STATIC);
    std::optional<uint64_t> label;
    if (sqlite3_step(m_getLabelStmt) == SQLITE_ROW) {
        label = static_cast<uint64_t>(sqlite3_column_int64(m_getLabelStmt, 0));
    }
    resetStatement(m_getLabelStmt);
    return label;
}

int LabelStore::countMappings()
{
    if (!m_ready) {
        return 0;
    }

    int count = 0;
    if (sqlite3_step(m_countStmt) == SQLITE_ROW) {
        count = sqlite3_column_int(m_countStmt, 0);
    }
    resetStatement(m_countStmt);
    return count;
}

std::vector<std::pair<QString, uint64_t>> LabelStore::getAllMappings()
{
    std::vector<std::pair<QString, uint64_t>> mappings;
    if (!m_ready) {
        return mappings;
    }

    while (sqlite3_step(m_getAllStmt) == SQLITE_ROW) {
        const char* chunkId = reinterpret_cast<const char*>(sqlite3_column_text(m_getAllStmt, 0));
        mappings.emplace_back(QString::fromUtf8(chunkId ? chunkId : ""),
                              static_cast<uint64_t>(sqlite3_column_int64(m_getAllStmt, 1)));
    }
    resetStatement(m_getAllStmt);
    return mappings;
}

bool LabelStore::clearAll()
{
    if (!m_ready) {
        return false;
    }

    const int rc = sqlite3_step(m_clearStmt);
    resetStatement(m_clearStmt);
    return rc == SQLITE_DONE;
}

bool LabelStore::replaceAll(const std::vector<std::pair<QString, uint64_t>>& mappings,
                            const QString& modelId, const QString& generationId)
{
    if (!m_ready || !execSql(m_db, "SAVEPOINT replace_labels")) {
        return false;
    }

    bool ok = clearAll();
    for (const auto& [chunkId, label] : mappings) {
        if (!ok) {
            break;
        }
        ok = addMapping(chunkId, label, modelId, generationId);
    }

    if (!ok) {
        execSql(m_db, "ROLLBACK TO SAVEPOINT replace_labels");
        execSql(m_db, "RELEASE SAVEPOINT replace_labels");
        return false;
    }
    return execSql(m_db, "RELEASE SAVEPOINT replace_labels");
}

bool LabelStore::prepareStatements()
{
    if (!m_db || !execSql(m_db, kCreateVectorMapSql)) {
        return false;
    }

    const std::pair<const char*, sqlite3_stmt**> statements[] = {
        {kAddSql, &m_addStmt},
        {kRemoveSql, &m_removeStmt},
        {kGetLabelSql, &m_getLabelStmt},
        {kCountSql, &m_countStmt},
        {kGetAllSql, &m_getAllStmt},
        {kClearSql, &m_clearStmt},
    };
    for (const auto& [sql, stmt] : statements) {
        if (sqlite3_prepare_v2(m_db, sql, -1, stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(ildIndex, "LabelStore prepare failed: %s", sqlite3_errmsg(m_db));
            return false;
        }
    }
    return true;
}

void LabelStore::resetStatement(sqlite3_stmt* stmt)
{
    if (!stmt) {
        return;
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

} // namespace ild
