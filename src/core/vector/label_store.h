#pragma once

#include <QString>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace ild {

// Persists the chunk id <-> HNSW label mapping in the vector_map table of
// the shared database. Not thread-safe; DenseIndex serializes access.
class LabelStore {
public:
    explicit LabelStore(sqlite3* db);
    ~LabelStore();

    LabelStore(const LabelStore&) = delete;
    LabelStore& operator=(const LabelStore&) = delete;

    bool isReady() const { return m_ready; }

    bool addMapping(const QString& chunkId, uint64_t hnswLabel,
                    const QString& modelId, const QString& generationId);
    bool removeMapping(const QString& chunkId);
    std::optional<uint64_t> getLabel(const QString& chunkId);
    int countMappings();
    std::vector<std::pair<QString, uint64_t>> getAllMappings();
    bool clearAll();

    // Replaces every mapping in one savepoint.
    bool replaceAll(const std::vector<std::pair<QString, uint64_t>>& mappings,
                    const QString& modelId, const QString& generationId);

private:
    bool prepareStatements();
    static void resetStatement(sqlite3_stmt* stmt);

    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_addStmt = nullptr;
    sqlite3_stmt* m_removeStmt = nullptr;
    sqlite3_stmt* m_getLabelStmt = nullptr;
    sqlite3_stmt* m_countStmt = nullptr;
    sqlite3_stmt* m_getAllStmt = nullptr;
    sqlite3_stmt* m_clearStmt = nullptr;
    bool m_ready = false;
};

} // namespace ild
