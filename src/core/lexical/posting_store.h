#pragma once

#include <QString>

#include <optional>
#include <unordered_map>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace ild {

// Persists BM25 postings in sparse_postings(term, chunk_id, tf) and
// per-chunk token counts in sparse_lengths(chunk_id, length). Rows are
// written per chunk as it is indexed.
class PostingStore {
public:
    struct Posting {
        QString term;
        QString chunkId;
        int tf = 0;
    };

    struct Snapshot {
        std::vector<Posting> postings;
        std::unordered_map<QString, int> lengths;
    };

    explicit PostingStore(sqlite3* db);
    ~PostingStore();

    PostingStore(const PostingStore&) = delete;
    PostingStore& operator=(const PostingStore&) = delete;

    bool isReady() const { return m_ready; }

    // Replaces any rows already stored for chunkId.
    bool addChunk(const QString& chunkId, const std::unordered_map<QString, int>& termFreqs,
                  int length);
    bool removeChunk(const QString& chunkId);
    std::optional<Snapshot> loadAll();
    int chunkCount();
    bool clearAll();

private:
    bool prepareStatements();
    bool execSql(const char* sql);
    bool removeChunkRows(const QString& chunkId);

    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_insertPostingStmt = nullptr;
    sqlite3_stmt* m_insertLengthStmt = nullptr;
    sqlite3_stmt* m_deletePostingsStmt = nullptr;
    sqlite3_stmt* m_deleteLengthStmt = nullptr;
    bool m_ready = false;
};

} // namespace ild
