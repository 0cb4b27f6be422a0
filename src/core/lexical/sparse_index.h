#pragma once

#include "core/shared/errors.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace ild {

class PostingStore;

// In-memory inverted index scored with Okapi BM25:
//   idf(t)   = ln(1 + (N - n_t + 0.5) / (n_t + 0.5))
//   score    = sum over distinct query terms of
//              idf(t) * tf * (k1 + 1) / (tf + k1 * (1 - b + b * len / avglen))
// Mirrors every change into the PostingStore when one is given.
class SparseIndex {
public:
    explicit SparseIndex(PostingStore* store, Bm25Settings params = {});

    SparseIndex(const SparseIndex&) = delete;
    SparseIndex& operator=(const SparseIndex&) = delete;

    // Replaces any postings already held for chunkId. Safe to call from
    // several threads for distinct chunk ids.
    bool add(const QString& chunkId, const QStringList& tokens);
    bool remove(const QString& chunkId);
    bool contains(const QString& chunkId) const;

    // Only chunks with a positive score are returned; sorted by score
    // descending, ties by chunk id. Duplicate query terms count once.
    std::vector<ScoredChunk> search(const QStringList& queryTokens, int k) const;

    // Replaces the in-memory state with the persisted postings.
    std::optional<IndexError> load();
    bool clear();

    int size() const;
    int termCount() const;
    double averageLength() const;
    Bm25Settings params() const { return m_params; }

private:
    void removeLocked(const QString& chunkId);

    PostingStore* m_store = nullptr;
    Bm25Settings m_params;
    std::unordered_map<QString, std::unordered_map<QString, int>> m_postings;
    std::unordered_map<QString, int> m_lengths;
    long long m_totalLength = 0;
    mutable std::shared_mutex m_mutex;
};

} // namespace ild
