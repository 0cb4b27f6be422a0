#include "core/lexical/sparse_index.h"
#include "core/lexical/posting_store.h"
#include "core/shared/logging.h"

#include <QSet>

#include <algorithm>
#include <cmath>
#include <mutex>

namespace ild {

SparseIndex::SparseIndex(PostingStore* store, Bm25Settings params)
    : m_store(store)
    , m_params(params)
{
}

bool SparseIndex::add(const QString& chunkId, const QStringList& tokens)
{
    std::unordered_map<QString, int> termFreqs;
    for (const QString& token : tokens) {
        if (!token.isEmpty()) {
            ++termFreqs[token];
        }
    }
    const int length = static_cast<int>(tokens.size());

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (m_store && !m_store->addChunk(chunkId, termFreqs, length)) {
        LOG_WARN(ildIndex, "SparseIndex::add(%s): posting store write failed",
                 qUtf8Printable(chunkId));
        return false;
    }

    removeLocked(chunkId);
    for (const auto& [term, tf] : termFreqs) {
        m_postings[term][chunkId] = tf;
    }
    m_lengths[chunkId] = length;
    m_totalLength += length;
    return true;
}

bool SparseIndex::remove(const QString& chunkId)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (m_lengths.count(chunkId) == 0) {
        return false;
    }
    if (m_store && !m_store->removeChunk(chunkId)) {
        return false;
    }
    removeLocked(chunkId);
    return true;
}

void SparseIndex::removeLocked(const QString& chunkId)
{
    const auto lengthIt = m_lengths.find(chunkId);
    if (lengthIt == m_lengths.end()) {
        return;
    }
    m_totalLength -= lengthIt->second;
    m_lengths.erase(lengthIt);

    for (auto it = m_postings.begin(); it != m_postings.end();) {
        it->second.erase(chunkId);
        if (it->second.empty()) {
            it = m_postings.erase(it);
        } else {
            ++it;
        }
    }
}

bool SparseIndex::contains(const QString& chunkId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_lengths.count(chunkId) > 0;
}

std::vector<ScoredChunk> SparseIndex::search(const QStringList& queryTokens, int k) const
{
    std::vector<ScoredChunk> hits;
    if (k <= 0 || queryTokens.isEmpty()) {
        return hits;
    }

    std::shared_lock<std::shared_mutex> lock(m_mutex);
    const double n = static_cast<double>(m_lengths.size());
    if (n == 0.0) {
        return hits;
    }
    const double avgLength = std::max(static_cast<double>(m_totalLength) / n, 1.0);

    std::unordered_map<QString, double> scores;
    QSet<QString> seen;
    for (const QString& term : queryTokens) {
        if (term.isEmpty() || seen.contains(term)) {
            continue;
        }
        seen.insert(term);

        const auto postingIt = m_postings.find(term);
        if (postingIt == m_postings.end()) {
            continue;
        }
        const double df = static_cast<double>(postingIt->second.size());
        const double idf = std::log(1.0 + (n - df + 0.5) / (df + 0.5));

        for (const auto& [chunkId, tf] : postingIt->second) {
            const auto lengthIt = m_lengths.find(chunkId);
            const double length = lengthIt != m_lengths.end() ? lengthIt->second : avgLength;
            const double tfD = static_cast<double>(tf);
            const double norm = tfD + m_params.k1
                * (1.0 - m_params.b + m_params.b * length / avgLength);
            scores[chunkId] += idf * tfD * (m_params.k1 + 1.0) / norm;
        }
    }

    hits.reserve(scores.size());
    for (const auto& [chunkId, score] : scores) {
        if (score > 0.0) {
            hits.push_back(ScoredChunk{chunkId, score});
        }
    }
    std::sort(hits.begin(), hits.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.chunkId < b.chunkId;
    });
    if (static_cast<int>(hits.size()) > k) {
        hits.resize(static_cast<size_t>(k));
    }
    return hits;
}

std::optional<IndexError> SparseIndex::load()
{
    if (!m_store) {
        return IndexError{IndexError::Kind::StorageUnavailable,
                          QStringLiteral("sparse index has no posting store")};
    }
    auto snapshot = m_store->loadAll();
    if (!snapshot.has_value()) {
        return IndexError{IndexError::Kind::StorageUnavailable,
                          QStringLiteral("sparse postings could not be read")};
    }

    std::unordered_map<QString, std::unordered_map<QString, int>> postings;
    for (PostingStore::Posting& posting : snapshot->postings) {
        if (snapshot->lengths.count(posting.chunkId) == 0) {
            return IndexError{IndexError::Kind::Corrupt,
                              QStringLiteral("posting for %1 has no length row")
                                  .arg(posting.chunkId)};
        }
        postings[posting.term][posting.chunkId] = posting.tf;
    }

    long long total = 0;
    for (const auto& [chunkId, length] : snapshot->lengths) {
        total += length;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_postings = std::move(postings);
    m_lengths = std::move(snapshot->lengths);
    m_totalLength = total;
    LOG_INFO(ildIndex, "SparseIndex loaded: %d chunks, %d terms",
             static_cast<int>(m_lengths.size()), static_cast<int>(m_postings.size()));
    return std::nullopt;
}

bool SparseIndex::clear()
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (m_store && !m_store->clearAll()) {
        return false;
    }
    m_postings.clear();
    m_lengths.clear();
    m_totalLength = 0;
    return true;
}

int SparseIndex::size() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return static_cast<int>(m_lengths.size());
}

int SparseIndex::termCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return static_cast<int>(m_postings.size());
}

double SparseIndex::averageLength() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (m_lengths.empty()) {
        return 0.0;
    }
    return static_cast<double>(m_totalLength) / static_cast<double>(m_lengths.size());
}

} // namespace ild
