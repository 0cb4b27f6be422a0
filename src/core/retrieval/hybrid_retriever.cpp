#include "core/retrieval/hybrid_retriever.h"
#include "core/embedding/embedder.h"
#include "core/lexical/lexical_tokenizer.h"
#include "core/lexical/sparse_index.h"
#include "core/shared/logging.h"
#include "core/text/text_normalizer.h"
#include "core/vector/dense_index.h"

#include <QElapsedTimer>

#include <algorithm>
#include <limits>
#include <optional>

namespace ild {

QString retrievalModeToString(RetrievalResult::Mode mode)
{
    switch (mode) {
    case RetrievalResult::Mode::Hybrid:     return QStringLiteral("hybrid");
    case RetrievalResult::Mode::SparseOnly: return QStringLiteral("sparse_only");
    case RetrievalResult::Mode::NoSources:  return QStringLiteral("no_sources");
    }
    return QStringLiteral("hybrid");
}

HybridRetriever::HybridRetriever(Embedder* embedder, const DenseIndex* dense,
                                 const SparseIndex* sparse, RetrievalSettings settings)
    : m_embedder(embedder)
    , m_dense(dense)
    , m_sparse(sparse)
    , m_settings(settings)
{
}

int HybridRetriever::candidatePoolSize(int k) const
{
    const qint64 multiplier = std::max(m_settings.candidateMultiplier, 1);
    const qint64 pool = std::min<qint64>(static_cast<qint64>(k) * multiplier,
                                         std::numeric_limits<int>::max());
    return std::max(static_cast<int>(pool), m_settings.minCandidates);
}

RetrievalResult HybridRetriever::retrieve(const QString& query, int k) const
{
    RetrievalResult result;
    const int topK = k > 0 ? k : std::max(m_settings.defaultTopK, 1);

    const int denseSize = m_dense ? m_dense->size() : 0;
    const int sparseSize = m_sparse ? m_sparse->size() : 0;
    if (denseSize == 0 && sparseSize == 0) {
        result.mode = RetrievalResult::Mode::NoSources;
        LOG_INFO(ildRetrieval, "retrieve: no sources available");
        return result;
    }

    QElapsedTimer timer;
    timer.start();

    const QString normalized = TextNormalizer::normalize(query);
    if (TextNormalizer::containsDevanagari(normalized)) {
        const auto split = TextNormalizer::splitMixedScript(normalized);
        LOG_DEBUG(ildRetrieval, "query script mix: devanagari=%d chars, other=%d chars",
                  static_cast<int>(split.devanagari.size()),
                  static_cast<int>(split.other.size()));
    }

    const int pool = candidatePoolSize(topK);

    std::vector<ScoredChunk> denseHits;
    QString degradedReason;
    if (!m_embedder || !m_embedder->isAvailable()) {
        degradedReason = QStringLiteral("embedder unavailable");
    } else if (!m_dense || !m_dense->isAvailable()) {
        degradedReason = QStringLiteral("dense index unavailable");
    } else if (m_embedder->binding() != m_dense->binding()) {
        degradedReason = QStringLiteral("query model %1/%2 does not match dense index %3/%4")
                             .arg(m_embedder->binding().modelId,
                                  m_embedder->binding().generationId,
                                  m_dense->binding().modelId,
                                  m_dense->binding().generationId);
    } else {
        const EmbeddingResult embedded = m_embedder->embedQuery(normalized);
        if (!embedded.ok()) {
            degradedReason = QStringLiteral("query embedding failed: %1")
                                 .arg(embeddingStatusToString(embedded.status));
        } else {
            const auto searched = m_dense->search(embedded.vector, pool);
            if (!searched.has_value()) {
                degradedReason = QStringLiteral("dense search failed");
            } else {
                denseHits = *searched;
            }
        }
    }

    const QStringList tokens = LexicalTokenizer::tokenize(normalized);
    const std::vector<ScoredChunk> sparseHits =
        m_sparse ? m_sparse->search(tokens, pool) : std::vector<ScoredChunk>{};

    if (!degradedReason.isEmpty()) {
        result.mode = RetrievalResult::Mode::SparseOnly;
        result.degraded = true;
        result.degradedReason = degradedReason;
        LOG_WARN(ildRetrieval, "retrieve degraded to sparse-only: %s",
                 qUtf8Printable(degradedReason));
        denseHits.clear();
    }

    FusionConfig fusion;
    fusion.denseWeight = m_settings.denseWeight;
    fusion.sparseWeight = m_settings.sparseWeight;
    fusion.maxResults = topK;
    result.hits = ScoreFusion::fuse(denseHits, sparseHits, fusion);

    LOG_DEBUG(ildRetrieval, "retrieve: %d dense, %d sparse, %d fused in %lld ms",
              static_cast<int>(denseHits.size()), static_cast<int>(sparseHits.size()),
              static_cast<int>(result.hits.size()), static_cast<long long>(timer.elapsed()));
    return result;
}

} // namespace ild
