#pragma once

#include "core/retrieval/score_fusion.h"
#include "core/shared/settings.h"

#include <QString>

#include <vector>

namespace ild {

class DenseIndex;
class Embedder;
class SparseIndex;

struct RetrievalResult {
    enum class Mode {
        Hybrid,
        SparseOnly,
        NoSources,
    };

    Mode mode = Mode::Hybrid;
    bool degraded = false;
    QString degradedReason;
    std::vector<RetrievedChunk> hits;
};

QString retrievalModeToString(RetrievalResult::Mode mode);

// Dense + sparse retrieval fused by ScoreFusion. Any failure on the dense
// side (embedder unavailable, model binding mismatch, query embedding or
// dense search failure) degrades to sparse-only instead of failing.
// Safe to call concurrently.
class HybridRetriever {
public:
    HybridRetriever(Embedder* embedder, const DenseIndex* dense, const SparseIndex* sparse,
                    RetrievalSettings settings = {});

    // k <= 0 uses the configured default top-k.
    RetrievalResult retrieve(const QString& query, int k = 0) const;

    // Candidates drawn from each index for a final top-k.
    int candidatePoolSize(int k) const;

    const RetrievalSettings& settings() const { return m_settings; }

private:
    Embedder* m_embedder = nullptr;
    const DenseIndex* m_dense = nullptr;
    const SparseIndex* m_sparse = nullptr;
    RetrievalSettings m_settings;
};

} // namespace ild
