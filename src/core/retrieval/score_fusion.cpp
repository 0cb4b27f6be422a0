#include "core/retrieval/score_fusion.h"

#include <algorithm>
#include <unordered_map>

namespace ild {

std::vector<double> ScoreFusion::normalizeScores(const std::vector<ScoredChunk>& hits)
{
    std::vector<double> normalized(hits.size(), 0.0);
    if (hits.empty()) {
        return normalized;
    }

    double lo = 0.0;
    double hi = hits.front().score;
    for (const ScoredChunk& hit : hits) {
        lo = std::min(lo, hit.score);
        hi = std::max(hi, hit.score);
    }
    const double range = hi - lo;
    if (range <= 0.0) {
        return normalized;
    }

    for (size_t i = 0; i < hits.size(); ++i) {
        normalized[i] = std::clamp((hits[i].score - lo) / range, 0.0, 1.0);
    }
    return normalized;
}

std::pair<double, double> ScoreFusion::normalizedWeights(const FusionConfig& config)
{
    const double dense = std::max(config.denseWeight, 0.0);
    const double sparse = std::max(config.sparseWeight, 0.0);
    const double sum = dense + sparse;
    if (sum <= 0.0) {
        return {0.5, 0.5};
    }
    return {dense / sum, sparse / sum};
}

std::vector<RetrievedChunk> ScoreFusion::fuse(const std::vector<ScoredChunk>& dense,
                                              const std::vector<ScoredChunk>& sparse,
                                              FusionConfig config)
{
    const auto [denseWeight, sparseWeight] = normalizedWeights(config);
    const std::vector<double> denseNorm = normalizeScores(dense);
    const std::vector<double> sparseNorm = normalizeScores(sparse);

    std::unordered_map<QString, RetrievedChunk> byChunk;
    byChunk.reserve(dense.size() + sparse.size());

    for (size_t i = 0; i < dense.size(); ++i) {
        RetrievedChunk& entry = byChunk[dense[i].chunkId];
        if (entry.fromDense) {
            continue;
        }
        entry.chunkId = dense[i].chunkId;
        entry.denseScore = dense[i].score;
        entry.denseNormalized = denseNorm[i];
        entry.fromDense = true;
    }
    for (size_t i = 0; i < sparse.size(); ++i) {
        RetrievedChunk& entry = byChunk[sparse[i].chunkId];
        if (entry.fromSparse) {
            continue;
        }
        entry.chunkId = sparse[i].chunkId;
        entry.sparseScore = sparse[i].score;
        entry.sparseNormalized = sparseNorm[i];
        entry.fromSparse = true;
    }

    std::vector<RetrievedChunk> fused;
    fused.reserve(byChunk.size());
    for (auto& [chunkId, entry] : byChunk) {
        entry.combinedScore = denseWeight * entry.denseNormalized
            + sparseWeight * entry.sparseNormalized;
        fused.push_back(std::move(entry));
    }

    std::sort(fused.begin(), fused.end(), [](const RetrievedChunk& a, const RetrievedChunk& b) {
        if (a.combinedScore != b.combinedScore) {
            return a.combinedScore > b.combinedScore;
        }
        const double aBest = std::max(a.denseNormalized, a.sparseNormalized);
        const double bBest = std::max(b.denseNormalized, b.sparseNormalized);
        if (aBest != bBest) {
            return aBest > bBest;
        }
        return a.chunkId < b.chunkId;
    });

    const size_t limit = static_cast<size_t>(std::max(config.maxResults, 0));
    if (fused.size() > limit) {
        fused.resize(limit);
    }
    return fused;
}

} // namespace ild
