#pragma once

#include "core/shared/types.h"

#include <QString>

#include <utility>
#include <vector>

namespace ild {

struct FusionConfig {
    double denseWeight = 0.5;
    double sparseWeight = 0.5;
    int maxResults = 10;
};

// One fused candidate. Raw scores are those reported by each index; a
// candidate missing from a list has raw and normalized score 0 for it.
struct RetrievedChunk {
    QString chunkId;
    double denseScore = 0.0;
    double sparseScore = 0.0;
    double denseNormalized = 0.0;
    double sparseNormalized = 0.0;
    double combinedScore = 0.0;
    bool fromDense = false;
    bool fromSparse = false;
};

// Weighted-sum fusion of a dense and a sparse candidate list.
//
// Each list is min-max normalized with the floor pinned at or below zero:
//   lo = min(0, min score), hi = max score, norm = (s - lo) / (hi - lo)
// so the best candidate of a list scores 1 and a list whose scores are all
// equal to zero normalizes to 0. Weights are rescaled to sum to 1.
class ScoreFusion {
public:
    static std::vector<RetrievedChunk> fuse(const std::vector<ScoredChunk>& dense,
                                            const std::vector<ScoredChunk>& sparse,
                                            FusionConfig config = {});

    // Same order as the input.
    static std::vector<double> normalizeScores(const std::vector<ScoredChunk>& hits);
    static std::pair<double, double> normalizedWeights(const FusionConfig& config);
};

} // namespace ild
