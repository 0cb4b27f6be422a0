#pragma once

#include "core/embedding/embedder.h"
#include "core/shared/errors.h"
#include "core/shared/types.h"
#include "core/vector/vector_index.h"

#include <QString>

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace ild {

class LabelStore;

// Chunk-id keyed dense index over a VectorIndex. Scores are cosine
// similarities (1 - inner-product distance), higher is closer.
//
// The label map is mirrored into the LabelStore when one is given; a null
// store keeps the mapping in memory only.
class DenseIndex {
public:
    DenseIndex(LabelStore* labels, ModelBinding binding);
    ~DenseIndex();

    DenseIndex(const DenseIndex&) = delete;
    DenseIndex& operator=(const DenseIndex&) = delete;

    // Starts an empty graph for the configured binding. Clears stored labels.
    bool create();

    // Validates the sidecar against the binding before the graph is read.
    // An unknown binding (zero dimensions) adopts the stored one.
    std::optional<IndexError> load(const QString& indexPath, const QString& metaPath);
    bool save(const QString& indexPath, const QString& metaPath) const;

    // Replaces any vector already stored for chunkId.
    bool add(const QString& chunkId, const std::vector<float>& vector);
    bool remove(const QString& chunkId);
    bool contains(const QString& chunkId) const;

    // Sorted by score descending, ties by chunk id. Empty index gives an
    // empty list; nullopt only on a failed search or dimension mismatch.
    std::optional<std::vector<ScoredChunk>> search(const std::vector<float>& queryVector,
                                                   int k) const;

    // Rebuilds the graph from its own live vectors when more than
    // VectorIndex::kCompactionRatio of the labels are deleted.
    bool compactIfNeeded();

    int size() const;
    bool isAvailable() const;
    ModelBinding binding() const;

private:
    bool compactLocked();
    VectorIndex::IndexMetadata metadataForBinding() const;

    LabelStore* m_labels = nullptr;
    ModelBinding m_binding;
    std::unique_ptr<VectorIndex> m_index;
    std::unordered_map<QString, uint64_t> m_labelByChunk;
    std::unordered_map<uint64_t, QString> m_chunkByLabel;
    mutable std::shared_mutex m_mutex;
};

} // namespace ild
