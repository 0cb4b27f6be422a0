#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace ild {

// HNSW graph over unit vectors with inner-product distance (1 - dot).
// Labels are assigned sequentially and never reused until compaction.
class VectorIndex {
public:
    struct KnnResult {
        uint64_t label = 0;
        float distance = 0.0f;
    };

    struct IndexMetadata {
        int schemaVersion = 1;
        int dimensions = 0;
        std::string modelId = "unknown";
        std::string generationId = "v1";
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 64;
    static constexpr int kInitialCapacity = 10000;
    static constexpr double kCompactionRatio = 0.20;
    static constexpr uint64_t kInvalidLabel = UINT64_MAX;

    VectorIndex();
    explicit VectorIndex(const IndexMetadata& metadata);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    bool create(int initialCapacity = kInitialCapacity);

    // Reads the sidecar first. Fails on unreadable files, a dimension
    // mismatch with configured metadata, or an element count that
    // disagrees with the sidecar.
    bool load(const std::string& indexPath, const std::string& metaPath);
    bool save(const std::string& indexPath, const std::string& metaPath) const;

    // Returns kInvalidLabel on failure.
    uint64_t addVector(const float* embedding);
    bool deleteVector(uint64_t label);
    std::optional<std::vector<float>> vectorForLabel(uint64_t label) const;

    // Sorted by ascending distance. nullopt when the search itself failed.
    std::optional<std::vector<KnnResult>> search(const float* queryVector, int k) const;

    int totalElements() const;
    int deletedElements() const;
    int liveElements() const;
    bool needsCompaction() const;
    bool isAvailable() const;
    uint64_t nextLabel() const;
    int dimensions() const;
    const IndexMetadata& metadata() const;

    // Reads only the sidecar. Used to check the model binding before the
    // graph is loaded.
    static std::optional<IndexMetadata> readMetadata(const std::string& metaPath);

private:
    bool ensureCapacityForOneMore();

    IndexMetadata m_metadata;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    uint64_t m_nextLabel = 0;
    int m_deletedCount = 0;
    mutable std::shared_mutex m_mutex;
};

} // namespace ild
