#include "core/vector/dense_index.h"
#include "core/shared/logging.h"
#include "core/vector/label_store.h"

#include <QFileInfo>

#include <algorithm>
#include <mutex>

namespace ild {

DenseIndex::DenseIndex(LabelStore* labels, ModelBinding binding)
    : m_labels(labels)
    , m_binding(std::move(binding))
{
}

DenseIndex::~DenseIndex() = default;

VectorIndex::IndexMetadata DenseIndex::metadataForBinding() const
{
    VectorIndex::IndexMetadata metadata;
    metadata.dimensions = m_binding.dimensions;
    metadata.modelId = m_binding.modelId.toStdString();
    metadata.generationId = m_binding.generationId.toStdString();
    return metadata;
}

bool DenseIndex::create()
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto index = std::make_unique<VectorIndex>(metadataForBinding());
    if (!index->create()) {
        return false;
    }
    if (m_labels && !m_labels->clearAll()) {
        LOG_ERROR(ildIndex, "DenseIndex::create could not clear stored labels");
        return false;
    }
    m_index = std::move(index);
    m_labelByChunk.clear();
    m_chunkByLabel.clear();
    return true;
}

std::optional<IndexError> DenseIndex::load(const QString& indexPath, const QString& metaPath)
{
    if (!QFileInfo::exists(indexPath) || !QFileInfo::exists(metaPath)) {
        return IndexError{IndexError::Kind::Missing,
                          QStringLiteral("dense index files not found at %1").arg(indexPath)};
    }

    const auto stored = VectorIndex::readMetadata(metaPath.toStdString());
    if (!stored.has_value()) {
        return IndexError{IndexError::Kind::Corrupt,
                          QStringLiteral("unreadable dense index sidecar %1").arg(metaPath)};
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    const ModelBinding storedBinding{QString::fromStdString(stored->modelId),
                                     QString::fromStdString(stored->generationId),
                                     stored->dimensions};
    if (m_binding.dimensions <= 0) {
        LOG_INFO(ildIndex, "DenseIndex: adopting stored binding %s/%s (%d dims)",
                 qUtf8Printable(storedBinding.modelId),
                 qUtf8Printable(storedBinding.generationId), storedBinding.dimensions);
        m_binding = storedBinding;
    } else if (storedBinding != m_binding) {
        return IndexError{IndexError::Kind::ModelMismatch,
                          QStringLiteral("dense index built with %1/%2 (%3 dims), "
                                         "embedder is %4/%5 (%6 dims)")
                              .arg(storedBinding.modelId, storedBinding.generationId)
                              .arg(storedBinding.dimensions)
                              .arg(m_binding.modelId, m_binding.generationId)
                              .arg(m_binding.dimensions)};
    }

    auto index = std::make_unique<VectorIndex>(metadataForBinding());
    if (!index->load(indexPath.toStdString(), metaPath.toStdString())) {
        return IndexError{IndexError::Kind::Corrupt,
                          QStringLiteral("dense index graph %1 failed to load").arg(indexPath)};
    }

    std::unordered_map<QString, uint64_t> labelByChunk;
    std::unordered_map<uint64_t, QString> chunkByLabel;
    if (m_labels) {
        for (auto& [chunkId, label] : m_labels->getAllMappings()) {
            if (label >= index->nextLabel()) {
                return IndexError{IndexError::Kind::Corrupt,
                                  QStringLiteral("label %1 for chunk %2 is beyond the graph")
                                      .arg(label).arg(chunkId)};
            }
            chunkByLabel.emplace(label, chunkId);
            labelByChunk.emplace(std::move(chunkId), label);
        }
        if (static_cast<int>(labelByChunk.size()) != index->liveElements()) {
            return IndexError{IndexError::Kind::Corrupt,
                              QStringLiteral("dense index has %1 live vectors but %2 labels")
                                  .arg(index->liveElements())
                                  .arg(labelByChunk.size())};
        }
    }

    m_index = std::move(index);
    m_labelByChunk = std::move(labelByChunk);
    m_chunkByLabel = std::move(chunkByLabel);
    LOG_INFO(ildIndex, "DenseIndex loaded: %d vectors", static_cast<int>(m_labelByChunk.size()));
    return std::nullopt;
}

bool DenseIndex::save(const QString& indexPath, const QString& metaPath) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        return false;
    }
    return m_index->save(indexPath.toStdString(), metaPath.toStdString());
}

bool DenseIndex::add(const QString& chunkId, const std::vector<float>& vector)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        LOG_WARN(ildIndex, "DenseIndex::add(%s): index unavailable", qUtf8Printable(chunkId));
        return false;
    }
    if (static_cast<int>(vector.size()) != m_binding.dimensions) {
        LOG_WARN(ildIndex, "DenseIndex::add(%s): %d dims, expected %d", qUtf8Printable(chunkId),
                 static_cast<int>(vector.size()), m_binding.dimensions);
        return false;
    }

    const auto existing = m_labelByChunk.find(chunkId);
    if (existing != m_labelByChunk.end()) {
        m_index->deleteVector(existing->second);
        m_chunkByLabel.erase(existing->second);
        m_labelByChunk.erase(existing);
    }

    const uint64_t label = m_index->addVector(vector.data());
    if (label == VectorIndex::kInvalidLabel) {
        return false;
    }
    if (m_labels
        && !m_labels->addMapping(chunkId, label, m_binding.modelId, m_binding.generationId)) {
        m_index->deleteVector(label);
        return false;
    }
    m_labelByChunk.emplace(chunkId, label);
    m_chunkByLabel.emplace(label, chunkId);
    return true;
}

bool DenseIndex::remove(const QString& chunkId)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    const auto it = m_labelByChunk.find(chunkId);
    if (it == m_labelByChunk.end() || !m_index) {
        return false;
    }
    if (m_labels && !m_labels->removeMapping(chunkId)) {
        LOG_WARN(ildIndex, "DenseIndex::remove(%s): label store delete failed",
                 qUtf8Printable(chunkId));
        return false;
    }
    if (!m_index->deleteVector(it->second)) {
        return false;
    }
    m_chunkByLabel.erase(it->second);
    m_labelByChunk.erase(it);
    return true;
}

bool DenseIndex::contains(const QString& chunkId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_labelByChunk.count(chunkId) > 0;
}

std::optional<std::vector<ScoredChunk>> DenseIndex::search(const std::vector<float>& queryVector,
                                                           int k) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<ScoredChunk> hits;
    if (k <= 0 || m_labelByChunk.empty()) {
        return hits;
    }
    if (!m_index || static_cast<int>(queryVector.size()) != m_binding.dimensions) {
        return std::nullopt;
    }

    const auto knn = m_index->search(queryVector.data(), k);
    if (!knn.has_value()) {
        return std::nullopt;
    }

    hits.reserve(knn->size());
    for (const VectorIndex::KnnResult& result : *knn) {
        const auto it = m_chunkByLabel.find(result.label);
        if (it == m_chunkByLabel.end()) {
            continue;
        }
        hits.push_back(ScoredChunk{it->second, 1.0 - static_cast<double>(result.distance)});
    }
    std::sort(hits.begin(), hits.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.chunkId < b.chunkId;
    });
    return hits;
}

bool DenseIndex::compactIfNeeded()
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index || !m_index->needsCompaction()) {
        return true;
    }
    return compactLocked();
}

bool DenseIndex::compactLocked()
{
    const int before = m_index->totalElements();
    auto compacted = std::make_unique<VectorIndex>(metadataForBinding());
    if (!compacted->create(std::max(VectorIndex::kInitialCapacity,
                                    static_cast<int>(m_labelByChunk.size()) * 2))) {
        return false;
    }

    std::vector<std::pair<QString, uint64_t>> remapped;
    remapped.reserve(m_labelByChunk.size());
    for (const auto& [chunkId, oldLabel] : m_labelByChunk) {
        const auto vector = m_index->vectorForLabel(oldLabel);
        if (!vector.has_value()) {
            LOG_ERROR(ildIndex, "DenseIndex compaction: vector missing for chunk %s",
                      qUtf8Printable(chunkId));
            return false;
        }
        const uint64_t newLabel = compacted->addVector(vector->data());
        if (newLabel == VectorIndex::kInvalidLabel) {
            return false;
        }
        remapped.emplace_back(chunkId, newLabel);
    }

    if (m_labels
        && !m_labels->replaceAll(remapped, m_binding.modelId, m_binding.generationId)) {
        LOG_ERROR(ildIndex, "DenseIndex compaction: label store update failed");
        return false;
    }

    m_index = std::move(compacted);
    m_labelByChunk.clear();
    m_chunkByLabel.clear();
    for (auto& [chunkId, label] : remapped) {
        m_chunkByLabel.emplace(label, chunkId);
        m_labelByChunk.emplace(std::move(chunkId), label);
    }
    LOG_INFO(ildIndex, "DenseIndex compacted %d -> %d vectors", before,
             static_cast<int>(m_labelByChunk.size()));
    return true;
}

int DenseIndex::size() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return static_cast<int>(m_labelByChunk.size());
}

bool DenseIndex::isAvailable() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_index != nullptr && m_index->isAvailable();
}

ModelBinding DenseIndex::binding() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_binding;
}

} // namespace ild
