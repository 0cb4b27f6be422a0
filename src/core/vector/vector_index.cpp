#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

#include <hnswlib/hnswlib.h>

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <limits>
#include <mutex>

namespace ild {

namespace {

constexpr int kMetaVersion = 1;

// Anything smaller cannot be a serialized HNSW graph; hnswlib's loader is
// unsafe on truncated payloads
constexpr qint64 kMinSerializedIndexBytes = 96;

} // namespace

VectorIndex::VectorIndex() = default;

VectorIndex::VectorIndex(const IndexMetadata& metadata)
    : m_metadata(metadata)
{
}

VectorIndex::~VectorIndex() = default;

bool VectorIndex::create(int initialCapacity)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (m_metadata.dimensions <= 0) {
        LOG_ERROR(ildIndex, "VectorIndex::create requires a positive dimension");
        return false;
    }

    try {
        const int capacity = std::max(initialCapacity, 1);
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_metadata.dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(capacity),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_nextLabel = 0;
        m_deletedCount = 0;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(ildIndex, "VectorIndex::create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

std::optional<VectorIndex::IndexMetadata> VectorIndex::readMetadata(const std::string& metaPath)
{
    QFile metaFile(QString::fromStdString(metaPath));
    if (!metaFile.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument metaDoc = QJsonDocument::fromJson(metaFile.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !metaDoc.isObject()) {
        LOG_ERROR(ildIndex, "VectorIndex: invalid meta JSON in %s: %s",
                  metaPath.c_str(), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    const QJsonObject meta = metaDoc.object();
    IndexMetadata metadata;
    metadata.dimensions = meta.value(QStringLiteral("dimensions")).toInt(-1);
    if (metadata.dimensions <= 0) {
        LOG_ERROR(ildIndex, "VectorIndex: missing or invalid dimensions in %s", metaPath.c_str());
        return std::nullopt;
    }
    metadata.schemaVersion = meta.value(QStringLiteral("version")).toInt(kMetaVersion);
    metadata.modelId = meta.value(QStringLiteral("model_id"))
                           .toString(QStringLiteral("unknown")).toStdString();
    metadata.generationId = meta.value(QStringLiteral("generation_id"))
                                .toString(QStringLiteral("v1")).toStdString();
    return metadata;
}

bool VectorIndex::load(const std::string& indexPath, const std::string& metaPath)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    const QFileInfo indexInfo(QString::fromStdString(indexPath));
    if (!indexInfo.exists() || !indexInfo.isFile()) {
        LOG_ERROR(ildIndex, "VectorIndex::load missing index file: %s", indexPath.c_str());
        return false;
    }
    if (indexInfo.size() < kMinSerializedIndexBytes) {
        LOG_ERROR(ildIndex, "VectorIndex::load index payload too small: %lld bytes",
                  static_cast<long long>(indexInfo.size()));
        return false;
    }

    const std::optional<IndexMetadata> stored = readMetadata(metaPath);
    if (!stored.has_value()) {
        return false;
    }
    if (m_metadata.dimensions > 0 && stored->dimensions != m_metadata.dimensions) {
        LOG_ERROR(ildIndex, "VectorIndex::load dimension mismatch: %d, expected %d",
                  stored->dimensions, m_metadata.dimensions);
        return false;
    }

    QFile metaFile(QString::fromStdString(metaPath));
    if (!metaFile.open(QIODevice::ReadOnly)) {
        return false;
    }
    const QJsonObject meta = QJsonDocument::fromJson(metaFile.readAll()).object();
    const uint64_t totalElementsMeta =
        meta.value(QStringLiteral("total_elements")).toVariant().toULongLong();
    const uint64_t nextLabelMeta = meta.value(QStringLiteral("next_label")).toVariant().toULongLong();
    const int deletedElementsMeta = meta.value(QStringLiteral("deleted_elements")).toInt(0);

    uint64_t targetCapacity = static_cast<uint64_t>(kInitialCapacity);
    targetCapacity = std::max(targetCapacity, nextLabelMeta + 1);
    targetCapacity = std::max(targetCapacity, totalElementsMeta * 2);
    if (targetCapacity > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
        LOG_ERROR(ildIndex, "VectorIndex::load target capacity too large");
        return false;
    }

    try {
        auto space = std::make_unique<hnswlib::InnerProductSpace>(stored->dimensions);
        auto index = std::make_unique<hnswlib::HierarchicalNSW<float>>(space.get());
        index->loadIndex(indexPath, space.get(), static_cast<size_t>(targetCapacity));
        if (index->getCurrentElementCount() != totalElementsMeta) {
            LOG_ERROR(ildIndex, "VectorIndex::load element count %zu disagrees with sidecar %llu",
                      index->getCurrentElementCount(),
                      static_cast<unsigned long long>(totalElementsMeta));
            return false;
        }
        index->setEf(static_cast<size_t>(kEfSearch));

        m_metadata = stored.value();
        m_space = std::move(space);
        m_index = std::move(index);
        m_nextLabel = nextLabelMeta;
        m_deletedCount = std::max(deletedElementsMeta, 0);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(ildIndex, "VectorIndex::load failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::save(const std::string& indexPath, const std::string& metaPath) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        LOG_WARN(ildIndex, "VectorIndex::save called with unavailable index");
        return false;
    }

    try {
        m_index->saveIndex(indexPath);
    } catch (const std::exception& e) {
        LOG_ERROR(ildIndex, "VectorIndex::save failed to persist index: %s", e.what());
        return false;
    }

    QJsonObject meta;
    meta.insert(QStringLiteral("version"), kMetaVersion);
    meta.insert(QStringLiteral("model_id"), QString::fromStdString(m_metadata.modelId));
    meta.insert(QStringLiteral("generation_id"), QString::fromStdString(m_metadata.generationId));
    meta.insert(QStringLiteral("dimensions"), m_metadata.dimensions);
    meta.insert(QStringLiteral("total_elements"),
                static_cast<qint64>(m_index->getCurrentElementCount()));
    meta.insert(QStringLiteral("deleted_elements"), m_deletedCount);
    meta.insert(QStringLiteral("next_label"), static_cast<qint64>(m_nextLabel));
    meta.insert(QStringLiteral("ef_construction"), kEfConstruction);
    meta.insert(QStringLiteral("m"), kM);
    meta.insert(QStringLiteral("last_persisted"),
                QDateTime::currentDateTimeUtc().toString(Qt::ISODate));

    QFile metaFile(QString::fromStdString(metaPath));
    if (!metaFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(ildIndex, "VectorIndex::save failed to open meta file: %s", metaPath.c_str());
        return false;
    }
    const qint64 written = metaFile.write(QJsonDocument(meta).toJson(QJsonDocument::Indented));
    if (written < 0) {
        LOG_ERROR(ildIndex, "VectorIndex::save failed writing meta file: %s", metaPath.c_str());
        return false;
    }
    return true;
}

uint64_t VectorIndex::addVector(const float* embedding)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index || embedding == nullptr) {
        LOG_WARN(ildIndex, "VectorIndex::addVector called with unavailable index or null vector");
        return kInvalidLabel;
    }

    if (!ensureCapacityForOneMore()) {
        return kInvalidLabel;
    }

    const uint64_t label = m_nextLabel;
    try {
        m_index->addPoint(embedding, static_cast<hnswlib::labeltype>(label));
        ++m_nextLabel;
        return label;
    } catch (const std::exception& e) {
        LOG_ERROR(ildIndex, "VectorIndex::addVector failed: %s", e.what());
        return kInvalidLabel;
    }
}

bool VectorIndex::deleteVector(uint64_t label)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        return false;
    }

    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(label));
        ++m_deletedCount;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(ildIndex, "VectorIndex::deleteVector(%llu) failed: %s",
                  static_cast<unsigned long long>(label), e.what());
        return false;
    }
}

std::optional<std::vector<float>> VectorIndex::vectorForLabel(uint64_t label) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        return std::nullopt;
    }
    try {
        return m_index->getDataByLabel<float>(static_cast<hnswlib::labeltype>(label));
    } catch (const std::exception& e) {
        LOG_WARN(ildIndex, "VectorIndex: no vector for label %llu: %s",
                 static_cast<unsigned long long>(label), e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<VectorIndex::KnnResult>> VectorIndex::search(const float* queryVector,
                                                                         int k) const
{
    std::vector<KnnResult> results;
    if (queryVector == nullptr || k <= 0) {
        return results;
    }

    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        return std::nullopt;
    }
    if (m_index->getCurrentElementCount() == 0) {
        return results;
    }

    try {
        auto queue = m_index->searchKnn(queryVector, static_cast<size_t>(k));
        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            results.push_back(KnnResult{static_cast<uint64_t>(entry.second), entry.first});
        }
        std::sort(results.begin(), results.end(), [](const KnnResult& a, const KnnResult& b) {
            if (a.distance != b.distance) {
                return a.distance < b.distance;
            }
            return a.label < b.label;
        });
        return results;
    } catch (const std::exception& e) {
        LOG_ERROR(ildIndex, "VectorIndex::search failed: %s", e.what());
        return std::nullopt;
    }
}

int VectorIndex::totalElements() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_index ? static_cast<int>(m_index->getCurrentElementCount()) : 0;
}

int VectorIndex::deletedElements() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_deletedCount;
}

int VectorIndex::liveElements() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        return 0;
    }
    return static_cast<int>(m_index->getCurrentElementCount()) - m_deletedCount;
}

bool VectorIndex::needsCompaction() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index || m_index->getCurrentElementCount() == 0) {
        return false;
    }
    return static_cast<double>(m_deletedCount)
        / static_cast<double>(m_index->getCurrentElementCount()) > kCompactionRatio;
}

bool VectorIndex::isAvailable() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_index != nullptr;
}

uint64_t VectorIndex::nextLabel() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_nextLabel;
}

int VectorIndex::dimensions() const
{
    return m_metadata.dimensions;
}

const VectorIndex::IndexMetadata& VectorIndex::metadata() const
{
    return m_metadata;
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (maxElements == 0) {
        LOG_ERROR(ildIndex, "VectorIndex has zero max elements");
        return false;
    }

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold) {
        return true;
    }

    const size_t newCapacity = maxElements * 2;
    if (newCapacity <= maxElements) {
        LOG_ERROR(ildIndex, "VectorIndex resize overflow");
        return false;
    }

    try {
        m_index->resizeIndex(newCapacity);
        LOG_INFO(ildIndex, "VectorIndex resized to capacity %zu", newCapacity);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(ildIndex, "VectorIndex resize failed: %s", e.what());
        return false;
    }
}

} // namespace ild
