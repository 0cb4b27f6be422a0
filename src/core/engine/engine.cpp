#include "core/engine/engine.h"
#include "core/embedding/embedder.h"
#include "core/embedding/embedding_manager.h"
#include "core/extraction/backend_factory.h"
#include "core/extraction/extraction_orchestrator.h"
#include "core/extraction/poppler_page_renderer.h"
#include "core/index/chunk_store.h"
#include "core/lexical/posting_store.h"
#include "core/lexical/sparse_index.h"
#include "core/models/model_registry.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/vector/dense_index.h"
#include "core/vector/label_store.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <numeric>
#include <unordered_map>

namespace ild {

namespace {

IndexError makeIndexError(IndexError::Kind kind, const QString& message)
{
    IndexError error;
    error.kind = kind;
    error.message = message;
    return error;
}

} // namespace

// ── Answer context ──────────────────────────────────────────

QString ContextPassage::citationLabel() const
{
    return QStringLiteral("[%1]").arg(citation);
}

QString AnswerContext::formatted() const
{
    QString out;
    for (const ContextPassage& passage : passages) {
        const QString pages = passage.firstPage == passage.lastPage
            ? QStringLiteral("p. %1").arg(passage.firstPage)
            : QStringLiteral("pp. %1-%2").arg(passage.firstPage).arg(passage.lastPage);
        out += QStringLiteral("%1 %2, %3\n%4\n\n")
                   .arg(passage.citationLabel(), passage.filename, pages, passage.chunk.text);
    }
    return out.trimmed();
}

// ── Construction ────────────────────────────────────────────

Engine::Engine(Settings settings, EngineComponents components)
    : m_settings(std::move(settings))
    , m_components(std::move(components))
    , m_chunker(ChunkerConfig{m_settings.chunking.windowTokens, m_settings.chunking.overlapTokens})
{
    if (m_settings.dataDir.isEmpty()) {
        m_settings.dataDir = SettingsManager::defaultDataDir();
    }

    OrchestratorConfig config;
    config.acceptanceThreshold = m_settings.extraction.acceptanceThreshold;
    config.concurrency = m_settings.extraction.concurrency;
    config.backendTimeoutMs = m_settings.extraction.backendTimeoutMs;
    config.dpi = m_settings.extraction.renderDpi;
    m_orchestrator = std::make_unique<ExtractionOrchestrator>(
        *m_components.renderer, m_components.backends, config);
}

Engine::~Engine() = default;

std::unique_ptr<Engine> Engine::createDefault(const Settings& settings)
{
    const QString dataDir = settings.dataDir.isEmpty() ? SettingsManager::defaultDataDir()
                                                       : settings.dataDir;
    EngineComponents components;
    components.registry = std::make_unique<ModelRegistry>(
        ModelRegistry::resolveModelsDir(settings.modelsDir, dataDir));
    components.renderer = std::make_unique<PopplerPageRenderer>();
    components.backends = BackendFactory::create(settings.extraction, components.registry.get());

    auto embedder = std::make_shared<EmbeddingManager>(
        components.registry.get(), settings.embeddingRole, settings.embeddingBatchSize);
    if (!embedder->initialize()) {
        LOG_WARN(ildCore, "Embedding model '%s' unavailable; retrieval will be sparse-only",
                 qUtf8Printable(settings.embeddingRole));
    }
    components.embedder = std::move(embedder);

    return std::make_unique<Engine>(settings, std::move(components));
}

QString Engine::databasePath() const
{
    return QDir(m_settings.dataDir).filePath(QStringLiteral("inlegaldesk.db"));
}

QString Engine::denseIndexPath() const
{
    return QDir(m_settings.dataDir).filePath(QStringLiteral("dense.hnsw"));
}

QString Engine::denseMetaPath() const
{
    return QDir(m_settings.dataDir).filePath(QStringLiteral("dense.meta.json"));
}

bool Engine::isOpen() const
{
    return m_store != nullptr;
}

// ── Open ────────────────────────────────────────────────────

std::optional<IndexError> Engine::open()
{
    std::lock_guard<std::mutex> lock(m_writeMutex);

    if (!QDir().mkpath(m_settings.dataDir)) {
        m_indexError = makeIndexError(IndexError::Kind::StorageUnavailable,
                                      QStringLiteral("cannot create %1").arg(m_settings.dataDir));
        return m_indexError;
    }

    auto store = ChunkStore::open(databasePath());
    if (!store.has_value()) {
        m_indexError = makeIndexError(IndexError::Kind::StorageUnavailable,
                                      QStringLiteral("cannot open %1").arg(databasePath()));
        LOG_ERROR(ildCore, "%s", qUtf8Printable(m_indexError->message));
        return m_indexError;
    }
    m_store = std::make_unique<ChunkStore>(std::move(*store));
    m_labels = std::make_unique<LabelStore>(m_store->rawDb());
    m_postings = std::make_unique<PostingStore>(m_store->rawDb());
    if (!m_labels->isReady() || !m_postings->isReady()) {
        m_indexError = makeIndexError(IndexError::Kind::StorageUnavailable,
                                      QStringLiteral("index tables could not be prepared"));
        m_store.reset();
        return m_indexError;
    }

    replaceIndexes(true, true);
    m_indexError = loadIndexes();
    if (m_indexError) {
        LOG_WARN(ildIndex, "Index error at startup (%s): %s; run rebuild to recover",
                 qUtf8Printable(indexErrorKindToString(m_indexError->kind)),
                 qUtf8Printable(m_indexError->message));
    }
    return m_indexError;
}

void Engine::replaceIndexes(bool sparse, bool dense)
{
    std::unique_lock<std::shared_mutex> lock(m_componentsMutex);
    Embedder* embedder = m_components.embedder.get();

    if (sparse || !m_sparse) {
        m_sparse = std::make_unique<SparseIndex>(m_postings.get(), m_settings.bm25);
    }
    if (dense || !m_dense) {
        const ModelBinding binding = embedder && embedder->isAvailable() ? embedder->binding()
                                                                         : ModelBinding{};
        m_dense = std::make_unique<DenseIndex>(m_labels.get(), binding);
    }
    m_retriever = std::make_unique<HybridRetriever>(embedder, m_dense.get(), m_sparse.get(),
                                                    m_settings.retrieval);
    m_ingestor = std::make_unique<Ingestor>(*m_store, *m_orchestrator, m_chunker, embedder,
                                            *m_sparse, m_dense.get(),
                                            [this]() { return persistDense(); });
}

std::optional<IndexError> Engine::loadIndexes()
{
    const int storedChunks = m_store->chunkCount();
    const std::vector<Document> docs = m_store->listDocuments();
    const int embeddedChunks = std::accumulate(
        docs.begin(), docs.end(), 0,
        [](int sum, const Document& doc) { return sum + doc.embeddedChunkCount; });

    std::optional<IndexError> sparseError = m_sparse->load();
    if (!sparseError && m_sparse->size() != storedChunks) {
        sparseError = makeIndexError(IndexError::Kind::Corrupt,
                                     QStringLiteral("sparse index holds %1 chunks, store holds %2")
                                         .arg(m_sparse->size()).arg(storedChunks));
    }

    std::optional<IndexError> denseError;
    const bool denseFilesExist = QFileInfo::exists(denseIndexPath())
        || QFileInfo::exists(denseMetaPath());
    if (!denseFilesExist && m_labels->countMappings() == 0 && embeddedChunks == 0) {
        if (m_dense->binding().dimensions > 0 && !m_dense->create()) {
            LOG_WARN(ildIndex, "Fresh dense index could not be created");
        }
    } else {
        denseError = m_dense->load(denseIndexPath(), denseMetaPath());
        if (!denseError && m_dense->size() != embeddedChunks) {
            denseError = makeIndexError(
                IndexError::Kind::Corrupt,
                QStringLiteral("dense index holds %1 vectors, store expects %2")
                    .arg(m_dense->size()).arg(embeddedChunks));
        }
    }

    // A failed index starts empty; rebuildIndexes() restores it.
    if (sparseError || denseError) {
        replaceIndexes(sparseError.has_value(), denseError.has_value());
    }

    LOG_INFO(ildCore, "Engine opened: %d documents, %d chunks (sparse %d, dense %d)",
             static_cast<int>(docs.size()), storedChunks, m_sparse->size(), m_dense->size());
    return sparseError ? sparseError : denseError;
}

bool Engine::persistDense()
{
    if (!m_dense || !m_dense->isAvailable()) {
        return true;
    }
    return m_dense->save(denseIndexPath(), denseMetaPath());
}

// ── Ingestion ───────────────────────────────────────────────

IngestOutcome Engine::ingest(const QByteArray& pdfBytes, const QString& filename)
{
    if (!m_ingestor) {
        IngestOutcome outcome;
        outcome.error = IngestionError{IngestionError::Reason::StorageFailure,
                                       QStringLiteral("engine is not open")};
        return outcome;
    }

    PreparedDocument prepared;
    {
        std::lock_guard<std::mutex> extractLock(m_extractMutex);
        std::shared_lock<std::shared_mutex> componentsLock(m_componentsMutex);
        m_orchestrator->clearCancel();
        prepared = m_ingestor->prepare(pdfBytes, filename);
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    return m_ingestor->apply(prepared);
}

IngestOutcome Engine::ingestFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        IngestOutcome outcome;
        outcome.error = IngestionError{IngestionError::Reason::UnreadablePdf,
                                       QStringLiteral("cannot read %1: %2")
                                           .arg(path, file.errorString())};
        return outcome;
    }
    return ingest(file.readAll(), QFileInfo(path).fileName());
}

void Engine::requestCancel()
{
    m_orchestrator->requestCancel();
}

// ── Retrieval ───────────────────────────────────────────────

RetrievalResult Engine::retrieve(const QString& query, int k) const
{
    std::shared_lock<std::shared_mutex> lock(m_componentsMutex);
    if (!m_retriever) {
        RetrievalResult result;
        result.mode = RetrievalResult::Mode::NoSources;
        return result;
    }
    return m_retriever->retrieve(query, k);
}

AnswerContext Engine::answerContext(const QString& query, int maxResults) const
{
    const RetrievalResult retrieved = retrieve(query, maxResults);

    AnswerContext context;
    context.mode = retrieved.mode;
    context.degraded = retrieved.degraded;
    context.degradedReason = retrieved.degradedReason;
    if (!m_store) {
        return context;
    }

    std::unordered_map<QString, QString> filenames;
    for (const RetrievedChunk& hit : retrieved.hits) {
        auto chunk = m_store->getChunk(hit.chunkId);
        if (!chunk) {
            LOG_WARN(ildRetrieval, "Retrieved chunk %s is not in the store",
                     qUtf8Printable(hit.chunkId));
            continue;
        }
        auto nameIt = filenames.find(chunk->documentId);
        if (nameIt == filenames.end()) {
            const auto doc = m_store->getDocument(chunk->documentId);
            nameIt = filenames.emplace(chunk->documentId, doc ? doc->filename : QString()).first;
        }

        ContextPassage passage;
        passage.citation = static_cast<int>(context.passages.size()) + 1;
        passage.filename = nameIt->second;
        passage.firstPage = chunk->pageStart + 1;
        passage.lastPage = chunk->pageEnd + 1;
        passage.combinedScore = hit.combinedScore;
        passage.chunk = std::move(*chunk);
        context.passages.push_back(std::move(passage));
    }
    return context;
}

// ── Documents ───────────────────────────────────────────────

std::vector<Document> Engine::listDocuments() const
{
    return m_store ? m_store->listDocuments() : std::vector<Document>{};
}

std::optional<Document> Engine::getDocument(const QString& documentId) const
{
    return m_store ? m_store->getDocument(documentId) : std::nullopt;
}

int Engine::documentCount() const
{
    return m_store ? m_store->documentCount() : 0;
}

IndexStats Engine::indexStats() const
{
    IndexStats stats;
    std::shared_lock<std::shared_mutex> lock(m_componentsMutex);
    if (m_store) {
        stats.documents = m_store->documentCount();
        stats.chunks = m_store->chunkCount();
    }
    stats.sparseChunks = m_sparse ? m_sparse->size() : 0;
    stats.denseVectors = m_dense ? m_dense->size() : 0;
    return stats;
}

bool Engine::deleteDocument(const QString& documentId)
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (!m_store || !m_store->getDocument(documentId)) {
        return false;
    }

    const std::vector<QString> chunkIds = m_store->chunkIdsForDocument(documentId);
    if (!m_store->beginTransaction()) {
        return false;
    }
    for (const QString& chunkId : chunkIds) {
        m_sparse->remove(chunkId);
        m_dense->remove(chunkId);
    }
    if (!m_store->deleteDocument(documentId)) {
        m_store->rollbackTransaction();
        LOG_ERROR(ildCore, "Delete of %s failed; indexes reloaded from storage",
                  qUtf8Printable(documentId));
        replaceIndexes(true, true);
        m_indexError = loadIndexes();
        return false;
    }
    if (!m_dense->compactIfNeeded()) {
        LOG_WARN(ildIndex, "Dense compaction failed after deleting %s",
                 qUtf8Printable(documentId));
    }
    if (!persistDense() || !m_store->commitTransaction()) {
        m_store->rollbackTransaction();
        LOG_ERROR(ildCore, "Delete of %s could not be persisted; indexes reloaded",
                  qUtf8Printable(documentId));
        replaceIndexes(true, true);
        m_indexError = loadIndexes();
        return false;
    }

    LOG_INFO(ildCore, "Deleted document %s (%d chunks)", qUtf8Printable(documentId),
             static_cast<int>(chunkIds.size()));
    return true;
}

std::optional<IndexError> Engine::rebuildIndexes()
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (!m_store) {
        return makeIndexError(IndexError::Kind::StorageUnavailable,
                              QStringLiteral("engine is not open"));
    }

    if (!m_store->beginTransaction()) {
        return makeIndexError(IndexError::Kind::StorageUnavailable,
                              QStringLiteral("could not open a transaction"));
    }
    auto fail = [this](const QString& message) {
        m_store->rollbackTransaction();
        LOG_ERROR(ildIndex, "Rebuild failed: %s", qUtf8Printable(message));
        replaceIndexes(true, true);
        m_indexError = loadIndexes();
        return makeIndexError(IndexError::Kind::StorageUnavailable, message);
    };

    replaceIndexes(true, true);
    if (!m_sparse->clear()) {
        return fail(QStringLiteral("sparse postings could not be cleared"));
    }
    if (m_dense->binding().dimensions > 0) {
        if (!m_dense->create()) {
            return fail(QStringLiteral("dense index could not be created"));
        }
    } else if (!m_labels->clearAll()) {
        return fail(QStringLiteral("dense labels could not be cleared"));
    }

    int totalChunks = 0;
    int totalEmbedded = 0;
    for (const Document& doc : m_store->listDocuments()) {
        const std::vector<Chunk> chunks =
            m_store->getChunks(m_store->chunkIdsForDocument(doc.id));
        const std::optional<int> embedded = m_ingestor->indexChunks(chunks);
        if (!embedded) {
            return fail(QStringLiteral("indexing chunks of %1 failed").arg(doc.id));
        }
        if (!m_store->updateChunkCounts(doc.id, static_cast<int>(chunks.size()), *embedded)) {
            return fail(QStringLiteral("chunk counts of %1 could not be updated").arg(doc.id));
        }
        totalChunks += static_cast<int>(chunks.size());
        totalEmbedded += *embedded;
    }

    if (m_dense->isAvailable()) {
        if (!persistDense()) {
            return fail(QStringLiteral("dense index could not be persisted"));
        }
    } else {
        QFile::remove(denseIndexPath());
        QFile::remove(denseMetaPath());
    }
    if (!m_store->commitTransaction()) {
        return fail(QStringLiteral("commit failed"));
    }

    m_indexError.reset();
    LOG_INFO(ildIndex, "Rebuilt indexes: %d chunks, %d embedded", totalChunks, totalEmbedded);
    return std::nullopt;
}

} // namespace ild
