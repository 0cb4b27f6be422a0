#pragma once

#include "core/extraction/extractor_backend.h"
#include "core/extraction/page_renderer.h"
#include "core/indexing/ingestor.h"
#include "core/retrieval/hybrid_retriever.h"
#include "core/shared/chunk.h"
#include "core/shared/errors.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QByteArray>
#include <QString>

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <vector>

namespace ild {

class ChunkStore;
class DenseIndex;
class Embedder;
class ExtractionOrchestrator;
class LabelStore;
class ModelRegistry;
class PostingStore;
class SparseIndex;

// Parts the engine runs on. createDefault() builds the production set;
// tests inject scripted ones.
struct EngineComponents {
    std::unique_ptr<PageRenderer> renderer;
    std::vector<std::shared_ptr<ExtractorBackend>> backends;
    std::shared_ptr<Embedder> embedder;          // may be null: sparse-only
    std::unique_ptr<ModelRegistry> registry;     // kept alive for backends/embedder
};

// One numbered source handed to the answer generator.
struct ContextPassage {
    int citation = 0;           // 1-based, rendered as "[n]"
    Chunk chunk;
    QString filename;
    int firstPage = 0;          // 1-based
    int lastPage = 0;           // 1-based
    double combinedScore = 0.0;

    QString citationLabel() const;
};

struct AnswerContext {
    RetrievalResult::Mode mode = RetrievalResult::Mode::Hybrid;
    bool degraded = false;
    QString degradedReason;
    std::vector<ContextPassage> passages;

    bool noSources() const { return mode == RetrievalResult::Mode::NoSources; }

    // "[1] file.pdf, p. 2\n<text>\n\n[2] ..." in citation order.
    QString formatted() const;
};

// Row and entry counts across the store and both indexes.
struct IndexStats {
    int documents = 0;
    int chunks = 0;
    int sparseChunks = 0;
    int denseVectors = 0;
};

// Engine -- the public surface: ingestion, retrieval, document management.
//
// State lives under Settings::dataDir:
//   inlegaldesk.db        documents, pages, chunks, sparse postings, label map
//   dense.hnsw            dense graph
//   dense.meta.json       dense sidecar (model binding, counts)
//
// Writes (ingest apply, delete, rebuild) are serialized; retrieval runs
// concurrently with them and may observe a partially applied document.
class Engine {
public:
    Engine(Settings settings, EngineComponents components);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Production wiring: Poppler renderer, backends from settings, ONNX
    // embedder for Settings::embeddingRole.
    static std::unique_ptr<Engine> createDefault(const Settings& settings);

    // Opens the chunk store and loads both indexes. A StorageUnavailable
    // error leaves the engine unusable; any other error leaves the affected
    // index empty until rebuildIndexes().
    std::optional<IndexError> open();
    bool isOpen() const;
    const std::optional<IndexError>& indexError() const { return m_indexError; }

    // ── Ingestion ───────────────────────────────────────────

    IngestOutcome ingest(const QByteArray& pdfBytes, const QString& filename);
    IngestOutcome ingestFile(const QString& path);
    void requestCancel();

    // ── Retrieval ───────────────────────────────────────────

    RetrievalResult retrieve(const QString& query, int k = 0) const;
    AnswerContext answerContext(const QString& query, int maxResults = 0) const;

    // ── Documents ───────────────────────────────────────────

    std::vector<Document> listDocuments() const;
    std::optional<Document> getDocument(const QString& documentId) const;
    int documentCount() const;
    IndexStats indexStats() const;
    // Removes the document with its chunks, postings and vectors.
    bool deleteDocument(const QString& documentId);

    // Recreates the sparse and dense indexes from the stored chunks,
    // re-embedding with the current embedder.
    std::optional<IndexError> rebuildIndexes();

    const Settings& settings() const { return m_settings; }
    QString databasePath() const;
    QString denseIndexPath() const;
    QString denseMetaPath() const;

private:
    // Callers hold m_writeMutex.
    std::optional<IndexError> loadIndexes();
    void replaceIndexes(bool sparse, bool dense);
    bool persistDense();

    Settings m_settings;
    EngineComponents m_components;
    Chunker m_chunker;

    std::unique_ptr<ExtractionOrchestrator> m_orchestrator;
    std::unique_ptr<ChunkStore> m_store;
    std::unique_ptr<LabelStore> m_labels;
    std::unique_ptr<PostingStore> m_postings;
    std::unique_ptr<DenseIndex> m_dense;
    std::unique_ptr<SparseIndex> m_sparse;
    std::unique_ptr<HybridRetriever> m_retriever;
    std::unique_ptr<Ingestor> m_ingestor;

    std::optional<IndexError> m_indexError;
    std::mutex m_extractMutex;
    std::mutex m_writeMutex;
    // Guards swapping the index objects against concurrent readers.
    mutable std::shared_mutex m_componentsMutex;
};

} // namespace ild
