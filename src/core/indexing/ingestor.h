#pragma once

#include "core/extraction/extraction_orchestrator.h"
#include "core/indexing/chunker.h"
#include "core/shared/chunk.h"
#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>
#include <vector>

namespace ild {

class ChunkStore;
class DenseIndex;
class Embedder;
class SparseIndex;

// Produced by prepare() without touching storage; consumed by apply().
struct PreparedDocument {
    QString documentId;
    QString filename;
    QString contentHash;
    ExtractionRun run;
    std::vector<Chunk> chunks;
    std::vector<QStringList> chunkTokens;                 // one per chunk
    std::vector<std::optional<std::vector<float>>> vectors;  // one per chunk
    std::optional<IngestionError> failure;
    int prepDurationMs = 0;
};

struct IngestOutcome {
    std::optional<Document> document;
    std::optional<IngestionError> error;
    std::vector<PageResult> pages;
    int droppedDenseChunks = 0;
    int durationMs = 0;

    bool ok() const { return document.has_value(); }
};

// Ingestor -- PDF bytes to a stored, indexed Document.
//
// prepare() runs the expensive stages (extraction, chunking, tokenizing,
// embedding) and may run on any thread. apply() is the single writer: it
// stores the document, pages and chunks and updates both indexes inside
// one transaction, then calls the persist hook before committing. Any
// storage failure rolls everything back and is reported as
// storage_failure.
//
// A chunk whose embedding fails stays in the sparse index and is left out
// of the dense index; it never fails the document.
class Ingestor {
public:
    // Writes index state that lives outside the database (the dense graph).
    using PersistHook = std::function<bool()>;

    Ingestor(ChunkStore& store,
             ExtractionOrchestrator& orchestrator,
             const Chunker& chunker,
             Embedder* embedder,
             SparseIndex& sparse,
             DenseIndex* dense,
             PersistHook persist = {});

    PreparedDocument prepare(const QByteArray& pdfBytes, const QString& filename);
    IngestOutcome apply(const PreparedDocument& prepared);
    IngestOutcome ingest(const QByteArray& pdfBytes, const QString& filename);

    // Adds stored chunks to both indexes; used to rebuild them. Returns the
    // number of chunks that reached the dense index, or nullopt on a
    // storage failure.
    std::optional<int> indexChunks(const std::vector<Chunk>& chunks);

    static QString contentHash(const QByteArray& pdfBytes);

private:
    bool denseUsable() const;
    std::vector<std::optional<std::vector<float>>> embedChunks(const std::vector<Chunk>& chunks);
    void undoIndexUpdates(const std::vector<QString>& sparseAdded,
                          const std::vector<QString>& denseAdded);

    ChunkStore& m_store;
    ExtractionOrchestrator& m_orchestrator;
    const Chunker& m_chunker;
    Embedder* m_embedder = nullptr;
    SparseIndex& m_sparse;
    DenseIndex* m_dense = nullptr;
    PersistHook m_persist;
};

} // namespace ild
