#include "core/indexing/ingestor.h"
#include "core/embedding/embedder.h"
#include "core/index/chunk_store.h"
#include "core/lexical/lexical_tokenizer.h"
#include "core/lexical/sparse_index.h"
#include "core/shared/logging.h"
#include "core/vector/dense_index.h"

#include <QCryptographicHash>
#include <QDateTime>
#include <QElapsedTimer>
#include <QUuid>

namespace ild {

namespace {

IngestionError makeError(IngestionError::Reason reason, const QString& message)
{
    IngestionError error;
    error.reason = reason;
    error.message = message;
    return error;
}

} // namespace

// ── Construction ────────────────────────────────────────────

Ingestor::Ingestor(ChunkStore& store,
                   ExtractionOrchestrator& orchestrator,
                   const Chunker& chunker,
                   Embedder* embedder,
                   SparseIndex& sparse,
                   DenseIndex* dense,
                   PersistHook persist)
    : m_store(store)
    , m_orchestrator(orchestrator)
    , m_chunker(chunker)
    , m_embedder(embedder)
    , m_sparse(sparse)
    , m_dense(dense)
    , m_persist(std::move(persist))
{
}

QString Ingestor::contentHash(const QByteArray& pdfBytes)
{
    return QString::fromLatin1(
        QCryptographicHash::hash(pdfBytes, QCryptographicHash::Sha256).toHex());
}

bool Ingestor::denseUsable() const
{
    return m_embedder && m_embedder->isAvailable() && m_dense && m_dense->isAvailable()
        && m_embedder->binding() == m_dense->binding();
}

IngestOutcome Ingestor::ingest(const QByteArray& pdfBytes, const QString& filename)
{
    return apply(prepare(pdfBytes, filename));
}

// ── Prep stage ──────────────────────────────────────────────

PreparedDocument Ingestor::prepare(const QByteArray& pdfBytes, const QString& filename)
{
    QElapsedTimer timer;
    timer.start();

    PreparedDocument prepared;
    prepared.filename = filename;
    prepared.contentHash = contentHash(pdfBytes);

    prepared.run = m_orchestrator.extractDocument(pdfBytes);
    const ExtractionRun& run = prepared.run;

    if (run.documentError.has_value()) {
        prepared.failure = makeError(IngestionError::Reason::UnreadablePdf,
                                     run.documentError->errorMessage.value_or(
                                         QStringLiteral("PDF could not be opened")));
    } else if (run.cancelled) {
        prepared.failure = makeError(IngestionError::Reason::Cancelled,
                                     QStringLiteral("ingestion cancelled"));
    } else if (run.pageCount == 0) {
        prepared.failure = makeError(IngestionError::Reason::UnreadablePdf,
                                     QStringLiteral("PDF has no pages"));
    } else if (run.pagesWithText() == 0) {
        prepared.failure = makeError(IngestionError::Reason::NoTextExtracted,
                                     QStringLiteral("no backend produced text for any of %1 pages")
                                         .arg(run.pageCount));
    }

    if (prepared.failure) {
        LOG_WARN(ildCore, "Ingest of %s failed: %s (%s)", qUtf8Printable(filename),
                 qUtf8Printable(ingestionReasonToString(prepared.failure->reason)),
                 qUtf8Printable(prepared.failure->message));
        prepared.prepDurationMs = static_cast<int>(timer.elapsed());
        return prepared;
    }

    prepared.documentId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    prepared.chunks = m_chunker.chunk(prepared.documentId, run.text, run.offsets);

    prepared.chunkTokens.reserve(prepared.chunks.size());
    for (const Chunk& chunk : prepared.chunks) {
        prepared.chunkTokens.push_back(LexicalTokenizer::tokenize(chunk.text));
    }

    prepared.vectors = embedChunks(prepared.chunks);

    prepared.prepDurationMs = static_cast<int>(timer.elapsed());
    LOG_INFO(ildCore, "Prepared %s: %d pages (%d with text), %d chunks in %d ms",
             qUtf8Printable(filename), run.pageCount, run.pagesWithText(),
             static_cast<int>(prepared.chunks.size()), prepared.prepDurationMs);
    return prepared;
}

std::vector<std::optional<std::vector<float>>> Ingestor::embedChunks(
    const std::vector<Chunk>& chunks)
{
    std::vector<std::optional<std::vector<float>>> vectors(chunks.size());
    if (chunks.empty()) {
        return vectors;
    }
    if (!denseUsable()) {
        LOG_WARN(ildCore, "Dense indexing unavailable; %d chunks indexed sparse-only",
                 static_cast<int>(chunks.size()));
        return vectors;
    }

    std::vector<QString> texts;
    texts.reserve(chunks.size());
    for (const Chunk& chunk : chunks) {
        texts.push_back(chunk.text);
    }

    std::vector<EmbeddingResult> results = m_embedder->embedBatch(texts);
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (i < results.size() && results[i].ok()) {
            vectors[i] = std::move(results[i].vector);
            continue;
        }
        const QString reason = i < results.size()
            ? embeddingStatusToString(results[i].status)
            : QStringLiteral("missing result");
        LOG_WARN(ildCore, "Embedding failed for chunk %s (%s); dense entry dropped",
                 qUtf8Printable(chunks[i].chunkId), qUtf8Printable(reason));
    }
    return vectors;
}

// ── Writer stage ────────────────────────────────────────────

void Ingestor::undoIndexUpdates(const std::vector<QString>& sparseAdded,
                                const std::vector<QString>& denseAdded)
{
    for (const QString& chunkId : sparseAdded) {
        m_sparse.remove(chunkId);
    }
    if (m_dense) {
        for (const QString& chunkId : denseAdded) {
            m_dense->remove(chunkId);
        }
    }
}

IngestOutcome Ingestor::apply(const PreparedDocument& prepared)
{
    QElapsedTimer timer;
    timer.start();

    IngestOutcome outcome;
    outcome.pages = prepared.run.pages;
    if (prepared.failure) {
        outcome.error = prepared.failure;
        outcome.durationMs = prepared.prepDurationMs;
        return outcome;
    }

    const QStringList duplicates = m_store.documentsWithHash(prepared.contentHash);
    if (!duplicates.isEmpty()) {
        LOG_INFO(ildCore, "%s has the same content as %s; storing as a new document",
                 qUtf8Printable(prepared.filename), qUtf8Printable(duplicates.first()));
    }

    Document doc;
    doc.id = prepared.documentId;
    doc.filename = prepared.filename;
    doc.pageCount = prepared.run.pageCount;
    doc.ingestedAt = QDateTime::currentDateTimeUtc();
    doc.contentHash = prepared.contentHash;
    for (const PageResult& page : prepared.run.pages) {
        doc.pageConfidences.push_back(page.confidence);
        doc.pageBackends.append(page.backendName);
    }

    auto storageFailure = [&](const QString& message) {
        LOG_ERROR(ildCore, "Ingest of %s failed: %s", qUtf8Printable(prepared.filename),
                  qUtf8Printable(message));
        outcome.error = makeError(IngestionError::Reason::StorageFailure, message);
        outcome.durationMs = prepared.prepDurationMs + static_cast<int>(timer.elapsed());
        return outcome;
    };

    if (!m_store.beginTransaction()) {
        return storageFailure(QStringLiteral("could not open a transaction"));
    }

    std::vector<QString> sparseAdded;
    std::vector<QString> denseAdded;
    auto rollback = [&](const QString& message) {
        m_store.rollbackTransaction();
        undoIndexUpdates(sparseAdded, denseAdded);
        if (!denseAdded.empty() && m_persist && !m_persist()) {
            LOG_ERROR(ildCore, "Dense index could not be re-persisted after rollback");
        }
        return storageFailure(message);
    };

    if (!m_store.insertDocument(doc, prepared.run.text, prepared.run.pages,
                                prepared.run.offsets)) {
        return rollback(QStringLiteral("document row insert failed"));
    }
    if (!m_store.insertChunks(prepared.chunks)) {
        return rollback(QStringLiteral("chunk insert failed"));
    }

    for (size_t i = 0; i < prepared.chunks.size(); ++i) {
        const QString& chunkId = prepared.chunks[i].chunkId;
        if (!m_sparse.add(chunkId, prepared.chunkTokens[i])) {
            return rollback(QStringLiteral("sparse index update failed for chunk %1").arg(chunkId));
        }
        sparseAdded.push_back(chunkId);

        if (!prepared.vectors[i].has_value()) {
            ++outcome.droppedDenseChunks;
            continue;
        }
        if (!m_dense || !m_dense->add(chunkId, *prepared.vectors[i])) {
            LOG_WARN(ildCore, "Dense add failed for chunk %s; kept sparse-only",
                     qUtf8Printable(chunkId));
            ++outcome.droppedDenseChunks;
            continue;
        }
        denseAdded.push_back(chunkId);
    }

    doc.chunkCount = static_cast<int>(prepared.chunks.size());
    doc.embeddedChunkCount = static_cast<int>(denseAdded.size());
    if (!m_store.updateChunkCounts(doc.id, doc.chunkCount, doc.embeddedChunkCount)) {
        return rollback(QStringLiteral("chunk count update failed"));
    }

    if (!denseAdded.empty() && m_persist && !m_persist()) {
        return rollback(QStringLiteral("dense index could not be persisted"));
    }
    if (!m_store.commitTransaction()) {
        return rollback(QStringLiteral("commit failed"));
    }

    outcome.document = doc;
    outcome.durationMs = prepared.prepDurationMs + static_cast<int>(timer.elapsed());
    LOG_INFO(ildCore, "Ingested %s as %s: %d pages, %d chunks (%d embedded) in %d ms",
             qUtf8Printable(doc.filename), qUtf8Printable(doc.id), doc.pageCount,
             doc.chunkCount, doc.embeddedChunkCount, outcome.durationMs);
    return outcome;
}

// ── Rebuild ─────────────────────────────────────────────────

std::optional<int> Ingestor::indexChunks(const std::vector<Chunk>& chunks)
{
    const std::vector<std::optional<std::vector<float>>> vectors = embedChunks(chunks);

    int embedded = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (!m_sparse.add(chunks[i].chunkId, LexicalTokenizer::tokenize(chunks[i].text))) {
            return std::nullopt;
        }
        if (vectors[i].has_value() && m_dense && m_dense->add(chunks[i].chunkId, *vectors[i])) {
            ++embedded;
        }
    }
    return embedded;
}

} // namespace ild
