#include <QtTest/QtTest>
#include "core/index/chunk_store.h"
#include "core/shared/chunk.h"

#include <QTemporaryDir>

#include <sqlite3.h>

using ild::Chunk;
using ild::ChunkStore;
using ild::Document;
using ild::PageOffset;
using ild::PageOutcome;
using ild::PageResult;

namespace {

Document makeDocument(const QString& id, qint64 ingestedMs = 1700000000000LL,
                      const QString& hash = QStringLiteral("hash-a"))
{
    Document doc;
    doc.id = id;
    doc.filename = id + QStringLiteral(".pdf");
    doc.pageCount = 2;
    doc.ingestedAt = QDateTime::fromMSecsSinceEpoch(ingestedMs).toUTC();
    doc.contentHash = hash;
    return doc;
}

std::vector<PageResult> twoPages()
{
    PageResult first;
    first.pageIndex = 0;
    first.text = QStringLiteral("धारा 302");
    first.confidence = 0.92;
    first.backendName = QStringLiteral("donut");
    first.outcome = PageOutcome::Extracted;
    first.attemptedBackends = {QStringLiteral("donut")};
    first.durationMs = 1200;

    PageResult second;
    second.pageIndex = 1;
    second.outcome = PageOutcome::Exhausted;
    second.attemptedBackends = {QStringLiteral("donut"), QStringLiteral("tesseract")};
    return {first, second};
}

std::vector<PageOffset> twoOffsets()
{
    return {PageOffset{0, 0, 8}, PageOffset{1, 8, 8}};
}

Chunk makeChunk(const QString& documentId, int sequence, const QString& text)
{
    Chunk chunk;
    chunk.documentId = documentId;
    chunk.sequenceIndex = sequence;
    chunk.tokenStart = sequence * 160;
    chunk.tokenCount = 200;
    chunk.chunkId = ild::computeChunkId(documentId, chunk.tokenStart);
    chunk.charStart = sequence * 10;
    chunk.charEnd = sequence * 10 + 10;
    chunk.pageStart = 0;
    chunk.pageEnd = sequence;
    chunk.text = text;
    return chunk;
}

} // namespace

class TestChunkStore : public QObject {
    Q_OBJECT

private slots:
    // ── Documents ────────────────────────────────────────────────
    void testInsertAndGetDocument();
    void testPagesRoundTrip();
    void testGetMissingDocument();
    void testListDocumentsOrderedByIngestion();
    void testDocumentsWithHash();
    void testUpdateChunkCounts();
    void testDuplicateDocumentIdRejected();

    // ── Chunks ───────────────────────────────────────────────────
    void testInsertAndGetChunks();
    void testGetChunksKeepsInputOrder();
    void testDuplicateSequenceRollsBackBatch();
    void testChunkForUnknownDocumentRejected();
    void testAllChunksOrder();

    // ── Deletion and transactions ────────────────────────────────
    void testDeleteCascades();
    void testRollbackDiscardsWrites();

    // ── Files ────────────────────────────────────────────────────
    void testReopenFromDisk();
    void testNewerSchemaRejected();
};

// ── Documents ────────────────────────────────────────────────────

void TestChunkStore::testInsertAndGetDocument()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());

    const Document doc = makeDocument(QStringLiteral("doc-1"));
    QVERIFY(store->insertDocument(doc, QStringLiteral("धारा 302"), twoPages(), twoOffsets()));
    QCOMPARE(store->documentCount(), 1);

    const auto loaded = store->getDocument(QStringLiteral("doc-1"));
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->filename, QStringLiteral("doc-1.pdf"));
    QCOMPARE(loaded->pageCount, 2);
    QCOMPARE(loaded->contentHash, QStringLiteral("hash-a"));
    QVERIFY(qAbs(loaded->ingestedAt.toMSecsSinceEpoch() - doc.ingestedAt.toMSecsSinceEpoch()) <= 1);
    QCOMPARE(static_cast<int>(loaded->pageConfidences.size()), 2);
    QCOMPARE(loaded->pageConfidences[0], 0.92);
    QCOMPARE(loaded->pageConfidences[1], 0.0);
    QCOMPARE(loaded->pageBackends, (QStringList{QStringLiteral("donut"), QString()}));
    QCOMPARE(store->documentText(QStringLiteral("doc-1")).value_or(QString()),
             QStringLiteral("धारा 302"));
}

void TestChunkStore::testPagesRoundTrip()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("doc-1")), QStringLiteral("धारा 302"),
                                  twoPages(), twoOffsets()));

    const auto rows = store->pagesForDocument(QStringLiteral("doc-1"));
    QCOMPARE(static_cast<int>(rows.size()), 2);
    QCOMPARE(rows[0].page.outcome, PageOutcome::Extracted);
    QCOMPARE(rows[0].page.durationMs, 1200);
    QCOMPARE(rows[0].offset.charEnd, 8);
    QCOMPARE(rows[1].page.outcome, PageOutcome::Exhausted);
    QCOMPARE(rows[1].page.attemptedBackends,
             (QStringList{QStringLiteral("donut"), QStringLiteral("tesseract")}));
    QCOMPARE(rows[1].offset.charStart, rows[1].offset.charEnd);
}

void TestChunkStore::testGetMissingDocument()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(!store->getDocument(QStringLiteral("nope")).has_value());
    QVERIFY(!store->documentText(QStringLiteral("nope")).has_value());
    QVERIFY(store->pagesForDocument(QStringLiteral("nope")).empty());
}

void TestChunkStore::testListDocumentsOrderedByIngestion()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("late"), 1700000005000LL),
                                  QStringLiteral("x"), {}, {}));
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("early"), 1700000001000LL),
                                  QStringLiteral("y"), {}, {}));

    const auto docs = store->listDocuments();
    QCOMPARE(static_cast<int>(docs.size()), 2);
    QCOMPARE(docs[0].id, QStringLiteral("early"));
    QCOMPARE(docs[1].id, QStringLiteral("late"));
}

void TestChunkStore::testDocumentsWithHash()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("a"), 1000, QStringLiteral("h1")),
                                  QStringLiteral("x"), {}, {}));
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("b"), 2000, QStringLiteral("h1")),
                                  QStringLiteral("x"), {}, {}));
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("c"), 3000, QStringLiteral("h2")),
                                  QStringLiteral("y"), {}, {}));

    QCOMPARE(store->documentsWithHash(QStringLiteral("h1")),
             (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
    QVERIFY(store->documentsWithHash(QStringLiteral("h3")).isEmpty());
}

void TestChunkStore::testUpdateChunkCounts()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("doc-1")), QStringLiteral("x"), {}, {}));

    QVERIFY(store->updateChunkCounts(QStringLiteral("doc-1"), 12, 9));
    const auto doc = store->getDocument(QStringLiteral("doc-1"));
    QCOMPARE(doc->chunkCount, 12);
    QCOMPARE(doc->embeddedChunkCount, 9);

    QVERIFY(!store->updateChunkCounts(QStringLiteral("missing"), 1, 1));
}

void TestChunkStore::testDuplicateDocumentIdRejected()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("doc-1")), QStringLiteral("x"),
                                  twoPages(), twoOffsets()));
    QVERIFY(!store->insertDocument(makeDocument(QStringLiteral("doc-1")), QStringLiteral("x"),
                                   twoPages(), twoOffsets()));
    QCOMPARE(store->documentCount(), 1);
    QCOMPARE(static_cast<int>(store->pagesForDocument(QStringLiteral("doc-1")).size()), 2);
}

// ── Chunks ───────────────────────────────────────────────────────

void TestChunkStore::testInsertAndGetChunks()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("doc-1")), QStringLiteral("x"), {}, {}));

    const Chunk c0 = makeChunk(QStringLiteral("doc-1"), 0, QStringLiteral("धारा 302 हत्या"));
    const Chunk c1 = makeChunk(QStringLiteral("doc-1"), 1, QStringLiteral("punishment for murder"));
    QVERIFY(store->insertChunks({c0, c1}));
    QCOMPARE(store->chunkCount(), 2);

    const auto loaded = store->getChunk(c1.chunkId);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->documentId, QStringLiteral("doc-1"));
    QCOMPARE(loaded->sequenceIndex, 1);
    QCOMPARE(loaded->tokenStart, 160);
    QCOMPARE(loaded->tokenCount, 200);
    QCOMPARE(loaded->charStart, 10);
    QCOMPARE(loaded->charEnd, 20);
    QCOMPARE(loaded->pageEnd, 1);
    QCOMPARE(loaded->text, QStringLiteral("punishment for murder"));

    QVERIFY(store->chunkIdsForDocument(QStringLiteral("doc-1"))
            == (std::vector<QString>{c0.chunkId, c1.chunkId}));
    QVERIFY(!store->getChunk(QStringLiteral("missing")).has_value());
}

void TestChunkStore::testGetChunksKeepsInputOrder()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("doc-1")), QStringLiteral("x"), {}, {}));
    const Chunk c0 = makeChunk(QStringLiteral("doc-1"), 0, QStringLiteral("zero"));
    const Chunk c1 = makeChunk(QStringLiteral("doc-1"), 1, QStringLiteral("one"));
    const Chunk c2 = makeChunk(QStringLiteral("doc-1"), 2, QStringLiteral("two"));
    QVERIFY(store->insertChunks({c0, c1, c2}));

    const auto chunks = store->getChunks({c2.chunkId, QStringLiteral("ghost"), c0.chunkId});
    QCOMPARE(static_cast<int>(chunks.size()), 2);
    QCOMPARE(chunks[0].text, QStringLiteral("two"));
    QCOMPARE(chunks[1].text, QStringLiteral("zero"));
}

void TestChunkStore::testDuplicateSequenceRollsBackBatch()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("doc-1")), QStringLiteral("x"), {}, {}));

    Chunk clash = makeChunk(QStringLiteral("doc-1"), 0, QStringLiteral("clash"));
    clash.chunkId = QStringLiteral("different-id");
    QVERIFY(!store->insertChunks({makeChunk(QStringLiteral("doc-1"), 0, QStringLiteral("a")), clash}));
    QCOMPARE(store->chunkCount(), 0);
}

void TestChunkStore::testChunkForUnknownDocumentRejected()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(!store->insertChunks({makeChunk(QStringLiteral("orphan"), 0, QStringLiteral("a"))}));
    QCOMPARE(store->chunkCount(), 0);
}

void TestChunkStore::testAllChunksOrder()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("second"), 2000), QStringLiteral("x"), {}, {}));
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("first"), 1000), QStringLiteral("y"), {}, {}));
    QVERIFY(store->insertChunks({makeChunk(QStringLiteral("second"), 1, QStringLiteral("s1")),
                                 makeChunk(QStringLiteral("second"), 0, QStringLiteral("s0"))}));
    QVERIFY(store->insertChunks({makeChunk(QStringLiteral("first"), 0, QStringLiteral("f0"))}));

    const auto chunks = store->allChunks();
    QCOMPARE(static_cast<int>(chunks.size()), 3);
    QCOMPARE(chunks[0].text, QStringLiteral("f0"));
    QCOMPARE(chunks[1].text, QStringLiteral("s0"));
    QCOMPARE(chunks[2].text, QStringLiteral("s1"));
}

// ── Deletion and transactions ────────────────────────────────────

void TestChunkStore::testDeleteCascades()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("doc-1")), QStringLiteral("x"),
                                  twoPages(), twoOffsets()));
    QVERIFY(store->insertChunks({makeChunk(QStringLiteral("doc-1"), 0, QStringLiteral("a"))}));

    QVERIFY(store->deleteDocument(QStringLiteral("doc-1")));
    QCOMPARE(store->documentCount(), 0);
    QCOMPARE(store->chunkCount(), 0);
    QVERIFY(store->pagesForDocument(QStringLiteral("doc-1")).empty());
    QVERIFY(!store->deleteDocument(QStringLiteral("doc-1")));
}

void TestChunkStore::testRollbackDiscardsWrites()
{
    auto store = ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());

    QVERIFY(store->beginTransaction());
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("doc-1")), QStringLiteral("x"),
                                  twoPages(), twoOffsets()));
    QVERIFY(store->insertChunks({makeChunk(QStringLiteral("doc-1"), 0, QStringLiteral("a"))}));
    QVERIFY(store->rollbackTransaction());

    QCOMPARE(store->documentCount(), 0);
    QCOMPARE(store->chunkCount(), 0);

    QVERIFY(store->beginTransaction());
    QVERIFY(store->insertDocument(makeDocument(QStringLiteral("doc-2")), QStringLiteral("x"), {}, {}));
    QVERIFY(store->commitTransaction());
    QCOMPARE(store->documentCount(), 1);
}

// ── Files ────────────────────────────────────────────────────────

void TestChunkStore::testReopenFromDisk()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + QStringLiteral("/inlegaldesk.db");

    {
        auto store = ChunkStore::open(path);
        QVERIFY(store.has_value());
        QVERIFY(store->insertDocument(makeDocument(QStringLiteral("doc-1")), QStringLiteral("x"),
                                      twoPages(), twoOffsets()));
        QVERIFY(store->insertChunks({makeChunk(QStringLiteral("doc-1"), 0, QStringLiteral("a"))}));
    }

    auto reopened = ChunkStore::open(path);
    QVERIFY(reopened.has_value());
    QCOMPARE(reopened->documentCount(), 1);
    QCOMPARE(reopened->chunkCount(), 1);
}

void TestChunkStore::testNewerSchemaRejected()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + QStringLiteral("/inlegaldesk.db");

    {
        auto store = ChunkStore::open(path);
        QVERIFY(store.has_value());
        QCOMPARE(sqlite3_exec(store->rawDb(), "PRAGMA user_version = 99", nullptr, nullptr, nullptr),
                 SQLITE_OK);
    }
    QVERIFY(!ChunkStore::open(path).has_value());
}

QTEST_MAIN(TestChunkStore)
#include "test_chunk_store.moc"
