#include <QtTest/QtTest>
#include "core/index/chunk_store.h"
#include "core/vector/dense_index.h"
#include "core/vector/label_store.h"

#include <QFile>
#include <QTemporaryDir>

#include <cmath>

using ild::DenseIndex;
using ild::IndexError;
using ild::LabelStore;
using ild::ModelBinding;

namespace {

constexpr int kDims = 16;

ModelBinding testBinding(const QString& generation = QStringLiteral("v1"))
{
    return ModelBinding{QStringLiteral("e5-small-test"), generation, kDims};
}

std::vector<float> axis(int dim)
{
    std::vector<float> vector(static_cast<size_t>(kDims), 0.0F);
    vector[static_cast<size_t>(dim % kDims)] = 1.0F;
    return vector;
}

} // namespace

class TestDenseIndex : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── In-memory behavior ───────────────────────────────────────
    void testSearchScoresAreCosine();
    void testEmptyIndexSearchIsEmpty();
    void testDimensionMismatchRejected();
    void testReAddReplacesVector();
    void testRemove();
    void testTiesOrderedByChunkId();
    void testUnavailableBeforeCreate();

    // ── Persistence ──────────────────────────────────────────────
    void testSaveAndLoadWithLabels();
    void testLoadMissingFiles();
    void testLoadModelMismatch();
    void testLoadAdoptsStoredBinding();
    void testLoadCorruptSidecar();
    void testLoadLabelCountMismatch();
    void testCreateClearsStoredLabels();

    // ── Compaction ───────────────────────────────────────────────
    void testCompactionRemapsLabels();

private:
    QString indexPath() const { return m_dir->path() + QStringLiteral("/dense.hnsw"); }
    QString metaPath() const { return m_dir->path() + QStringLiteral("/dense.meta.json"); }

    std::unique_ptr<QTemporaryDir> m_dir;
    std::optional<ild::ChunkStore> m_store;
    std::unique_ptr<LabelStore> m_labels;
};

void TestDenseIndex::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = ild::ChunkStore::open(QStringLiteral(":memory:"));
    QVERIFY(m_store.has_value());
    m_labels = std::make_unique<LabelStore>(m_store->rawDb());
    QVERIFY(m_labels->isReady());
}

void TestDenseIndex::cleanup()
{
    m_labels.reset();
    m_store.reset();
    m_dir.reset();
}

// ── In-memory behavior ───────────────────────────────────────────

void TestDenseIndex::testSearchScoresAreCosine()
{
    DenseIndex index(nullptr, testBinding());
    QVERIFY(index.create());
    QVERIFY(index.add(QStringLiteral("same"), axis(0)));
    QVERIFY(index.add(QStringLiteral("orthogonal"), axis(1)));

    const auto hits = index.search(axis(0), 2);
    QVERIFY(hits.has_value());
    QCOMPARE(static_cast<int>(hits->size()), 2);
    QCOMPARE(hits->front().chunkId, QStringLiteral("same"));
    QVERIFY(std::fabs(hits->front().score - 1.0) < 1e-5);
    QVERIFY(std::fabs(hits->back().score) < 1e-5);
}

void TestDenseIndex::testEmptyIndexSearchIsEmpty()
{
    DenseIndex index(nullptr, testBinding());
    QVERIFY(index.create());
    const auto hits = index.search(axis(0), 5);
    QVERIFY(hits.has_value());
    QVERIFY(hits->empty());
}

void TestDenseIndex::testDimensionMismatchRejected()
{
    DenseIndex index(nullptr, testBinding());
    QVERIFY(index.create());
    QVERIFY(!index.add(QStringLiteral("short"), std::vector<float>(8, 0.5F)));
    QVERIFY(index.add(QStringLiteral("ok"), axis(3)));
    QVERIFY(!index.search(std::vector<float>(8, 0.5F), 3).has_value());
}

void TestDenseIndex::testReAddReplacesVector()
{
    DenseIndex index(m_labels.get(), testBinding());
    QVERIFY(index.create());
    QVERIFY(index.add(QStringLiteral("c1"), axis(0)));
    QVERIFY(index.add(QStringLiteral("c1"), axis(4)));

    QCOMPARE(index.size(), 1);
    QCOMPARE(m_labels->countMappings(), 1);
    const auto hits = index.search(axis(4), 1);
    QVERIFY(hits.has_value());
    QCOMPARE(hits->front().chunkId, QStringLiteral("c1"));
    QVERIFY(hits->front().score > 0.99);
}

void TestDenseIndex::testRemove()
{
    DenseIndex index(m_labels.get(), testBinding());
    QVERIFY(index.create());
    QVERIFY(index.add(QStringLiteral("c1"), axis(0)));
    QVERIFY(index.add(QStringLiteral("c2"), axis(1)));

    QVERIFY(index.remove(QStringLiteral("c1")));
    QVERIFY(!index.contains(QStringLiteral("c1")));
    QVERIFY(!index.remove(QStringLiteral("c1")));
    QCOMPARE(index.size(), 1);
    QVERIFY(!m_labels->getLabel(QStringLiteral("c1")).has_value());

    const auto hits = index.search(axis(0), 5);
    QVERIFY(hits.has_value());
    for (const auto& hit : *hits) {
        QVERIFY(hit.chunkId != QStringLiteral("c1"));
    }
}

void TestDenseIndex::testTiesOrderedByChunkId()
{
    DenseIndex index(nullptr, testBinding());
    QVERIFY(index.create());
    QVERIFY(index.add(QStringLiteral("zeta"), axis(2)));
    QVERIFY(index.add(QStringLiteral("alpha"), axis(2)));

    const auto hits = index.search(axis(2), 2);
    QVERIFY(hits.has_value());
    QCOMPARE((*hits)[0].chunkId, QStringLiteral("alpha"));
    QCOMPARE((*hits)[1].chunkId, QStringLiteral("zeta"));
}

void TestDenseIndex::testUnavailableBeforeCreate()
{
    DenseIndex index(nullptr, testBinding());
    QVERIFY(!index.isAvailable());
    QVERIFY(!index.add(QStringLiteral("c1"), axis(0)));
    QCOMPARE(index.size(), 0);
}

// ── Persistence ──────────────────────────────────────────────────

void TestDenseIndex::testSaveAndLoadWithLabels()
{
    {
        DenseIndex writer(m_labels.get(), testBinding());
        QVERIFY(writer.create());
        for (int i = 0; i < 3; ++i) {
            QVERIFY(writer.add(QStringLiteral("c%1").arg(i), axis(i)));
        }
        QVERIFY(writer.save(indexPath(), metaPath()));
    }

    DenseIndex reader(m_labels.get(), testBinding());
    QVERIFY(!reader.load(indexPath(), metaPath()).has_value());
    QCOMPARE(reader.size(), 3);
    QVERIFY(reader.contains(QStringLiteral("c2")));

    const auto hits = reader.search(axis(1), 1);
    QVERIFY(hits.has_value());
    QCOMPARE(hits->front().chunkId, QStringLiteral("c1"));
}

void TestDenseIndex::testLoadMissingFiles()
{
    DenseIndex index(m_labels.get(), testBinding());
    const auto error = index.load(indexPath(), metaPath());
    QVERIFY(error.has_value());
    QCOMPARE(error->kind, IndexError::Kind::Missing);
}

void TestDenseIndex::testLoadModelMismatch()
{
    {
        DenseIndex writer(m_labels.get(), testBinding(QStringLiteral("v1")));
        QVERIFY(writer.create());
        QVERIFY(writer.add(QStringLiteral("c0"), axis(0)));
        QVERIFY(writer.save(indexPath(), metaPath()));
    }

    DenseIndex reader(m_labels.get(), testBinding(QStringLiteral("v2")));
    const auto error = reader.load(indexPath(), metaPath());
    QVERIFY(error.has_value());
    QCOMPARE(error->kind, IndexError::Kind::ModelMismatch);
    QVERIFY(!reader.isAvailable());
}

void TestDenseIndex::testLoadAdoptsStoredBinding()
{
    {
        DenseIndex writer(m_labels.get(), testBinding(QStringLiteral("g3")));
        QVERIFY(writer.create());
        QVERIFY(writer.add(QStringLiteral("c0"), axis(0)));
        QVERIFY(writer.save(indexPath(), metaPath()));
    }

    DenseIndex reader(m_labels.get(), ModelBinding{});
    QVERIFY(!reader.load(indexPath(), metaPath()).has_value());
    QVERIFY(reader.binding() == testBinding(QStringLiteral("g3")));
}

void TestDenseIndex::testLoadCorruptSidecar()
{
    {
        DenseIndex writer(m_labels.get(), testBinding());
        QVERIFY(writer.create());
        QVERIFY(writer.add(QStringLiteral("c0"), axis(0)));
        QVERIFY(writer.save(indexPath(), metaPath()));
    }
    {
        QFile meta(metaPath());
        QVERIFY(meta.open(QIODevice::WriteOnly | QIODevice::Truncate));
        meta.write("{\"dimensions\": \"sixteen\"");
    }

    DenseIndex reader(m_labels.get(), testBinding());
    const auto error = reader.load(indexPath(), metaPath());
    QVERIFY(error.has_value());
    QCOMPARE(error->kind, IndexError::Kind::Corrupt);
}

void TestDenseIndex::testLoadLabelCountMismatch()
{
    {
        DenseIndex writer(m_labels.get(), testBinding());
        QVERIFY(writer.create());
        QVERIFY(writer.add(QStringLiteral("c0"), axis(0)));
        QVERIFY(writer.add(QStringLiteral("c1"), axis(1)));
        QVERIFY(writer.save(indexPath(), metaPath()));
    }
    // Labels written after the graph was saved no longer agree with it.
    QVERIFY(m_labels->removeMapping(QStringLiteral("c1")));

    DenseIndex reader(m_labels.get(), testBinding());
    const auto error = reader.load(indexPath(), metaPath());
    QVERIFY(error.has_value());
    QCOMPARE(error->kind, IndexError::Kind::Corrupt);
}

void TestDenseIndex::testCreateClearsStoredLabels()
{
    DenseIndex index(m_labels.get(), testBinding());
    QVERIFY(index.create());
    QVERIFY(index.add(QStringLiteral("c0"), axis(0)));
    QCOMPARE(m_labels->countMappings(), 1);

    QVERIFY(index.create());
    QCOMPARE(m_labels->countMappings(), 0);
    QCOMPARE(index.size(), 0);
}

// ── Compaction ───────────────────────────────────────────────────

void TestDenseIndex::testCompactionRemapsLabels()
{
    DenseIndex index(m_labels.get(), testBinding());
    QVERIFY(index.create());
    for (int i = 0; i < 10; ++i) {
        QVERIFY(index.add(QStringLiteral("c%1").arg(i), axis(i)));
    }
    for (int i = 0; i < 3; ++i) {
        QVERIFY(index.remove(QStringLiteral("c%1").arg(i)));
    }

    QVERIFY(index.compactIfNeeded());
    QCOMPARE(index.size(), 7);
    QCOMPARE(m_labels->countMappings(), 7);
    for (const auto& [chunkId, label] : m_labels->getAllMappings()) {
        Q_UNUSED(chunkId);
        QVERIFY(label < 7U);
    }

    const auto hits = index.search(axis(8), 1);
    QVERIFY(hits.has_value());
    QCOMPARE(hits->front().chunkId, QStringLiteral("c8"));

    // Saved compacted graph reloads with the remapped labels.
    QVERIFY(index.save(indexPath(), metaPath()));
    DenseIndex reader(m_labels.get(), testBinding());
    QVERIFY(!reader.load(indexPath(), metaPath()).has_value());
    QCOMPARE(reader.size(), 7);
}

QTEST_MAIN(TestDenseIndex)
#include "test_dense_index.moc"
