#include <QtTest/QtTest>
#include "core/embedding/embedding_manager.h"
#include "core/models/model_registry.h"

#include <QTemporaryDir>

#include <chrono>
#include <cmath>

using ild::EmbeddingCircuitBreaker;
using ild::EmbeddingManager;
using ild::EmbeddingResult;

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

class TestEmbeddingManager : public QObject {
    Q_OBJECT

private slots:
    // ── Circuit breaker ──────────────────────────────────────────
    void testBreakerStartsClosed();
    void testBreakerOpensAtThreshold();
    void testBreakerStaysClosedBelowThreshold();
    void testBreakerHalfOpensAfterDelay();

    // ── Manager without a model ──────────────────────────────────
    void testNullRegistryUnavailable();
    void testMissingRoleUnavailable();
    void testUnavailableEmbedFails();
    void testEmptyBatchReturnsNoResults();
    void testBlankTextFailsOnlyItself();

    // ── Helpers ──────────────────────────────────────────────────
    void testNormalizeEmbedding();
    void testNormalizeZeroVectorUnchanged();
    void testStatusStrings();
};

// ── Circuit breaker ──────────────────────────────────────────────

void TestEmbeddingManager::testBreakerStartsClosed()
{
    EmbeddingCircuitBreaker breaker;
    QVERIFY(!breaker.isOpen());
    QCOMPARE(breaker.consecutiveFailures.load(), 0);
}

void TestEmbeddingManager::testBreakerOpensAtThreshold()
{
    EmbeddingCircuitBreaker breaker;
    for (int i = 0; i < EmbeddingCircuitBreaker::kOpenThreshold - 1; ++i) {
        breaker.recordFailure();
    }
    QVERIFY(!breaker.isOpen());

    breaker.recordFailure();
    QVERIFY(breaker.isOpen());
    QCOMPARE(breaker.consecutiveFailures.load(), EmbeddingCircuitBreaker::kOpenThreshold);
}

void TestEmbeddingManager::testBreakerStaysClosedBelowThreshold()
{
    EmbeddingCircuitBreaker breaker;
    breaker.recordFailure();
    breaker.recordFailure();
    breaker.recordSuccess();
    QCOMPARE(breaker.consecutiveFailures.load(), 0);

    // Interleaved successes never let failures accumulate
    for (int i = 0; i < EmbeddingCircuitBreaker::kOpenThreshold * 2; ++i) {
        breaker.recordFailure();
        breaker.recordSuccess();
    }
    QVERIFY(!breaker.isOpen());
}

void TestEmbeddingManager::testBreakerHalfOpensAfterDelay()
{
    EmbeddingCircuitBreaker breaker;
    for (int i = 0; i < EmbeddingCircuitBreaker::kOpenThreshold; ++i) {
        breaker.recordFailure();
    }
    QVERIFY(breaker.isOpen());

    breaker.lastFailureTime.store(steadyNowMs() - EmbeddingCircuitBreaker::kHalfOpenDelayMs - 500);
    QVERIFY(!breaker.isOpen());

    // A failed probe re-opens immediately
    breaker.recordFailure();
    QVERIFY(breaker.isOpen());
}

// ── Manager without a model ──────────────────────────────────────

void TestEmbeddingManager::testNullRegistryUnavailable()
{
    EmbeddingManager manager(nullptr, QStringLiteral("bi-encoder"));
    QVERIFY(!manager.initialize());
    QVERIFY(!manager.isAvailable());
    QCOMPARE(manager.binding().dimensions, 0);
}

void TestEmbeddingManager::testMissingRoleUnavailable()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    ild::ModelRegistry registry(dir.path());
    EmbeddingManager manager(&registry, QStringLiteral("bi-encoder"));
    QVERIFY(!manager.initialize());
    QVERIFY(!manager.isAvailable());
}

void TestEmbeddingManager::testUnavailableEmbedFails()
{
    EmbeddingManager manager(nullptr, QStringLiteral("bi-encoder"));
    const EmbeddingResult single = manager.embed(QStringLiteral("धारा 302"));
    QCOMPARE(single.status, EmbeddingResult::Status::ModelUnavailable);
    QVERIFY(single.vector.empty());
    QVERIFY(single.errorMessage.has_value());

    QCOMPARE(manager.embedQuery(QStringLiteral("murder")).status,
             EmbeddingResult::Status::ModelUnavailable);

    const auto batch = manager.embedBatch({QStringLiteral("a"), QStringLiteral("b"),
                                           QStringLiteral("c")});
    QCOMPARE(batch.size(), size_t(3));
    for (const EmbeddingResult& r : batch) {
        QVERIFY(!r.ok());
    }
}

void TestEmbeddingManager::testEmptyBatchReturnsNoResults()
{
    EmbeddingManager manager(nullptr, QStringLiteral("bi-encoder"));
    QVERIFY(manager.embedBatch({}).empty());
}

void TestEmbeddingManager::testBlankTextFailsOnlyItself()
{
    // Batch size 2 puts the blank text inside a slice with a real one
    EmbeddingManager manager(nullptr, QStringLiteral("bi-encoder"), 2);
    const auto results = manager.embedBatch({QStringLiteral("धारा 302"), QStringLiteral("   "),
                                             QStringLiteral("bail"), QString(),
                                             QStringLiteral("appeal")});
    QCOMPARE(results.size(), size_t(5));
    QCOMPARE(results[0].status, EmbeddingResult::Status::ModelUnavailable);
    QCOMPARE(results[1].status, EmbeddingResult::Status::InvalidInput);
    QCOMPARE(results[2].status, EmbeddingResult::Status::ModelUnavailable);
    QCOMPARE(results[3].status, EmbeddingResult::Status::InvalidInput);
    QCOMPARE(results[4].status, EmbeddingResult::Status::ModelUnavailable);
    QCOMPARE(results[1].errorMessage.value_or(QString()), QStringLiteral("empty text"));

    QCOMPARE(manager.embed(QStringLiteral("\n\t")).status,
             EmbeddingResult::Status::InvalidInput);
}

// ── Helpers ──────────────────────────────────────────────────────

void TestEmbeddingManager::testNormalizeEmbedding()
{
    const std::vector<float> normalized = EmbeddingManager::normalizeEmbedding({3.0f, 4.0f});
    QCOMPARE(normalized.size(), size_t(2));
    QVERIFY(std::abs(normalized[0] - 0.6f) < 1e-6f);
    QVERIFY(std::abs(normalized[1] - 0.8f) < 1e-6f);
}

void TestEmbeddingManager::testNormalizeZeroVectorUnchanged()
{
    const std::vector<float> zero(4, 0.0f);
    QVERIFY(EmbeddingManager::normalizeEmbedding(zero) == zero);
}

void TestEmbeddingManager::testStatusStrings()
{
    QCOMPARE(ild::embeddingStatusToString(EmbeddingResult::Status::Success),
             QStringLiteral("success"));
    QCOMPARE(ild::embeddingStatusToString(EmbeddingResult::Status::CircuitOpen),
             QStringLiteral("circuit_open"));
    QCOMPARE(ild::embeddingStatusToString(EmbeddingResult::Status::InvalidInput),
             QStringLiteral("invalid_input"));
}

QTEST_MAIN(TestEmbeddingManager)
#include "test_embedding_manager.moc"
