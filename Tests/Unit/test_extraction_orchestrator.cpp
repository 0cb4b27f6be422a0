#include <QtTest/QtTest>
#include "core/extraction/extraction_orchestrator.h"
#include "Support/scripted_backend.h"
#include "Support/scripted_renderer.h"

using ild::BackendResult;
using ild::ExtractionOrchestrator;
using ild::OrchestratorConfig;
using ild::PageOutcome;
using ild::test::ScriptedBackend;
using ild::test::ScriptedRenderer;

namespace {

std::shared_ptr<ScriptedBackend> backendWith(const QString& name, const QString& text,
                                             double confidence)
{
    return std::make_shared<ScriptedBackend>(name, ScriptedBackend::success(text, confidence));
}

std::shared_ptr<ScriptedBackend> failingBackend(const QString& name)
{
    return std::make_shared<ScriptedBackend>(
        name, ScriptedBackend::failure(BackendResult::Status::InferenceFailed));
}

OrchestratorConfig withThreshold(double threshold)
{
    OrchestratorConfig config;
    config.acceptanceThreshold = threshold;
    config.concurrency = 1;
    return config;
}

QImage blankPage()
{
    QImage image(16, 16, QImage::Format_RGB32);
    image.fill(Qt::white);
    return image;
}

} // namespace

class TestExtractionOrchestrator : public QObject {
    Q_OBJECT

private slots:
    // ── Backend selection within a page ──────────────────────────
    void testFirstBackendAboveThresholdWins();
    void testBestResultKeptWhenNoneReachesThreshold();
    void testEarlierBackendWinsTies();
    void testZeroThresholdAcceptsFirstUsable();
    void testFailedBackendFallsThrough();
    void testThrowingBackendFallsThrough();
    void testBlankTextIsNotUsable();
    void testUnreadyBackendSkipped();
    void testOverrunCountsAsTimeout();
    void testConfidenceClamped();

    // ── Page outcomes ────────────────────────────────────────────
    void testAllBackendsFailLeavesEmptyPage();
    void testRenderFailureDegradesOnePage();
    void testUnreadableDocumentReported();
    void testCancelledBeforeStartLeavesPagesNotAttempted();
    void testCancelMidRunKeepsFinishedPages();
    void testThrowingBackendInWorkerThread();

    // ── Document assembly ────────────────────────────────────────
    void testTextJoinedWithPageOffsets();
    void testPagesOrderedUnderConcurrency();
    void testLongDocumentNotTruncated();
};

// ── Backend selection within a page ──────────────────────────────

void TestExtractionOrchestrator::testFirstBackendAboveThresholdWins()
{
    ScriptedRenderer renderer(1);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("from a"), 0.1);
    auto b = backendWith(QStringLiteral("b"), QStringLiteral("from b"), 0.9);
    auto c = backendWith(QStringLiteral("c"), QStringLiteral("from c"), 0.4);
    ExtractionOrchestrator orchestrator(renderer, {a, b, c}, withThreshold(0.8));

    const ild::PageResult page = orchestrator.extractPage(blankPage(), 0);

    QCOMPARE(page.text, QStringLiteral("from b"));
    QCOMPARE(page.backendName, QStringLiteral("b"));
    QCOMPARE(page.confidence, 0.9);
    QCOMPARE(page.outcome, PageOutcome::Extracted);
    QCOMPARE(page.attemptedBackends, (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
    QCOMPARE(c->callCount(), 0);
}

void TestExtractionOrchestrator::testBestResultKeptWhenNoneReachesThreshold()
{
    ScriptedRenderer renderer(1);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("from a"), 0.3);
    auto b = backendWith(QStringLiteral("b"), QStringLiteral("from b"), 0.6);
    auto c = backendWith(QStringLiteral("c"), QStringLiteral("from c"), 0.5);
    ExtractionOrchestrator orchestrator(renderer, {a, b, c}, withThreshold(0.9));

    const ild::PageResult page = orchestrator.extractPage(blankPage(), 0);

    QCOMPARE(page.backendName, QStringLiteral("b"));
    QCOMPARE(page.confidence, 0.6);
    QCOMPARE(page.attemptedBackends.size(), 3);
}

void TestExtractionOrchestrator::testEarlierBackendWinsTies()
{
    ScriptedRenderer renderer(1);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("from a"), 0.5);
    auto b = backendWith(QStringLiteral("b"), QStringLiteral("from b"), 0.5);
    ExtractionOrchestrator orchestrator(renderer, {a, b}, withThreshold(0.9));

    const ild::PageResult page = orchestrator.extractPage(blankPage(), 0);
    QCOMPARE(page.backendName, QStringLiteral("a"));
    QCOMPARE(b->callCount(), 1);
}

void TestExtractionOrchestrator::testZeroThresholdAcceptsFirstUsable()
{
    ScriptedRenderer renderer(1);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("weak"), 0.05);
    auto b = backendWith(QStringLiteral("b"), QStringLiteral("strong"), 0.95);
    ExtractionOrchestrator orchestrator(renderer, {a, b}, withThreshold(0.0));

    const ild::PageResult page = orchestrator.extractPage(blankPage(), 0);
    QCOMPARE(page.backendName, QStringLiteral("a"));
    QCOMPARE(b->callCount(), 0);
}

void TestExtractionOrchestrator::testFailedBackendFallsThrough()
{
    ScriptedRenderer renderer(1);
    auto a = failingBackend(QStringLiteral("a"));
    auto b = backendWith(QStringLiteral("b"), QStringLiteral("fallback text"), 0.7);
    ExtractionOrchestrator orchestrator(renderer, {a, b}, withThreshold(0.5));

    const ild::PageResult page = orchestrator.extractPage(blankPage(), 0);
    QCOMPARE(page.text, QStringLiteral("fallback text"));
    QCOMPARE(page.attemptedBackends, (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
}

void TestExtractionOrchestrator::testThrowingBackendFallsThrough()
{
    ScriptedRenderer renderer(1);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("never returned"), 0.9);
    a->throwOnPage(0);
    auto b = backendWith(QStringLiteral("b"), QStringLiteral("fallback text"), 0.7);
    ExtractionOrchestrator orchestrator(renderer, {a, b}, withThreshold(0.5));

    const ild::PageResult page = orchestrator.extractPage(blankPage(), 0);
    QCOMPARE(page.outcome, PageOutcome::Extracted);
    QCOMPARE(page.backendName, QStringLiteral("b"));
    QCOMPARE(page.text, QStringLiteral("fallback text"));
    QCOMPARE(page.attemptedBackends, (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
}

void TestExtractionOrchestrator::testBlankTextIsNotUsable()
{
    ScriptedRenderer renderer(1);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral(" \n\t "), 0.99);
    auto b = backendWith(QStringLiteral("b"), QStringLiteral("real text"), 0.2);
    ExtractionOrchestrator orchestrator(renderer, {a, b}, withThreshold(0.5));

    const ild::PageResult page = orchestrator.extractPage(blankPage(), 0);
    QCOMPARE(page.backendName, QStringLiteral("b"));
    QCOMPARE(page.text, QStringLiteral("real text"));
}

void TestExtractionOrchestrator::testUnreadyBackendSkipped()
{
    ScriptedRenderer renderer(1);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("never"), 0.9);
    a->setReady(false);
    auto b = backendWith(QStringLiteral("b"), QStringLiteral("ready text"), 0.6);
    ExtractionOrchestrator orchestrator(renderer, {a, b}, withThreshold(0.5));

    const ild::PageResult page = orchestrator.extractPage(blankPage(), 0);
    QCOMPARE(page.backendName, QStringLiteral("b"));
    QCOMPARE(page.attemptedBackends, QStringList{QStringLiteral("b")});
    QCOMPARE(a->callCount(), 0);
    QVERIFY(!a->isReady());
}

void TestExtractionOrchestrator::testOverrunCountsAsTimeout()
{
    ScriptedRenderer renderer(1);
    BackendResult slow = ScriptedBackend::success(QStringLiteral("late text"), 0.9);
    slow.durationMs = 500;
    auto a = std::make_shared<ScriptedBackend>(QStringLiteral("slow"), slow);
    auto b = backendWith(QStringLiteral("b"), QStringLiteral("on time"), 0.4);

    OrchestratorConfig config = withThreshold(0.8);
    config.backendTimeoutMs = 100;
    ExtractionOrchestrator orchestrator(renderer, {a, b}, config);

    const ild::PageResult page = orchestrator.extractPage(blankPage(), 0);
    QCOMPARE(page.backendName, QStringLiteral("b"));
    QCOMPARE(page.text, QStringLiteral("on time"));
}

void TestExtractionOrchestrator::testConfidenceClamped()
{
    ScriptedRenderer renderer(1);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("text"), 1.7);
    ExtractionOrchestrator orchestrator(renderer, {a}, withThreshold(0.5));

    QCOMPARE(orchestrator.extractPage(blankPage(), 0).confidence, 1.0);
}

// ── Page outcomes ────────────────────────────────────────────────

void TestExtractionOrchestrator::testAllBackendsFailLeavesEmptyPage()
{
    ScriptedRenderer renderer(2);
    auto a = failingBackend(QStringLiteral("a"));
    auto b = backendWith(QStringLiteral("b"), QStringLiteral("page text"), 0.8);
    b->setPageResult(1, ScriptedBackend::failure(BackendResult::Status::MalformedImage));
    ExtractionOrchestrator orchestrator(renderer, {a, b}, withThreshold(0.5));

    const ild::ExtractionRun run = orchestrator.extractDocument(QByteArray("%PDF"));

    QCOMPARE(run.pageCount, 2);
    QVERIFY(!run.documentError.has_value());
    QCOMPARE(run.pages[1].text, QString());
    QCOMPARE(run.pages[1].confidence, 0.0);
    QVERIFY(run.pages[1].backendName.isEmpty());
    QCOMPARE(run.pages[1].outcome, PageOutcome::Exhausted);
    QCOMPARE(run.pages[1].attemptedBackends.size(), 2);
    QCOMPARE(run.pagesWithText(), 1);
}

void TestExtractionOrchestrator::testRenderFailureDegradesOnePage()
{
    ScriptedRenderer renderer(3);
    renderer.failPage(1);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("text"), 0.8);
    ExtractionOrchestrator orchestrator(renderer, {a}, withThreshold(0.5));

    const ild::ExtractionRun run = orchestrator.extractDocument(QByteArray("%PDF"));

    QCOMPARE(static_cast<int>(run.pages.size()), 3);
    QCOMPARE(run.pages[0].outcome, PageOutcome::Extracted);
    QCOMPARE(run.pages[1].outcome, PageOutcome::RenderFailed);
    QVERIFY(run.pages[1].text.isEmpty());
    QCOMPARE(run.pages[2].outcome, PageOutcome::Extracted);
    QCOMPARE(a->callCount(), 2);
}

void TestExtractionOrchestrator::testUnreadableDocumentReported()
{
    ScriptedRenderer renderer(3);
    renderer.setDocumentStatus(ild::RenderResult::Status::Corrupt);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("text"), 0.8);
    ExtractionOrchestrator orchestrator(renderer, {a}, withThreshold(0.5));

    const ild::ExtractionRun run = orchestrator.extractDocument(QByteArray("garbage"));

    QVERIFY(run.documentError.has_value());
    QCOMPARE(run.documentError->status, ild::RenderResult::Status::Corrupt);
    QCOMPARE(run.pageCount, 0);
    QVERIFY(run.pages.empty());
    QCOMPARE(a->callCount(), 0);
}

void TestExtractionOrchestrator::testCancelledBeforeStartLeavesPagesNotAttempted()
{
    ScriptedRenderer renderer(4);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("text"), 0.8);
    ExtractionOrchestrator orchestrator(renderer, {a}, withThreshold(0.5));

    orchestrator.requestCancel();
    const ild::ExtractionRun run = orchestrator.extractDocument(QByteArray("%PDF"));

    QVERIFY(run.cancelled);
    QCOMPARE(static_cast<int>(run.pages.size()), 4);
    for (const auto& page : run.pages) {
        QCOMPARE(page.outcome, PageOutcome::NotAttempted);
    }
    QCOMPARE(a->callCount(), 0);

    orchestrator.clearCancel();
    QVERIFY(!orchestrator.isCancelRequested());
    QCOMPARE(orchestrator.extractDocument(QByteArray("%PDF")).pagesWithText(), 4);
}

void TestExtractionOrchestrator::testCancelMidRunKeepsFinishedPages()
{
    ScriptedRenderer renderer(4);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("first pass"), 0.5);
    auto b = backendWith(QStringLiteral("b"), QStringLiteral("second pass"), 0.9);
    ExtractionOrchestrator orchestrator(renderer, {a, b}, withThreshold(0.8));

    bool backendSawCancel = false;
    a->setAfterExtract([&](const ild::ExtractionContext& context) {
        if (context.pageIndex == 0) {
            orchestrator.requestCancel();
            backendSawCancel = context.cancelled();
        }
    });

    const ild::ExtractionRun run = orchestrator.extractDocument(QByteArray("%PDF"));

    QVERIFY(backendSawCancel);
    QVERIFY(run.cancelled);
    QCOMPARE(static_cast<int>(run.pages.size()), 4);
    // Page 0 finished with what it had; the cancelled chain never reached b
    QCOMPARE(run.pages[0].outcome, PageOutcome::Extracted);
    QCOMPARE(run.pages[0].text, QStringLiteral("first pass"));
    QCOMPARE(run.pages[0].backendName, QStringLiteral("a"));
    QCOMPARE(run.pages[0].attemptedBackends, QStringList{QStringLiteral("a")});
    for (size_t i = 1; i < run.pages.size(); ++i) {
        QCOMPARE(run.pages[i].outcome, PageOutcome::NotAttempted);
        QVERIFY(run.pages[i].text.isEmpty());
        QVERIFY(run.pages[i].attemptedBackends.isEmpty());
    }
    QCOMPARE(a->callCount(), 1);
    QCOMPARE(b->callCount(), 0);
    QCOMPARE(run.text, QStringLiteral("first pass"));
}

void TestExtractionOrchestrator::testThrowingBackendInWorkerThread()
{
    ScriptedRenderer renderer(3);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("primary"), 0.9);
    a->throwOnPage(1);
    auto b = backendWith(QStringLiteral("b"), QStringLiteral("secondary"), 0.6);

    OrchestratorConfig config = withThreshold(0.5);
    config.concurrency = 3;
    ExtractionOrchestrator orchestrator(renderer, {a, b}, config);

    const ild::ExtractionRun run = orchestrator.extractDocument(QByteArray("%PDF"));

    QCOMPARE(run.pagesWithText(), 3);
    QCOMPARE(run.pages[0].backendName, QStringLiteral("a"));
    QCOMPARE(run.pages[1].backendName, QStringLiteral("b"));
    QCOMPARE(run.pages[1].text, QStringLiteral("secondary"));
    QCOMPARE(run.pages[2].backendName, QStringLiteral("a"));
    QCOMPARE(b->callCount(), 1);
}

// ── Document assembly ────────────────────────────────────────────

void TestExtractionOrchestrator::testTextJoinedWithPageOffsets()
{
    ScriptedRenderer renderer(3);
    auto a = backendWith(QStringLiteral("a"), QString(), 0.8);
    a->setPageResult(0, ScriptedBackend::success(QStringLiteral("  first   page "), 0.9));
    a->setPageResult(1, ScriptedBackend::failure(BackendResult::Status::InferenceFailed));
    a->setPageResult(2, ScriptedBackend::success(QStringLiteral("third"), 0.85));
    ExtractionOrchestrator orchestrator(renderer, {a}, withThreshold(0.5));

    const ild::ExtractionRun run = orchestrator.extractDocument(QByteArray("%PDF"));

    QCOMPARE(run.text, QStringLiteral("first page third"));
    QCOMPARE(static_cast<int>(run.offsets.size()), 3);
    QCOMPARE(run.offsets[0].charStart, 0);
    QCOMPARE(run.offsets[0].charEnd, 10);
    QCOMPARE(run.offsets[1].charStart, run.offsets[1].charEnd);
    QCOMPARE(run.offsets[2].charStart, 11);
    QCOMPARE(run.offsets[2].charEnd, 16);
    QCOMPARE(run.text.mid(run.offsets[2].charStart,
                          run.offsets[2].charEnd - run.offsets[2].charStart),
             QStringLiteral("third"));
}

void TestExtractionOrchestrator::testPagesOrderedUnderConcurrency()
{
    constexpr int kPages = 12;
    ScriptedRenderer renderer(kPages);
    auto a = backendWith(QStringLiteral("a"), QString(), 0.8);
    for (int i = 0; i < kPages; ++i) {
        a->setPageResult(i, ScriptedBackend::success(QStringLiteral("p%1").arg(i), 0.8));
    }
    a->setDelayMs(5);

    OrchestratorConfig config = withThreshold(0.5);
    config.concurrency = 4;
    ExtractionOrchestrator orchestrator(renderer, {a}, config);

    const ild::ExtractionRun run = orchestrator.extractDocument(QByteArray("%PDF"));

    QCOMPARE(static_cast<int>(run.pages.size()), kPages);
    for (int i = 0; i < kPages; ++i) {
        QCOMPARE(run.pages[static_cast<size_t>(i)].pageIndex, i);
        QCOMPARE(run.pages[static_cast<size_t>(i)].text, QStringLiteral("p%1").arg(i));
    }
    QVERIFY(run.text.startsWith(QStringLiteral("p0 p1 p2")));
}

void TestExtractionOrchestrator::testLongDocumentNotTruncated()
{
    constexpr int kPages = 1205;
    ScriptedRenderer renderer(kPages);
    auto a = backendWith(QStringLiteral("a"), QStringLiteral("schedule"), 0.8);
    a->setPageResult(kPages - 1, ScriptedBackend::success(QStringLiteral("last page"), 0.8));

    OrchestratorConfig config = withThreshold(0.5);
    config.concurrency = 4;
    ExtractionOrchestrator orchestrator(renderer, {a}, config);

    const ild::ExtractionRun run = orchestrator.extractDocument(QByteArray("%PDF"));

    QCOMPARE(run.pageCount, kPages);
    QCOMPARE(static_cast<int>(run.pages.size()), kPages);
    QCOMPARE(static_cast<int>(run.offsets.size()), kPages);
    QCOMPARE(run.pagesWithText(), kPages);
    QCOMPARE(run.pages.back().pageIndex, kPages - 1);
    QCOMPARE(run.pages.back().text, QStringLiteral("last page"));
    QVERIFY(run.text.endsWith(QStringLiteral("last page")));
}

QTEST_MAIN(TestExtractionOrchestrator)
#include "test_extraction_orchestrator.moc"
