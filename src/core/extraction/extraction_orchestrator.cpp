#include "core/extraction/extraction_orchestrator.h"
#include "core/shared/logging.h"
#include "core/text/text_normalizer.h"

#include <QElapsedTimer>
#include <QThread>

#include <algorithm>
#include <exception>
#include <thread>

namespace ild {

int ExtractionRun::pagesWithText() const
{
    return static_cast<int>(std::count_if(pages.begin(), pages.end(),
        [](const PageResult& page) { return !page.text.isEmpty(); }));
}

// ── Construction ────────────────────────────────────────────

ExtractionOrchestrator::ExtractionOrchestrator(
    PageRenderer& renderer,
    std::vector<std::shared_ptr<ExtractorBackend>> backends,
    OrchestratorConfig config)
    : m_renderer(renderer)
    , m_backends(std::move(backends))
    , m_config(config)
{
    m_config.acceptanceThreshold = std::clamp(m_config.acceptanceThreshold, 0.0, 1.0);
    if (m_config.backendTimeoutMs < 0) {
        LOG_WARN(ildExtraction, "Backend timeout %d ms clamped to 0 (no limit)",
                 m_config.backendTimeoutMs);
        m_config.backendTimeoutMs = 0;
    }
    if (m_config.dpi <= 0) {
        m_config.dpi = PageRenderer::kDefaultDpi;
    }
    LOG_INFO(ildExtraction, "ExtractionOrchestrator: %zu backend(s), threshold=%.2f, timeout=%d ms",
             m_backends.size(), m_config.acceptanceThreshold, m_config.backendTimeoutMs);
}

ExtractionOrchestrator::~ExtractionOrchestrator() = default;

// ── Cancellation ────────────────────────────────────────────

void ExtractionOrchestrator::requestCancel()
{
    m_cancelRequested.store(true);
    LOG_INFO(ildExtraction, "Extraction cancellation requested");
}

void ExtractionOrchestrator::clearCancel()
{
    m_cancelRequested.store(false);
}

bool ExtractionOrchestrator::isCancelRequested() const
{
    return m_cancelRequested.load();
}

// ── Page level ──────────────────────────────────────────────

PageResult ExtractionOrchestrator::extractPage(const QImage& image, int pageIndex)
{
    QElapsedTimer pageTimer;
    pageTimer.start();

    PageResult page;
    page.pageIndex = pageIndex;
    page.outcome = PageOutcome::Exhausted;

    ExtractionContext context;
    context.pageIndex = pageIndex;
    context.timeoutMs = m_config.backendTimeoutMs;
    context.cancelFlag = &m_cancelRequested;

    std::optional<PageResult> best;
    for (const std::shared_ptr<ExtractorBackend>& backend : m_backends) {
        if (context.cancelled()) {
            break;
        }
        if (!backend->ensureReady()) {
            continue;
        }

        page.attemptedBackends.append(backend->name());
        BackendResult result;
        try {
            result = backend->extract(image, context);
        } catch (const std::exception& ex) {
            LOG_WARN(ildExtraction, "Page %d: backend '%s' threw: %s", pageIndex,
                     qUtf8Printable(backend->name()), ex.what());
            result = BackendResult{};
            result.status = BackendResult::Status::InferenceFailed;
            result.errorMessage = QString::fromUtf8(ex.what());
        }

        // Backends that cannot interrupt themselves still lose on overrun
        if (result.status == BackendResult::Status::Success && context.timeoutMs > 0
            && result.durationMs > context.timeoutMs) {
            result.status = BackendResult::Status::Timeout;
        }

        const QString text = TextNormalizer::normalize(result.text);
        const double confidence = std::clamp(result.confidence, 0.0, 1.0);
        if (result.status != BackendResult::Status::Success || text.isEmpty()
            || confidence <= 0.0) {
            LOG_DEBUG(ildExtraction, "Page %d: backend '%s' gave no usable text (%s%s%s)",
                      pageIndex, qUtf8Printable(backend->name()),
                      qUtf8Printable(backendStatusToString(result.status)),
                      result.errorMessage ? ": " : "",
                      qUtf8Printable(result.errorMessage.value_or(QString())));
            continue;
        }

        if (!best.has_value() || confidence > best->confidence) {
            PageResult candidate;
            candidate.text = text;
            candidate.confidence = confidence;
            candidate.backendName = backend->name();
            best = std::move(candidate);
        }
        if (confidence >= m_config.acceptanceThreshold) {
            break;
        }
    }

    if (best.has_value()) {
        page.text = best->text;
        page.confidence = best->confidence;
        page.backendName = best->backendName;
        page.outcome = PageOutcome::Extracted;
    } else if (page.attemptedBackends.isEmpty() && context.cancelled()) {
        page.outcome = PageOutcome::NotAttempted;
    } else {
        LOG_WARN(ildExtraction, "Page %d: every backend failed (%s), page left empty",
                 pageIndex, qUtf8Printable(page.attemptedBackends.join(QStringLiteral(", "))));
    }

    page.durationMs = static_cast<int>(pageTimer.elapsed());
    return page;
}

PageResult ExtractionOrchestrator::processPage(const QByteArray& pdfBytes, int pageIndex)
{
    const RenderResult rendered = m_renderer.render(pdfBytes, pageIndex, m_config.dpi);
    if (!rendered.ok()) {
        LOG_WARN(ildExtraction, "Page %d: render failed: %s", pageIndex,
                 qUtf8Printable(rendered.errorMessage.value_or(QStringLiteral("unknown error"))));
        PageResult page;
        page.pageIndex = pageIndex;
        page.outcome = PageOutcome::RenderFailed;
        return page;
    }
    return extractPage(rendered.image, pageIndex);
}

// ── Document level ──────────────────────────────────────────

int ExtractionOrchestrator::workerCount(int pageCount) const
{
    int limit = m_config.concurrency > 0 ? m_config.concurrency : QThread::idealThreadCount();
    limit = std::max(1, limit);
    return std::min(limit, std::max(1, pageCount));
}

ExtractionRun ExtractionOrchestrator::extractDocument(const QByteArray& pdfBytes)
{
    ExtractionRun run;

    const RenderResult probe = m_renderer.probe(pdfBytes);
    if (!probe.ok()) {
        LOG_WARN(ildExtraction, "Document rejected by renderer: %s",
                 qUtf8Printable(probe.errorMessage.value_or(QStringLiteral("unknown error"))));
        run.documentError = probe;
        return run;
    }
    run.pageCount = probe.pageCount;

    std::vector<PageResult> pages(static_cast<size_t>(run.pageCount));
    for (int i = 0; i < run.pageCount; ++i) {
        pages[static_cast<size_t>(i)].pageIndex = i;
    }

    std::atomic<int> nextPage{0};
    auto worker = [&]() {
        for (;;) {
            const int index = nextPage.fetch_add(1);
            if (index >= run.pageCount) {
                return;
            }
            if (m_cancelRequested.load()) {
                continue;  // leave as NotAttempted
            }
            pages[static_cast<size_t>(index)] = processPage(pdfBytes, index);
        }
    };

    const int workers = workerCount(run.pageCount);
    LOG_DEBUG(ildExtraction, "Extracting %d page(s) with %d worker(s)", run.pageCount, workers);
    if (workers == 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(workers));
        for (int i = 0; i < workers; ++i) {
            threads.emplace_back(worker);
        }
        for (std::thread& thread : threads) {
            thread.join();
        }
    }

    run.cancelled = m_cancelRequested.load();

    // Each slot holds its own page, so the vector is already in page order
    run.offsets.reserve(pages.size());
    for (const PageResult& page : pages) {
        PageOffset offset;
        offset.pageIndex = page.pageIndex;
        if (!page.text.isEmpty()) {
            if (!run.text.isEmpty()) {
                run.text.append(QLatin1Char(' '));
            }
            offset.charStart = static_cast<int>(run.text.size());
            run.text.append(page.text);
        } else {
            offset.charStart = static_cast<int>(run.text.size());
        }
        offset.charEnd = static_cast<int>(run.text.size());
        run.offsets.push_back(offset);
    }
    run.pages = std::move(pages);

    LOG_INFO(ildExtraction, "Extracted %d of %d page(s), %lld chars%s",
             run.pagesWithText(), run.pageCount, static_cast<long long>(run.text.size()),
             run.cancelled ? " (cancelled)" : "");
    return run;
}

} // namespace ild
