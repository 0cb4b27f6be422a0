#pragma once

#include "core/extraction/extractor_backend.h"
#include "core/extraction/page_renderer.h"
#include "core/shared/types.h"

#include <QByteArray>
#include <QImage>

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

namespace ild {

struct OrchestratorConfig {
    double acceptanceThreshold = 0.0;
    int concurrency = 0;          // 0 = QThread::idealThreadCount()
    int backendTimeoutMs = 120000;
    int dpi = PageRenderer::kDefaultDpi;
};

// All pages of one document, sorted by page index.
struct ExtractionRun {
    std::vector<PageResult> pages;
    QString text;                       // normalized pages joined by one space
    std::vector<PageOffset> offsets;    // one per page, into text
    int pageCount = 0;
    bool cancelled = false;
    // Set when the document itself could not be opened
    std::optional<RenderResult> documentError;

    int pagesWithText() const;
};

// ExtractionOrchestrator -- turns PDF bytes into per-page text.
//
// Pages are rendered and extracted by a bounded pool of worker threads.
// Inside one page the backends are tried sequentially in priority order:
// the first result whose confidence reaches the acceptance threshold wins;
// otherwise the best result seen is kept (earlier backend on ties). A
// result counts only if it succeeded with non-empty text and confidence
// above zero. A page nobody could read ends with empty text and
// confidence 0; it never fails the run.
//
// Thread safety: extractDocument() may be called from one thread at a time
// per orchestrator; backends must be thread-safe.
class ExtractionOrchestrator {
public:
    ExtractionOrchestrator(PageRenderer& renderer,
                           std::vector<std::shared_ptr<ExtractorBackend>> backends,
                           OrchestratorConfig config = {});
    ~ExtractionOrchestrator();

    ExtractionOrchestrator(const ExtractionOrchestrator&) = delete;
    ExtractionOrchestrator& operator=(const ExtractionOrchestrator&) = delete;

    ExtractionRun extractDocument(const QByteArray& pdfBytes);

    // Runs the backend chain on an already rendered page.
    PageResult extractPage(const QImage& image, int pageIndex);

    // Pages not yet started are skipped once cancellation is requested;
    // running backend calls see it through ExtractionContext.
    void requestCancel();
    void clearCancel();
    bool isCancelRequested() const;

    const OrchestratorConfig& config() const { return m_config; }
    const std::vector<std::shared_ptr<ExtractorBackend>>& backends() const { return m_backends; }

private:
    PageResult processPage(const QByteArray& pdfBytes, int pageIndex);
    int workerCount(int pageCount) const;

    PageRenderer& m_renderer;
    std::vector<std::shared_ptr<ExtractorBackend>> m_backends;
    OrchestratorConfig m_config;
    std::atomic<bool> m_cancelRequested{false};
};

} // namespace ild
