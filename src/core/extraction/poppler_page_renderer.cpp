#include "core/extraction/poppler_page_renderer.h"
#include "core/shared/logging.h"

#include <poppler/qt6/poppler-qt6.h>

namespace ild {

// ── Impl (pimpl) ────────────────────────────────────────────

struct PopplerPageRenderer::Impl {
    QByteArray password;
    QByteArray cachedBytes;
    std::unique_ptr<Poppler::Document> document;

    bool isCached(const QByteArray& bytes) const
    {
        if (!document) {
            return false;
        }
        // Implicitly shared buffers compare by pointer first.
        return cachedBytes.constData() == bytes.constData() || cachedBytes == bytes;
    }
};

// ── Construction / destruction ──────────────────────────────

PopplerPageRenderer::PopplerPageRenderer(const QByteArray& password)
    : m_impl(std::make_unique<Impl>())
{
    m_impl->password = password;
}

PopplerPageRenderer::~PopplerPageRenderer() = default;

// ── Interface ───────────────────────────────────────────────

RenderResult PopplerPageRenderer::probe(const QByteArray& pdfBytes)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return loadUnlocked(pdfBytes);
}

RenderResult PopplerPageRenderer::loadUnlocked(const QByteArray& pdfBytes)
{
    RenderResult result;

    if (pdfBytes.isEmpty()) {
        result.status = RenderResult::Status::Empty;
        result.errorMessage = QStringLiteral("PDF payload is empty");
        return result;
    }

    if (!m_impl->isCached(pdfBytes)) {
        m_impl->document.reset();
        m_impl->cachedBytes.clear();

        std::unique_ptr<Poppler::Document> doc =
            Poppler::Document::loadFromData(pdfBytes, m_impl->password, m_impl->password);
        if (!doc) {
            result.status = RenderResult::Status::Corrupt;
            result.errorMessage = QStringLiteral("Failed to load PDF document");
            LOG_WARN(ildExtraction, "Poppler failed to parse PDF (%lld bytes)",
                     static_cast<long long>(pdfBytes.size()));
            return result;
        }

        // Reject encrypted/locked PDFs
        if (doc->isLocked()) {
            result.status = RenderResult::Status::Locked;
            result.errorMessage = QStringLiteral("PDF is encrypted or password-protected");
            LOG_INFO(ildExtraction, "Rejecting encrypted PDF");
            return result;
        }

        doc->setRenderHint(Poppler::Document::Antialiasing, true);
        doc->setRenderHint(Poppler::Document::TextAntialiasing, true);

        m_impl->document = std::move(doc);
        m_impl->cachedBytes = pdfBytes;
        LOG_DEBUG(ildExtraction, "Loaded PDF with %d page(s)", m_impl->document->numPages());
    }

    result.status = RenderResult::Status::Success;
    result.pageCount = m_impl->document->numPages();
    return result;
}

RenderResult PopplerPageRenderer::render(const QByteArray& pdfBytes, int pageIndex, int dpi)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    RenderResult result = loadUnlocked(pdfBytes);
    if (!result.ok()) {
        return result;
    }

    if (pageIndex < 0 || pageIndex >= result.pageCount) {
        result.status = RenderResult::Status::OutOfRange;
        result.errorMessage = QStringLiteral("Page index %1 out of range (page count %2)")
                                  .arg(pageIndex)
                                  .arg(result.pageCount);
        return result;
    }

    const int effectiveDpi = dpi > 0 ? dpi : kDefaultDpi;

    std::unique_ptr<Poppler::Page> page = m_impl->document->page(pageIndex);
    if (!page) {
        result.status = RenderResult::Status::Corrupt;
        result.errorMessage = QStringLiteral("Failed to load page %1").arg(pageIndex);
        LOG_WARN(ildExtraction, "Poppler failed to load page %d", pageIndex);
        return result;
    }

    QImage image = page->renderToImage(effectiveDpi, effectiveDpi);
    if (image.isNull()) {
        result.status = RenderResult::Status::Corrupt;
        result.errorMessage = QStringLiteral("Failed to rasterize page %1").arg(pageIndex);
        LOG_WARN(ildExtraction, "Poppler produced a null image for page %d at %d dpi",
                 pageIndex, effectiveDpi);
        return result;
    }

    result.image = std::move(image);
    return result;
}

} // namespace ild
