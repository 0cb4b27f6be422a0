#include "core/extraction/tesseract_backend.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <mutex>

#include <leptonica/allheaders.h>
#include <tesseract/baseapi.h>
#include <tesseract/ocrclass.h>

namespace ild {

namespace {

// Called by Tesseract between words; returning true aborts recognition
bool cancelRequested(void* cancelThis, int /*words*/)
{
    const auto* context = static_cast<const ExtractionContext*>(cancelThis);
    return context != nullptr && context->cancelled();
}

Pix* pixFromImage(const QImage& image)
{
    const QImage rgb = image.convertToFormat(QImage::Format_RGB32);
    const int width = rgb.width();
    const int height = rgb.height();

    Pix* pix = pixCreate(width, height, 32);
    if (!pix) {
        return nullptr;
    }

    l_uint32* data = pixGetData(pix);
    const l_int32 wpl = pixGetWpl(pix);
    for (int y = 0; y < height; ++y) {
        const auto* src = reinterpret_cast<const QRgb*>(rgb.constScanLine(y));
        l_uint32* line = data + static_cast<size_t>(y) * static_cast<size_t>(wpl);
        for (int x = 0; x < width; ++x) {
            l_uint32 pixel = 0;
            composeRGBPixel(qRed(src[x]), qGreen(src[x]), qBlue(src[x]), &pixel);
            line[x] = pixel;
        }
    }

    Pix* gray = pixConvertRGBToGray(pix, 0.0f, 0.0f, 0.0f);  // equal weight
    pixDestroy(&pix);
    return gray;
}

} // anonymous namespace

// ── Impl (pimpl) ────────────────────────────────────────────

struct TesseractBackend::Impl {
    QString languages;
    int sourceDpi = 300;
    std::unique_ptr<tesseract::TessBaseAPI> api;
    std::mutex apiMutex;  // TessBaseAPI is not reentrant

    ~Impl()
    {
        if (api) {
            api->End();
        }
    }
};

// ── Construction / destruction ──────────────────────────────

TesseractBackend::TesseractBackend(QString languages, int sourceDpi)
    : m_impl(std::make_unique<Impl>())
{
    m_impl->languages = std::move(languages);
    m_impl->sourceDpi = sourceDpi;
}

TesseractBackend::~TesseractBackend() = default;

// ── Interface ───────────────────────────────────────────────

bool TesseractBackend::initialize()
{
    auto api = std::make_unique<tesseract::TessBaseAPI>();
    const QByteArray langs = m_impl->languages.toUtf8();
    // nullptr = default tessdata path (TESSDATA_PREFIX)
    const int rc = api->Init(nullptr, langs.constData());
    if (rc != 0) {
        LOG_ERROR(ildExtraction, "Tesseract Init failed (rc=%d). "
                  "Check TESSDATA_PREFIX and traineddata for '%s'.", rc, langs.constData());
        return false;
    }

    api->SetPageSegMode(tesseract::PSM_AUTO);
    m_impl->api = std::move(api);
    LOG_INFO(ildExtraction, "Tesseract OCR engine initialised (lang=%s)", langs.constData());
    return true;
}

BackendResult TesseractBackend::extract(const QImage& image, const ExtractionContext& context)
{
    QElapsedTimer timer;
    timer.start();

    BackendResult result;
    auto finish = [&](BackendResult::Status status, const QString& message) {
        result.status = status;
        if (!message.isEmpty()) {
            result.errorMessage = message;
        }
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    };

    if (!isReady() || !m_impl->api) {
        return finish(BackendResult::Status::Unavailable,
                      QStringLiteral("Tesseract engine not initialised"));
    }
    if (image.isNull() || image.width() <= 0 || image.height() <= 0) {
        return finish(BackendResult::Status::MalformedImage, QStringLiteral("empty page image"));
    }
    if (context.cancelled()) {
        return finish(BackendResult::Status::Cancelled, QString());
    }

    Pix* pix = pixFromImage(image);
    if (!pix) {
        return finish(BackendResult::Status::MalformedImage,
                      QStringLiteral("Failed to convert image to grayscale"));
    }

    std::lock_guard<std::mutex> lock(m_impl->apiMutex);
    tesseract::TessBaseAPI* api = m_impl->api.get();
    api->SetImage(pix);
    api->SetSourceResolution(m_impl->sourceDpi);

    ETEXT_DESC monitor;
    monitor.cancel = &cancelRequested;
    monitor.cancel_this = const_cast<ExtractionContext*>(&context);
    if (context.timeoutMs > 0) {
        monitor.set_deadline_msecs(context.timeoutMs);
    }

    const int rc = api->Recognize(&monitor);
    const bool timedOut = context.timeoutMs > 0 && monitor.deadline_exceeded();

    if (rc != 0 || timedOut || context.cancelled()) {
        api->Clear();
        pixDestroy(&pix);
        if (context.cancelled()) {
            return finish(BackendResult::Status::Cancelled, QString());
        }
        if (timedOut) {
            return finish(BackendResult::Status::Timeout,
                          QStringLiteral("OCR exceeded %1 ms").arg(context.timeoutMs));
        }
        return finish(BackendResult::Status::InferenceFailed,
                      QStringLiteral("Tesseract recognition failed (rc=%1)").arg(rc));
    }

    char* ocrText = api->GetUTF8Text();
    if (ocrText) {
        result.text = QString::fromUtf8(ocrText).trimmed();
        delete[] ocrText;
    }
    const int meanConfidence = api->MeanTextConf();
    result.confidence = result.text.isEmpty()
        ? 0.0
        : std::clamp(static_cast<double>(meanConfidence) / 100.0, 0.0, 1.0);

    api->Clear();
    pixDestroy(&pix);

    finish(BackendResult::Status::Success, QString());
    LOG_DEBUG(ildExtraction, "OCR extracted %lld chars on page %d in %d ms (conf %.2f)",
              static_cast<long long>(result.text.size()), context.pageIndex,
              result.durationMs, result.confidence);
    return result;
}

} // namespace ild
