#include "core/extraction/backend_factory.h"
#include "core/extraction/onnx_vision_backend.h"
#include "core/extraction/remote_vision_backend.h"
#include "core/extraction/tesseract_backend.h"
#include "core/shared/logging.h"

namespace ild {

namespace {

const QString kDonut = QStringLiteral("donut");
const QString kPix2Struct = QStringLiteral("pix2struct");
const QString kOpenAi = QStringLiteral("openai");
const QString kTesseract = QStringLiteral("tesseract");

} // anonymous namespace

QStringList BackendFactory::presetOrder(const QString& preset)
{
    const QString key = preset.trimmed().toLower();
    if (key == QStringLiteral("premium")) {
        return {kOpenAi, kTesseract};
    }
    if (key == QStringLiteral("high")) {
        return {kOpenAi, kDonut, kPix2Struct, kTesseract};
    }
    if (key == QStringLiteral("balanced")) {
        return {kDonut, kOpenAi, kPix2Struct, kTesseract};
    }
    if (key == QStringLiteral("fast")) {
        return {kTesseract, kOpenAi};
    }
    if (key == QStringLiteral("offline")) {
        return {kDonut, kPix2Struct, kTesseract};
    }
    if (key == QStringLiteral("basic")) {
        return {kTesseract};
    }
    return {};
}

QString BackendFactory::canonicalName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == kDonut || key == kPix2Struct || key == kOpenAi || key == kTesseract) {
        return key;
    }
    if (key == QStringLiteral("openai_vision") || key == QStringLiteral("remote_vision")) {
        return kOpenAi;
    }
    if (key == QStringLiteral("tesseract_fallback") || key == QStringLiteral("ocr")) {
        return kTesseract;
    }
    return QString();
}

QStringList BackendFactory::resolveOrder(const ExtractionSettings& settings)
{
    QStringList requested;
    if (!settings.preset.isEmpty()) {
        requested = presetOrder(settings.preset);
        if (requested.isEmpty()) {
            LOG_WARN(ildExtraction, "Unknown extraction preset '%s', using backend order",
                     qUtf8Printable(settings.preset));
        }
    }
    if (requested.isEmpty()) {
        requested = settings.backendOrder;
    }

    QStringList order;
    for (const QString& name : requested) {
        const QString canonical = canonicalName(name);
        if (canonical.isEmpty()) {
            LOG_WARN(ildExtraction, "Unknown extractor backend '%s' ignored", qUtf8Printable(name));
            continue;
        }
        if (!order.contains(canonical)) {
            order.append(canonical);
        }
    }

    if (settings.ocrFallbackEnabled && !order.contains(kTesseract)) {
        order.append(kTesseract);
    }
    return order;
}

std::vector<std::shared_ptr<ExtractorBackend>> BackendFactory::create(
    const ExtractionSettings& settings, ModelRegistry* registry)
{
    std::vector<std::shared_ptr<ExtractorBackend>> backends;
    const QStringList order = resolveOrder(settings);
    for (const QString& name : order) {
        if (name == kDonut || name == kPix2Struct) {
            backends.push_back(std::make_shared<OnnxVisionBackend>(registry, name));
        } else if (name == kOpenAi) {
            backends.push_back(std::make_shared<RemoteVisionBackend>(settings.remote));
        } else if (name == kTesseract) {
            backends.push_back(std::make_shared<TesseractBackend>(settings.tesseractLanguages,
                                                                  settings.renderDpi));
        }
    }
    LOG_INFO(ildExtraction, "Extractor backend order: %s",
             qUtf8Printable(order.join(QStringLiteral(", "))));
    return backends;
}

} // namespace ild
