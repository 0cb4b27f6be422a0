#include "core/extraction/extractor_backend.h"
#include "core/shared/logging.h"

namespace ild {

QString backendStatusToString(BackendResult::Status status)
{
    switch (status) {
    case BackendResult::Status::Success:         return QStringLiteral("success");
    case BackendResult::Status::Unavailable:     return QStringLiteral("unavailable");
    case BackendResult::Status::Timeout:         return QStringLiteral("timeout");
    case BackendResult::Status::InferenceFailed: return QStringLiteral("inference_failed");
    case BackendResult::Status::MalformedImage:  return QStringLiteral("malformed_image");
    case BackendResult::Status::Cancelled:       return QStringLiteral("cancelled");
    }
    return QStringLiteral("inference_failed");
}

QString backendKindToString(BackendKind kind)
{
    switch (kind) {
    case BackendKind::DocumentTransformer: return QStringLiteral("document_transformer");
    case BackendKind::VisualQaTransformer: return QStringLiteral("visual_qa_transformer");
    case BackendKind::RemoteVision:        return QStringLiteral("remote_vision");
    case BackendKind::Ocr:                 return QStringLiteral("ocr");
    }
    return QStringLiteral("ocr");
}

bool ExtractorBackend::ensureReady()
{
    std::lock_guard<std::mutex> lock(m_initMutex);
    if (m_initAttempted) {
        return m_ready.load();
    }
    m_initAttempted = true;

    const bool ready = initialize();
    m_ready.store(ready);
    if (ready) {
        LOG_INFO(ildExtraction, "Extractor backend '%s' ready", qUtf8Printable(name()));
    } else {
        LOG_WARN(ildExtraction, "Extractor backend '%s' unavailable, will be skipped",
                 qUtf8Printable(name()));
    }
    return ready;
}

} // namespace ild
