#pragma once

#include <QImage>
#include <QString>

#include <atomic>
#include <mutex>
#include <optional>

namespace ild {

// Result of one backend on one page image. A non-Success status is the
// ExtractionError of the taxonomy; text is meaningful only on Success.
struct BackendResult {
    enum class Status {
        Success,
        Unavailable,
        Timeout,
        InferenceFailed,
        MalformedImage,
        Cancelled,
    };

    Status status = Status::InferenceFailed;
    QString text;
    double confidence = 0.0;
    std::optional<QString> errorMessage;
    int durationMs = 0;
};

QString backendStatusToString(BackendResult::Status status);

// Per-call inputs from the orchestrator. cancelFlag may be null.
struct ExtractionContext {
    int pageIndex = 0;
    int timeoutMs = 0;
    const std::atomic<bool>* cancelFlag = nullptr;

    bool cancelled() const { return cancelFlag && cancelFlag->load(); }
};

enum class BackendKind {
    DocumentTransformer,
    VisualQaTransformer,
    RemoteVision,
    Ocr,
};

QString backendKindToString(BackendKind kind);

// ExtractorBackend -- one vision-language or OCR engine turning a page
// image into (text, confidence).
//
// Initialization is lazy and happens at most once: the first ensureReady()
// runs initialize(); later calls return the cached outcome. A backend whose
// initialization failed stays unready and is skipped by the orchestrator.
// extract() maps third-party errors to a status; anything that still
// escapes is recorded by the orchestrator as InferenceFailed.
class ExtractorBackend {
public:
    virtual ~ExtractorBackend() = default;

    virtual QString name() const = 0;
    virtual BackendKind kind() const = 0;

    // Thread-safe; blocks concurrent callers until the first attempt ends.
    bool ensureReady();
    bool isReady() const { return m_ready.load(); }

    virtual BackendResult extract(const QImage& image, const ExtractionContext& context) = 0;

protected:
    virtual bool initialize() = 0;

private:
    std::mutex m_initMutex;
    bool m_initAttempted = false;
    std::atomic<bool> m_ready{false};
};

} // namespace ild
