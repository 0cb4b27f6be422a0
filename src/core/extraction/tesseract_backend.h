#pragma once

#include "core/extraction/extractor_backend.h"

#include <memory>

namespace ild {

// TesseractBackend -- local OCR fallback. Runs Tesseract with the
// configured language set (Hindi + English by default) on a Leptonica
// grayscale copy of the page. Confidence is the mean word confidence / 100.
class TesseractBackend : public ExtractorBackend {
public:
    explicit TesseractBackend(QString languages = QStringLiteral("hin+eng"),
                              int sourceDpi = 300);
    ~TesseractBackend() override;

    // Non-copyable (owns Tesseract engine state)
    TesseractBackend(const TesseractBackend&) = delete;
    TesseractBackend& operator=(const TesseractBackend&) = delete;

    QString name() const override { return QStringLiteral("tesseract"); }
    BackendKind kind() const override { return BackendKind::Ocr; }

    BackendResult extract(const QImage& image, const ExtractionContext& context) override;

protected:
    bool initialize() override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace ild
