#pragma once

#include "core/extraction/extractor_backend.h"
#include "core/shared/settings.h"

#include <QByteArray>

namespace ild {

// RemoteVisionBackend -- sends the page as a base64 PNG to an
// OpenAI-compatible chat completion endpoint and returns the model's
// transcription. Unready when the API key environment variable is empty.
//
// Each call owns its QNetworkAccessManager and event loop, so extract()
// may run on any worker thread.
class RemoteVisionBackend : public ExtractorBackend {
public:
    explicit RemoteVisionBackend(RemoteVisionSettings settings);
    ~RemoteVisionBackend() override;

    QString name() const override { return QStringLiteral("openai"); }
    BackendKind kind() const override { return BackendKind::RemoteVision; }

    BackendResult extract(const QImage& image, const ExtractionContext& context) override;

    // Request body for one page image. Exposed for tests.
    QByteArray buildRequestBody(const QImage& image) const;
    // Parses choices[0].message.content; nullopt when the payload is malformed.
    static std::optional<QString> parseResponseBody(const QByteArray& body);

protected:
    bool initialize() override;

private:
    RemoteVisionSettings m_settings;
    QByteArray m_apiKey;
};

} // namespace ild
