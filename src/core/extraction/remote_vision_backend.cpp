#include "core/extraction/remote_vision_backend.h"
#include "core/extraction/text_confidence.h"
#include "core/shared/logging.h"

#include <QBuffer>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

namespace ild {

namespace {

const QString kExtractionPrompt = QStringLiteral(
    "Extract all text from this document image. Return only the extracted text "
    "without any additional commentary or formatting.");

constexpr int kCancelPollMs = 100;

} // anonymous namespace

RemoteVisionBackend::RemoteVisionBackend(RemoteVisionSettings settings)
    : m_settings(std::move(settings))
{
}

RemoteVisionBackend::~RemoteVisionBackend() = default;

bool RemoteVisionBackend::initialize()
{
    m_apiKey = qgetenv(m_settings.apiKeyEnv.toUtf8().constData()).trimmed();
    if (m_apiKey.isEmpty()) {
        LOG_WARN(ildExtraction, "Remote vision disabled: $%s is not set",
                 qUtf8Printable(m_settings.apiKeyEnv));
        return false;
    }
    if (!QUrl(m_settings.endpoint).isValid()) {
        LOG_WARN(ildExtraction, "Remote vision disabled: invalid endpoint '%s'",
                 qUtf8Printable(m_settings.endpoint));
        return false;
    }
    return true;
}

QByteArray RemoteVisionBackend::buildRequestBody(const QImage& image) const
{
    QByteArray png;
    QBuffer buffer(&png);
    buffer.open(QIODevice::WriteOnly);
    image.save(&buffer, "PNG");

    QJsonObject textPart;
    textPart.insert(QStringLiteral("type"), QStringLiteral("text"));
    textPart.insert(QStringLiteral("text"), kExtractionPrompt);

    QJsonObject imageUrl;
    imageUrl.insert(QStringLiteral("url"),
                    QStringLiteral("data:image/png;base64,")
                        + QString::fromLatin1(png.toBase64()));
    QJsonObject imagePart;
    imagePart.insert(QStringLiteral("type"), QStringLiteral("image_url"));
    imagePart.insert(QStringLiteral("image_url"), imageUrl);

    QJsonObject message;
    message.insert(QStringLiteral("role"), QStringLiteral("user"));
    message.insert(QStringLiteral("content"), QJsonArray{textPart, imagePart});

    QJsonObject body;
    body.insert(QStringLiteral("model"), m_settings.model);
    body.insert(QStringLiteral("messages"), QJsonArray{message});
    body.insert(QStringLiteral("max_tokens"), m_settings.maxTokens);
    body.insert(QStringLiteral("temperature"), m_settings.temperature);
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

std::optional<QString> RemoteVisionBackend::parseResponseBody(const QByteArray& body)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }

    const QJsonArray choices = doc.object().value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty()) {
        return std::nullopt;
    }
    const QJsonValue content = choices.first().toObject()
                                   .value(QStringLiteral("message")).toObject()
                                   .value(QStringLiteral("content"));
    if (!content.isString()) {
        return std::nullopt;
    }
    return content.toString().trimmed();
}

BackendResult RemoteVisionBackend::extract(const QImage& image, const ExtractionContext& context)
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

    if (!isReady()) {
        return finish(BackendResult::Status::Unavailable, QStringLiteral("API key missing"));
    }
    if (image.isNull()) {
        return finish(BackendResult::Status::MalformedImage, QStringLiteral("empty page image"));
    }

    QNetworkRequest request{QUrl(m_settings.endpoint)};
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("Authorization", "Bearer " + m_apiKey);
    if (context.timeoutMs > 0) {
        request.setTransferTimeout(context.timeoutMs);
    }

    // Thread-local manager and loop; the caller is a plain worker thread
    QNetworkAccessManager localManager;
    QEventLoop loop;
    QNetworkReply* reply = localManager.post(request, buildRequestBody(image));
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer cancelPoll;
    cancelPoll.setInterval(kCancelPollMs);
    QObject::connect(&cancelPoll, &QTimer::timeout, &loop, [&context, reply]() {
        if (context.cancelled()) {
            reply->abort();
        }
    });
    cancelPoll.start();

    if (!reply->isFinished()) {
        loop.exec();
    }
    cancelPoll.stop();

    const QNetworkReply::NetworkError error = reply->error();
    const QByteArray body = reply->readAll();
    const QString errorString = reply->errorString();
    const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    reply->deleteLater();

    if (context.cancelled()) {
        return finish(BackendResult::Status::Cancelled, QString());
    }
    if (error == QNetworkReply::OperationCanceledError || error == QNetworkReply::TimeoutError) {
        return finish(BackendResult::Status::Timeout,
                      QStringLiteral("no response within %1 ms").arg(context.timeoutMs));
    }
    if (error != QNetworkReply::NoError) {
        LOG_WARN(ildExtraction, "Remote vision request failed on page %d (HTTP %d): %s",
                 context.pageIndex, httpStatus, qUtf8Printable(errorString));
        return finish(BackendResult::Status::InferenceFailed,
                      QStringLiteral("HTTP %1: %2").arg(httpStatus).arg(errorString));
    }

    const std::optional<QString> text = parseResponseBody(body);
    if (!text.has_value()) {
        return finish(BackendResult::Status::InferenceFailed,
                      QStringLiteral("malformed completion payload"));
    }

    result.text = text.value();
    result.confidence = estimateTextConfidence(result.text);
    return finish(BackendResult::Status::Success, QString());
}

} // namespace ild
