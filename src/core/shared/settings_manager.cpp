#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace ild {

namespace {

QStringList stringListFromJson(const QJsonValue& value)
{
    QStringList out;
    const QJsonArray array = value.toArray();
    out.reserve(array.size());
    for (const QJsonValue& entry : array) {
        const QString s = entry.toString().trimmed();
        if (!s.isEmpty()) {
            out.append(s);
        }
    }
    return out;
}

QJsonObject remoteToJson(const RemoteVisionSettings& remote)
{
    QJsonObject json;
    json.insert(QStringLiteral("endpoint"), remote.endpoint);
    json.insert(QStringLiteral("model"), remote.model);
    json.insert(QStringLiteral("apiKeyEnv"), remote.apiKeyEnv);
    json.insert(QStringLiteral("maxTokens"), remote.maxTokens);
    json.insert(QStringLiteral("temperature"), remote.temperature);
    return json;
}

RemoteVisionSettings remoteFromJson(const QJsonObject& json)
{
    RemoteVisionSettings remote;
    remote.endpoint = json.value(QStringLiteral("endpoint")).toString(remote.endpoint);
    remote.model = json.value(QStringLiteral("model")).toString(remote.model);
    remote.apiKeyEnv = json.value(QStringLiteral("apiKeyEnv")).toString(remote.apiKeyEnv);
    remote.maxTokens = json.value(QStringLiteral("maxTokens")).toInt(remote.maxTokens);
    remote.temperature = json.value(QStringLiteral("temperature")).toDouble(remote.temperature);
    return remote;
}

} // namespace

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(ildCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(ildCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(ildCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(ildCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(ildCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::defaultSettingsPath()
{
    return defaultDataDir() + QStringLiteral("/settings.json");
}

QString SettingsManager::defaultDataDir()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/inlegaldesk");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject extraction;
    extraction.insert(QStringLiteral("backendOrder"),
                      QJsonArray::fromStringList(settings.extraction.backendOrder));
    extraction.insert(QStringLiteral("preset"), settings.extraction.preset);
    extraction.insert(QStringLiteral("ocrFallbackEnabled"), settings.extraction.ocrFallbackEnabled);
    extraction.insert(QStringLiteral("acceptanceThreshold"), settings.extraction.acceptanceThreshold);
    extraction.insert(QStringLiteral("concurrency"), settings.extraction.concurrency);
    extraction.insert(QStringLiteral("backendTimeoutMs"), settings.extraction.backendTimeoutMs);
    extraction.insert(QStringLiteral("renderDpi"), settings.extraction.renderDpi);
    extraction.insert(QStringLiteral("tesseractLanguages"), settings.extraction.tesseractLanguages);
    extraction.insert(QStringLiteral("remote"), remoteToJson(settings.extraction.remote));

    QJsonObject chunking;
    chunking.insert(QStringLiteral("windowTokens"), settings.chunking.windowTokens);
    chunking.insert(QStringLiteral("overlapTokens"), settings.chunking.overlapTokens);

    QJsonObject retrieval;
    retrieval.insert(QStringLiteral("denseWeight"), settings.retrieval.denseWeight);
    retrieval.insert(QStringLiteral("sparseWeight"), settings.retrieval.sparseWeight);
    retrieval.insert(QStringLiteral("defaultTopK"), settings.retrieval.defaultTopK);
    retrieval.insert(QStringLiteral("candidateMultiplier"), settings.retrieval.candidateMultiplier);
    retrieval.insert(QStringLiteral("minCandidates"), settings.retrieval.minCandidates);

    QJsonObject bm25;
    bm25.insert(QStringLiteral("k1"), settings.bm25.k1);
    bm25.insert(QStringLiteral("b"), settings.bm25.b);

    QJsonObject json;
    json.insert(QStringLiteral("dataDir"), settings.dataDir);
    json.insert(QStringLiteral("modelsDir"), settings.modelsDir);
    json.insert(QStringLiteral("embeddingRole"), settings.embeddingRole);
    json.insert(QStringLiteral("embeddingBatchSize"), settings.embeddingBatchSize);
    json.insert(QStringLiteral("extraction"), extraction);
    json.insert(QStringLiteral("chunking"), chunking);
    json.insert(QStringLiteral("retrieval"), retrieval);
    json.insert(QStringLiteral("bm25"), bm25);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dataDir = json.value(QStringLiteral("dataDir")).toString(settings.dataDir);
    settings.modelsDir = json.value(QStringLiteral("modelsDir")).toString(settings.modelsDir);
    settings.embeddingRole = json.value(QStringLiteral("embeddingRole"))
                                 .toString(settings.embeddingRole);
    settings.embeddingBatchSize = json.value(QStringLiteral("embeddingBatchSize"))
                                      .toInt(settings.embeddingBatchSize);

    const QJsonObject extraction = json.value(QStringLiteral("extraction")).toObject();
    ExtractionSettings& ex = settings.extraction;
    if (extraction.contains(QStringLiteral("backendOrder"))) {
        ex.backendOrder = stringListFromJson(extraction.value(QStringLiteral("backendOrder")));
    }
    ex.preset = extraction.value(QStringLiteral("preset")).toString(ex.preset).trimmed().toLower();
    ex.ocrFallbackEnabled = extraction.value(QStringLiteral("ocrFallbackEnabled"))
                                .toBool(ex.ocrFallbackEnabled);
    ex.acceptanceThreshold = extraction.value(QStringLiteral("acceptanceThreshold"))
                                 .toDouble(ex.acceptanceThreshold);
    ex.concurrency = extraction.value(QStringLiteral("concurrency")).toInt(ex.concurrency);
    ex.backendTimeoutMs = extraction.value(QStringLiteral("backendTimeoutMs"))
                              .toInt(ex.backendTimeoutMs);
    ex.renderDpi = extraction.value(QStringLiteral("renderDpi")).toInt(ex.renderDpi);
    ex.tesseractLanguages = extraction.value(QStringLiteral("tesseractLanguages"))
                                .toString(ex.tesseractLanguages);
    if (extraction.value(QStringLiteral("remote")).isObject()) {
        ex.remote = remoteFromJson(extraction.value(QStringLiteral("remote")).toObject());
    }

    const QJsonObject chunking = json.value(QStringLiteral("chunking")).toObject();
    settings.chunking.windowTokens = chunking.value(QStringLiteral("windowTokens"))
                                         .toInt(settings.chunking.windowTokens);
    settings.chunking.overlapTokens = chunking.value(QStringLiteral("overlapTokens"))
                                          .toInt(settings.chunking.overlapTokens);

    const QJsonObject retrieval = json.value(QStringLiteral("retrieval")).toObject();
    RetrievalSettings& rs = settings.retrieval;
    rs.denseWeight = retrieval.value(QStringLiteral("denseWeight")).toDouble(rs.denseWeight);
    rs.sparseWeight = retrieval.value(QStringLiteral("sparseWeight")).toDouble(rs.sparseWeight);
    rs.defaultTopK = retrieval.value(QStringLiteral("defaultTopK")).toInt(rs.defaultTopK);
    rs.candidateMultiplier = retrieval.value(QStringLiteral("candidateMultiplier"))
                                 .toInt(rs.candidateMultiplier);
    rs.minCandidates = retrieval.value(QStringLiteral("minCandidates")).toInt(rs.minCandidates);

    const QJsonObject bm25 = json.value(QStringLiteral("bm25")).toObject();
    settings.bm25.k1 = bm25.value(QStringLiteral("k1")).toDouble(settings.bm25.k1);
    settings.bm25.b = bm25.value(QStringLiteral("b")).toDouble(settings.bm25.b);

    return settings;
}

} // namespace ild
