#include "core/models/model_manifest.h"

#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace ild {

namespace {

std::vector<QString> readStrings(const QJsonObject& obj, const QString& key)
{
    std::vector<QString> values;
    const QJsonArray array = obj.value(key).toArray();
    values.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& value : array) {
        if (value.isString()) {
            values.push_back(value.toString());
        }
    }
    return values;
}

bool parseVision(const QJsonObject& obj, VisionPreprocess& vision, QString& reason)
{
    vision.mode = obj.value(QStringLiteral("mode")).toString(vision.mode);
    if (vision.mode != QLatin1String("resize_normalize")
        && vision.mode != QLatin1String("flattened_patches")) {
        reason = QStringLiteral("unknown vision mode '%1'").arg(vision.mode);
        return false;
    }
    vision.imageWidth = obj.value(QStringLiteral("imageWidth")).toInt(vision.imageWidth);
    vision.imageHeight = obj.value(QStringLiteral("imageHeight")).toInt(vision.imageHeight);
    vision.mean = static_cast<float>(obj.value(QStringLiteral("mean")).toDouble(vision.mean));
    vision.std = static_cast<float>(obj.value(QStringLiteral("std")).toDouble(vision.std));
    vision.maxPatches = obj.value(QStringLiteral("maxPatches")).toInt(vision.maxPatches);
    vision.patchSize = obj.value(QStringLiteral("patchSize")).toInt(vision.patchSize);
    if (vision.imageWidth <= 0 || vision.imageHeight <= 0 || vision.std == 0.0f
        || vision.maxPatches <= 0 || vision.patchSize <= 0) {
        reason = QStringLiteral("non-positive vision parameter");
        return false;
    }
    return true;
}

std::optional<ModelManifestEntry> parseEntry(const QJsonObject& obj, QString& reason)
{
    ModelManifestEntry entry;
    entry.name = obj.value(QStringLiteral("name")).toString();
    entry.file = obj.value(QStringLiteral("file")).toString();
    if (entry.name.isEmpty() || entry.file.isEmpty()) {
        reason = QStringLiteral("'name' and 'file' are required");
        return std::nullopt;
    }

    entry.dimensions = obj.value(QStringLiteral("dimensions")).toInt(entry.dimensions);
    entry.maxSeqLength = obj.value(QStringLiteral("maxSeqLength")).toInt(entry.maxSeqLength);
    if (entry.dimensions < 0 || entry.maxSeqLength <= 2) {
        reason = QStringLiteral("invalid dimensions or maxSeqLength");
        return std::nullopt;
    }

    entry.vocab = obj.value(QStringLiteral("vocab")).toString();
    entry.modelId = obj.value(QStringLiteral("modelId")).toString(entry.name);
    entry.generationId = obj.value(QStringLiteral("generationId")).toString(entry.generationId);
    entry.queryPrefix = obj.value(QStringLiteral("queryPrefix")).toString();
    entry.tokenizer = obj.value(QStringLiteral("tokenizer")).toString();
    entry.poolingStrategy =
        obj.value(QStringLiteral("poolingStrategy")).toString(entry.poolingStrategy);
    entry.inputs = readStrings(obj, QStringLiteral("inputs"));
    entry.outputs = readStrings(obj, QStringLiteral("outputs"));

    const QJsonValue vision = obj.value(QStringLiteral("vision"));
    if (vision.isObject() && !parseVision(vision.toObject(), entry.vision, reason)) {
        return std::nullopt;
    }
    return entry;
}

} // namespace

const ModelManifestEntry* ModelManifest::find(const std::string& role) const
{
    const auto it = models.find(role);
    return it == models.end() ? nullptr : &it->second;
}

std::optional<ModelManifest> ModelManifest::loadFromFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(ildCore, "ModelManifest: cannot open %s", qPrintable(path));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(ildCore, "ModelManifest: %s is not a JSON object (%s)", qPrintable(path),
                 qPrintable(parseError.errorString()));
        return std::nullopt;
    }
    return loadFromJson(doc.object());
}

std::optional<ModelManifest> ModelManifest::loadFromJson(const QJsonObject& root)
{
    const QJsonValue roles = root.value(QStringLiteral("models"));
    if (!roles.isObject()) {
        LOG_WARN(ildCore, "ModelManifest: 'models' object missing");
        return std::nullopt;
    }

    ModelManifest manifest;
    const QJsonObject rolesObj = roles.toObject();
    for (auto it = rolesObj.constBegin(); it != rolesObj.constEnd(); ++it) {
        QString reason = QStringLiteral("entry is not an object");
        std::optional<ModelManifestEntry> entry;
        if (it.value().isObject()) {
            entry = parseEntry(it.value().toObject(), reason);
        }
        if (!entry) {
            LOG_WARN(ildCore, "ModelManifest: skipping role '%s': %s", qPrintable(it.key()),
                     qPrintable(reason));
            continue;
        }
        manifest.models.emplace(it.key().toStdString(), std::move(*entry));
    }
    return manifest;
}

} // namespace ild
