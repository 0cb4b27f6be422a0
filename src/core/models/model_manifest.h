#pragma once

#include <QString>
#include <QJsonObject>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ild {

// Image preprocessing for vision-language roles.
//   "resize_normalize":  resize to imageWidth x imageHeight, RGB planar
//                        [1,3,H,W], (v/255 - mean) / std
//   "flattened_patches": aspect-preserving patch grid of at most
//                        maxPatches patchSize^2 RGB patches, per-image
//                        standardization, [1,maxPatches,2+3*patchSize^2]
struct VisionPreprocess {
    QString mode = QStringLiteral("resize_normalize");
    int imageWidth = 1920;
    int imageHeight = 2560;
    float mean = 0.5f;
    float std = 0.5f;
    int maxPatches = 2048;
    int patchSize = 16;
};

struct ModelManifestEntry {
    QString name;
    QString file;
    QString vocab;
    QString modelId;
    QString generationId = QStringLiteral("v1");
    int dimensions = 0;
    int maxSeqLength = 512;
    QString queryPrefix;
    QString tokenizer;
    std::vector<QString> inputs;
    std::vector<QString> outputs;
    QString poolingStrategy = QStringLiteral("mean");
    VisionPreprocess vision;
};

// manifest.json: {"models": {"<role>": {entry}, ...}}. An entry needs
// "name" and a non-empty "file"; invalid entries are logged and skipped,
// so a manifest may load with fewer roles than it lists.
struct ModelManifest {
    std::unordered_map<std::string, ModelManifestEntry> models;

    const ModelManifestEntry* find(const std::string& role) const;

    static std::optional<ModelManifest> loadFromFile(const QString& path);
    static std::optional<ModelManifest> loadFromJson(const QJsonObject& root);
};

} // namespace ild
