#pragma once

#include "core/models/model_manifest.h"
#include "core/models/model_session.h"

#include <QString>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace ild {

// Owns the manifest of a models directory and the ONNX sessions created
// from it. Thread-safe.
class ModelRegistry {
public:
    explicit ModelRegistry(const QString& modelsDir);
    ~ModelRegistry();

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;
    ModelRegistry(ModelRegistry&&) = delete;
    ModelRegistry& operator=(ModelRegistry&&) = delete;

    // Lazy-creates and caches a ModelSession for the given role
    // (e.g. "bi-encoder", "donut"). Returns nullptr if the role is not in
    // the manifest or initialization fails. A failed role is not retried.
    ModelSession* getSession(const std::string& role);

    bool hasModel(const std::string& role) const;
    const ModelManifestEntry* entry(const std::string& role) const;

    // Resolves the models directory. Search order:
    //   1. $INLEGALDESK_MODELS_DIR
    //   2. the configured directory, when non-empty
    //   3. <app dir>/../share/inlegaldesk/models
    //   4. <data dir>/models
    // The first candidate holding manifest.json wins; otherwise the first
    // candidate is returned.
    static QString resolveModelsDir(const QString& configuredDir, const QString& dataDir);

    const ModelManifest& manifest() const;
    const QString& modelsDir() const;

private:
    std::unique_ptr<ModelSession> openSession(const std::string& role) const;

    QString m_modelsDir;
    ModelManifest m_manifest;
    std::unordered_map<std::string, std::unique_ptr<ModelSession>> m_sessions;
    std::unordered_set<std::string> m_failedRoles;
    mutable std::mutex m_mutex;
};

} // namespace ild
