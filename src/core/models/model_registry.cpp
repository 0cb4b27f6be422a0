#include "core/models/model_registry.h"

#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

namespace ild {

namespace {

const QString kManifestName = QStringLiteral("manifest.json");

} // namespace

ModelRegistry::ModelRegistry(const QString& modelsDir)
    : m_modelsDir(modelsDir)
{
    const QString manifestPath = QDir(m_modelsDir).filePath(kManifestName);
    if (auto loaded = ModelManifest::loadFromFile(manifestPath)) {
        m_manifest = std::move(*loaded);
        LOG_INFO(ildCore, "ModelRegistry: %zu role(s) in %s", m_manifest.models.size(),
                 qPrintable(manifestPath));
    } else {
        LOG_WARN(ildCore, "ModelRegistry: no usable manifest at %s; model backends disabled",
                 qPrintable(manifestPath));
    }
}

ModelRegistry::~ModelRegistry() = default;

std::unique_ptr<ModelSession> ModelRegistry::openSession(const std::string& role) const
{
    const ModelManifestEntry* entry = m_manifest.find(role);
    if (!entry) {
        LOG_WARN(ildCore, "ModelRegistry: role '%s' not in manifest", role.c_str());
        return nullptr;
    }

    const QString modelPath = QDir(m_modelsDir).filePath(entry->file);
    if (!QFileInfo::exists(modelPath)) {
        LOG_WARN(ildCore, "ModelRegistry: model file %s for role '%s' is missing",
                 qPrintable(modelPath), role.c_str());
        return nullptr;
    }

    auto session = std::make_unique<ModelSession>(*entry);
    if (!session->initialize(modelPath)) {
        LOG_WARN(ildCore, "ModelRegistry: session for role '%s' failed to initialize",
                 role.c_str());
        return nullptr;
    }
    return session;
}

ModelSession* ModelRegistry::getSession(const std::string& role)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (const auto it = m_sessions.find(role); it != m_sessions.end()) {
        return it->second.get();
    }
    if (m_failedRoles.count(role) > 0) {
        return nullptr;
    }

    std::unique_ptr<ModelSession> session = openSession(role);
    if (!session) {
        m_failedRoles.insert(role);
        return nullptr;
    }
    LOG_INFO(ildCore, "ModelRegistry: loaded role '%s'", role.c_str());
    return m_sessions.emplace(role, std::move(session)).first->second.get();
}

bool ModelRegistry::hasModel(const std::string& role) const
{
    return m_manifest.find(role) != nullptr;
}

const ModelManifestEntry* ModelRegistry::entry(const std::string& role) const
{
    return m_manifest.find(role);
}

QString ModelRegistry::resolveModelsDir(const QString& configuredDir, const QString& dataDir)
{
    QStringList candidates;
    const auto addCandidate = [&candidates](const QString& dir) {
        if (!dir.isEmpty()) {
            const QString cleaned = QDir::cleanPath(dir);
            if (!candidates.contains(cleaned)) {
                candidates << cleaned;
            }
        }
    };

    addCandidate(qEnvironmentVariable("INLEGALDESK_MODELS_DIR"));
    addCandidate(configuredDir);
    if (QCoreApplication::instance() != nullptr) {
        addCandidate(QCoreApplication::applicationDirPath()
                     + QStringLiteral("/../share/inlegaldesk/models"));
    }
    if (!dataDir.isEmpty()) {
        addCandidate(QDir(dataDir).filePath(QStringLiteral("models")));
    }

    for (const QString& dir : candidates) {
        if (QFileInfo::exists(QDir(dir).filePath(kManifestName))) {
            LOG_DEBUG(ildCore, "ModelRegistry: models dir %s", qPrintable(dir));
            return dir;
        }
    }

    LOG_WARN(ildCore, "ModelRegistry: %s not found under %s", qPrintable(kManifestName),
             qPrintable(candidates.join(QStringLiteral(", "))));
    return candidates.value(0);
}

const ModelManifest& ModelRegistry::manifest() const
{
    return m_manifest;
}

const QString& ModelRegistry::modelsDir() const
{
    return m_modelsDir;
}

} // namespace ild
