#pragma once

#include "core/extraction/extractor_backend.h"
#include "core/shared/settings.h"

#include <QStringList>

#include <memory>
#include <vector>

namespace ild {

class ModelRegistry;

// Builds the ordered backend list from extraction settings. Backends are
// returned uninitialized; the orchestrator readies them lazily.
class BackendFactory {
public:
    // Backend order for a named preset; empty for an unknown name.
    static QStringList presetOrder(const QString& preset);

    // Effective order: the preset when set and known, else backendOrder,
    // with "tesseract" appended when OCR fallback is on. Aliases are
    // canonicalized and duplicates dropped.
    static QStringList resolveOrder(const ExtractionSettings& settings);

    // Canonical backend name, or empty when the name is unknown.
    static QString canonicalName(const QString& name);

    static std::vector<std::shared_ptr<ExtractorBackend>> create(
        const ExtractionSettings& settings, ModelRegistry* registry);
};

} // namespace ild
