#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace ild {

// SettingsManager -- JSON save/load for engine settings.
//
// Default location:
//   $XDG_DATA_HOME/inlegaldesk/settings.json
// Missing keys keep their defaults; unknown keys are ignored.
class SettingsManager {
public:
    // Returns nullopt if the file doesn't exist or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath);

    // Creates the parent directory if needed.
    static bool save(const Settings& settings, const QString& filePath);

    static QString defaultSettingsPath();
    static QString defaultDataDir();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace ild
