#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace pl {

// SettingsManager -- JSON save/load for service settings.
//
// Settings are stored as a JSON file at:
//   $POLICYLENS_SETTINGS, or <GenericDataLocation>/policylens/settings.json
class SettingsManager {
public:
    // Load settings from the default location. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<Settings> load();

    // Load settings from an explicit path.
    static std::optional<Settings> loadFromFile(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings, const QString& filePath = {});

    // Returns the default file path for the settings file.
    static QString settingsFilePath();

    // Convert settings to/from JSON. Absent keys keep their defaults.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace pl
