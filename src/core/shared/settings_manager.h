#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace lp {

// SettingsManager -- JSON save/load for engine settings.
//
// Settings are stored as a JSON file at $LEARNPULSE_SETTINGS_PATH when set,
// otherwise at <GenericConfigLocation>/learnpulse/settings.json.
// Each module has its own section; missing keys keep their defaults.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<EngineSettings> load();

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const EngineSettings& settings);

    // Returns the file path for the settings file.
    static QString settingsFilePath();

    // Convert settings to/from JSON.
    static QJsonObject toJson(const EngineSettings& settings);
    static EngineSettings fromJson(const QJsonObject& json);
};

} // namespace lp
