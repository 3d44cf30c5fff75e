#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace sx {

// SettingsManager -- JSON save/load for engine settings.
//
// Settings are stored as a JSON file at:
//   $SEXTANT_SETTINGS, or <GenericDataLocation>/sextant/settings.json
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath = settingsFilePath());

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings, const QString& filePath = settingsFilePath());

    // Returns the default file path for the settings file.
    static QString settingsFilePath();

    // Convert settings to/from JSON. Invalid values are logged and the
    // defaults kept.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);

    // True when switching from `before` to `after` changes the vectors the
    // bi-encoder produces, so existing corpora need a regenerate run.
    static bool requiresReindex(const EmbeddingSettings& before,
                                const EmbeddingSettings& after);
};

} // namespace sx
