#pragma once

#include <QString>
#include <QJsonObject>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sx {

// One model of manifest.json, keyed by role ("bi-encoder", "cross-encoder").
struct ModelManifestEntry {
    QString name;
    QString file;
    QString vocab;
    QString modelId;
    QString fallbackRole;
    int dimensions = 0;
    int maxSeqLength = 512;
    QString queryPrefix;
    QString tokenizer;
    std::vector<QString> inputs;
    std::vector<QString> outputs;
    // "cls" or "mean" for bi-encoders.
    QString poolingStrategy = QStringLiteral("cls");
    // "sigmoid" maps cross-encoder logits to [0, 1].
    QString outputTransform;
    int intraOpThreads = 2;
};

struct ModelManifest {
    std::unordered_map<std::string, ModelManifestEntry> models;

    static std::optional<ModelManifest> loadFromFile(const QString& path);
    static std::optional<ModelManifest> loadFromJson(const QJsonObject& root);
};

} // namespace sx
