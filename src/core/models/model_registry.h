#pragma once

#include "core/models/model_manifest.h"
#include "core/models/model_session.h"

#include <QString>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <unordered_map>
#include <vector>

namespace sx {

class ModelRegistry {
public:
    explicit ModelRegistry(const QString& modelsDir);
    ~ModelRegistry();

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;
    ModelRegistry(ModelRegistry&&) = delete;
    ModelRegistry& operator=(ModelRegistry&&) = delete;

    // Lazy-creates and caches a ModelSession for the given role (e.g. "bi-encoder").
    // Returns nullptr if the role is not in the manifest or initialization fails.
    ModelSession* getSession(const std::string& role);

    // Checks whether the manifest contains a model for the given role
    // without loading it.
    bool hasModel(const std::string& role) const;

    // Manifest entry for the role, or nullptr.
    const ModelManifestEntry* entry(const std::string& role) const;

    // Eagerly loads sessions for multiple roles.
    void preload(const std::vector<std::string>& roles);

    // Resolves the models directory. Search order:
    //   1. the configured directory (embedding.models_dir)
    //   2. $SEXTANT_MODELS_DIR
    //   3. <app dir>/models and <app dir>/../share/sextant/models
    //   4. <generic data location>/sextant/models
    // The first candidate holding a manifest.json wins; otherwise the first
    // candidate is returned.
    static QString resolveModelsDir(const QString& configuredDir = {});

    const ModelManifest& manifest() const;
    const QString& modelsDir() const;

private:
    ModelSession* getSessionUnlocked(const std::string& role,
                                     std::unordered_set<std::string>& visited);

    QString m_modelsDir;
    ModelManifest m_manifest;
    std::unordered_map<std::string, std::unique_ptr<ModelSession>> m_sessions;
    mutable std::mutex m_mutex;
};

} // namespace sx
