#include "core/models/model_registry.h"

#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QProcessEnvironment>
#include <QStandardPaths>

namespace sx {

namespace {

QStringList modelDirCandidates(const QString& configuredDir)
{
    QStringList candidates;
    if (!configuredDir.isEmpty()) {
        candidates << QDir::cleanPath(configuredDir);
    }

    const QString envModelDir =
        QProcessEnvironment::systemEnvironment().value(QStringLiteral("SEXTANT_MODELS_DIR"));
    if (!envModelDir.isEmpty()) {
        candidates << QDir::cleanPath(envModelDir);
    }

    if (QCoreApplication::instance() != nullptr) {
        const QString appDir = QCoreApplication::applicationDirPath();
        candidates << QDir::cleanPath(appDir + QStringLiteral("/models"));
        candidates << QDir::cleanPath(appDir + QStringLiteral("/../share/sextant/models"));
    }

    candidates << QDir::cleanPath(
        QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
        + QStringLiteral("/sextant/models"));

    candidates.removeDuplicates();
    return candidates;
}

} // namespace

ModelRegistry::ModelRegistry(const QString& modelsDir)
    : m_modelsDir(modelsDir)
{
    const QString manifestPath = m_modelsDir + QStringLiteral("/manifest.json");
    std::optional<ModelManifest> loaded = ModelManifest::loadFromFile(manifestPath);
    if (loaded.has_value()) {
        m_manifest = std::move(loaded.value());
        LOG_INFO(sxEmbed, "ModelRegistry: loaded manifest with %zu model(s) from %s",
                 m_manifest.models.size(), qPrintable(manifestPath));
    } else {
        LOG_WARN(sxEmbed, "ModelRegistry: failed to load manifest from %s",
                 qPrintable(manifestPath));
    }
}

ModelRegistry::~ModelRegistry() = default;

ModelSession* ModelRegistry::getSession(const std::string& role)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::unordered_set<std::string> visited;
    visited.insert(role);
    return getSessionUnlocked(role, visited);
}

ModelSession* ModelRegistry::getSessionUnlocked(const std::string& role,
                                                std::unordered_set<std::string>& visited)
{
    auto sessionIt = m_sessions.find(role);
    if (sessionIt != m_sessions.end()) {
        return sessionIt->second.get();
    }

    auto manifestIt = m_manifest.models.find(role);
    if (manifestIt == m_manifest.models.end()) {
        LOG_WARN(sxEmbed, "ModelRegistry: no manifest entry for role '%s'", role.c_str());
        return nullptr;
    }

    const ModelManifestEntry& entry = manifestIt->second;
    const QString modelPath = m_modelsDir + QStringLiteral("/") + entry.file;

    auto session = std::make_unique<ModelSession>(entry);
    if (!session->initialize(modelPath)) {
        if (!entry.fallbackRole.isEmpty()) {
            const std::string fallbackRole = entry.fallbackRole.toStdString();
            if (!visited.count(fallbackRole)) {
                visited.insert(fallbackRole);
                LOG_WARN(sxEmbed,
                         "ModelRegistry: failed to initialize role '%s', trying fallback role '%s'",
                         role.c_str(), fallbackRole.c_str());
                return getSessionUnlocked(fallbackRole, visited);
            }
        }
        LOG_WARN(sxEmbed, "ModelRegistry: failed to initialize session for role '%s'",
                 role.c_str());
        return nullptr;
    }

    ModelSession* raw = session.get();
    m_sessions[role] = std::move(session);
    return raw;
}

bool ModelRegistry::hasModel(const std::string& role) const
{
    return m_manifest.models.find(role) != m_manifest.models.end();
}

const ModelManifestEntry* ModelRegistry::entry(const std::string& role) const
{
    const auto it = m_manifest.models.find(role);
    return it != m_manifest.models.end() ? &it->second : nullptr;
}

void ModelRegistry::preload(const std::vector<std::string>& roles)
{
    for (const std::string& role : roles) {
        getSession(role);
    }
}

QString ModelRegistry::resolveModelsDir(const QString& configuredDir)
{
    const QStringList candidates = modelDirCandidates(configuredDir);

    for (const QString& dir : candidates) {
        if (QFile::exists(dir + QStringLiteral("/manifest.json"))) {
            LOG_INFO(sxEmbed, "ModelRegistry: resolved models dir to %s", qPrintable(dir));
            return dir;
        }
    }

    LOG_WARN(sxEmbed, "ModelRegistry: manifest.json not found in any candidate dir. Searched: %s",
             qPrintable(candidates.join(QStringLiteral(", "))));
    return candidates.isEmpty() ? QString() : candidates.first();
}

const ModelManifest& ModelRegistry::manifest() const
{
    return m_manifest;
}

const QString& ModelRegistry::modelsDir() const
{
    return m_modelsDir;
}

} // namespace sx
