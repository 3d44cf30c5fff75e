#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QProcessEnvironment>
#include <QStandardPaths>

namespace sx {

namespace {

const QStringList kApiTypes = {
    QStringLiteral("local"),
    QStringLiteral("openai"),
    QStringLiteral("gemini"),
    QStringLiteral("huggingface"),
};

// Accepts JSON numbers and numeric strings ("768"), as written by hand-edited
// config files and environment-driven bootstrap scripts.
std::optional<int> toPositiveInt(const QJsonValue& value)
{
    bool ok = false;
    int parsed = 0;
    if (value.isDouble()) {
        const double raw = value.toDouble();
        parsed = static_cast<int>(raw);
        ok = static_cast<double>(parsed) == raw;
    } else if (value.isString()) {
        parsed = value.toString().trimmed().toInt(&ok);
    }
    if (!ok || parsed <= 0) {
        return std::nullopt;
    }
    return parsed;
}

void readPositiveInt(const QJsonObject& section, const char* key, int& target)
{
    const QString name = QString::fromLatin1(key);
    if (!section.contains(name)) {
        return;
    }
    const std::optional<int> parsed = toPositiveInt(section.value(name));
    if (!parsed.has_value()) {
        LOG_WARN(sxCore, "Ignoring invalid setting %s, keeping %d", key, target);
        return;
    }
    target = parsed.value();
}

} // namespace

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(sxCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(sxCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(sxCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(sxCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(sxCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    // The file may hold an API key.
    file.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath =
        QProcessEnvironment::systemEnvironment().value(QStringLiteral("SEXTANT_SETTINGS"));
    if (!overridePath.isEmpty()) {
        return QDir::cleanPath(overridePath);
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/sextant/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject database;
    database.insert(QStringLiteral("path"), settings.dbPath);

    const EmbeddingSettings& e = settings.embedding;
    QJsonObject embedding;
    embedding.insert(QStringLiteral("api_type"), e.apiType);
    embedding.insert(QStringLiteral("model"), e.model);
    if (e.dimensions.has_value()) {
        embedding.insert(QStringLiteral("dimensions"), e.dimensions.value());
    }
    embedding.insert(QStringLiteral("endpoint"), e.endpoint);
    embedding.insert(QStringLiteral("api_key"), e.apiKey);
    embedding.insert(QStringLiteral("query_prefix"), e.queryPrefix);
    embedding.insert(QStringLiteral("models_dir"), e.modelsDir);
    embedding.insert(QStringLiteral("cross_encoder"), e.crossEncoder);
    embedding.insert(QStringLiteral("cross_encoder_endpoint"), e.crossEncoderEndpoint);
    embedding.insert(QStringLiteral("batch_size"), e.batchSize);
    embedding.insert(QStringLiteral("max_parallel_batches"), e.maxParallelBatches);
    embedding.insert(QStringLiteral("max_attempts"), e.maxAttempts);
    embedding.insert(QStringLiteral("base_delay_ms"), e.baseDelayMs);
    embedding.insert(QStringLiteral("max_delay_ms"), e.maxDelayMs);
    embedding.insert(QStringLiteral("timeout_ms"), e.timeoutMs);

    QJsonObject chunker;
    chunker.insert(QStringLiteral("max_tokens"), settings.chunker.maxTokens);
    chunker.insert(QStringLiteral("overlap_tokens"), settings.chunker.overlapTokens);

    QJsonObject indexer;
    indexer.insert(QStringLiteral("write_batch_chunks"), settings.indexer.writeBatchChunks);

    const SearchSettings& s = settings.search;
    QJsonObject search;
    search.insert(QStringLiteral("oversample_factor"), s.oversampleFactor);
    search.insert(QStringLiteral("min_candidate_floor"), s.minCandidateFloor);
    search.insert(QStringLiteral("query_embed_timeout_ms"), s.queryEmbedTimeoutMs);
    search.insert(QStringLiteral("rerank_timeout_ms"), s.rerankTimeoutMs);
    search.insert(QStringLiteral("dedup_overlap_ratio"), s.dedupOverlapRatio);

    QJsonObject json;
    json.insert(QStringLiteral("database"), database);
    json.insert(QStringLiteral("embedding"), embedding);
    json.insert(QStringLiteral("chunker"), chunker);
    json.insert(QStringLiteral("indexer"), indexer);
    json.insert(QStringLiteral("search"), search);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    const QJsonObject database = json.value(QStringLiteral("database")).toObject();
    settings.dbPath = database.value(QStringLiteral("path")).toString(settings.dbPath);

    const QJsonObject embedding = json.value(QStringLiteral("embedding")).toObject();
    EmbeddingSettings& e = settings.embedding;

    const QString apiType = embedding.value(QStringLiteral("api_type"))
                                .toString(e.apiType).trimmed().toLower();
    if (kApiTypes.contains(apiType)) {
        e.apiType = apiType;
    } else {
        LOG_WARN(sxCore, "Unknown embedding api_type '%s', using '%s'",
                 qUtf8Printable(apiType), qUtf8Printable(e.apiType));
    }

    e.model = embedding.value(QStringLiteral("model")).toString(e.model);
    if (embedding.contains(QStringLiteral("dimensions"))) {
        e.dimensions = toPositiveInt(embedding.value(QStringLiteral("dimensions")));
        if (!e.dimensions.has_value()) {
            LOG_WARN(sxCore, "Invalid embedding dimensions, leaving them to the model");
        }
    }
    e.endpoint = embedding.value(QStringLiteral("endpoint")).toString(e.endpoint);
    e.apiKey = embedding.value(QStringLiteral("api_key")).toString(e.apiKey);
    e.queryPrefix = embedding.value(QStringLiteral("query_prefix")).toString(e.queryPrefix);
    e.modelsDir = embedding.value(QStringLiteral("models_dir")).toString(e.modelsDir);
    e.crossEncoder = embedding.value(QStringLiteral("cross_encoder")).toString(e.crossEncoder);
    e.crossEncoderEndpoint = embedding.value(QStringLiteral("cross_encoder_endpoint"))
                                 .toString(e.crossEncoderEndpoint);
    readPositiveInt(embedding, "batch_size", e.batchSize);
    readPositiveInt(embedding, "max_parallel_batches", e.maxParallelBatches);
    readPositiveInt(embedding, "max_attempts", e.maxAttempts);
    readPositiveInt(embedding, "base_delay_ms", e.baseDelayMs);
    readPositiveInt(embedding, "max_delay_ms", e.maxDelayMs);
    readPositiveInt(embedding, "timeout_ms", e.timeoutMs);

    const QJsonObject chunker = json.value(QStringLiteral("chunker")).toObject();
    readPositiveInt(chunker, "max_tokens", settings.chunker.maxTokens);
    if (chunker.contains(QStringLiteral("overlap_tokens"))) {
        const int overlap = chunker.value(QStringLiteral("overlap_tokens")).toInt(-1);
        if (overlap >= 0 && overlap < settings.chunker.maxTokens) {
            settings.chunker.overlapTokens = overlap;
        } else {
            LOG_WARN(sxCore, "Ignoring invalid setting overlap_tokens, keeping %d",
                     settings.chunker.overlapTokens);
        }
    }

    const QJsonObject indexer = json.value(QStringLiteral("indexer")).toObject();
    readPositiveInt(indexer, "write_batch_chunks", settings.indexer.writeBatchChunks);

    const QJsonObject search = json.value(QStringLiteral("search")).toObject();
    SearchSettings& s = settings.search;
    readPositiveInt(search, "oversample_factor", s.oversampleFactor);
    readPositiveInt(search, "min_candidate_floor", s.minCandidateFloor);
    readPositiveInt(search, "query_embed_timeout_ms", s.queryEmbedTimeoutMs);
    readPositiveInt(search, "rerank_timeout_ms", s.rerankTimeoutMs);
    if (search.contains(QStringLiteral("dedup_overlap_ratio"))) {
        const double ratio = search.value(QStringLiteral("dedup_overlap_ratio")).toDouble(-1.0);
        if (ratio > 0.0 && ratio <= 1.0) {
            s.dedupOverlapRatio = ratio;
        } else {
            LOG_WARN(sxCore, "Ignoring invalid setting dedup_overlap_ratio, keeping %.2f",
                     s.dedupOverlapRatio);
        }
    }

    return settings;
}

bool SettingsManager::requiresReindex(const EmbeddingSettings& before,
                                      const EmbeddingSettings& after)
{
    return before.apiType != after.apiType
        || before.model != after.model
        || before.dimensions != after.dimensions
        || before.endpoint != after.endpoint;
}

} // namespace sx
