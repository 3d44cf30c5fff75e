#include "core/engine/engine.h"
#include "core/embedding/embedding_provider.h"
#include "core/embedding/provider_executor.h"
#include "core/embedding/provider_factory.h"
#include "core/query/filter_set.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>

namespace sx {

namespace {

constexpr int kLiveWorkers = 2;

} // anonymous namespace

Engine::~Engine()
{
    // Workers may still hold references to the provider.
    m_executor.reset();
}

std::unique_ptr<Engine> Engine::open(const Settings& settings, QString* error)
{
    QString providerError;
    std::unique_ptr<EmbeddingProvider> provider =
        ProviderFactory::create(settings.embedding, &providerError);
    if (!provider) {
        if (error) {
            *error = providerError;
        }
        return nullptr;
    }
    return open(settings, std::move(provider), error);
}

std::unique_ptr<Engine> Engine::open(const Settings& settings,
                                     std::unique_ptr<EmbeddingProvider> provider,
                                     QString* error)
{
    auto fail = [error](const QString& message) -> std::unique_ptr<Engine> {
        LOG_ERROR(sxCore, "Engine: %s", qUtf8Printable(message));
        if (error) {
            *error = message;
        }
        return nullptr;
    };

    if (!provider) {
        return fail(QStringLiteral("no embedding provider"));
    }
    if (settings.dbPath.isEmpty()) {
        return fail(QStringLiteral("no database path configured"));
    }

    const QString dbDir = QFileInfo(settings.dbPath).absolutePath();
    if (!QDir().mkpath(dbDir)) {
        return fail(QStringLiteral("cannot create %1").arg(dbDir));
    }

    std::unique_ptr<Engine> engine(new Engine());
    engine->m_settings = settings;
    engine->m_store = EntryStore::open(settings.dbPath);
    if (!engine->m_store) {
        return fail(QStringLiteral("cannot open entry store at %1").arg(settings.dbPath));
    }
    engine->m_provider = std::move(provider);
    engine->m_executor = std::make_unique<ProviderExecutor>(
        kLiveWorkers, settings.embedding.maxParallelBatches);

    ChunkerConfig chunkerConfig;
    chunkerConfig.maxTokens = settings.chunker.maxTokens;
    chunkerConfig.overlapTokens = settings.chunker.overlapTokens;
    engine->m_chunker = std::make_unique<Chunker>(chunkerConfig);

    LOG_INFO(sxCore, "Engine ready: %s, provider %s",
             qUtf8Printable(settings.dbPath), qUtf8Printable(engine->m_provider->modelId()));
    return engine;
}

// ── Entry points ────────────────────────────────────────────

IndexRunResult Engine::index(const QString& corpusId, const std::vector<ContentUnit>& units,
                             IndexMode mode, const CancellationToken& token)
{
    CorpusLockRegistry::Guard guard = m_locks.acquire(corpusId);

    IndexerConfig config;
    config.batchSize = m_settings.embedding.batchSize;
    config.writeBatchChunks = m_settings.indexer.writeBatchChunks;
    config.embedTimeoutMs = m_settings.embedding.timeoutMs;

    Indexer indexer(*m_store, *m_provider, *m_executor, *m_chunker, config);
    return indexer.run(corpusId, units, mode, token);
}

SearchResponse Engine::search(const QString& rawQuery, const QStringList& corpusIds,
                              bool filtersEnabled, int topK, bool rerank,
                              const CancellationToken& token)
{
    SearchRequest request;
    request.rawQuery = rawQuery;
    request.corpusIds = corpusIds;
    request.filtersEnabled = filtersEnabled;
    request.topK = topK;
    request.rerank = rerank;
    return search(request, token);
}

SearchResponse Engine::search(const SearchRequest& request, const CancellationToken& token)
{
    SearchConfig config;
    config.oversampleFactor = m_settings.search.oversampleFactor;
    config.minCandidateFloor = m_settings.search.minCandidateFloor;
    config.queryEmbedTimeoutMs = m_settings.search.queryEmbedTimeoutMs;
    config.rerankTimeoutMs = m_settings.search.rerankTimeoutMs;
    config.dedupOverlapRatio = m_settings.search.dedupOverlapRatio;

    // Built per request so relative dates ("today") track the clock.
    const FilterSet filters = FilterSet::standard();
    SearchPipeline pipeline(*m_store, *m_provider, *m_executor, filters, config);
    return pipeline.search(request, token);
}

// ── Content management ──────────────────────────────────────

std::vector<CorpusInfo> Engine::corpora()
{
    return m_store->listCorpora();
}

std::optional<std::vector<FileState>> Engine::listFiles(const QString& corpusId)
{
    return m_store->fileStates(corpusId);
}

std::optional<QString> Engine::fileContent(const QString& corpusId, const QString& filePath)
{
    const std::optional<std::vector<Entry>> entries = m_store->entriesForFile(corpusId, filePath);
    if (!entries.has_value() || entries->empty()) {
        return std::nullopt;
    }

    QStringList parts;
    for (const Entry& entry : *entries) {
        parts.append(entry.text);
    }
    return parts.join(QStringLiteral("\n\n"));
}

std::optional<CorpusStats> Engine::stats(const QString& corpusId)
{
    return m_store->stats(corpusId);
}

StoreWriteResult Engine::deleteFile(const QString& corpusId, const QString& filePath)
{
    CorpusLockRegistry::Guard guard = m_locks.acquire(corpusId);
    return m_store->deleteFile(corpusId, filePath);
}

StoreWriteResult Engine::deleteSourceType(const QString& corpusId, SourceType type)
{
    CorpusLockRegistry::Guard guard = m_locks.acquire(corpusId);
    return m_store->deleteSourceType(corpusId, type);
}

StoreResult Engine::deleteCorpus(const QString& corpusId)
{
    CorpusLockRegistry::Guard guard = m_locks.acquire(corpusId);
    return m_store->deleteCorpus(corpusId);
}

QStringList Engine::contentTypes()
{
    return supportedSourceTypes();
}

bool Engine::isIndexing(const QString& corpusId) const
{
    return m_locks.isLocked(corpusId);
}

} // namespace sx
