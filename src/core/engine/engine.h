#pragma once

#include "core/index/entry_store.h"
#include "core/indexing/chunker.h"
#include "core/indexing/corpus_lock.h"
#include "core/indexing/indexer.h"
#include "core/search/search_pipeline.h"
#include "core/shared/cancellation.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <vector>

namespace sx {

class EmbeddingProvider;
class ProviderExecutor;

// Engine: the two entry points (index, search) plus content management
// over one entry store and one embedding provider.
//
// Every method is synchronous and may be called from any thread. Index runs
// and deletions for the same corpus are serialized by a corpus lock; other
// corpora and searches proceed in parallel.
class Engine {
public:
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Opens the store at settings.dbPath and the provider selected by
    // settings.embedding. nullptr with `error` set on failure.
    static std::unique_ptr<Engine> open(const Settings& settings, QString* error = nullptr);

    // Same, with a caller-supplied provider.
    static std::unique_ptr<Engine> open(const Settings& settings,
                                        std::unique_ptr<EmbeddingProvider> provider,
                                        QString* error = nullptr);

    // ── Entry points ────────────────────────────────────────

    IndexRunResult index(const QString& corpusId, const std::vector<ContentUnit>& units,
                         IndexMode mode = IndexMode::Sync,
                         const CancellationToken& token = {});

    SearchResponse search(const QString& rawQuery, const QStringList& corpusIds,
                          bool filtersEnabled = true, int topK = 10, bool rerank = true,
                          const CancellationToken& token = {});
    SearchResponse search(const SearchRequest& request, const CancellationToken& token = {});

    // ── Content management ──────────────────────────────────

    std::vector<CorpusInfo> corpora();
    std::optional<std::vector<FileState>> listFiles(const QString& corpusId);
    // Entry texts of a file in chunk order, joined by blank lines.
    // nullopt when the file is not indexed.
    std::optional<QString> fileContent(const QString& corpusId, const QString& filePath);
    std::optional<CorpusStats> stats(const QString& corpusId);

    StoreWriteResult deleteFile(const QString& corpusId, const QString& filePath);
    StoreWriteResult deleteSourceType(const QString& corpusId, SourceType type);
    StoreResult deleteCorpus(const QString& corpusId);

    static QStringList contentTypes();

    bool isIndexing(const QString& corpusId) const;

    EmbeddingProvider& provider() { return *m_provider; }
    EntryStore& store() { return *m_store; }
    const Settings& settings() const { return m_settings; }

private:
    Engine() = default;

    Settings m_settings;
    std::unique_ptr<EntryStore> m_store;
    std::unique_ptr<EmbeddingProvider> m_provider;
    std::unique_ptr<ProviderExecutor> m_executor;
    std::unique_ptr<Chunker> m_chunker;
    CorpusLockRegistry m_locks;
};

} // namespace sx
