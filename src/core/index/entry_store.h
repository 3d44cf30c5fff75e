#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

struct sqlite3;

namespace sx {

class VectorIndex;

struct StoreResult {
    ErrorCode code = ErrorCode::None;
    QString message;

    bool ok() const { return code == ErrorCode::None; }
};

struct StoreWriteResult : StoreResult {
    int inserted = 0;
    int updated = 0;
    int deleted = 0;
    std::vector<int64_t> insertedIds;
};

struct CorpusInfo {
    QString corpusId;
    QString modelId;
    int dimensions = 0;
    int64_t createdAt = 0;
};

// Last indexed state of one file of a corpus.
struct FileState {
    QString filePath;
    QString contentHash;
    SourceType sourceType = SourceType::PlainText;
    int entryCount = 0;
    int64_t indexedBytes = 0;
    int64_t indexedAt = 0;
};

struct CorpusStats {
    int entryCount = 0;
    int fileCount = 0;
    int64_t indexedBytes = 0;
};

// Every write for one file, applied as part of a single transaction.
struct FileChangeSet {
    QString filePath;
    SourceType sourceType = SourceType::PlainText;
    QString contentHash;
    int64_t indexedBytes = 0;

    // Drops the file's entries and file state; inserts/updates are ignored.
    bool removeFile = false;

    std::vector<Entry> inserts;
    // Full rows, embedding included, addressed by Entry::id.
    std::vector<Entry> updates;
    std::vector<int64_t> deletes;
};

struct VectorQuery {
    QStringList corpusIds;
    std::vector<float> queryVector;
    int limit = 10;
    // Evaluated on each candidate's file path inside the ANN traversal.
    std::function<bool(const QString&)> pathFilter;
};

struct ScoredEntry {
    Entry entry;
    float similarity = 0.0f;
};

struct SimilarityResult : StoreResult {
    std::vector<ScoredEntry> hits;
};

// EntryStore: SQLite (WAL) persistence of entries plus one in-memory HNSW
// index per corpus.
//
// One writer connection guarded by a mutex and a small pool of read-only
// connections. Each similarity search hydrates its candidates inside one
// read transaction, so it observes a file batch either fully committed or
// not at all. The HNSW indexes are rebuilt lazily from the stored vectors
// and kept current after every commit; they only generate candidates, the
// returned similarity is always recomputed from the row.
class EntryStore {
public:
    ~EntryStore();

    EntryStore(const EntryStore&) = delete;
    EntryStore& operator=(const EntryStore&) = delete;

    // Open or create the database at the given file path.
    static std::unique_ptr<EntryStore> open(const QString& dbPath, int readerCount = 4);

    // ── Corpora ─────────────────────────────────────────────

    // Registers the corpus on first use. DimensionMismatch when the corpus
    // already exists with another model or dimension.
    StoreResult ensureCorpus(const QString& corpusId, const QString& modelId, int dimensions);
    std::optional<CorpusInfo> corpusInfo(const QString& corpusId);
    std::vector<CorpusInfo> listCorpora();
    StoreResult deleteCorpus(const QString& corpusId);

    // ── Reads ───────────────────────────────────────────────

    std::optional<std::vector<FileState>> fileStates(const QString& corpusId);
    // Entries ordered by chunk ordinal. Embeddings are loaded on request.
    std::optional<std::vector<Entry>> entriesForFile(const QString& corpusId,
                                                     const QString& filePath,
                                                     bool withEmbeddings = false);
    std::optional<CorpusStats> stats(const QString& corpusId);

    // ── Writes ──────────────────────────────────────────────

    // All-or-nothing: either every change set is committed or none is.
    StoreWriteResult applyFileChanges(const QString& corpusId,
                                      const std::vector<FileChangeSet>& changes);
    StoreWriteResult deleteFile(const QString& corpusId, const QString& filePath);
    StoreWriteResult deleteSourceType(const QString& corpusId, SourceType type);

    // ── Similarity ──────────────────────────────────────────

    SimilarityResult searchSimilar(const VectorQuery& query);

    // ── Maintenance ─────────────────────────────────────────

    // Rows changed through the writer connection since open.
    int64_t totalChanges() const;
    bool integrityCheck() const;

private:
    struct CorpusIndex;
    class ReaderLease;

    EntryStore() = default;

    bool init(const QString& dbPath, int readerCount);
    bool execSql(sqlite3* db, const char* sql) const;

    sqlite3* acquireReader();
    void releaseReader(sqlite3* db);

    std::optional<CorpusInfo> corpusInfoOn(sqlite3* db, const QString& corpusId) const;
    std::shared_ptr<CorpusIndex> corpusIndex(const CorpusInfo& info);
    std::shared_ptr<CorpusIndex> loadCorpusIndexLocked(const CorpusInfo& info);
    void dropCorpusIndex(const QString& corpusId);

    StoreWriteResult applyLocked(const QString& corpusId,
                                 const std::vector<FileChangeSet>& changes,
                                 std::vector<Entry>& upserted,
                                 std::vector<int64_t>& removed);

    sqlite3* m_writer = nullptr;
    mutable std::mutex m_writeMutex;

    std::vector<sqlite3*> m_readers;
    std::vector<sqlite3*> m_idleReaders;
    std::mutex m_readerMutex;
    std::condition_variable m_readerAvailable;

    std::map<QString, std::shared_ptr<CorpusIndex>> m_indexes;
    std::mutex m_indexMutex;
};

} // namespace sx
