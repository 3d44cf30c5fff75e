#include "core/index/entry_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index.h"

#include <sqlite3.h>

#include <QDateTime>
#include <QFile>
#include <QThread>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <shared_mutex>
#include <unordered_map>

namespace sx {

namespace {

constexpr int kHydrateBatch = 500;

// Column order shared by every query that materializes an Entry.
constexpr const char* kEntryColumns =
    "id, corpus_id, file_path, source_type, heading, text, content_hash, chunk_hash, "
    "chunk_ordinal, char_start, char_end, created_at, updated_at, embedding";

constexpr const char* kSelectCorpusSql =
    "SELECT corpus_id, model_id, dimensions, created_at FROM corpora WHERE corpus_id = ?1";
constexpr const char* kListCorporaSql =
    "SELECT corpus_id, model_id, dimensions, created_at FROM corpora ORDER BY corpus_id ASC";
constexpr const char* kInsertCorpusSql =
    "INSERT INTO corpora (corpus_id, model_id, dimensions, created_at) VALUES (?1, ?2, ?3, ?4)";
constexpr const char* kDeleteCorpusSql = "DELETE FROM corpora WHERE corpus_id = ?1";

constexpr const char* kInsertEntrySql = R"(
    INSERT INTO entries (corpus_id, file_path, source_type, heading, text, embedding,
                         content_hash, chunk_hash, chunk_ordinal, char_start, char_end,
                         created_at, updated_at)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?12)
)";

constexpr const char* kUpdateEntrySql = R"(
    UPDATE entries SET
        file_path = ?3,
        source_type = ?4,
        heading = ?5,
        text = ?6,
        embedding = ?7,
        content_hash = ?8,
        chunk_hash = ?9,
        chunk_ordinal = ?10,
        char_start = ?11,
        char_end = ?12,
        updated_at = ?13
    WHERE id = ?1 AND corpus_id = ?2
)";

constexpr const char* kDeleteEntrySql = "DELETE FROM entries WHERE id = ?1 AND corpus_id = ?2";
constexpr const char* kEntryOwnerSql = "SELECT corpus_id FROM entries WHERE id = ?1";
constexpr const char* kFileEntryIdsSql =
    "SELECT id FROM entries WHERE corpus_id = ?1 AND file_path = ?2";
constexpr const char* kDeleteFileEntriesSql =
    "DELETE FROM entries WHERE corpus_id = ?1 AND file_path = ?2";
constexpr const char* kDeleteDatesSql = "DELETE FROM entry_dates WHERE entry_id = ?1";
constexpr const char* kInsertDateSql =
    "INSERT OR IGNORE INTO entry_dates (entry_id, day) VALUES (?1, ?2)";

constexpr const char* kUpsertFileStateSql = R"(
    INSERT INTO file_state (corpus_id, file_path, content_hash, source_type,
                            indexed_bytes, indexed_at)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    ON CONFLICT(corpus_id, file_path) DO UPDATE SET
        content_hash = excluded.content_hash,
        source_type = excluded.source_type,
        indexed_bytes = excluded.indexed_bytes,
        indexed_at = excluded.indexed_at
)";

constexpr const char* kDeleteFileStateSql =
    "DELETE FROM file_state WHERE corpus_id = ?1 AND file_path = ?2";

constexpr const char* kFileStatesSql = R"(
    SELECT fs.file_path, fs.content_hash, fs.source_type, fs.indexed_bytes, fs.indexed_at,
           (SELECT COUNT(*) FROM entries e
            WHERE e.corpus_id = fs.corpus_id AND e.file_path = fs.file_path)
    FROM file_state fs
    WHERE fs.corpus_id = ?1
    ORDER BY fs.file_path ASC
)";

constexpr const char* kFileDatesSql = R"(
    SELECT d.entry_id, d.day
    FROM entry_dates d
    JOIN entries e ON e.id = d.entry_id
    WHERE e.corpus_id = ?1 AND e.file_path = ?2
    ORDER BY d.day ASC
)";

constexpr const char* kStatsSql = R"(
    SELECT (SELECT COUNT(*) FROM entries WHERE corpus_id = ?1),
           (SELECT COUNT(*) FROM file_state WHERE corpus_id = ?1),
           (SELECT COALESCE(SUM(indexed_bytes), 0) FROM file_state WHERE corpus_id = ?1)
)";

constexpr const char* kCorpusVectorsSql =
    "SELECT id, file_path, embedding FROM entries WHERE corpus_id = ?1 ORDER BY id ASC";
constexpr const char* kFilesOfTypeSql =
    "SELECT file_path FROM file_state WHERE corpus_id = ?1 AND source_type = ?2 "
    "ORDER BY file_path ASC";

// Prepared statement owned for the duration of one scope.
class Statement {
public:
    Statement(sqlite3* db, const char* sql)
        : m_db(db)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(sxStore, "prepare failed: %s", sqlite3_errmsg(db));
            sqlite3_finalize(m_stmt);
            m_stmt = nullptr;
        }
    }

    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return m_stmt != nullptr; }
    sqlite3_stmt* get() const { return m_stmt; }

    void bindText(int index, const QString& value)
    {
        const QByteArray utf8 = value.toUtf8();
        sqlite3_bind_text(m_stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
    }

    void bindInt64(int index, int64_t value) { sqlite3_bind_int64(m_stmt, index, value); }

    void bindVector(int index, const std::vector<float>& values)
    {
        sqlite3_bind_blob(m_stmt, index, values.data(),
                          static_cast<int>(values.size() * sizeof(float)), SQLITE_TRANSIENT);
    }

    // sqlite3_busy_timeout's handler is not invoked when SQLite detects a
    // potential WAL deadlock, so SQLITE_BUSY is retried here as well.
    int step()
    {
        int rc = SQLITE_BUSY;
        for (int attempt = 0; attempt < 5 && rc == SQLITE_BUSY; ++attempt) {
            if (attempt > 0) {
                sqlite3_reset(m_stmt);
                QThread::msleep(50 * attempt);  // 50, 100, 150, 200 ms
            }
            rc = sqlite3_step(m_stmt);
        }
        return rc;
    }

    // Runs a statement that returns no rows.
    bool exec()
    {
        const int rc = step();
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(sxStore, "step failed: %s", sqlite3_errmsg(m_db));
            return false;
        }
        return true;
    }

    void reset()
    {
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
    }

    QString columnText(int col) const
    {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return text ? QString::fromUtf8(text, sqlite3_column_bytes(m_stmt, col)) : QString();
    }

    int64_t columnInt64(int col) const { return sqlite3_column_int64(m_stmt, col); }

    std::vector<float> columnVector(int col) const
    {
        std::vector<float> values;
        const void* blob = sqlite3_column_blob(m_stmt, col);
        const int bytes = sqlite3_column_bytes(m_stmt, col);
        if (blob == nullptr || bytes <= 0 || bytes % static_cast<int>(sizeof(float)) != 0) {
            return values;
        }
        values.resize(static_cast<size_t>(bytes) / sizeof(float));
        std::memcpy(values.data(), blob, static_cast<size_t>(bytes));
        return values;
    }

private:
    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_stmt = nullptr;
};

void normalizeInPlace(std::vector<float>& values)
{
    double norm = 0.0;
    for (float v : values) {
        norm += static_cast<double>(v) * static_cast<double>(v);
    }
    norm = std::sqrt(norm);
    if (norm <= 0.0) {
        return;
    }
    for (float& v : values) {
        v = static_cast<float>(v / norm);
    }
}

float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b)
{
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0f;
    }
    return static_cast<float>(dot / (std::sqrt(normA) * std::sqrt(normB)));
}

Entry readEntry(const Statement& stmt, bool withEmbedding)
{
    Entry entry;
    entry.id = stmt.columnInt64(0);
    entry.corpusId = stmt.columnText(1);
    entry.filePath = stmt.columnText(2);
    entry.sourceType = sourceTypeFromString(stmt.columnText(3));
    entry.heading = stmt.columnText(4);
    entry.text = stmt.columnText(5);
    entry.contentHash = stmt.columnText(6);
    entry.chunkHash = stmt.columnText(7);
    entry.chunkOrdinal = static_cast<int>(stmt.columnInt64(8));
    entry.charStart = static_cast<int>(stmt.columnInt64(9));
    entry.charEnd = static_cast<int>(stmt.columnInt64(10));
    entry.createdAt = stmt.columnInt64(11);
    entry.updatedAt = stmt.columnInt64(12);
    if (withEmbedding) {
        entry.embedding = stmt.columnVector(13);
    }
    return entry;
}

QByteArray inClause(size_t count)
{
    QByteArray placeholders;
    for (size_t i = 0; i < count; ++i) {
        placeholders += (i == 0) ? "?" : ",?";
    }
    return placeholders;
}

} // namespace

struct EntryStore::CorpusIndex {
    std::unique_ptr<VectorIndex> index;
    std::unordered_map<uint64_t, QString> paths;
    std::shared_mutex mutex;
};

class EntryStore::ReaderLease {
public:
    explicit ReaderLease(EntryStore& store)
        : m_store(store)
        , m_db(store.acquireReader())
    {
    }

    ~ReaderLease() { m_store.releaseReader(m_db); }

    ReaderLease(const ReaderLease&) = delete;
    ReaderLease& operator=(const ReaderLease&) = delete;

    sqlite3* db() const { return m_db; }

private:
    EntryStore& m_store;
    sqlite3* m_db = nullptr;
};

EntryStore::~EntryStore()
{
    for (sqlite3* reader : m_readers) {
        sqlite3_close(reader);
    }
    if (m_writer) {
        sqlite3_close(m_writer);
        m_writer = nullptr;
    }
}

std::unique_ptr<EntryStore> EntryStore::open(const QString& dbPath, int readerCount)
{
    std::unique_ptr<EntryStore> store(new EntryStore());
    if (!store->init(dbPath, readerCount)) {
        return nullptr;
    }
    return store;
}

bool EntryStore::init(const QString& dbPath, int readerCount)
{
    const QByteArray pathUtf8 = dbPath.toUtf8();
    int rc = sqlite3_open(pathUtf8.constData(), &m_writer);
    if (rc != SQLITE_OK) {
        LOG_ERROR(sxStore, "Failed to open database: %s", sqlite3_errmsg(m_writer));
        return false;
    }

    // Set busy_timeout first so the busy handler covers every later statement.
    sqlite3_busy_timeout(m_writer, 30000);

    if (!execSql(m_writer, kConnectionPragmas)) {
        LOG_ERROR(sxStore, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        Statement stmt(m_writer,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='entries'");
        if (stmt.ok() && stmt.step() == SQLITE_ROW) {
            schemaExists = stmt.columnInt64(0) > 0;
        }
    }

    if (!schemaExists) {
        if (!execSql(m_writer, kDatabasePragmas)) {
            LOG_ERROR(sxStore, "Failed to set database pragmas");
            return false;
        }

        {
            Statement stmt(m_writer, "PRAGMA journal_mode");
            if (stmt.ok() && stmt.step() == SQLITE_ROW) {
                const QString mode = stmt.columnText(0);
                if (mode != QLatin1String("wal")) {
                    LOG_WARN(sxStore, "Expected WAL journal mode, got: %s", qUtf8Printable(mode));
                }
            }
        }

        if (!execSql(m_writer, kSchemaV1)) {
            LOG_ERROR(sxStore, "Failed to create schema");
            return false;
        }
        if (!execSql(m_writer, kDefaultSettings)) {
            LOG_ERROR(sxStore, "Failed to insert default settings");
            return false;
        }
    }

    {
        Statement stmt(m_writer, "SELECT value FROM settings WHERE key = 'schema_version'");
        if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
            LOG_ERROR(sxStore, "Database has no schema_version setting");
            return false;
        }
        const int version = stmt.columnText(0).toInt();
        if (version > kCurrentSchemaVersion) {
            LOG_ERROR(sxStore, "Database schema version %d is newer than supported version %d",
                      version, kCurrentSchemaVersion);
            return false;
        }
    }

    // Restrict database file permissions to owner-only (0600)
    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    QFile walFile(dbPath + QStringLiteral("-wal"));
    if (walFile.exists()) {
        walFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }
    QFile shmFile(dbPath + QStringLiteral("-shm"));
    if (shmFile.exists()) {
        shmFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    const int readers = std::max(readerCount, 1);
    for (int i = 0; i < readers; ++i) {
        sqlite3* reader = nullptr;
        rc = sqlite3_open_v2(pathUtf8.constData(), &reader, SQLITE_OPEN_READONLY, nullptr);
        if (rc != SQLITE_OK) {
            LOG_ERROR(sxStore, "Failed to open reader connection: %s", sqlite3_errmsg(reader));
            sqlite3_close(reader);
            return false;
        }
        sqlite3_busy_timeout(reader, 30000);
        m_readers.push_back(reader);
    }
    m_idleReaders = m_readers;

    LOG_INFO(sxStore, "Database opened: %s (%d readers)", pathUtf8.constData(), readers);
    return true;
}

bool EntryStore::execSql(sqlite3* db, const char* sql) const
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(sxStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

sqlite3* EntryStore::acquireReader()
{
    std::unique_lock<std::mutex> lock(m_readerMutex);
    m_readerAvailable.wait(lock, [this] { return !m_idleReaders.empty(); });
    sqlite3* db = m_idleReaders.back();
    m_idleReaders.pop_back();
    return db;
}

void EntryStore::releaseReader(sqlite3* db)
{
    {
        std::lock_guard<std::mutex> lock(m_readerMutex);
        m_idleReaders.push_back(db);
    }
    m_readerAvailable.notify_one();
}

// ── Corpora ─────────────────────────────────────────────────

std::optional<CorpusInfo> EntryStore::corpusInfoOn(sqlite3* db, const QString& corpusId) const
{
    Statement stmt(db, kSelectCorpusSql);
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bindText(1, corpusId);
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    CorpusInfo info;
    info.corpusId = stmt.columnText(0);
    info.modelId = stmt.columnText(1);
    info.dimensions = static_cast<int>(stmt.columnInt64(2));
    info.createdAt = stmt.columnInt64(3);
    return info;
}

StoreResult EntryStore::ensureCorpus(const QString& corpusId, const QString& modelId,
                                     int dimensions)
{
    StoreResult result;
    if (corpusId.isEmpty() || dimensions <= 0) {
        result.code = ErrorCode::InvalidArgument;
        result.message = QStringLiteral("A corpus needs an id and a positive dimension");
        return result;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    const std::optional<CorpusInfo> existing = corpusInfoOn(m_writer, corpusId);
    if (existing.has_value()) {
        if (existing->dimensions != dimensions || existing->modelId != modelId) {
            result.code = ErrorCode::DimensionMismatch;
            result.message = QStringLiteral("Corpus %1 was indexed with %2 (%3 dimensions); "
                                            "configured model is %4 (%5 dimensions)")
                                 .arg(corpusId, existing->modelId)
                                 .arg(existing->dimensions)
                                 .arg(modelId)
                                 .arg(dimensions);
            LOG_WARN(sxStore, "%s", qUtf8Printable(result.message));
        }
        return result;
    }

    Statement stmt(m_writer, kInsertCorpusSql);
    if (!stmt.ok()) {
        result.code = ErrorCode::StorageError;
        result.message = QString::fromUtf8(sqlite3_errmsg(m_writer));
        return result;
    }
    stmt.bindText(1, corpusId);
    stmt.bindText(2, modelId);
    stmt.bindInt64(3, dimensions);
    stmt.bindInt64(4, QDateTime::currentSecsSinceEpoch());
    if (!stmt.exec()) {
        result.code = ErrorCode::StorageError;
        result.message = QString::fromUtf8(sqlite3_errmsg(m_writer));
        return result;
    }
    LOG_INFO(sxStore, "Created corpus %s (%s, %d dimensions)",
             qUtf8Printable(corpusId), qUtf8Printable(modelId), dimensions);
    return result;
}

std::optional<CorpusInfo> EntryStore::corpusInfo(const QString& corpusId)
{
    ReaderLease lease(*this);
    return corpusInfoOn(lease.db(), corpusId);
}

std::vector<CorpusInfo> EntryStore::listCorpora()
{
    std::vector<CorpusInfo> corpora;
    ReaderLease lease(*this);
    Statement stmt(lease.db(), kListCorporaSql);
    if (!stmt.ok()) {
        return corpora;
    }
    while (stmt.step() == SQLITE_ROW) {
        CorpusInfo info;
        info.corpusId = stmt.columnText(0);
        info.modelId = stmt.columnText(1);
        info.dimensions = static_cast<int>(stmt.columnInt64(2));
        info.createdAt = stmt.columnInt64(3);
        corpora.push_back(std::move(info));
    }
    return corpora;
}

StoreResult EntryStore::deleteCorpus(const QString& corpusId)
{
    StoreResult result;
    std::lock_guard<std::mutex> lock(m_writeMutex);

    Statement stmt(m_writer, kDeleteCorpusSql);
    if (!stmt.ok()) {
        result.code = ErrorCode::StorageError;
        result.message = QString::fromUtf8(sqlite3_errmsg(m_writer));
        return result;
    }
    stmt.bindText(1, corpusId);
    if (!stmt.exec()) {
        result.code = ErrorCode::StorageError;
        result.message = QString::fromUtf8(sqlite3_errmsg(m_writer));
        return result;
    }

    dropCorpusIndex(corpusId);
    LOG_INFO(sxStore, "Deleted corpus %s", qUtf8Printable(corpusId));
    return result;
}

// ── Reads ───────────────────────────────────────────────────

std::optional<std::vector<FileState>> EntryStore::fileStates(const QString& corpusId)
{
    ReaderLease lease(*this);
    Statement stmt(lease.db(), kFileStatesSql);
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bindText(1, corpusId);

    std::vector<FileState> states;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        FileState state;
        state.filePath = stmt.columnText(0);
        state.contentHash = stmt.columnText(1);
        state.sourceType = sourceTypeFromString(stmt.columnText(2));
        state.indexedBytes = stmt.columnInt64(3);
        state.indexedAt = stmt.columnInt64(4);
        state.entryCount = static_cast<int>(stmt.columnInt64(5));
        states.push_back(std::move(state));
    }
    if (rc != SQLITE_DONE) {
        LOG_ERROR(sxStore, "fileStates failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }
    return states;
}

std::optional<std::vector<Entry>> EntryStore::entriesForFile(const QString& corpusId,
                                                             const QString& filePath,
                                                             bool withEmbeddings)
{
    ReaderLease lease(*this);
    sqlite3* db = lease.db();
    if (!execSql(db, "BEGIN")) {
        return std::nullopt;
    }

    std::vector<Entry> entries;
    std::unordered_map<int64_t, size_t> positions;
    bool ok = true;
    {
        const QByteArray sql = QByteArray("SELECT ") + kEntryColumns
            + " FROM entries WHERE corpus_id = ?1 AND file_path = ?2"
              " ORDER BY chunk_ordinal ASC, id ASC";
        Statement stmt(db, sql.constData());
        ok = stmt.ok();
        if (ok) {
            stmt.bindText(1, corpusId);
            stmt.bindText(2, filePath);
            int rc = SQLITE_ROW;
            while ((rc = stmt.step()) == SQLITE_ROW) {
                positions.emplace(stmt.columnInt64(0), entries.size());
                entries.push_back(readEntry(stmt, withEmbeddings));
            }
            ok = rc == SQLITE_DONE;
        }
    }
    if (ok) {
        Statement stmt(db, kFileDatesSql);
        ok = stmt.ok();
        if (ok) {
            stmt.bindText(1, corpusId);
            stmt.bindText(2, filePath);
            int rc = SQLITE_ROW;
            while ((rc = stmt.step()) == SQLITE_ROW) {
                const auto it = positions.find(stmt.columnInt64(0));
                const QDate day = QDate::fromString(stmt.columnText(1), Qt::ISODate);
                if (it != positions.end() && day.isValid()) {
                    entries[it->second].dates.push_back(day);
                }
            }
            ok = rc == SQLITE_DONE;
        }
    }

    if (!ok) {
        LOG_ERROR(sxStore, "entriesForFile failed: %s", sqlite3_errmsg(db));
        execSql(db, "ROLLBACK");
        return std::nullopt;
    }
    execSql(db, "COMMIT");
    return entries;
}

std::optional<CorpusStats> EntryStore::stats(const QString& corpusId)
{
    ReaderLease lease(*this);
    Statement stmt(lease.db(), kStatsSql);
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bindText(1, corpusId);
    if (stmt.step() != SQLITE_ROW) {
        LOG_ERROR(sxStore, "stats failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }
    CorpusStats stats;
    stats.entryCount = static_cast<int>(stmt.columnInt64(0));
    stats.fileCount = static_cast<int>(stmt.columnInt64(1));
    stats.indexedBytes = stmt.columnInt64(2);
    return stats;
}

// ── Writes ──────────────────────────────────────────────────

StoreWriteResult EntryStore::applyFileChanges(const QString& corpusId,
                                              const std::vector<FileChangeSet>& changes)
{
    StoreWriteResult result;
    if (corpusId.isEmpty()) {
        result.code = ErrorCode::InvalidArgument;
        result.message = QStringLiteral("Writes need a corpus id");
        return result;
    }
    if (changes.empty()) {
        return result;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);

    const std::optional<CorpusInfo> info = corpusInfoOn(m_writer, corpusId);
    if (!info.has_value()) {
        const bool onlyRemovals = std::all_of(changes.begin(), changes.end(),
                                              [](const FileChangeSet& c) { return c.removeFile; });
        if (onlyRemovals) {
            return result;  // nothing stored for an unknown corpus
        }
        result.code = ErrorCode::InvalidArgument;
        result.message = QStringLiteral("Unknown corpus %1").arg(corpusId);
        return result;
    }

    for (const FileChangeSet& change : changes) {
        if (change.removeFile) {
            continue;
        }
        for (const auto* rows : {&change.inserts, &change.updates}) {
            for (const Entry& entry : *rows) {
                if (static_cast<int>(entry.embedding.size()) != info->dimensions) {
                    result.code = ErrorCode::DimensionMismatch;
                    result.message = QStringLiteral("%1: vector has %2 dimensions, corpus %3 "
                                                    "expects %4")
                                         .arg(change.filePath)
                                         .arg(entry.embedding.size())
                                         .arg(corpusId)
                                         .arg(info->dimensions);
                    LOG_ERROR(sxStore, "%s", qUtf8Printable(result.message));
                    return result;
                }
            }
        }
    }

    if (!execSql(m_writer, "BEGIN IMMEDIATE")) {
        result.code = ErrorCode::StorageError;
        result.message = QStringLiteral("Could not begin write transaction");
        return result;
    }

    std::vector<Entry> upserted;
    std::vector<int64_t> removed;
    result = applyLocked(corpusId, changes, upserted, removed);
    if (!result.ok()) {
        execSql(m_writer, "ROLLBACK");
        return result;
    }
    if (!execSql(m_writer, "COMMIT")) {
        execSql(m_writer, "ROLLBACK");
        result = StoreWriteResult();
        result.code = ErrorCode::StorageError;
        result.message = QStringLiteral("Commit failed: %1")
                             .arg(QString::fromUtf8(sqlite3_errmsg(m_writer)));
        return result;
    }

    // Keep a loaded ANN index in step with the committed rows. An index that
    // is not loaded yet is built from the rows on first search.
    std::shared_ptr<CorpusIndex> index;
    {
        std::lock_guard<std::mutex> indexLock(m_indexMutex);
        const auto it = m_indexes.find(corpusId);
        if (it != m_indexes.end()) {
            index = it->second;
        }
    }
    if (index) {
        std::unique_lock<std::shared_mutex> indexWrite(index->mutex);
        for (int64_t id : removed) {
            const auto label = static_cast<uint64_t>(id);
            if (index->paths.erase(label) > 0) {
                index->index->deleteVector(label);
            }
        }
        for (const Entry& entry : upserted) {
            const auto label = static_cast<uint64_t>(entry.id);
            if (index->index->addVector(label, entry.embedding.data())) {
                index->paths[label] = entry.filePath;
            }
        }
    }

    LOG_DEBUG(sxStore, "Committed %d file change sets for %s: +%d ~%d -%d",
              static_cast<int>(changes.size()), qUtf8Printable(corpusId),
              result.inserted, result.updated, result.deleted);
    return result;
}

StoreWriteResult EntryStore::applyLocked(const QString& corpusId,
                                         const std::vector<FileChangeSet>& changes,
                                         std::vector<Entry>& upserted,
                                         std::vector<int64_t>& removed)
{
    StoreWriteResult result;
    const int64_t now = QDateTime::currentSecsSinceEpoch();

    auto storageError = [this, &result](const char* what) {
        result.code = ErrorCode::StorageError;
        result.message = QStringLiteral("%1: %2")
                             .arg(QString::fromUtf8(what),
                                  QString::fromUtf8(sqlite3_errmsg(m_writer)));
        LOG_ERROR(sxStore, "%s", qUtf8Printable(result.message));
        return result;
    };

    auto scopeViolation = [&result, &corpusId](int64_t id, const QString& owner) {
        result.code = ErrorCode::CorpusScopeViolation;
        result.message = QStringLiteral("Entry %1 belongs to corpus %2, write was scoped to %3")
                             .arg(id)
                             .arg(owner, corpusId);
        LOG_ERROR(sxStore, "%s", qUtf8Printable(result.message));
        return result;
    };

    Statement insertEntry(m_writer, kInsertEntrySql);
    Statement updateEntry(m_writer, kUpdateEntrySql);
    Statement deleteEntry(m_writer, kDeleteEntrySql);
    Statement entryOwner(m_writer, kEntryOwnerSql);
    Statement fileEntryIds(m_writer, kFileEntryIdsSql);
    Statement deleteFileEntries(m_writer, kDeleteFileEntriesSql);
    Statement deleteDates(m_writer, kDeleteDatesSql);
    Statement insertDate(m_writer, kInsertDateSql);
    Statement upsertFileState(m_writer, kUpsertFileStateSql);
    Statement deleteFileState(m_writer, kDeleteFileStateSql);
    if (!insertEntry.ok() || !updateEntry.ok() || !deleteEntry.ok() || !entryOwner.ok()
        || !fileEntryIds.ok() || !deleteFileEntries.ok() || !deleteDates.ok()
        || !insertDate.ok() || !upsertFileState.ok() || !deleteFileState.ok()) {
        return storageError("prepare");
    }

    // Corpus owning an id, empty when the row does not exist.
    auto ownerOf = [&entryOwner](int64_t id) {
        entryOwner.bindInt64(1, id);
        QString owner;
        if (entryOwner.step() == SQLITE_ROW) {
            owner = entryOwner.columnText(0);
        }
        entryOwner.reset();
        return owner;
    };

    auto writeDates = [&insertDate](int64_t id, const std::vector<QDate>& dates) {
        for (const QDate& day : dates) {
            if (!day.isValid()) {
                continue;
            }
            insertDate.bindInt64(1, id);
            insertDate.bindText(2, day.toString(Qt::ISODate));
            if (!insertDate.exec()) {
                return false;
            }
        }
        return true;
    };

    for (const FileChangeSet& change : changes) {
        if (change.removeFile) {
            fileEntryIds.bindText(1, corpusId);
            fileEntryIds.bindText(2, change.filePath);
            int rc = SQLITE_ROW;
            while ((rc = fileEntryIds.step()) == SQLITE_ROW) {
                removed.push_back(fileEntryIds.columnInt64(0));
            }
            fileEntryIds.reset();
            if (rc != SQLITE_DONE) {
                return storageError("list file entries");
            }

            deleteFileEntries.bindText(1, corpusId);
            deleteFileEntries.bindText(2, change.filePath);
            if (!deleteFileEntries.exec()) {
                return storageError("delete file entries");
            }
            result.deleted += sqlite3_changes(m_writer);

            deleteFileState.bindText(1, corpusId);
            deleteFileState.bindText(2, change.filePath);
            if (!deleteFileState.exec()) {
                return storageError("delete file state");
            }
            continue;
        }

        for (int64_t id : change.deletes) {
            deleteEntry.bindInt64(1, id);
            deleteEntry.bindText(2, corpusId);
            if (!deleteEntry.exec()) {
                return storageError("delete entry");
            }
            if (sqlite3_changes(m_writer) == 0) {
                const QString owner = ownerOf(id);
                if (!owner.isEmpty() && owner != corpusId) {
                    return scopeViolation(id, owner);
                }
                continue;
            }
            ++result.deleted;
            removed.push_back(id);
        }

        for (const Entry& entry : change.updates) {
            if (!entry.corpusId.isEmpty() && entry.corpusId != corpusId) {
                return scopeViolation(entry.id, entry.corpusId);
            }
            std::vector<float> vector = entry.embedding;
            normalizeInPlace(vector);

            updateEntry.bindInt64(1, entry.id);
            updateEntry.bindText(2, corpusId);
            updateEntry.bindText(3, change.filePath);
            updateEntry.bindText(4, sourceTypeToString(change.sourceType));
            updateEntry.bindText(5, entry.heading);
            updateEntry.bindText(6, entry.text);
            updateEntry.bindVector(7, vector);
            updateEntry.bindText(8, change.contentHash);
            updateEntry.bindText(9, entry.chunkHash);
            updateEntry.bindInt64(10, entry.chunkOrdinal);
            updateEntry.bindInt64(11, entry.charStart);
            updateEntry.bindInt64(12, entry.charEnd);
            updateEntry.bindInt64(13, now);
            if (!updateEntry.exec()) {
                return storageError("update entry");
            }
            if (sqlite3_changes(m_writer) == 0) {
                const QString owner = ownerOf(entry.id);
                if (!owner.isEmpty()) {
                    return scopeViolation(entry.id, owner);
                }
                result.code = ErrorCode::StorageError;
                result.message = QStringLiteral("Entry %1 does not exist").arg(entry.id);
                LOG_ERROR(sxStore, "%s", qUtf8Printable(result.message));
                return result;
            }

            deleteDates.bindInt64(1, entry.id);
            if (!deleteDates.exec() || !writeDates(entry.id, entry.dates)) {
                return storageError("write entry dates");
            }

            Entry indexed;
            indexed.id = entry.id;
            indexed.filePath = change.filePath;
            indexed.embedding = std::move(vector);
            upserted.push_back(std::move(indexed));
            ++result.updated;
        }

        for (const Entry& entry : change.inserts) {
            if (!entry.corpusId.isEmpty() && entry.corpusId != corpusId) {
                return scopeViolation(entry.id, entry.corpusId);
            }
            std::vector<float> vector = entry.embedding;
            normalizeInPlace(vector);

            insertEntry.bindText(1, corpusId);
            insertEntry.bindText(2, change.filePath);
            insertEntry.bindText(3, sourceTypeToString(change.sourceType));
            insertEntry.bindText(4, entry.heading);
            insertEntry.bindText(5, entry.text);
            insertEntry.bindVector(6, vector);
            insertEntry.bindText(7, change.contentHash);
            insertEntry.bindText(8, entry.chunkHash);
            insertEntry.bindInt64(9, entry.chunkOrdinal);
            insertEntry.bindInt64(10, entry.charStart);
            insertEntry.bindInt64(11, entry.charEnd);
            insertEntry.bindInt64(12, now);
            if (!insertEntry.exec()) {
                return storageError("insert entry");
            }
            const int64_t id = sqlite3_last_insert_rowid(m_writer);
            if (!writeDates(id, entry.dates)) {
                return storageError("write entry dates");
            }

            Entry indexed;
            indexed.id = id;
            indexed.filePath = change.filePath;
            indexed.embedding = std::move(vector);
            upserted.push_back(std::move(indexed));
            result.insertedIds.push_back(id);
            ++result.inserted;
        }

        upsertFileState.bindText(1, corpusId);
        upsertFileState.bindText(2, change.filePath);
        upsertFileState.bindText(3, change.contentHash);
        upsertFileState.bindText(4, sourceTypeToString(change.sourceType));
        upsertFileState.bindInt64(5, change.indexedBytes);
        upsertFileState.bindInt64(6, now);
        if (!upsertFileState.exec()) {
            return storageError("upsert file state");
        }
    }

    return result;
}

StoreWriteResult EntryStore::deleteFile(const QString& corpusId, const QString& filePath)
{
    FileChangeSet change;
    change.filePath = filePath;
    change.removeFile = true;
    return applyFileChanges(corpusId, {change});
}

StoreWriteResult EntryStore::deleteSourceType(const QString& corpusId, SourceType type)
{
    std::vector<FileChangeSet> changes;
    {
        ReaderLease lease(*this);
        Statement stmt(lease.db(), kFilesOfTypeSql);
        if (!stmt.ok()) {
            StoreWriteResult result;
            result.code = ErrorCode::StorageError;
            result.message = QString::fromUtf8(sqlite3_errmsg(lease.db()));
            return result;
        }
        stmt.bindText(1, corpusId);
        stmt.bindText(2, sourceTypeToString(type));
        while (stmt.step() == SQLITE_ROW) {
            FileChangeSet change;
            change.filePath = stmt.columnText(0);
            change.removeFile = true;
            changes.push_back(std::move(change));
        }
    }
    return applyFileChanges(corpusId, changes);
}

// ── Similarity ──────────────────────────────────────────────

std::shared_ptr<EntryStore::CorpusIndex> EntryStore::corpusIndex(const CorpusInfo& info)
{
    {
        std::lock_guard<std::mutex> lock(m_indexMutex);
        const auto it = m_indexes.find(info.corpusId);
        if (it != m_indexes.end()) {
            return it->second;
        }
    }

    // Load under the write mutex so no commit lands between reading the rows
    // and publishing the index.
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    {
        std::lock_guard<std::mutex> lock(m_indexMutex);
        const auto it = m_indexes.find(info.corpusId);
        if (it != m_indexes.end()) {
            return it->second;
        }
    }
    return loadCorpusIndexLocked(info);
}

std::shared_ptr<EntryStore::CorpusIndex> EntryStore::loadCorpusIndexLocked(const CorpusInfo& info)
{
    auto loaded = std::make_shared<CorpusIndex>();
    VectorIndex::IndexMetadata metadata;
    metadata.dimensions = info.dimensions;
    metadata.modelId = info.modelId.toStdString();
    loaded->index = std::make_unique<VectorIndex>(metadata);
    if (!loaded->index->create()) {
        return nullptr;
    }

    Statement stmt(m_writer, kCorpusVectorsSql);
    if (!stmt.ok()) {
        return nullptr;
    }
    stmt.bindText(1, info.corpusId);
    int rc = SQLITE_ROW;
    int skipped = 0;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        const auto label = static_cast<uint64_t>(stmt.columnInt64(0));
        const std::vector<float> vector = stmt.columnVector(2);
        if (static_cast<int>(vector.size()) != info.dimensions) {
            ++skipped;
            continue;
        }
        if (loaded->index->addVector(label, vector.data())) {
            loaded->paths.emplace(label, stmt.columnText(1));
        }
    }
    if (rc != SQLITE_DONE) {
        LOG_ERROR(sxStore, "Loading vectors for %s failed: %s",
                  qUtf8Printable(info.corpusId), sqlite3_errmsg(m_writer));
        return nullptr;
    }
    if (skipped > 0) {
        LOG_WARN(sxStore, "Skipped %d stored vectors of the wrong dimension in %s",
                 skipped, qUtf8Printable(info.corpusId));
    }

    {
        std::lock_guard<std::mutex> lock(m_indexMutex);
        m_indexes[info.corpusId] = loaded;
    }
    LOG_INFO(sxStore, "Loaded ANN index for %s: %d vectors",
             qUtf8Printable(info.corpusId), loaded->index->totalElements());
    return loaded;
}

void EntryStore::dropCorpusIndex(const QString& corpusId)
{
    std::lock_guard<std::mutex> lock(m_indexMutex);
    m_indexes.erase(corpusId);
}

SimilarityResult EntryStore::searchSimilar(const VectorQuery& query)
{
    SimilarityResult result;
    if (query.corpusIds.isEmpty()) {
        result.code = ErrorCode::InvalidArgument;
        result.message = QStringLiteral("A similarity search needs at least one corpus");
        return result;
    }
    if (query.limit <= 0 || query.queryVector.empty()) {
        return result;
    }

    std::vector<float> queryVector = query.queryVector;
    normalizeInPlace(queryVector);

    QStringList corpora = query.corpusIds;
    corpora.removeDuplicates();

    // label -> corpus whose index produced it
    std::unordered_map<int64_t, QString> candidates;
    for (const QString& corpusId : corpora) {
        const std::optional<CorpusInfo> info = corpusInfo(corpusId);
        if (!info.has_value()) {
            continue;  // never indexed, nothing to find
        }
        if (info->dimensions != static_cast<int>(queryVector.size())) {
            result.code = ErrorCode::DimensionMismatch;
            result.message = QStringLiteral("Query vector has %1 dimensions, corpus %2 has %3")
                                 .arg(queryVector.size())
                                 .arg(corpusId)
                                 .arg(info->dimensions);
            LOG_WARN(sxStore, "%s", qUtf8Printable(result.message));
            return result;
        }

        const std::shared_ptr<CorpusIndex> index = corpusIndex(*info);
        if (!index) {
            result.code = ErrorCode::StorageError;
            result.message = QStringLiteral("Could not load the vector index of %1").arg(corpusId);
            return result;
        }

        std::shared_lock<std::shared_mutex> lock(index->mutex);
        VectorIndex::LabelFilter allow;
        if (query.pathFilter) {
            allow = [&index, &query](uint64_t label) {
                const auto it = index->paths.find(label);
                return it != index->paths.end() && query.pathFilter(it->second);
            };
        }
        for (const VectorIndex::KnnResult& hit :
             index->index->search(queryVector.data(), query.limit, allow)) {
            candidates.emplace(static_cast<int64_t>(hit.label), corpusId);
        }
    }

    if (candidates.empty()) {
        return result;
    }

    std::vector<int64_t> ids;
    ids.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        ids.push_back(candidate.first);
    }
    std::sort(ids.begin(), ids.end());

    ReaderLease lease(*this);
    sqlite3* db = lease.db();
    if (!execSql(db, "BEGIN")) {
        result.code = ErrorCode::StorageError;
        result.message = QStringLiteral("Could not begin read transaction");
        return result;
    }

    std::vector<Entry> rows;
    std::unordered_map<int64_t, size_t> positions;
    bool ok = true;
    for (size_t offset = 0; ok && offset < ids.size(); offset += kHydrateBatch) {
        const size_t count = std::min(ids.size() - offset, static_cast<size_t>(kHydrateBatch));
        const QByteArray placeholders = inClause(count);

        const QByteArray entrySql = QByteArray("SELECT ") + kEntryColumns
            + " FROM entries WHERE id IN (" + placeholders + ")";
        Statement entries(db, entrySql.constData());
        if (!entries.ok()) {
            ok = false;
            break;
        }
        for (size_t i = 0; i < count; ++i) {
            entries.bindInt64(static_cast<int>(i) + 1, ids[offset + i]);
        }
        int rc = SQLITE_ROW;
        while ((rc = entries.step()) == SQLITE_ROW) {
            positions.emplace(entries.columnInt64(0), rows.size());
            rows.push_back(readEntry(entries, true));
        }
        ok = rc == SQLITE_DONE;
        if (!ok) {
            break;
        }

        const QByteArray dateSql = "SELECT entry_id, day FROM entry_dates WHERE entry_id IN ("
            + placeholders + ") ORDER BY entry_id ASC, day ASC";
        Statement dates(db, dateSql.constData());
        if (!dates.ok()) {
            ok = false;
            break;
        }
        for (size_t i = 0; i < count; ++i) {
            dates.bindInt64(static_cast<int>(i) + 1, ids[offset + i]);
        }
        while ((rc = dates.step()) == SQLITE_ROW) {
            const auto it = positions.find(dates.columnInt64(0));
            const QDate day = QDate::fromString(dates.columnText(1), Qt::ISODate);
            if (it != positions.end() && day.isValid()) {
                rows[it->second].dates.push_back(day);
            }
        }
        ok = rc == SQLITE_DONE;
    }

    if (!ok) {
        result.code = ErrorCode::StorageError;
        result.message = QStringLiteral("Hydrating candidates failed: %1")
                             .arg(QString::fromUtf8(sqlite3_errmsg(db)));
        LOG_ERROR(sxStore, "%s", qUtf8Printable(result.message));
        execSql(db, "ROLLBACK");
        return result;
    }
    execSql(db, "COMMIT");

    result.hits.reserve(rows.size());
    for (Entry& entry : rows) {
        const QString& expected = candidates.at(entry.id);
        if (entry.corpusId != expected) {
            LOG_ERROR(sxStore, "Entry %lld of corpus %s surfaced in the index of %s; dropped",
                      static_cast<long long>(entry.id), qUtf8Printable(entry.corpusId),
                      qUtf8Printable(expected));
            Q_ASSERT_X(false, "EntryStore::searchSimilar", "entry outside the queried corpus");
            continue;
        }
        if (entry.embedding.size() != queryVector.size()) {
            continue;
        }
        ScoredEntry scored;
        scored.similarity = cosineSimilarity(queryVector, entry.embedding);
        scored.entry = std::move(entry);
        result.hits.push_back(std::move(scored));
    }

    std::sort(result.hits.begin(), result.hits.end(),
              [](const ScoredEntry& a, const ScoredEntry& b) {
                  if (a.similarity != b.similarity) {
                      return a.similarity > b.similarity;
                  }
                  return a.entry.id < b.entry.id;
              });
    if (result.hits.size() > static_cast<size_t>(query.limit)) {
        result.hits.resize(static_cast<size_t>(query.limit));
    }
    return result;
}

// ── Maintenance ─────────────────────────────────────────────

int64_t EntryStore::totalChanges() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return sqlite3_total_changes(m_writer);
}

bool EntryStore::integrityCheck() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (!m_writer) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_writer, "PRAGMA integrity_check;", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = (result && std::strcmp(result, "ok") == 0);
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace sx
