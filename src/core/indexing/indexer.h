#pragma once

#include "core/indexing/chunker.h"
#include "core/shared/cancellation.h"
#include "core/shared/types.h"

#include <QString>

#include <vector>

namespace sx {

// Forward declarations to avoid pulling in heavy headers.
class EntryStore;
class EmbeddingProvider;
class ProviderExecutor;
struct FileState;

struct IndexerConfig {
    // Texts per provider call.
    int batchSize = 32;
    // Upper bound on chunks embedded and committed together. A single file
    // larger than this still forms one write batch.
    int writeBatchChunks = 128;
    // Per provider call; 0 means no deadline beyond the provider's own.
    int embedTimeoutMs = 0;
};

// Outcome for one file path of the snapshot (or of the stored corpus).
struct FileOutcome {
    enum class Status {
        Unchanged,   // content hash matches, nothing written
        Indexed,     // entries inserted, updated or deleted
        Deleted,     // missing from the snapshot, all entries removed
        Failed,      // its write batch failed, nothing of it committed
        NotReached,  // the run stopped before its batch
    };

    QString filePath;
    Status status = Status::NotReached;
    ErrorCode error = ErrorCode::None;
    QString message;
    int inserted = 0;
    int updated = 0;
    int deleted = 0;
    int reused = 0;
};

QString fileOutcomeStatusToString(FileOutcome::Status status);

struct IndexRunResult {
    ErrorCode code = ErrorCode::None;
    QString message;

    int filesUnchanged = 0;
    int filesIndexed = 0;
    int filesDeleted = 0;
    int filesFailed = 0;
    int filesNotReached = 0;

    int entriesInserted = 0;
    int entriesUpdated = 0;
    int entriesDeleted = 0;
    int entriesReused = 0;
    int chunksEmbedded = 0;
    int batchesCommitted = 0;

    std::vector<FileOutcome> files;

    bool ok() const { return code == ErrorCode::None; }
    // True when the run changed nothing in the store.
    bool noWrites() const
    {
        return entriesInserted == 0 && entriesUpdated == 0 && entriesDeleted == 0
            && filesDeleted == 0;
    }
};

// Indexer: turns a snapshot of content units into Entry Store writes.
//
// For each unit it:
//   1. Hashes the raw text and compares it with the stored file state
//      (unchanged files cost nothing)
//   2. Chunks changed files and diffs the chunks against the stored entries
//      by chunk hash: matching chunks keep their vectors, the rest are paired
//      in ordinal order as in-place updates, extras become inserts or deletes
//   3. Groups changed files into write batches, embeds each batch's new text
//      in concurrent provider calls, and commits the batch in one transaction
//
// In Sync mode, files stored for the corpus but absent from the snapshot are
// deleted. Regenerate drops the corpus first. A failed or cancelled batch
// commits nothing; earlier batches stay committed and the run stops.
class Indexer {
public:
    Indexer(EntryStore& store, EmbeddingProvider& provider, ProviderExecutor& executor,
            const Chunker& chunker, IndexerConfig config = {});

    IndexRunResult run(const QString& corpusId, const std::vector<ContentUnit>& units,
                       IndexMode mode = IndexMode::Sync,
                       const CancellationToken& token = {});

private:
    struct PlannedFile;
    struct WriteBatch;

    bool checkCorpus(const QString& corpusId, IndexRunResult& result);
    PlannedFile planFile(const QString& corpusId, const ContentUnit& unit,
                         const FileState* previous, IndexRunResult& result);
    std::vector<WriteBatch> groupBatches(std::vector<PlannedFile>& planned) const;
    bool embedBatch(WriteBatch& batch, const CancellationToken& token, ErrorCode& error,
                    QString& message);
    bool commitBatch(const QString& corpusId, WriteBatch& batch, IndexRunResult& result);

    EntryStore& m_store;
    EmbeddingProvider& m_provider;
    ProviderExecutor& m_executor;
    const Chunker& m_chunker;
    IndexerConfig m_config;
};

} // namespace sx
