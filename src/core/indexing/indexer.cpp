#include "core/indexing/indexer.h"
#include "core/embedding/embedding_provider.h"
#include "core/embedding/provider_executor.h"
#include "core/index/entry_store.h"
#include "core/indexing/date_extractor.h"
#include "core/shared/chunk.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <chrono>
#include <future>
#include <map>
#include <unordered_map>

namespace sx {

namespace {

constexpr int kCancelPollMs = 50;

bool sameDates(std::vector<QDate> a, std::vector<QDate> b)
{
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());
    return a == b;
}

} // namespace

QString fileOutcomeStatusToString(FileOutcome::Status status)
{
    switch (status) {
    case FileOutcome::Status::Unchanged:  return QStringLiteral("unchanged");
    case FileOutcome::Status::Indexed:    return QStringLiteral("indexed");
    case FileOutcome::Status::Deleted:    return QStringLiteral("deleted");
    case FileOutcome::Status::Failed:     return QStringLiteral("failed");
    case FileOutcome::Status::NotReached: return QStringLiteral("not_reached");
    }
    return QStringLiteral("unknown");
}

// A changed file, diffed against its stored entries.
struct Indexer::PlannedFile {
    struct Pending {
        bool update = false;
        size_t index = 0;
    };

    size_t outcomeIndex = 0;
    FileChangeSet change;
    // Rows of change.inserts / change.updates that still need a vector.
    std::vector<Pending> pending;
    int reused = 0;
};

struct Indexer::WriteBatch {
    std::vector<PlannedFile> files;
    int pendingChunks = 0;
};

Indexer::Indexer(EntryStore& store, EmbeddingProvider& provider, ProviderExecutor& executor,
                 const Chunker& chunker, IndexerConfig config)
    : m_store(store)
    , m_provider(provider)
    , m_executor(executor)
    , m_chunker(chunker)
    , m_config(config)
{
    m_config.batchSize = std::max(m_config.batchSize, 1);
    m_config.writeBatchChunks = std::max(m_config.writeBatchChunks, 1);
}

// ── Run ─────────────────────────────────────────────────────

IndexRunResult Indexer::run(const QString& corpusId, const std::vector<ContentUnit>& units,
                            IndexMode mode, const CancellationToken& token)
{
    IndexRunResult result;
    if (corpusId.trimmed().isEmpty()) {
        result.code = ErrorCode::InvalidArgument;
        result.message = QStringLiteral("Index runs need a corpus id");
        return result;
    }

    QElapsedTimer timer;
    timer.start();

    if (mode == IndexMode::Regenerate) {
        const StoreResult dropped = m_store.deleteCorpus(corpusId);
        if (!dropped.ok()) {
            result.code = dropped.code;
            result.message = dropped.message;
            return result;
        }
        LOG_INFO(sxIndex, "Regenerating corpus %s", qUtf8Printable(corpusId));
    }

    if (!checkCorpus(corpusId, result)) {
        return result;
    }

    const std::optional<std::vector<FileState>> states = m_store.fileStates(corpusId);
    if (!states.has_value()) {
        result.code = ErrorCode::StorageError;
        result.message = QStringLiteral("Could not read file states of %1").arg(corpusId);
        return result;
    }
    std::unordered_map<QString, const FileState*> previousByPath;
    for (const FileState& state : *states) {
        previousByPath.emplace(state.filePath, &state);
    }

    // The last unit for a path wins.
    std::map<QString, size_t> lastUnitForPath;
    for (size_t i = 0; i < units.size(); ++i) {
        const QString& path = units[i].filePath;
        if (path.isEmpty()) {
            LOG_WARN(sxIndex, "Skipping content unit without a file path");
            continue;
        }
        if (!lastUnitForPath.emplace(path, i).second) {
            LOG_WARN(sxIndex, "Duplicate content unit for %s, keeping the last one",
                     qUtf8Printable(path));
            lastUnitForPath[path] = i;
        }
    }

    // ── Plan ──
    std::vector<PlannedFile> planned;
    for (size_t i = 0; i < units.size(); ++i) {
        const ContentUnit& unit = units[i];
        const auto last = lastUnitForPath.find(unit.filePath);
        if (last == lastUnitForPath.end() || last->second != i) {
            continue;
        }

        const auto previous = previousByPath.find(unit.filePath);
        const FileState* state = previous != previousByPath.end() ? previous->second : nullptr;

        FileOutcome outcome;
        outcome.filePath = unit.filePath;
        if (!result.ok()) {
            result.files.push_back(std::move(outcome));
            continue;
        }

        const QString contentHash = computeContentHash(unit.rawText);
        if (state && state->contentHash == contentHash
            && state->sourceType == unit.metadata.sourceType) {
            outcome.status = FileOutcome::Status::Unchanged;
            result.files.push_back(std::move(outcome));
            LOG_DEBUG(sxIndex, "Skipped (content hash unchanged): %s",
                      qUtf8Printable(unit.filePath));
            continue;
        }

        result.files.push_back(std::move(outcome));
        PlannedFile file = planFile(corpusId, unit, state, result);
        if (!result.ok()) {
            result.files.back().status = FileOutcome::Status::Failed;
            result.files.back().error = result.code;
            result.files.back().message = result.message;
            continue;
        }
        file.outcomeIndex = result.files.size() - 1;
        planned.push_back(std::move(file));
    }

    // ── Deletions ──
    std::vector<FileChangeSet> removals;
    std::vector<size_t> removalOutcomes;
    if (result.ok() && mode == IndexMode::Sync) {
        for (const FileState& state : *states) {
            if (lastUnitForPath.count(state.filePath) > 0) {
                continue;
            }
            FileChangeSet removal;
            removal.filePath = state.filePath;
            removal.removeFile = true;
            removals.push_back(std::move(removal));

            FileOutcome outcome;
            outcome.filePath = state.filePath;
            outcome.deleted = state.entryCount;
            result.files.push_back(std::move(outcome));
            removalOutcomes.push_back(result.files.size() - 1);
        }
    }

    if (result.ok() && !removals.empty()) {
        if (token.isCancelled()) {
            result.code = ErrorCode::Cancelled;
            result.message = QStringLiteral("Index run cancelled");
        } else {
            const StoreWriteResult written = m_store.applyFileChanges(corpusId, removals);
            for (size_t index : removalOutcomes) {
                FileOutcome& outcome = result.files[index];
                outcome.status = written.ok() ? FileOutcome::Status::Deleted
                                              : FileOutcome::Status::Failed;
                outcome.error = written.code;
                outcome.message = written.message;
            }
            if (written.ok()) {
                result.entriesDeleted += written.deleted;
                LOG_INFO(sxIndex, "Deleted %d files missing from the snapshot of %s",
                         static_cast<int>(removals.size()), qUtf8Printable(corpusId));
            } else {
                result.code = written.code;
                result.message = written.message;
            }
        }
    }

    // ── Embed and commit, one write batch at a time ──
    if (result.ok()) {
        std::vector<WriteBatch> batches = groupBatches(planned);
        for (WriteBatch& batch : batches) {
            if (token.isCancelled()) {
                result.code = ErrorCode::Cancelled;
                result.message = QStringLiteral("Index run cancelled");
                break;
            }

            ErrorCode error = ErrorCode::None;
            QString message;
            if (!embedBatch(batch, token, error, message)) {
                for (const PlannedFile& file : batch.files) {
                    FileOutcome& outcome = result.files[file.outcomeIndex];
                    outcome.status = FileOutcome::Status::Failed;
                    outcome.error = error;
                    outcome.message = message;
                }
                result.code = error;
                result.message = message;
                LOG_WARN(sxIndex, "Embedding failed, batch of %d files not written: %s",
                         static_cast<int>(batch.files.size()), qUtf8Printable(message));
                break;
            }

            if (!commitBatch(corpusId, batch, result)) {
                break;
            }
        }
    }

    for (const FileOutcome& outcome : result.files) {
        switch (outcome.status) {
        case FileOutcome::Status::Unchanged:  ++result.filesUnchanged; break;
        case FileOutcome::Status::Indexed:    ++result.filesIndexed; break;
        case FileOutcome::Status::Deleted:    ++result.filesDeleted; break;
        case FileOutcome::Status::Failed:     ++result.filesFailed; break;
        case FileOutcome::Status::NotReached: ++result.filesNotReached; break;
        }
    }

    LOG_INFO(sxIndex, "Index run %s for %s in %lldms: %d indexed, %d unchanged, %d deleted, "
                      "%d failed, %d not reached (+%d ~%d -%d entries, %d reused)",
             qUtf8Printable(errorCodeToString(result.code)), qUtf8Printable(corpusId),
             static_cast<long long>(timer.elapsed()), result.filesIndexed, result.filesUnchanged,
             result.filesDeleted, result.filesFailed, result.filesNotReached,
             result.entriesInserted, result.entriesUpdated, result.entriesDeleted,
             result.entriesReused);
    return result;
}

// ── Corpus identity ─────────────────────────────────────────

bool Indexer::checkCorpus(const QString& corpusId, IndexRunResult& result)
{
    const std::optional<CorpusInfo> info = m_store.corpusInfo(corpusId);
    if (!info.has_value()) {
        return true;
    }

    if (info->modelId != m_provider.modelId()) {
        result.code = ErrorCode::DimensionMismatch;
        result.message = QStringLiteral("Corpus %1 was indexed with %2, the provider is %3; "
                                        "regenerate the corpus to switch models")
                             .arg(corpusId, info->modelId, m_provider.modelId());
    } else if (m_provider.dimensions() > 0 && m_provider.dimensions() != info->dimensions) {
        result.code = ErrorCode::DimensionMismatch;
        result.message = QStringLiteral("Corpus %1 stores %2-dim vectors, the provider "
                                        "produces %3")
                             .arg(corpusId)
                             .arg(info->dimensions)
                             .arg(m_provider.dimensions());
    }

    if (!result.ok()) {
        LOG_ERROR(sxIndex, "%s", qUtf8Printable(result.message));
        return false;
    }
    return true;
}

// ── Planning ────────────────────────────────────────────────

Indexer::PlannedFile Indexer::planFile(const QString& corpusId, const ContentUnit& unit,
                                       const FileState* previous, IndexRunResult& result)
{
    PlannedFile file;
    FileChangeSet& change = file.change;
    change.filePath = unit.filePath;
    change.sourceType = unit.metadata.sourceType;
    change.contentHash = computeContentHash(unit.rawText);
    change.indexedBytes = unit.rawText.toUtf8().size();

    std::vector<Entry> existing;
    if (previous) {
        std::optional<std::vector<Entry>> stored =
            m_store.entriesForFile(corpusId, unit.filePath, /*withEmbeddings=*/true);
        if (!stored.has_value()) {
            result.code = ErrorCode::StorageError;
            result.message = QStringLiteral("Could not read entries of %1").arg(unit.filePath);
            return file;
        }
        existing = std::move(*stored);
    }

    const std::vector<Chunk> chunks = m_chunker.chunk(unit.rawText, unit.metadata);
    if (chunks.empty()) {
        LOG_DEBUG(sxIndex, "No chunks produced for %s (empty content)",
                  qUtf8Printable(unit.filePath));
    }

    // Chunks whose text is already stored keep that entry and its vector.
    std::multimap<QString, size_t> unusedByHash;
    for (size_t i = 0; i < existing.size(); ++i) {
        unusedByHash.emplace(existing[i].chunkHash, i);
    }

    std::vector<QString> chunkHashes;
    std::vector<int> matched(chunks.size(), -1);
    std::vector<bool> used(existing.size(), false);
    chunkHashes.reserve(chunks.size());
    for (size_t j = 0; j < chunks.size(); ++j) {
        chunkHashes.push_back(computeChunkHash(chunks[j].text));
        const auto it = unusedByHash.find(chunkHashes.back());
        if (it != unusedByHash.end()) {
            matched[j] = static_cast<int>(it->second);
            used[it->second] = true;
            unusedByHash.erase(it);
        }
    }

    // Leftover old entries, in ordinal order, absorb new chunks as updates.
    std::vector<size_t> leftovers;
    for (size_t i = 0; i < existing.size(); ++i) {
        if (!used[i]) {
            leftovers.push_back(i);
        }
    }
    size_t nextLeftover = 0;

    for (size_t j = 0; j < chunks.size(); ++j) {
        const Chunk& chunk = chunks[j];

        Entry entry;
        entry.corpusId = corpusId;
        entry.filePath = unit.filePath;
        entry.sourceType = unit.metadata.sourceType;
        entry.heading = chunk.heading;
        entry.text = chunk.text;
        entry.contentHash = change.contentHash;
        entry.chunkHash = chunkHashes[j];
        entry.chunkOrdinal = chunk.ordinal;
        entry.charStart = chunk.charStart;
        entry.charEnd = chunk.charEnd;
        entry.dates = DateExtractor::merge(DateExtractor::extract(chunk.text),
                                           unit.metadata.dates);

        if (matched[j] >= 0) {
            const Entry& old = existing[static_cast<size_t>(matched[j])];
            ++file.reused;
            if (old.chunkOrdinal == entry.chunkOrdinal && old.charStart == entry.charStart
                && old.charEnd == entry.charEnd && old.heading == entry.heading
                && old.sourceType == entry.sourceType && sameDates(old.dates, entry.dates)) {
                continue;
            }
            // Same text at a new position: rewrite the row, keep the vector.
            entry.id = old.id;
            entry.embedding = old.embedding;
            change.updates.push_back(std::move(entry));
            continue;
        }

        if (nextLeftover < leftovers.size()) {
            entry.id = existing[leftovers[nextLeftover++]].id;
            change.updates.push_back(std::move(entry));
            file.pending.push_back({true, change.updates.size() - 1});
        } else {
            change.inserts.push_back(std::move(entry));
            file.pending.push_back({false, change.inserts.size() - 1});
        }
    }

    for (; nextLeftover < leftovers.size(); ++nextLeftover) {
        change.deletes.push_back(existing[leftovers[nextLeftover]].id);
    }

    return file;
}

std::vector<Indexer::WriteBatch> Indexer::groupBatches(std::vector<PlannedFile>& planned) const
{
    std::vector<WriteBatch> batches;
    WriteBatch current;
    for (PlannedFile& file : planned) {
        const int cost = static_cast<int>(file.pending.size());
        if (!current.files.empty() && current.pendingChunks + cost > m_config.writeBatchChunks) {
            batches.push_back(std::move(current));
            current = WriteBatch();
        }
        current.pendingChunks += cost;
        current.files.push_back(std::move(file));
    }
    if (!current.files.empty()) {
        batches.push_back(std::move(current));
    }
    return batches;
}

// ── Embedding ───────────────────────────────────────────────

bool Indexer::embedBatch(WriteBatch& batch, const CancellationToken& token, ErrorCode& error,
                         QString& message)
{
    std::vector<QString> texts;
    texts.reserve(static_cast<size_t>(batch.pendingChunks));
    for (const PlannedFile& file : batch.files) {
        for (const PlannedFile::Pending& pending : file.pending) {
            const auto& rows = pending.update ? file.change.updates : file.change.inserts;
            texts.push_back(rows[pending.index].text);
        }
    }
    if (texts.empty()) {
        return true;
    }

    // One token per batch: a failed sub-batch or a cancelled run stops the rest.
    CancellationToken batchToken;
    std::vector<std::future<EmbeddingResult>> futures;
    const size_t step = static_cast<size_t>(m_config.batchSize);
    const int timeoutMs = m_config.embedTimeoutMs;
    for (size_t offset = 0; offset < texts.size(); offset += step) {
        const size_t end = std::min(texts.size(), offset + step);
        std::vector<QString> slice(texts.begin() + static_cast<std::ptrdiff_t>(offset),
                                   texts.begin() + static_cast<std::ptrdiff_t>(end));
        EmbeddingProvider& provider = m_provider;
        futures.push_back(m_executor.submit(
            ProviderExecutor::Lane::Bulk,
            [&provider, slice = std::move(slice), batchToken, timeoutMs]() {
                return provider.embedDocuments(slice,
                                               CallContext::withTimeout(timeoutMs, batchToken));
            }));
    }

    std::vector<std::vector<float>> vectors;
    vectors.reserve(texts.size());
    bool failed = false;
    for (auto& future : futures) {
        while (future.wait_for(std::chrono::milliseconds(kCancelPollMs))
               != std::future_status::ready) {
            if (token.isCancelled()) {
                batchToken.cancel();
            }
        }
        EmbeddingResult embedded = future.get();
        if (failed) {
            continue;
        }
        if (token.isCancelled()) {
            error = ErrorCode::Cancelled;
            message = QStringLiteral("Index run cancelled");
            failed = true;
        } else if (!embedded.ok()) {
            error = toErrorCode(embedded.status);
            message = embedded.message;
            failed = true;
        } else {
            for (auto& vector : embedded.vectors) {
                vectors.push_back(std::move(vector));
            }
        }
        if (failed) {
            batchToken.cancel();
        }
    }
    if (failed) {
        return false;
    }

    if (vectors.size() != texts.size()) {
        error = ErrorCode::ProviderUnavailable;
        message = QStringLiteral("Provider returned %1 vectors for %2 texts")
                      .arg(vectors.size())
                      .arg(texts.size());
        return false;
    }

    size_t next = 0;
    for (PlannedFile& file : batch.files) {
        for (const PlannedFile::Pending& pending : file.pending) {
            auto& rows = pending.update ? file.change.updates : file.change.inserts;
            rows[pending.index].embedding = std::move(vectors[next++]);
        }
    }
    return true;
}

// ── Commit ──────────────────────────────────────────────────

bool Indexer::commitBatch(const QString& corpusId, WriteBatch& batch, IndexRunResult& result)
{
    int dimensions = m_provider.dimensions();
    for (const PlannedFile& file : batch.files) {
        if (dimensions > 0) {
            break;
        }
        for (const auto* rows : {&file.change.inserts, &file.change.updates}) {
            if (!rows->empty()) {
                dimensions = static_cast<int>(rows->front().embedding.size());
                break;
            }
        }
    }

    auto failBatch = [&](ErrorCode code, const QString& message) {
        for (const PlannedFile& file : batch.files) {
            FileOutcome& outcome = result.files[file.outcomeIndex];
            outcome.status = FileOutcome::Status::Failed;
            outcome.error = code;
            outcome.message = message;
        }
        result.code = code;
        result.message = message;
        LOG_ERROR(sxIndex, "Write batch of %d files failed: %s",
                  static_cast<int>(batch.files.size()), qUtf8Printable(message));
        return false;
    };

    std::vector<FileChangeSet> changes;
    changes.reserve(batch.files.size());
    if (m_store.corpusInfo(corpusId).has_value()) {
        for (const PlannedFile& file : batch.files) {
            changes.push_back(file.change);
        }
    } else if (dimensions > 0) {
        const StoreResult created = m_store.ensureCorpus(corpusId, m_provider.modelId(),
                                                         dimensions);
        if (!created.ok()) {
            return failBatch(created.code, created.message);
        }
        LOG_INFO(sxIndex, "Created corpus %s (%s, %d dims)", qUtf8Printable(corpusId),
                 qUtf8Printable(m_provider.modelId()), dimensions);
        for (const PlannedFile& file : batch.files) {
            changes.push_back(file.change);
        }
    }
    // Otherwise the corpus does not exist yet and every file of the batch is
    // empty: there is nothing to store.

    StoreWriteResult written;
    if (!changes.empty()) {
        written = m_store.applyFileChanges(corpusId, changes);
        if (!written.ok()) {
            return failBatch(written.code, written.message);
        }
    }

    for (const PlannedFile& file : batch.files) {
        FileOutcome& outcome = result.files[file.outcomeIndex];
        outcome.status = FileOutcome::Status::Indexed;
        outcome.inserted = static_cast<int>(file.change.inserts.size());
        outcome.updated = static_cast<int>(file.change.updates.size());
        outcome.deleted = static_cast<int>(file.change.deletes.size());
        outcome.reused = file.reused;
        result.entriesReused += file.reused;
        LOG_DEBUG(sxIndex, "Indexed %s: +%d ~%d -%d, %d reused",
                  qUtf8Printable(outcome.filePath), outcome.inserted, outcome.updated,
                  outcome.deleted, outcome.reused);
    }

    result.entriesInserted += written.inserted;
    result.entriesUpdated += written.updated;
    result.entriesDeleted += written.deleted;
    result.chunksEmbedded += batch.pendingChunks;
    ++result.batchesCommitted;
    return true;
}

} // namespace sx
