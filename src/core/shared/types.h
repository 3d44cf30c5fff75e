#pragma once

#include <QDate>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>
#include <vector>

namespace sx {

// Origin of a content unit, as reported by the content processor.
enum class SourceType {
    File,
    Markdown,
    Org,
    Pdf,
    PlainText,
    Docx,
    Image,
    WebPage,
    Email,
    Notion,
    GitHub,
    Unknown,
};

QString sourceTypeToString(SourceType type);
SourceType sourceTypeFromString(const QString& str);

// Every source type name accepted by sourceTypeFromString(), in enum order.
QStringList supportedSourceTypes();

// Typed failure surfaced by the indexing and search entry points.
enum class ErrorCode {
    None,
    ProviderUnavailable,
    ModelFailure,
    DimensionMismatch,
    CorpusScopeViolation,
    StorageError,
    Cancelled,
    InvalidArgument,
};

QString errorCodeToString(ErrorCode code);

enum class IndexMode {
    Sync,        // incremental: skip unchanged files, delete missing ones
    Regenerate,  // drop the corpus and index the snapshot from scratch
};

QString indexModeToString(IndexMode mode);
std::optional<IndexMode> indexModeFromString(const QString& str);

struct SourceMetadata {
    SourceType sourceType = SourceType::PlainText;
    QString title;
    // Dates the content processor already knows about (e.g. an email's
    // sent date). Merged with dates found in the chunk text.
    std::vector<QDate> dates;
};

// One raw record handed over by a content processor.
struct ContentUnit {
    QString filePath;
    QString rawText;
    SourceMetadata metadata;
};

struct Entry {
    int64_t id = 0;
    QString corpusId;
    QString filePath;
    SourceType sourceType = SourceType::PlainText;
    QString heading;
    QString text;
    std::vector<float> embedding;
    QString contentHash;
    QString chunkHash;
    int chunkOrdinal = 0;
    int charStart = 0;
    int charEnd = 0;
    std::vector<QDate> dates;
    int64_t createdAt = 0;
    int64_t updatedAt = 0;
};

} // namespace sx
