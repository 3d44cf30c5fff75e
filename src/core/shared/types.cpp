#include "core/shared/types.h"

namespace sx {

QString sourceTypeToString(SourceType type)
{
    switch (type) {
    case SourceType::File:      return QStringLiteral("file");
    case SourceType::Markdown:  return QStringLiteral("markdown");
    case SourceType::Org:       return QStringLiteral("org");
    case SourceType::Pdf:       return QStringLiteral("pdf");
    case SourceType::PlainText: return QStringLiteral("plaintext");
    case SourceType::Docx:      return QStringLiteral("docx");
    case SourceType::Image:     return QStringLiteral("image");
    case SourceType::WebPage:   return QStringLiteral("webpage");
    case SourceType::Email:     return QStringLiteral("email");
    case SourceType::Notion:    return QStringLiteral("notion");
    case SourceType::GitHub:    return QStringLiteral("github");
    case SourceType::Unknown:   return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

SourceType sourceTypeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("file"))      return SourceType::File;
    if (lower == QLatin1String("markdown"))  return SourceType::Markdown;
    if (lower == QLatin1String("org"))       return SourceType::Org;
    if (lower == QLatin1String("pdf"))       return SourceType::Pdf;
    if (lower == QLatin1String("plaintext")) return SourceType::PlainText;
    if (lower == QLatin1String("docx"))      return SourceType::Docx;
    if (lower == QLatin1String("image"))     return SourceType::Image;
    if (lower == QLatin1String("webpage"))   return SourceType::WebPage;
    if (lower == QLatin1String("email"))     return SourceType::Email;
    if (lower == QLatin1String("notion"))    return SourceType::Notion;
    if (lower == QLatin1String("github"))    return SourceType::GitHub;
    return SourceType::Unknown;
}

QStringList supportedSourceTypes()
{
    QStringList names;
    for (int i = static_cast<int>(SourceType::File); i < static_cast<int>(SourceType::Unknown); ++i) {
        names.append(sourceTypeToString(static_cast<SourceType>(i)));
    }
    return names;
}

QString errorCodeToString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:                 return QStringLiteral("none");
    case ErrorCode::ProviderUnavailable:  return QStringLiteral("provider_unavailable");
    case ErrorCode::ModelFailure:         return QStringLiteral("model_failure");
    case ErrorCode::DimensionMismatch:    return QStringLiteral("dimension_mismatch");
    case ErrorCode::CorpusScopeViolation: return QStringLiteral("corpus_scope_violation");
    case ErrorCode::StorageError:         return QStringLiteral("storage_error");
    case ErrorCode::Cancelled:            return QStringLiteral("cancelled");
    case ErrorCode::InvalidArgument:      return QStringLiteral("invalid_argument");
    }
    return QStringLiteral("none");
}

QString indexModeToString(IndexMode mode)
{
    switch (mode) {
    case IndexMode::Sync:       return QStringLiteral("sync");
    case IndexMode::Regenerate: return QStringLiteral("regenerate");
    }
    return QStringLiteral("sync");
}

std::optional<IndexMode> indexModeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("sync")) return IndexMode::Sync;
    if (lower == QLatin1String("regenerate")) return IndexMode::Regenerate;
    return std::nullopt;
}

} // namespace sx
