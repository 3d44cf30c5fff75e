#include "core/models/tokenizer_factory.h"

#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>

namespace sx {

namespace {

constexpr const char* kRequiredTokens[] = {"[PAD]", "[UNK]", "[CLS]", "[SEP]"};

std::unique_ptr<WordPieceTokenizer> reject(const ModelManifestEntry& entry, const QString& reason,
                                           QString* error)
{
    LOG_WARN(sxEmbed, "Tokenizer for model '%s' rejected: %s",
             qUtf8Printable(entry.name), qUtf8Printable(reason));
    if (error) {
        *error = reason;
    }
    return nullptr;
}

} // namespace

QString TokenizerFactory::resolveVocabPath(const ModelManifestEntry& entry,
                                           const QString& modelsDir)
{
    if (entry.vocab.isEmpty()) {
        return {};
    }
    if (QFileInfo(entry.vocab).isAbsolute()) {
        return QFileInfo::exists(entry.vocab) ? QDir::cleanPath(entry.vocab) : QString();
    }

    const QDir root(modelsDir);
    QStringList candidates;
    if (!entry.file.isEmpty()) {
        const QString modelDir = QFileInfo(root.filePath(entry.file)).absolutePath();
        candidates << QDir(modelDir).filePath(entry.vocab);
    }
    candidates << root.filePath(entry.vocab);

    for (const QString& candidate : candidates) {
        if (QFileInfo(candidate).isFile()) {
            return QDir::cleanPath(candidate);
        }
    }
    return {};
}

std::unique_ptr<WordPieceTokenizer> TokenizerFactory::create(const ModelManifestEntry& entry,
                                                             const QString& modelsDir,
                                                             TokenizerUse use, QString* error)
{
    if (entry.tokenizer != QLatin1String("wordpiece")) {
        return reject(entry, QStringLiteral("unsupported tokenizer type '%1'").arg(entry.tokenizer),
                      error);
    }
    if (entry.vocab.isEmpty()) {
        return reject(entry, QStringLiteral("no vocab file in the manifest"), error);
    }
    if (use == TokenizerUse::Pair && entry.maxSeqLength < kMinPairSequenceLength) {
        return reject(entry,
                      QStringLiteral("maxSeqLength %1 cannot hold a query and a passage")
                          .arg(entry.maxSeqLength),
                      error);
    }

    const QString vocabPath = resolveVocabPath(entry, modelsDir);
    if (vocabPath.isEmpty()) {
        return reject(entry, QStringLiteral("vocab '%1' not found under %2")
                                 .arg(entry.vocab, modelsDir),
                      error);
    }

    auto tokenizer = std::make_unique<WordPieceTokenizer>(vocabPath, entry.maxSeqLength);
    if (!tokenizer->isLoaded()) {
        return reject(entry, QStringLiteral("cannot load vocab %1").arg(vocabPath), error);
    }

    // Without these the encodings silently fall back to BERT's default ids,
    // which belong to other tokens in this vocab.
    QStringList missing;
    for (const char* token : kRequiredTokens) {
        if (!tokenizer->hasToken(QLatin1String(token))) {
            missing << QLatin1String(token);
        }
    }
    if (!missing.isEmpty()) {
        return reject(entry, QStringLiteral("vocab %1 lacks %2")
                                 .arg(vocabPath, missing.join(QStringLiteral(", "))),
                      error);
    }

    LOG_DEBUG(sxEmbed, "Tokenizer for '%s': %d tokens, max sequence %d (%s)",
              qUtf8Printable(entry.name), tokenizer->vocabSize(),
              tokenizer->maxSequenceLength(), qUtf8Printable(vocabPath));
    return tokenizer;
}

} // namespace sx
