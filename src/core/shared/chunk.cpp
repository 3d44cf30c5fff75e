#include "core/shared/chunk.h"
#include <QCryptographicHash>

namespace sx {

namespace {

QString sha256Hex(const QString& text)
{
    const QByteArray hash = QCryptographicHash::hash(
        text.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

} // namespace

QString computeContentHash(const QString& rawText)
{
    return sha256Hex(rawText);
}

QString computeChunkHash(const QString& chunkText)
{
    // Whitespace at the edges does not change what gets embedded.
    return sha256Hex(chunkText.trimmed());
}

} // namespace sx
