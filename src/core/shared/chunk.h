#pragma once

#include <QString>

namespace sx {

// One piece of a content unit, positioned by character offsets into the
// unit's raw text.
struct Chunk {
    int ordinal = 0;
    QString text;
    QString heading;
    int charStart = 0;
    int charEnd = 0;
};

// Hex SHA-256 of a unit's raw text. Decides whether a file must be re-indexed.
QString computeContentHash(const QString& rawText);

// Hex SHA-256 of one chunk's text. Lets unchanged chunks keep their vectors.
QString computeChunkHash(const QString& chunkText);

} // namespace sx
