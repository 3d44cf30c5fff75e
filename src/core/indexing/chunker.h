#pragma once

#include "core/shared/chunk.h"
#include "core/shared/types.h"

#include <QString>
#include <vector>

namespace sx {

// Configuration for the Chunker.
// Defined outside the class to avoid the "default member initializer needed
// within enclosing class" issue in C++.
struct ChunkerConfig {
    int maxTokens = 256;
    int overlapTokens = 32;
};

// Chunker: splits a content unit into chunks sized for the bi-encoder.
//
// Split priority (highest to lowest):
//   1. Heading boundary (Markdown "#" headings, Org "*" headings for Org units)
//   2. Paragraph boundary (blank line); paragraphs of one section are packed
//      together while the chunk stays within maxTokens
//   3. Fixed windows of maxTokens whitespace-delimited tokens, consecutive
//      windows sharing overlapTokens tokens
//
// Whitespace-only chunks are dropped. Output depends only on the input, so a
// re-run over the same text yields the same chunks and offsets.
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    std::vector<Chunk> chunk(const QString& rawText, const SourceMetadata& metadata = {}) const;

    const Config& config() const { return m_config; }

private:
    struct Span {
        int start = 0;
        int end = 0;
    };

    std::vector<Span> tokenSpans(const QString& text, Span range) const;
    void appendWindows(const QString& text, Span range, const QString& heading,
                       std::vector<Chunk>& out) const;
    void appendChunk(const QString& text, Span range, const QString& heading,
                     std::vector<Chunk>& out) const;

    Config m_config;
};

} // namespace sx
