#include "core/indexing/chunker.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <algorithm>

namespace sx {

namespace {

struct Section {
    int start = 0;
    int end = 0;
    QString heading;
};

std::vector<Section> splitSections(const QString& text, SourceType sourceType)
{
    static const QRegularExpression markdownHeading(
        QStringLiteral(R"(^#{1,6}[ \t]+(.+?)[ \t#]*$)"),
        QRegularExpression::MultilineOption);
    static const QRegularExpression orgHeading(
        QStringLiteral(R"(^\*+[ \t]+(.+?)[ \t]*$)"),
        QRegularExpression::MultilineOption);

    const QRegularExpression& headingPattern =
        sourceType == SourceType::Org ? orgHeading : markdownHeading;

    std::vector<Section> sections;
    Section current;
    QRegularExpressionMatchIterator it = headingPattern.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const int headingStart = static_cast<int>(match.capturedStart(0));
        if (headingStart > current.start) {
            current.end = headingStart;
            sections.push_back(current);
        }
        current.start = headingStart;
        current.heading = match.captured(1).trimmed();
    }
    current.end = static_cast<int>(text.size());
    if (current.end > current.start) {
        sections.push_back(current);
    }
    return sections;
}

} // namespace

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    // Sanity-check config bounds
    if (m_config.maxTokens < 1) {
        m_config.maxTokens = 1;
    }
    if (m_config.overlapTokens < 0) {
        m_config.overlapTokens = 0;
    }
    if (m_config.overlapTokens >= m_config.maxTokens) {
        m_config.overlapTokens = m_config.maxTokens - 1;
    }
}

// ── Public API ──────────────────────────────────────────────

std::vector<Chunk> Chunker::chunk(const QString& rawText, const SourceMetadata& metadata) const
{
    std::vector<Chunk> chunks;
    if (rawText.trimmed().isEmpty()) {
        return chunks;
    }

    static const QRegularExpression paragraphBreak(QStringLiteral(R"(\n[ \t]*\n)"));

    for (const Section& section : splitSections(rawText, metadata.sourceType)) {
        // Paragraph boundaries inside the section.
        std::vector<Span> paragraphs;
        int paraStart = section.start;
        QRegularExpressionMatchIterator breaks = paragraphBreak.globalMatch(rawText, section.start);
        while (breaks.hasNext()) {
            const QRegularExpressionMatch match = breaks.next();
            if (match.capturedEnd(0) > section.end) {
                break;
            }
            paragraphs.push_back({paraStart, static_cast<int>(match.capturedStart(0))});
            paraStart = static_cast<int>(match.capturedEnd(0));
        }
        paragraphs.push_back({paraStart, section.end});

        // Greedy packing of whole paragraphs.
        Span pending{-1, -1};
        int pendingTokens = 0;
        const auto flush = [&]() {
            if (pending.start >= 0) {
                appendChunk(rawText, pending, section.heading, chunks);
            }
            pending = {-1, -1};
            pendingTokens = 0;
        };

        for (const Span& paragraph : paragraphs) {
            const int tokens = static_cast<int>(tokenSpans(rawText, paragraph).size());
            if (tokens == 0) {
                continue;
            }
            if (tokens > m_config.maxTokens) {
                flush();
                appendWindows(rawText, paragraph, section.heading, chunks);
                continue;
            }
            if (pending.start >= 0 && pendingTokens + tokens <= m_config.maxTokens) {
                pending.end = paragraph.end;
                pendingTokens += tokens;
                continue;
            }
            flush();
            pending = paragraph;
            pendingTokens = tokens;
        }
        flush();
    }

    LOG_DEBUG(sxIndex, "Chunked %d chunks from %d chars",
              static_cast<int>(chunks.size()),
              static_cast<int>(rawText.size()));

    return chunks;
}

// ── Private helpers ─────────────────────────────────────────

std::vector<Chunker::Span> Chunker::tokenSpans(const QString& text, Span range) const
{
    static const QRegularExpression tokenPattern(QStringLiteral(R"(\S+)"));

    std::vector<Span> spans;
    // Matches run over the whole text; the range only bounds where they stop.
    QRegularExpressionMatchIterator it = tokenPattern.globalMatch(text, range.start);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const int start = static_cast<int>(match.capturedStart(0));
        if (start >= range.end) {
            break;
        }
        spans.push_back({start, std::min(static_cast<int>(match.capturedEnd(0)), range.end)});
    }
    return spans;
}

void Chunker::appendWindows(const QString& text, Span range, const QString& heading,
                            std::vector<Chunk>& out) const
{
    const std::vector<Span> tokens = tokenSpans(text, range);
    const int count = static_cast<int>(tokens.size());
    const int step = m_config.maxTokens - m_config.overlapTokens;

    for (int first = 0; first < count; first += step) {
        const int last = std::min(first + m_config.maxTokens, count) - 1;
        appendChunk(text,
                    {tokens[static_cast<size_t>(first)].start, tokens[static_cast<size_t>(last)].end},
                    heading, out);
        if (last == count - 1) {
            break;
        }
    }
}

void Chunker::appendChunk(const QString& text, Span range, const QString& heading,
                          std::vector<Chunk>& out) const
{
    // Trim to the first and last non-space characters.
    while (range.start < range.end && text.at(range.start).isSpace()) {
        ++range.start;
    }
    while (range.end > range.start && text.at(range.end - 1).isSpace()) {
        --range.end;
    }
    if (range.end <= range.start) {
        return;
    }

    Chunk c;
    c.ordinal = static_cast<int>(out.size());
    c.text = text.mid(range.start, range.end - range.start);
    c.heading = heading;
    c.charStart = range.start;
    c.charEnd = range.end;
    out.push_back(std::move(c));
}

} // namespace sx
