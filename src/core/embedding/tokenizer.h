#pragma once

#include <QString>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sx {

// Model input for one sequence or for a padded batch of sequences
// (row-major, batchSize x sequenceLength).
struct Encoding {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int batchSize = 0;
    int sequenceLength = 0;
};

// BERT-style WordPiece tokenizer driven by a vocab.txt file (one token per
// line, line number = id). Lowercases, strips accents and splits
// punctuation before greedy longest-match-first word piece lookup.
class WordPieceTokenizer {
public:
    static constexpr int kDefaultMaxSequenceLength = 512;

    explicit WordPieceTokenizer(const QString& vocabPath,
                                int maxSequenceLength = kDefaultMaxSequenceLength);

    bool isLoaded() const { return m_loaded; }
    int maxSequenceLength() const { return m_maxSequenceLength; }
    int vocabSize() const { return static_cast<int>(m_vocab.size()); }
    bool hasToken(const QString& token) const;

    // [CLS] text [SEP], truncated to maxSequenceLength.
    Encoding encode(const QString& text) const;

    // [CLS] a [SEP] b [SEP]. When too long, b is cut to half the budget
    // first, then a takes what is left.
    Encoding encodePair(const QString& a, const QString& b) const;

    Encoding encodeBatch(const std::vector<QString>& texts) const;
    Encoding encodePairBatch(const QString& a, const std::vector<QString>& bs) const;

private:
    QString normalize(const QString& text) const;
    std::vector<QString> splitWords(const QString& normalized) const;
    std::vector<int64_t> contentIds(const QString& text, int budget) const;
    void appendWordPieces(const QString& word, int budget, std::vector<int64_t>& out) const;
    int64_t specialId(const char* token, int64_t fallback) const;
    Encoding stack(std::vector<Encoding>&& rows) const;

    std::unordered_map<std::string, int64_t> m_vocab;
    int m_maxSequenceLength = kDefaultMaxSequenceLength;
    int64_t m_padId = 0;
    int64_t m_unkId = 100;
    int64_t m_clsId = 101;
    int64_t m_sepId = 102;
    bool m_loaded = false;
};

} // namespace sx
