#include "core/embedding/tokenizer.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QStringConverter>
#include <QTextStream>

#include <algorithm>

namespace sx {

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength)
    : m_maxSequenceLength(std::max(maxSequenceLength, 4))
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_WARN(sxEmbed, "WordPieceTokenizer failed to open vocab: %s", qUtf8Printable(vocabPath));
        return;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);

    int64_t index = 0;
    while (!in.atEnd()) {
        const QString token = in.readLine().trimmed();
        if (!token.isEmpty()) {
            m_vocab.emplace(token.toStdString(), index);
        }
        ++index;
    }

    if (m_vocab.empty()) {
        LOG_WARN(sxEmbed, "WordPieceTokenizer loaded empty vocab from %s", qUtf8Printable(vocabPath));
        return;
    }

    m_padId = specialId("[PAD]", m_padId);
    m_unkId = specialId("[UNK]", m_unkId);
    m_clsId = specialId("[CLS]", m_clsId);
    m_sepId = specialId("[SEP]", m_sepId);
    m_loaded = true;
}

bool WordPieceTokenizer::hasToken(const QString& token) const
{
    return m_vocab.count(token.toStdString()) > 0;
}

int64_t WordPieceTokenizer::specialId(const char* token, int64_t fallback) const
{
    const auto it = m_vocab.find(token);
    return it != m_vocab.end() ? it->second : fallback;
}

QString WordPieceTokenizer::normalize(const QString& text) const
{
    const QString decomposed = text.toLower().normalized(QString::NormalizationForm_D);

    QString stripped;
    stripped.reserve(decomposed.size());
    for (const QChar ch : decomposed) {
        const QChar::Category category = ch.category();
        if (category == QChar::Mark_NonSpacing
            || category == QChar::Mark_SpacingCombining
            || category == QChar::Mark_Enclosing
            || category == QChar::Other_Control) {
            continue;
        }
        stripped.append(ch);
    }
    return stripped;
}

std::vector<QString> WordPieceTokenizer::splitWords(const QString& normalized) const
{
    std::vector<QString> words;
    QString current;
    auto flush = [&words, &current]() {
        if (!current.isEmpty()) {
            words.push_back(current);
            current.clear();
        }
    };

    for (const QChar ch : normalized) {
        if (ch.isSpace()) {
            flush();
        } else if (ch.isPunct() || ch.isSymbol()) {
            flush();
            words.push_back(QString(ch));
        } else {
            current.append(ch);
        }
    }
    flush();
    return words;
}

void WordPieceTokenizer::appendWordPieces(const QString& word, int budget,
                                          std::vector<int64_t>& out) const
{
    const int length = word.size();
    std::vector<int64_t> pieces;
    int start = 0;

    while (start < length) {
        int end = length;
        int64_t matched = -1;
        while (end > start) {
            QString piece = word.mid(start, end - start);
            if (start > 0) {
                piece.prepend(QStringLiteral("##"));
            }
            const auto it = m_vocab.find(piece.toStdString());
            if (it != m_vocab.end()) {
                matched = it->second;
                break;
            }
            --end;
        }

        if (matched < 0) {
            // A word that cannot be fully segmented becomes a single [UNK].
            pieces.assign(1, m_unkId);
            break;
        }
        pieces.push_back(matched);
        start = end;
    }

    for (int64_t id : pieces) {
        if (static_cast<int>(out.size()) >= budget) {
            return;
        }
        out.push_back(id);
    }
}

std::vector<int64_t> WordPieceTokenizer::contentIds(const QString& text, int budget) const
{
    std::vector<int64_t> ids;
    if (!m_loaded || budget <= 0) {
        return ids;
    }
    for (const QString& word : splitWords(normalize(text))) {
        if (static_cast<int>(ids.size()) >= budget) {
            break;
        }
        appendWordPieces(word, budget, ids);
    }
    return ids;
}

Encoding WordPieceTokenizer::encode(const QString& text) const
{
    Encoding encoding;
    if (!m_loaded) {
        return encoding;
    }

    const std::vector<int64_t> content = contentIds(text, m_maxSequenceLength - 2);
    encoding.inputIds.reserve(content.size() + 2);
    encoding.inputIds.push_back(m_clsId);
    encoding.inputIds.insert(encoding.inputIds.end(), content.begin(), content.end());
    encoding.inputIds.push_back(m_sepId);

    encoding.sequenceLength = static_cast<int>(encoding.inputIds.size());
    encoding.batchSize = 1;
    encoding.attentionMask.assign(encoding.inputIds.size(), 1);
    encoding.tokenTypeIds.assign(encoding.inputIds.size(), 0);
    return encoding;
}

Encoding WordPieceTokenizer::encodePair(const QString& a, const QString& b) const
{
    Encoding encoding;
    if (!m_loaded) {
        return encoding;
    }

    const int budget = m_maxSequenceLength - 3;
    std::vector<int64_t> tokensA = contentIds(a, budget);
    std::vector<int64_t> tokensB = contentIds(b, budget);
    if (static_cast<int>(tokensA.size() + tokensB.size()) > budget) {
        const size_t halfBudget = static_cast<size_t>(budget / 2);
        if (tokensB.size() > halfBudget) {
            tokensB.resize(halfBudget);
        }
        const size_t remaining = static_cast<size_t>(budget) - tokensB.size();
        if (tokensA.size() > remaining) {
            tokensA.resize(remaining);
        }
    }

    encoding.inputIds.push_back(m_clsId);
    encoding.inputIds.insert(encoding.inputIds.end(), tokensA.begin(), tokensA.end());
    encoding.inputIds.push_back(m_sepId);
    const size_t segmentA = encoding.inputIds.size();
    encoding.inputIds.insert(encoding.inputIds.end(), tokensB.begin(), tokensB.end());
    encoding.inputIds.push_back(m_sepId);

    encoding.sequenceLength = static_cast<int>(encoding.inputIds.size());
    encoding.batchSize = 1;
    encoding.attentionMask.assign(encoding.inputIds.size(), 1);
    encoding.tokenTypeIds.assign(segmentA, 0);
    encoding.tokenTypeIds.resize(encoding.inputIds.size(), 1);
    return encoding;
}

Encoding WordPieceTokenizer::encodeBatch(const std::vector<QString>& texts) const
{
    std::vector<Encoding> rows;
    rows.reserve(texts.size());
    for (const QString& text : texts) {
        rows.push_back(encode(text));
    }
    return stack(std::move(rows));
}

Encoding WordPieceTokenizer::encodePairBatch(const QString& a,
                                             const std::vector<QString>& bs) const
{
    std::vector<Encoding> rows;
    rows.reserve(bs.size());
    for (const QString& b : bs) {
        rows.push_back(encodePair(a, b));
    }
    return stack(std::move(rows));
}

Encoding WordPieceTokenizer::stack(std::vector<Encoding>&& rows) const
{
    Encoding batch;
    if (rows.empty() || rows.front().inputIds.empty()) {
        return batch;
    }

    int maxLength = 0;
    for (const Encoding& row : rows) {
        maxLength = std::max(maxLength, row.sequenceLength);
    }

    batch.batchSize = static_cast<int>(rows.size());
    batch.sequenceLength = maxLength;
    const size_t total = static_cast<size_t>(batch.batchSize) * static_cast<size_t>(maxLength);
    batch.inputIds.reserve(total);
    batch.attentionMask.reserve(total);
    batch.tokenTypeIds.reserve(total);

    for (Encoding& row : rows) {
        row.inputIds.resize(static_cast<size_t>(maxLength), m_padId);
        row.attentionMask.resize(static_cast<size_t>(maxLength), 0);
        row.tokenTypeIds.resize(static_cast<size_t>(maxLength), 0);
        batch.inputIds.insert(batch.inputIds.end(), row.inputIds.begin(), row.inputIds.end());
        batch.attentionMask.insert(batch.attentionMask.end(),
                                   row.attentionMask.begin(), row.attentionMask.end());
        batch.tokenTypeIds.insert(batch.tokenTypeIds.end(),
                                  row.tokenTypeIds.begin(), row.tokenTypeIds.end());
    }
    return batch;
}

} // namespace sx
