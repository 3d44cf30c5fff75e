#include <QtTest/QtTest>
#include "core/embedding/tokenizer.h"
#include "core/models/tokenizer_factory.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

#include <vector>

using Ids = std::vector<int64_t>;

class TestTokenizer : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    // ── Single sequences ─────────────────────────────────────────
    void testLoadVocabNotFound();
    void testSpecialIdsFromVocab();
    void testEmptyInputIsClsSep();
    void testPunctuationSplit();
    void testWordPiecesAndUnknown();
    void testAccentsStripped();
    void testLongTextTruncated();

    // ── Pairs and batches ────────────────────────────────────────
    void testPairSegments();
    void testPairTruncationCutsSecondSegmentFirst();
    void testBatchPadding();
    void testPairBatchPadding();

    // ── Factory ──────────────────────────────────────────────────
    void testFactoryRejectsUnsupportedType();
    void testFactoryRejectsMissingVocab();
    void testFactoryRejectsEmptyVocabFile();
    void testFactoryAppliesMaxSequenceLength();
    void testFactoryRejectsVocabWithoutSpecialTokens();
    void testFactoryRejectsPairModelWithShortSequence();
    void testFactoryResolvesVocabBesideModelFile();
    void testResolveVocabPathEmptyWhenAbsent();

private:
    QTemporaryDir m_tempDir;
    QString m_vocabPath;
};

void TestTokenizer::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_vocabPath = m_tempDir.path() + QStringLiteral("/vocab.txt");

    QFile vocab(m_vocabPath);
    QVERIFY(vocab.open(QIODevice::WriteOnly | QIODevice::Text));
    QTextStream out(&vocab);
    out << "[PAD]\n";   // 0
    out << "[UNK]\n";   // 1
    out << "[CLS]\n";   // 2
    out << "[SEP]\n";   // 3
    out << "hello\n";   // 4
    out << "world\n";   // 5
    out << "it\n";      // 6
    out << "test\n";    // 7
    out << "a\n";       // 8
    out << "!\n";       // 9
    out << "'\n";       // 10
    out << "s\n";       // 11
    out << "##ing\n";   // 12
    out << "play\n";    // 13
    out << "cafe\n";    // 14
}

// ── Single sequences ─────────────────────────────────────────────

void TestTokenizer::testLoadVocabNotFound()
{
    sx::WordPieceTokenizer tokenizer(QStringLiteral("/definitely/missing/vocab.txt"));
    QVERIFY(!tokenizer.isLoaded());
    QVERIFY(tokenizer.encode(QStringLiteral("hello")).inputIds.empty());
    QCOMPARE(tokenizer.encodeBatch({QStringLiteral("hello")}).batchSize, 0);
}

void TestTokenizer::testSpecialIdsFromVocab()
{
    sx::WordPieceTokenizer tokenizer(m_vocabPath);
    QVERIFY(tokenizer.isLoaded());
    QCOMPARE(tokenizer.vocabSize(), 15);

    const sx::Encoding encoding = tokenizer.encode(QStringLiteral("hello world"));
    QCOMPARE(encoding.inputIds, (Ids{2, 4, 5, 3}));
    QCOMPARE(encoding.attentionMask, (Ids{1, 1, 1, 1}));
    QCOMPARE(encoding.tokenTypeIds, (Ids{0, 0, 0, 0}));
    QCOMPARE(encoding.batchSize, 1);
    QCOMPARE(encoding.sequenceLength, 4);
}

void TestTokenizer::testEmptyInputIsClsSep()
{
    sx::WordPieceTokenizer tokenizer(m_vocabPath);
    QCOMPARE(tokenizer.encode(QString()).inputIds, (Ids{2, 3}));
    QCOMPARE(tokenizer.encode(QStringLiteral("   \n")).inputIds, (Ids{2, 3}));
}

void TestTokenizer::testPunctuationSplit()
{
    sx::WordPieceTokenizer tokenizer(m_vocabPath);
    QCOMPARE(tokenizer.encode(QStringLiteral("It's a TEST!")).inputIds,
             (Ids{2, 6, 10, 11, 8, 7, 9, 3}));
}

void TestTokenizer::testWordPiecesAndUnknown()
{
    sx::WordPieceTokenizer tokenizer(m_vocabPath);
    QCOMPARE(tokenizer.encode(QStringLiteral("playing")).inputIds, (Ids{2, 13, 12, 3}));
    // A word that cannot be segmented completely is one [UNK].
    QCOMPARE(tokenizer.encode(QStringLiteral("playx xyz")).inputIds, (Ids{2, 1, 1, 3}));
}

void TestTokenizer::testAccentsStripped()
{
    sx::WordPieceTokenizer tokenizer(m_vocabPath);
    QCOMPARE(tokenizer.encode(QStringLiteral("Café")).inputIds, (Ids{2, 14, 3}));
}

void TestTokenizer::testLongTextTruncated()
{
    sx::WordPieceTokenizer tokenizer(m_vocabPath, 8);
    QCOMPARE(tokenizer.maxSequenceLength(), 8);

    QString longText;
    for (int i = 0; i < 2000; ++i) {
        longText += QStringLiteral("hello ");
    }

    const sx::Encoding encoding = tokenizer.encode(longText);
    QCOMPARE(encoding.sequenceLength, 8);
    QCOMPARE(encoding.inputIds.front(), int64_t(2));
    QCOMPARE(encoding.inputIds.back(), int64_t(3));

    sx::WordPieceTokenizer defaults(m_vocabPath);
    QCOMPARE(defaults.encode(longText).sequenceLength, 512);
}

// ── Pairs and batches ────────────────────────────────────────────

void TestTokenizer::testPairSegments()
{
    sx::WordPieceTokenizer tokenizer(m_vocabPath);
    const sx::Encoding encoding = tokenizer.encodePair(QStringLiteral("hello"),
                                                       QStringLiteral("a test"));
    QCOMPARE(encoding.inputIds, (Ids{2, 4, 3, 8, 7, 3}));
    QCOMPARE(encoding.tokenTypeIds, (Ids{0, 0, 0, 1, 1, 1}));
    QCOMPARE(encoding.attentionMask, (Ids{1, 1, 1, 1, 1, 1}));

    const sx::Encoding emptyPassage = tokenizer.encodePair(QStringLiteral("hello"), QString());
    QCOMPARE(emptyPassage.inputIds, (Ids{2, 4, 3, 3}));
}

void TestTokenizer::testPairTruncationCutsSecondSegmentFirst()
{
    sx::WordPieceTokenizer tokenizer(m_vocabPath, 8);
    const sx::Encoding encoding = tokenizer.encodePair(
        QStringLiteral("hello world"), QStringLiteral("a a a a a"));
    QCOMPARE(encoding.inputIds, (Ids{2, 4, 5, 3, 8, 8, 3}));
    QCOMPARE(encoding.tokenTypeIds, (Ids{0, 0, 0, 0, 1, 1, 1}));
    QVERIFY(encoding.sequenceLength <= 8);
}

void TestTokenizer::testBatchPadding()
{
    sx::WordPieceTokenizer tokenizer(m_vocabPath);
    const sx::Encoding batch = tokenizer.encodeBatch(
        {QStringLiteral("hello"), QStringLiteral("hello world")});
    QCOMPARE(batch.batchSize, 2);
    QCOMPARE(batch.sequenceLength, 4);
    QCOMPARE(batch.inputIds, (Ids{2, 4, 3, 0, 2, 4, 5, 3}));
    QCOMPARE(batch.attentionMask, (Ids{1, 1, 1, 0, 1, 1, 1, 1}));

    QCOMPARE(tokenizer.encodeBatch({}).batchSize, 0);
}

void TestTokenizer::testPairBatchPadding()
{
    sx::WordPieceTokenizer tokenizer(m_vocabPath);
    const sx::Encoding batch = tokenizer.encodePairBatch(
        QStringLiteral("test"), {QStringLiteral("a"), QStringLiteral("hello world")});
    QCOMPARE(batch.batchSize, 2);
    QCOMPARE(batch.sequenceLength, 6);
    QCOMPARE(batch.inputIds, (Ids{2, 7, 3, 8, 3, 0, 2, 7, 3, 4, 5, 3}));
    QCOMPARE(batch.tokenTypeIds, (Ids{0, 0, 0, 1, 1, 0, 0, 0, 0, 1, 1, 1}));
    QCOMPARE(batch.attentionMask, (Ids{1, 1, 1, 1, 1, 0, 1, 1, 1, 1, 1, 1}));
}

// ── Factory ──────────────────────────────────────────────────────

void TestTokenizer::testFactoryRejectsUnsupportedType()
{
    sx::ModelManifestEntry entry;
    entry.name = QStringLiteral("bpe-model");
    entry.tokenizer = QStringLiteral("bpe");
    entry.vocab = QStringLiteral("vocab.txt");
    QVERIFY(sx::TokenizerFactory::create(entry, m_tempDir.path()) == nullptr);
}

void TestTokenizer::testFactoryRejectsMissingVocab()
{
    sx::ModelManifestEntry entry;
    entry.name = QStringLiteral("model");
    entry.tokenizer = QStringLiteral("wordpiece");
    QVERIFY(sx::TokenizerFactory::create(entry, m_tempDir.path()) == nullptr);

    entry.vocab = QStringLiteral("missing-vocab.txt");
    QVERIFY(sx::TokenizerFactory::create(entry, m_tempDir.path()) == nullptr);
}

void TestTokenizer::testFactoryRejectsEmptyVocabFile()
{
    QFile empty(m_tempDir.filePath(QStringLiteral("empty.txt")));
    QVERIFY(empty.open(QIODevice::WriteOnly));
    empty.close();

    sx::ModelManifestEntry entry;
    entry.name = QStringLiteral("model");
    entry.tokenizer = QStringLiteral("wordpiece");
    entry.vocab = QStringLiteral("empty.txt");
    QVERIFY(sx::TokenizerFactory::create(entry, m_tempDir.path()) == nullptr);
}

void TestTokenizer::testFactoryAppliesMaxSequenceLength()
{
    sx::ModelManifestEntry entry;
    entry.name = QStringLiteral("model");
    entry.tokenizer = QStringLiteral("wordpiece");
    entry.vocab = QStringLiteral("vocab.txt");
    entry.maxSeqLength = 16;

    const auto tokenizer = sx::TokenizerFactory::create(entry, m_tempDir.path());
    QVERIFY(tokenizer != nullptr);
    QVERIFY(tokenizer->isLoaded());
    QCOMPARE(tokenizer->maxSequenceLength(), 16);
}

void TestTokenizer::testFactoryRejectsVocabWithoutSpecialTokens()
{
    QFile plain(m_tempDir.filePath(QStringLiteral("plain.txt")));
    QVERIFY(plain.open(QIODevice::WriteOnly | QIODevice::Text));
    plain.write("[PAD]\n[UNK]\nhello\nworld\n");
    plain.close();

    sx::ModelManifestEntry entry;
    entry.name = QStringLiteral("model");
    entry.tokenizer = QStringLiteral("wordpiece");
    entry.vocab = QStringLiteral("plain.txt");

    QString error;
    QVERIFY(sx::TokenizerFactory::create(entry, m_tempDir.path(), sx::TokenizerUse::Single,
                                         &error)
            == nullptr);
    QVERIFY(error.contains(QStringLiteral("[CLS]")));
    QVERIFY(error.contains(QStringLiteral("[SEP]")));
    QVERIFY(!error.contains(QStringLiteral("[PAD]")));
}

void TestTokenizer::testFactoryRejectsPairModelWithShortSequence()
{
    sx::ModelManifestEntry entry;
    entry.name = QStringLiteral("reranker");
    entry.tokenizer = QStringLiteral("wordpiece");
    entry.vocab = QStringLiteral("vocab.txt");
    entry.maxSeqLength = sx::TokenizerFactory::kMinPairSequenceLength - 1;

    QString error;
    QVERIFY(sx::TokenizerFactory::create(entry, m_tempDir.path(), sx::TokenizerUse::Pair, &error)
            == nullptr);
    QVERIFY(!error.isEmpty());

    // The same length is enough for single-text encoding.
    QVERIFY(sx::TokenizerFactory::create(entry, m_tempDir.path(), sx::TokenizerUse::Single)
            != nullptr);

    entry.maxSeqLength = sx::TokenizerFactory::kMinPairSequenceLength;
    const auto tokenizer =
        sx::TokenizerFactory::create(entry, m_tempDir.path(), sx::TokenizerUse::Pair);
    QVERIFY(tokenizer != nullptr);
    QCOMPARE(tokenizer->maxSequenceLength(), sx::TokenizerFactory::kMinPairSequenceLength);
}

void TestTokenizer::testFactoryResolvesVocabBesideModelFile()
{
    QVERIFY(QDir(m_tempDir.path()).mkpath(QStringLiteral("bge")));
    QFile vocab(m_tempDir.filePath(QStringLiteral("bge/vocab.txt")));
    QVERIFY(vocab.open(QIODevice::WriteOnly | QIODevice::Text));
    vocab.write("[PAD]\n[UNK]\n[CLS]\n[SEP]\nledger\n");
    vocab.close();

    sx::ModelManifestEntry entry;
    entry.name = QStringLiteral("bge");
    entry.tokenizer = QStringLiteral("wordpiece");
    entry.file = QStringLiteral("bge/model.onnx");
    entry.vocab = QStringLiteral("vocab.txt");

    // The sub-directory copy wins over the one at the top of modelsDir.
    QCOMPARE(sx::TokenizerFactory::resolveVocabPath(entry, m_tempDir.path()),
             QDir::cleanPath(m_tempDir.filePath(QStringLiteral("bge/vocab.txt"))));

    const auto tokenizer = sx::TokenizerFactory::create(entry, m_tempDir.path());
    QVERIFY(tokenizer != nullptr);
    QCOMPARE(tokenizer->vocabSize(), 5);
}

void TestTokenizer::testResolveVocabPathEmptyWhenAbsent()
{
    sx::ModelManifestEntry entry;
    entry.name = QStringLiteral("model");
    entry.tokenizer = QStringLiteral("wordpiece");
    entry.file = QStringLiteral("other/model.onnx");
    entry.vocab = QStringLiteral("nowhere.txt");
    QVERIFY(sx::TokenizerFactory::resolveVocabPath(entry, m_tempDir.path()).isEmpty());

    entry.vocab = m_tempDir.filePath(QStringLiteral("absent/vocab.txt"));
    QVERIFY(sx::TokenizerFactory::resolveVocabPath(entry, m_tempDir.path()).isEmpty());

    // Absolute paths are taken as they are.
    entry.vocab = m_vocabPath;
    QCOMPARE(sx::TokenizerFactory::resolveVocabPath(entry, m_tempDir.path()),
             QDir::cleanPath(m_vocabPath));
}

QTEST_MAIN(TestTokenizer)
#include "test_tokenizer.moc"
