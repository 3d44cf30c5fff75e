#include <QtTest/QtTest>
#include <QElapsedTimer>
#include <QTemporaryDir>
#include <QThread>

#include "core/engine/engine.h"
#include "core/embedding/embedding_provider.h"
#include "core/shared/types.h"
#include "Support/fake_embedding_provider.h"

#include <atomic>
#include <memory>
#include <thread>

namespace {

sx::ContentUnit unit(const QString& path, const QString& text,
                     sx::SourceType type = sx::SourceType::Markdown)
{
    sx::ContentUnit u;
    u.filePath = path;
    u.rawText = text;
    u.metadata.sourceType = type;
    return u;
}

std::vector<sx::ContentUnit> notesSnapshot()
{
    return {
        unit(QStringLiteral("/notes/taxes.md"),
             QStringLiteral("# Taxes\n\nFile the quarterly tax return before 2024-04-15.\n\n"
                            "Receipts for the home office are in the blue folder.")),
        unit(QStringLiteral("/notes/garden.org"),
             QStringLiteral("* Garden\nPlant tomatoes and basil after the last frost."),
             sx::SourceType::Org),
        unit(QStringLiteral("/notes/reading.md"),
             QStringLiteral("Reading list: distributed systems, consensus protocols, "
                            "byzantine fault tolerance.")),
    };
}

} // namespace

class TestEngine : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testIndexSearchLifecycle();
    void testPersistenceAcrossReopen();
    void testModelSwitchNeedsRegenerate();
    void testContentManagement();
    void testSameCorpusRunsSerialized();
    void testSearchNotBlockedByIndexing();
    void testOpenFailures();

private:
    std::unique_ptr<sx::Engine> openEngine(sx::test::FakeEmbeddingProvider** provider = nullptr,
                                           const QString& modelId = QStringLiteral("fake:bow-64"));

    std::unique_ptr<QTemporaryDir> m_dir;
    sx::Settings m_settings;
};

void TestEngine::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_settings = sx::Settings();
    m_settings.dbPath = m_dir->filePath(QStringLiteral("data/index.db"));
    m_settings.embedding.maxParallelBatches = 2;
    m_settings.embedding.batchSize = 2;
    m_settings.chunker.maxTokens = 64;
    m_settings.chunker.overlapTokens = 8;
}

void TestEngine::cleanup()
{
    m_dir.reset();
}

std::unique_ptr<sx::Engine> TestEngine::openEngine(sx::test::FakeEmbeddingProvider** provider,
                                                   const QString& modelId)
{
    auto fake = std::make_unique<sx::test::FakeEmbeddingProvider>(64, modelId);
    if (provider) {
        *provider = fake.get();
    }
    QString error;
    std::unique_ptr<sx::Engine> engine = sx::Engine::open(m_settings, std::move(fake), &error);
    if (!engine) {
        qWarning("Engine::open failed: %s", qPrintable(error));
    }
    return engine;
}

void TestEngine::testIndexSearchLifecycle()
{
    sx::test::FakeEmbeddingProvider* provider = nullptr;
    auto engine = openEngine(&provider);
    QVERIFY(engine != nullptr);

    // ── Phase 1: Index a snapshot ────────────────────────────────
    const sx::IndexRunResult first = engine->index(QStringLiteral("notes"), notesSnapshot());
    QVERIFY2(first.ok(), qPrintable(first.message));
    QCOMPARE(first.filesIndexed, 3);
    QVERIFY(first.entriesInserted >= 3);
    QVERIFY(!engine->isIndexing(QStringLiteral("notes")));

    // ── Phase 2: Search it ───────────────────────────────────────
    sx::SearchResponse response = engine->search(QStringLiteral("quarterly tax return"),
                                                 {QStringLiteral("notes")});
    QVERIFY2(response.ok(), qPrintable(response.message));
    QVERIFY(!response.hits.empty());
    QCOMPARE(response.hits.front().entry.filePath, QStringLiteral("/notes/taxes.md"));
    QCOMPARE(response.hits.front().entry.heading, QStringLiteral("Taxes"));

    response = engine->search(QStringLiteral("tomatoes file:\"*.org\""), {QStringLiteral("notes")});
    QVERIFY(response.ok());
    QCOMPARE(response.appliedFilters, QStringList{QStringLiteral("file[+*.org]")});
    QCOMPARE(static_cast<int>(response.hits.size()), 1);
    QCOMPARE(response.hits.front().entry.sourceType, sx::SourceType::Org);

    response = engine->search(QStringLiteral("tax dt:\"April 2024\""), {QStringLiteral("notes")});
    QVERIFY(response.ok());
    QCOMPARE(static_cast<int>(response.hits.size()), 1);
    QCOMPARE(response.hits.front().entry.filePath, QStringLiteral("/notes/taxes.md"));

    // ── Phase 3: Edit one file, drop another ─────────────────────
    std::vector<sx::ContentUnit> edited = notesSnapshot();
    edited[2].rawText = QStringLiteral("Reading list: sourdough baking and fermentation.");
    edited.erase(edited.begin() + 1);
    const int embeddedBefore = provider->textsEmbedded();

    const sx::IndexRunResult second = engine->index(QStringLiteral("notes"), edited);
    QVERIFY2(second.ok(), qPrintable(second.message));
    QCOMPARE(second.filesUnchanged, 1);
    QCOMPARE(second.filesIndexed, 1);
    QCOMPARE(second.filesDeleted, 1);
    QCOMPARE(provider->textsEmbedded() - embeddedBefore, second.chunksEmbedded);

    response = engine->search(QStringLiteral("sourdough fermentation"), {QStringLiteral("notes")});
    QCOMPARE(response.hits.front().entry.filePath, QStringLiteral("/notes/reading.md"));
    QVERIFY(response.hits.front().entry.text.contains(QLatin1String("sourdough")));

    response = engine->search(QStringLiteral("tomatoes basil"), {QStringLiteral("notes")});
    for (const sx::SearchHit& hit : response.hits) {
        QVERIFY(hit.entry.filePath != QStringLiteral("/notes/garden.org"));
    }

    // ── Phase 4: Content listing ─────────────────────────────────
    const auto files = engine->listFiles(QStringLiteral("notes"));
    QVERIFY(files.has_value());
    QCOMPARE(static_cast<int>(files->size()), 2);
    const auto content = engine->fileContent(QStringLiteral("notes"),
                                             QStringLiteral("/notes/reading.md"));
    QVERIFY(content.has_value());
    QCOMPARE(*content, QStringLiteral("Reading list: sourdough baking and fermentation."));
    QVERIFY(!engine->fileContent(QStringLiteral("notes"),
                                 QStringLiteral("/notes/garden.org")).has_value());
}

void TestEngine::testPersistenceAcrossReopen()
{
    {
        auto engine = openEngine();
        QVERIFY(engine != nullptr);
        QVERIFY(engine->index(QStringLiteral("notes"), notesSnapshot()).ok());
    }

    sx::test::FakeEmbeddingProvider* provider = nullptr;
    auto reopened = openEngine(&provider);
    QVERIFY(reopened != nullptr);

    const auto corpora = reopened->corpora();
    QCOMPARE(static_cast<int>(corpora.size()), 1);
    QCOMPARE(corpora.front().corpusId, QStringLiteral("notes"));
    QCOMPARE(corpora.front().dimensions, 64);

    const sx::SearchResponse response = reopened->search(QStringLiteral("consensus protocols"),
                                                         {QStringLiteral("notes")});
    QVERIFY(response.ok());
    QCOMPARE(response.hits.front().entry.filePath, QStringLiteral("/notes/reading.md"));

    // Nothing changed on disk, so nothing is embedded again.
    const sx::IndexRunResult rerun = reopened->index(QStringLiteral("notes"), notesSnapshot());
    QVERIFY(rerun.ok());
    QCOMPARE(rerun.filesUnchanged, 3);
    QCOMPARE(provider->documentCalls(), 0);
}

void TestEngine::testModelSwitchNeedsRegenerate()
{
    {
        auto engine = openEngine();
        QVERIFY(engine != nullptr);
        QVERIFY(engine->index(QStringLiteral("notes"), notesSnapshot()).ok());
    }

    auto switched = openEngine(nullptr, QStringLiteral("fake:other-64"));
    QVERIFY(switched != nullptr);

    const sx::IndexRunResult refused = switched->index(QStringLiteral("notes"), notesSnapshot());
    QCOMPARE(refused.code, sx::ErrorCode::DimensionMismatch);

    const sx::IndexRunResult regenerated = switched->index(
        QStringLiteral("notes"), notesSnapshot(), sx::IndexMode::Regenerate);
    QVERIFY2(regenerated.ok(), qPrintable(regenerated.message));
    QCOMPARE(regenerated.filesIndexed, 3);
    QCOMPARE(switched->corpora().front().modelId, QStringLiteral("fake:other-64"));
}

void TestEngine::testContentManagement()
{
    auto engine = openEngine();
    QVERIFY(engine != nullptr);
    QVERIFY(engine->index(QStringLiteral("notes"), notesSnapshot()).ok());
    QVERIFY(engine->index(QStringLiteral("mail"),
                          {unit(QStringLiteral("/mail/1.eml"),
                                QStringLiteral("Dinner on Friday with the tax advisor"),
                                sx::SourceType::Email)}).ok());
    QCOMPARE(static_cast<int>(engine->corpora().size()), 2);

    const sx::StoreWriteResult removedOrg = engine->deleteSourceType(QStringLiteral("notes"),
                                                                     sx::SourceType::Org);
    QVERIFY(removedOrg.ok());
    QCOMPARE(removedOrg.deleted, 1);
    QCOMPARE(engine->stats(QStringLiteral("notes"))->fileCount, 2);

    const sx::StoreWriteResult removedFile = engine->deleteFile(
        QStringLiteral("notes"), QStringLiteral("/notes/reading.md"));
    QVERIFY(removedFile.ok());
    QCOMPARE(engine->stats(QStringLiteral("notes"))->fileCount, 1);

    // Searching both corpora still reaches the mail entry.
    const sx::SearchResponse both = engine->search(
        QStringLiteral("tax"), {QStringLiteral("notes"), QStringLiteral("mail")});
    QVERIFY(both.ok());
    QCOMPARE(static_cast<int>(both.hits.size()), 2);

    QVERIFY(engine->deleteCorpus(QStringLiteral("mail")).ok());
    QCOMPARE(static_cast<int>(engine->corpora().size()), 1);
    const sx::SearchResponse gone = engine->search(QStringLiteral("dinner"),
                                                   {QStringLiteral("mail")});
    QVERIFY(gone.ok());
    QVERIFY(gone.hits.empty());

    QVERIFY(sx::Engine::contentTypes().contains(QStringLiteral("markdown")));
}

void TestEngine::testSameCorpusRunsSerialized()
{
    sx::test::FakeEmbeddingProvider* provider = nullptr;
    auto engine = openEngine(&provider);
    QVERIFY(engine != nullptr);
    provider->setDelayMs(30);

    std::vector<sx::ContentUnit> first;
    std::vector<sx::ContentUnit> second;
    for (int i = 0; i < 6; ++i) {
        first.push_back(unit(QStringLiteral("/a/%1.md").arg(i),
                             QStringLiteral("first batch note %1").arg(i)));
        second.push_back(unit(QStringLiteral("/b/%1.md").arg(i),
                              QStringLiteral("second batch note %1").arg(i)));
    }

    sx::IndexRunResult firstResult;
    sx::IndexRunResult secondResult;
    std::atomic<bool> sawLock{false};
    std::thread a([&]() { firstResult = engine->index(QStringLiteral("notes"), first); });
    std::thread b([&]() { secondResult = engine->index(QStringLiteral("notes"), second); });
    for (int i = 0; i < 200 && !sawLock.load(); ++i) {
        sawLock = engine->isIndexing(QStringLiteral("notes"));
        QThread::msleep(2);
    }
    a.join();
    b.join();

    QVERIFY(sawLock.load());
    QVERIFY2(firstResult.ok(), qPrintable(firstResult.message));
    QVERIFY2(secondResult.ok(), qPrintable(secondResult.message));
    QVERIFY(!engine->isIndexing(QStringLiteral("notes")));

    // Sync runs: whichever ran last replaced the other's snapshot.
    const auto files = engine->listFiles(QStringLiteral("notes"));
    QCOMPARE(static_cast<int>(files->size()), 6);
    const QString prefix = files->front().filePath.left(3);
    for (const sx::FileState& state : *files) {
        QCOMPARE(state.filePath.left(3), prefix);
    }
    QVERIFY(firstResult.filesDeleted == 6 || secondResult.filesDeleted == 6);
}

void TestEngine::testSearchNotBlockedByIndexing()
{
    sx::test::FakeEmbeddingProvider* provider = nullptr;
    auto engine = openEngine(&provider);
    QVERIFY(engine != nullptr);
    QVERIFY(engine->index(QStringLiteral("notes"), notesSnapshot()).ok());

    std::vector<sx::ContentUnit> large;
    for (int i = 0; i < 20; ++i) {
        large.push_back(unit(QStringLiteral("/mail/%1.eml").arg(i),
                             QStringLiteral("message number %1 about invoices").arg(i),
                             sx::SourceType::Email));
    }

    provider->setDelayMs(50);
    sx::IndexRunResult indexed;
    std::thread indexer([&]() { indexed = engine->index(QStringLiteral("mail"), large); });
    QThread::msleep(20);

    QElapsedTimer timer;
    timer.start();
    const sx::SearchResponse response = engine->search(QStringLiteral("consensus protocols"),
                                                       {QStringLiteral("notes")}, true, 5,
                                                       false);
    const qint64 searchMs = timer.elapsed();
    indexer.join();

    QVERIFY2(response.ok(), qPrintable(response.message));
    QVERIFY(!response.hits.empty());
    QVERIFY2(indexed.ok(), qPrintable(indexed.message));
    QCOMPARE(indexed.filesIndexed, 20);
    // The query waits for one embed on the live lane, not for the index run.
    QVERIFY2(searchMs < 400, qPrintable(QString::number(searchMs)));
}

void TestEngine::testOpenFailures()
{
    QString error;
    QVERIFY(sx::Engine::open(m_settings, std::unique_ptr<sx::EmbeddingProvider>(), &error)
            == nullptr);
    QVERIFY(error.contains(QLatin1String("provider")));

    sx::Settings noPath = m_settings;
    noPath.dbPath.clear();
    error.clear();
    QVERIFY(sx::Engine::open(noPath, std::make_unique<sx::test::FakeEmbeddingProvider>(), &error)
            == nullptr);
    QVERIFY(error.contains(QLatin1String("database")));
}

QTEST_MAIN(TestEngine)
#include "test_engine.moc"
