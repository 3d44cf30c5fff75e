#include <QtTest/QtTest>
#include "core/shared/settings_manager.h"

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaultsFromEmptyJson();
    void testSaveAndLoad();
    void testLoadMissingFile();
    void testLoadMalformedFile();
    void testNumericStringsAccepted();
    void testInvalidValuesKeepDefaults();
    void testUnknownApiTypeFallsBack();
    void testOverlapMustStayBelowMaxTokens();
    void testSettingsPathOverride();
    void testRequiresReindex();
};

void TestSettingsManager::testDefaultsFromEmptyJson()
{
    const sx::Settings settings = sx::SettingsManager::fromJson(QJsonObject());
    QCOMPARE(settings.embedding.apiType, QStringLiteral("local"));
    QCOMPARE(settings.embedding.model, QStringLiteral("bge-small-en-v1.5"));
    QVERIFY(!settings.embedding.dimensions.has_value());
    QCOMPARE(settings.chunker.maxTokens, 256);
    QCOMPARE(settings.chunker.overlapTokens, 32);
    QCOMPARE(settings.indexer.writeBatchChunks, 128);
    QCOMPARE(settings.search.oversampleFactor, 3);
    QCOMPARE(settings.search.minCandidateFloor, 50);
}

void TestSettingsManager::testSaveAndLoad()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/settings.json"));

    sx::Settings settings;
    settings.dbPath = dir.filePath(QStringLiteral("index.db"));
    settings.embedding.apiType = QStringLiteral("openai");
    settings.embedding.model = QStringLiteral("text-embedding-3-small");
    settings.embedding.dimensions = 512;
    settings.embedding.endpoint = QStringLiteral("http://127.0.0.1:9000");
    settings.embedding.apiKey = QStringLiteral("sk-test");
    settings.embedding.maxAttempts = 2;
    settings.chunker.maxTokens = 128;
    settings.chunker.overlapTokens = 16;
    settings.indexer.writeBatchChunks = 64;
    settings.search.rerankTimeoutMs = 750;
    settings.search.dedupOverlapRatio = 0.8;
    QVERIFY(sx::SettingsManager::save(settings, path));

    // The file may hold an API key, so only the owner can read it.
    const QFile::Permissions permissions = QFile::permissions(path);
    QVERIFY(permissions.testFlag(QFile::ReadOwner));
    QVERIFY(!permissions.testFlag(QFile::ReadOther));

    const std::optional<sx::Settings> loaded = sx::SettingsManager::load(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->dbPath, settings.dbPath);
    QCOMPARE(loaded->embedding.apiType, QStringLiteral("openai"));
    QCOMPARE(loaded->embedding.model, QStringLiteral("text-embedding-3-small"));
    QCOMPARE(loaded->embedding.dimensions.value_or(0), 512);
    QCOMPARE(loaded->embedding.endpoint, settings.embedding.endpoint);
    QCOMPARE(loaded->embedding.apiKey, QStringLiteral("sk-test"));
    QCOMPARE(loaded->embedding.maxAttempts, 2);
    QCOMPARE(loaded->chunker.maxTokens, 128);
    QCOMPARE(loaded->chunker.overlapTokens, 16);
    QCOMPARE(loaded->indexer.writeBatchChunks, 64);
    QCOMPARE(loaded->search.rerankTimeoutMs, 750);
    QCOMPARE(loaded->search.dedupOverlapRatio, 0.8);
}

void TestSettingsManager::testLoadMissingFile()
{
    QTemporaryDir dir;
    QVERIFY(!sx::SettingsManager::load(dir.filePath(QStringLiteral("absent.json"))).has_value());
}

void TestSettingsManager::testLoadMalformedFile()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("settings.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ \"embedding\": ");
    file.close();

    QVERIFY(!sx::SettingsManager::load(path).has_value());
}

void TestSettingsManager::testNumericStringsAccepted()
{
    const QJsonObject json = QJsonDocument::fromJson(R"({
        "embedding": { "dimensions": "768", "batch_size": " 16 " },
        "search": { "min_candidate_floor": 20 }
    })").object();
    const sx::Settings settings = sx::SettingsManager::fromJson(json);
    QCOMPARE(settings.embedding.dimensions.value_or(0), 768);
    QCOMPARE(settings.embedding.batchSize, 16);
    QCOMPARE(settings.search.minCandidateFloor, 20);
}

void TestSettingsManager::testInvalidValuesKeepDefaults()
{
    const QJsonObject json = QJsonDocument::fromJson(R"({
        "embedding": { "dimensions": -3, "batch_size": 2.5, "timeout_ms": "soon" },
        "indexer": { "write_batch_chunks": 0 },
        "search": { "dedup_overlap_ratio": 1.5, "oversample_factor": 0 }
    })").object();
    const sx::Settings settings = sx::SettingsManager::fromJson(json);
    QVERIFY(!settings.embedding.dimensions.has_value());
    QCOMPARE(settings.embedding.batchSize, 32);
    QCOMPARE(settings.embedding.timeoutMs, 30000);
    QCOMPARE(settings.indexer.writeBatchChunks, 128);
    QCOMPARE(settings.search.dedupOverlapRatio, 0.5);
    QCOMPARE(settings.search.oversampleFactor, 3);
}

void TestSettingsManager::testUnknownApiTypeFallsBack()
{
    QJsonObject embedding;
    embedding.insert(QStringLiteral("api_type"), QStringLiteral("  Gemini "));
    QJsonObject json;
    json.insert(QStringLiteral("embedding"), embedding);
    QCOMPARE(sx::SettingsManager::fromJson(json).embedding.apiType, QStringLiteral("gemini"));

    embedding.insert(QStringLiteral("api_type"), QStringLiteral("carrier-pigeon"));
    json.insert(QStringLiteral("embedding"), embedding);
    QCOMPARE(sx::SettingsManager::fromJson(json).embedding.apiType, QStringLiteral("local"));
}

void TestSettingsManager::testOverlapMustStayBelowMaxTokens()
{
    const QJsonObject json = QJsonDocument::fromJson(R"({
        "chunker": { "max_tokens": 64, "overlap_tokens": 64 }
    })").object();
    const sx::Settings settings = sx::SettingsManager::fromJson(json);
    QCOMPARE(settings.chunker.maxTokens, 64);
    QCOMPARE(settings.chunker.overlapTokens, 32);
}

void TestSettingsManager::testSettingsPathOverride()
{
    qputenv("SEXTANT_SETTINGS", QByteArrayLiteral("/tmp/sextant//custom/settings.json"));
    QCOMPARE(sx::SettingsManager::settingsFilePath(),
             QStringLiteral("/tmp/sextant/custom/settings.json"));
    qunsetenv("SEXTANT_SETTINGS");
    QVERIFY(sx::SettingsManager::settingsFilePath().endsWith(
        QLatin1String("/sextant/settings.json")));
}

void TestSettingsManager::testRequiresReindex()
{
    sx::EmbeddingSettings before;
    sx::EmbeddingSettings after = before;
    after.batchSize = 8;
    after.apiKey = QStringLiteral("rotated");
    after.crossEncoder = QStringLiteral("other-reranker");
    QVERIFY(!sx::SettingsManager::requiresReindex(before, after));

    after.model = QStringLiteral("bge-base-en-v1.5");
    QVERIFY(sx::SettingsManager::requiresReindex(before, after));

    after = before;
    after.dimensions = 256;
    QVERIFY(sx::SettingsManager::requiresReindex(before, after));
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
