#include <QtTest/QtTest>
#include "core/embedding/remote_cross_encoder.h"
#include "core/embedding/remote_embedding_provider.h"
#include "Support/canned_http_server.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTcpServer>

#include <cmath>
#include <memory>

namespace {

sx::RetryPolicy fastRetry(int maxAttempts)
{
    sx::RetryPolicy policy;
    policy.maxAttempts = maxAttempts;
    policy.baseDelayMs = 1;
    policy.maxDelayMs = 5;
    return policy;
}

sx::RemoteProviderConfig configFor(const sx::test::CannedHttpServer& server,
                                   const QString& path, const QString& model)
{
    sx::RemoteProviderConfig config;
    config.model = model;
    config.endpoint = server.baseUrl().toString() + path;
    config.apiKey = QStringLiteral("sk-test");
    config.retry = fastRetry(3);
    config.timeoutMs = 5000;
    return config;
}

QJsonObject bodyOf(const sx::test::CannedHttpServer::Request& request)
{
    return QJsonDocument::fromJson(request.body).object();
}

bool near(float actual, float expected)
{
    return std::fabs(actual - expected) < 1e-5f;
}

const QByteArray kOpenAiTwo = R"({"data": [
    {"index": 1, "embedding": [0.0, 2.0]},
    {"index": 0, "embedding": [3.0, 4.0]}
]})";

} // namespace

class TestRemoteEmbeddingProvider : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── OpenAI ───────────────────────────────────────────────────
    void testOpenAiRequestAndOrdering();
    void testOpenAiConfiguredDimensions();
    void testDimensionsLearnedFromFirstResponse();
    void testQueryPrefixApplied();

    // ── Gemini and Hugging Face ──────────────────────────────────
    void testGeminiRequestShape();
    void testHuggingFaceMeanPoolsTokens();

    // ── Retries ──────────────────────────────────────────────────
    void testRetriesTransientStatus();
    void testNoRetryOnClientError();
    void testRetriesExhausted();
    void testConnectionRefused();

    // ── Invalid payloads ─────────────────────────────────────────
    void testVectorCountMismatch();
    void testMalformedPayload();

    // ── Deadlines and cancellation ───────────────────────────────
    void testRequestTimeout();
    void testDeadlineReportsCancelled();
    void testCancelledBeforeSend();

    // ── Cross-encoder ────────────────────────────────────────────
    void testCrossEncoderScoresByIndex();
    void testCrossEncoderMissingScore();
    void testScorePairsWithoutCrossEncoder();

private:
    std::unique_ptr<sx::test::CannedHttpServer> m_server;
};

void TestRemoteEmbeddingProvider::init()
{
    m_server = std::make_unique<sx::test::CannedHttpServer>();
    QVERIFY(m_server->listen());
}

void TestRemoteEmbeddingProvider::cleanup()
{
    m_server.reset();
}

// ── OpenAI ───────────────────────────────────────────────────────

void TestRemoteEmbeddingProvider::testOpenAiRequestAndOrdering()
{
    sx::OpenAiEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/v1/"), QStringLiteral("text-embedding-3-small")),
        nullptr);
    QCOMPARE(provider.modelId(), QStringLiteral("openai:text-embedding-3-small"));
    QVERIFY(provider.isAvailable());

    m_server->enqueue(200, kOpenAiTwo);
    const sx::EmbeddingResult result = provider.embedDocuments(
        {QStringLiteral("first"), QStringLiteral("second")}, sx::CallContext());
    QVERIFY2(result.ok(), qPrintable(result.message));
    QCOMPARE(static_cast<int>(result.vectors.size()), 2);
    // Items come back out of order and are normalized.
    QVERIFY(near(result.vectors[0][0], 0.6f));
    QVERIFY(near(result.vectors[0][1], 0.8f));
    QVERIFY(near(result.vectors[1][1], 1.0f));

    QCOMPARE(static_cast<int>(m_server->requests().size()), 1);
    const auto& request = m_server->requests().front();
    QCOMPARE(request.method, QByteArray("POST"));
    QCOMPARE(request.path, QByteArray("/v1/embeddings"));
    QCOMPARE(request.headers.value("authorization"), QByteArray("Bearer sk-test"));

    const QJsonObject body = bodyOf(request);
    QCOMPARE(body.value(QStringLiteral("model")).toString(),
             QStringLiteral("text-embedding-3-small"));
    QCOMPARE(body.value(QStringLiteral("input")).toArray().size(), qsizetype(2));
    QCOMPARE(body.value(QStringLiteral("input")).toArray().at(1).toString(),
             QStringLiteral("second"));
    QVERIFY(!body.contains(QStringLiteral("dimensions")));
}

void TestRemoteEmbeddingProvider::testOpenAiConfiguredDimensions()
{
    sx::RemoteProviderConfig config =
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("text-embedding-3-large"));
    config.dimensions = 3;
    sx::OpenAiEmbeddingProvider provider(config, nullptr);
    QCOMPARE(provider.dimensions(), 3);

    // The backend ignored the requested width.
    m_server->enqueue(200, kOpenAiTwo);
    const sx::EmbeddingResult result = provider.embedDocuments(
        {QStringLiteral("a"), QStringLiteral("b")}, sx::CallContext());
    QCOMPARE(result.status, sx::ProviderStatus::InvalidResponse);
    QVERIFY(result.vectors.empty());
    QCOMPARE(bodyOf(m_server->requests().front()).value(QStringLiteral("dimensions")).toInt(), 3);
}

void TestRemoteEmbeddingProvider::testDimensionsLearnedFromFirstResponse()
{
    sx::OpenAiEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("m")), nullptr);
    QCOMPARE(provider.dimensions(), 0);

    m_server->enqueue(200, kOpenAiTwo);
    QVERIFY(provider.embedDocuments({QStringLiteral("a"), QStringLiteral("b")},
                                    sx::CallContext()).ok());
    QCOMPARE(provider.dimensions(), 2);

    m_server->enqueue(200, R"({"data": [{"index": 0, "embedding": [1.0, 0.0, 0.0]}]})");
    const sx::EmbeddingResult wider = provider.embedQuery(QStringLiteral("q"), sx::CallContext());
    QCOMPARE(wider.status, sx::ProviderStatus::InvalidResponse);
    QCOMPARE(provider.dimensions(), 2);
}

void TestRemoteEmbeddingProvider::testQueryPrefixApplied()
{
    sx::RemoteProviderConfig config =
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("m"));
    config.queryPrefix = QStringLiteral("query: ");
    sx::OpenAiEmbeddingProvider provider(config, nullptr);

    m_server->enqueue(200, R"({"data": [{"index": 0, "embedding": [1.0, 1.0]}]})");
    m_server->enqueue(200, R"({"data": [{"index": 0, "embedding": [1.0, 1.0]}]})");
    QVERIFY(provider.embedQuery(QStringLiteral("tax forms"), sx::CallContext()).ok());
    QVERIFY(provider.embedDocuments({QStringLiteral("tax forms")}, sx::CallContext()).ok());

    const auto& requests = m_server->requests();
    QCOMPARE(bodyOf(requests[0]).value(QStringLiteral("input")).toArray().at(0).toString(),
             QStringLiteral("query: tax forms"));
    QCOMPARE(bodyOf(requests[1]).value(QStringLiteral("input")).toArray().at(0).toString(),
             QStringLiteral("tax forms"));
}

// ── Gemini and Hugging Face ──────────────────────────────────────

void TestRemoteEmbeddingProvider::testGeminiRequestShape()
{
    sx::GeminiEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/v1beta"), QStringLiteral("text-embedding-004")),
        nullptr);
    QCOMPARE(provider.modelId(), QStringLiteral("gemini:text-embedding-004"));

    m_server->enqueue(200, R"({"embeddings": [{"values": [1.0, 0.0]}, {"values": [0.0, 5.0]}]})");
    m_server->enqueue(200, R"({"embeddings": [{"values": [2.0, 0.0]}]})");

    const sx::EmbeddingResult documents = provider.embedDocuments(
        {QStringLiteral("a"), QStringLiteral("b")}, sx::CallContext());
    QVERIFY2(documents.ok(), qPrintable(documents.message));
    QVERIFY(near(documents.vectors[1][1], 1.0f));
    QVERIFY(provider.embedQuery(QStringLiteral("q"), sx::CallContext()).ok());

    const auto& requests = m_server->requests();
    QCOMPARE(requests[0].path,
             QByteArray("/v1beta/models/text-embedding-004:batchEmbedContents"));
    QCOMPARE(requests[0].headers.value("x-goog-api-key"), QByteArray("sk-test"));

    const QJsonArray batch = bodyOf(requests[0]).value(QStringLiteral("requests")).toArray();
    QCOMPARE(batch.size(), qsizetype(2));
    const QJsonObject first = batch.at(0).toObject();
    QCOMPARE(first.value(QStringLiteral("model")).toString(),
             QStringLiteral("models/text-embedding-004"));
    QCOMPARE(first.value(QStringLiteral("taskType")).toString(),
             QStringLiteral("RETRIEVAL_DOCUMENT"));
    QCOMPARE(first.value(QStringLiteral("content")).toObject()
                 .value(QStringLiteral("parts")).toArray().at(0).toObject()
                 .value(QStringLiteral("text")).toString(),
             QStringLiteral("a"));

    const QJsonObject query =
        bodyOf(requests[1]).value(QStringLiteral("requests")).toArray().at(0).toObject();
    QCOMPARE(query.value(QStringLiteral("taskType")).toString(),
             QStringLiteral("RETRIEVAL_QUERY"));
}

void TestRemoteEmbeddingProvider::testHuggingFaceMeanPoolsTokens()
{
    sx::HuggingFaceEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/models/minilm"), QStringLiteral("minilm")),
        nullptr);

    // Sentence-level rows, then token-level rows.
    m_server->enqueue(200, R"([[3.0, 4.0], [1.0, 0.0]])");
    m_server->enqueue(200, R"([[[1.0, 0.0], [0.0, 1.0]]])");

    const sx::EmbeddingResult sentences = provider.embedDocuments(
        {QStringLiteral("a"), QStringLiteral("b")}, sx::CallContext());
    QVERIFY2(sentences.ok(), qPrintable(sentences.message));
    QVERIFY(near(sentences.vectors[0][1], 0.8f));

    const sx::EmbeddingResult tokens = provider.embedQuery(QStringLiteral("q"),
                                                           sx::CallContext());
    QVERIFY2(tokens.ok(), qPrintable(tokens.message));
    const float half = static_cast<float>(1.0 / std::sqrt(2.0));
    QVERIFY(near(tokens.vectors[0][0], half));
    QVERIFY(near(tokens.vectors[0][1], half));

    QCOMPARE(m_server->requests()[0].path, QByteArray("/models/minilm"));
    QCOMPARE(bodyOf(m_server->requests()[0]).value(QStringLiteral("inputs")).toArray().size(),
             qsizetype(2));
}

// ── Retries ──────────────────────────────────────────────────────

void TestRemoteEmbeddingProvider::testRetriesTransientStatus()
{
    sx::OpenAiEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("m")), nullptr);
    m_server->enqueue(503, R"({"error": "overloaded"})");
    m_server->enqueue(429, R"({"error": "slow down"})");
    m_server->enqueue(200, R"({"data": [{"index": 0, "embedding": [1.0, 0.0]}]})");

    const sx::EmbeddingResult result = provider.embedDocuments({QStringLiteral("a")},
                                                               sx::CallContext());
    QVERIFY2(result.ok(), qPrintable(result.message));
    QCOMPARE(static_cast<int>(m_server->requests().size()), 3);
}

void TestRemoteEmbeddingProvider::testNoRetryOnClientError()
{
    sx::OpenAiEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("m")), nullptr);
    m_server->enqueue(400, R"({"error": "bad input"})");
    m_server->enqueue(200, R"({"data": [{"index": 0, "embedding": [1.0, 0.0]}]})");

    const sx::EmbeddingResult result = provider.embedDocuments({QStringLiteral("a")},
                                                               sx::CallContext());
    QCOMPARE(result.status, sx::ProviderStatus::ProviderUnavailable);
    QCOMPARE(static_cast<int>(m_server->requests().size()), 1);
    QCOMPARE(m_server->pendingResponses(), 1);
}

void TestRemoteEmbeddingProvider::testRetriesExhausted()
{
    sx::OpenAiEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("m")), nullptr);
    for (int i = 0; i < 3; ++i) {
        m_server->enqueue(500, R"({"error": "boom"})");
    }

    const sx::EmbeddingResult result = provider.embedDocuments({QStringLiteral("a")},
                                                               sx::CallContext());
    QCOMPARE(result.status, sx::ProviderStatus::ProviderUnavailable);
    QVERIFY2(result.message.contains(QLatin1String("attempt 3/3")), qPrintable(result.message));
    QCOMPARE(static_cast<int>(m_server->requests().size()), 3);
}

void TestRemoteEmbeddingProvider::testConnectionRefused()
{
    // Grab a free port, then close it again.
    QTcpServer probe;
    QVERIFY(probe.listen(QHostAddress::LocalHost, 0));
    const quint16 port = probe.serverPort();
    probe.close();

    sx::RemoteProviderConfig config;
    config.model = QStringLiteral("m");
    config.endpoint = QStringLiteral("http://127.0.0.1:%1/v1").arg(port);
    config.retry = fastRetry(2);
    config.timeoutMs = 2000;
    sx::OpenAiEmbeddingProvider provider(config, nullptr);

    const sx::EmbeddingResult result = provider.embedDocuments({QStringLiteral("a")},
                                                               sx::CallContext());
    QCOMPARE(result.status, sx::ProviderStatus::ProviderUnavailable);
    QVERIFY(result.message.contains(QLatin1String("attempt 2/2")));
}

// ── Invalid payloads ─────────────────────────────────────────────

void TestRemoteEmbeddingProvider::testVectorCountMismatch()
{
    sx::OpenAiEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("m")), nullptr);
    m_server->enqueue(200, R"({"data": [{"index": 0, "embedding": [1.0, 0.0]}]})");

    const sx::EmbeddingResult result = provider.embedDocuments(
        {QStringLiteral("a"), QStringLiteral("b")}, sx::CallContext());
    QCOMPARE(result.status, sx::ProviderStatus::InvalidResponse);
    QVERIFY(result.vectors.empty());
    // Invalid payloads are not retried.
    QCOMPARE(static_cast<int>(m_server->requests().size()), 1);
}

void TestRemoteEmbeddingProvider::testMalformedPayload()
{
    sx::OpenAiEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("m")), nullptr);
    m_server->enqueue(200, "not json");
    m_server->enqueue(200, R"({"data": [{"index": 0, "embedding": ["x", 1.0]}]})");
    m_server->enqueue(200, R"({"data": [{"index": 0, "embedding": [1.0]},
                                        {"index": 0, "embedding": [1.0]}]})");

    for (int i = 0; i < 3; ++i) {
        const sx::EmbeddingResult result = provider.embedDocuments(
            {QStringLiteral("a"), QStringLiteral("b")}, sx::CallContext());
        QCOMPARE(result.status, sx::ProviderStatus::InvalidResponse);
    }
    QCOMPARE(provider.dimensions(), 0);
}

// ── Deadlines and cancellation ───────────────────────────────────

void TestRemoteEmbeddingProvider::testRequestTimeout()
{
    sx::RemoteProviderConfig config =
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("m"));
    config.retry = fastRetry(1);
    config.timeoutMs = 150;
    sx::OpenAiEmbeddingProvider provider(config, nullptr);
    m_server->enqueueHang();

    QElapsedTimer timer;
    timer.start();
    const sx::EmbeddingResult result = provider.embedDocuments({QStringLiteral("a")},
                                                               sx::CallContext());
    QCOMPARE(result.status, sx::ProviderStatus::ProviderUnavailable);
    QVERIFY(timer.elapsed() < 3000);
}

void TestRemoteEmbeddingProvider::testDeadlineReportsCancelled()
{
    sx::OpenAiEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("m")), nullptr);
    m_server->enqueueHang();

    const sx::EmbeddingResult result = provider.embedDocuments(
        {QStringLiteral("a")}, sx::CallContext::withTimeout(150));
    QCOMPARE(result.status, sx::ProviderStatus::Cancelled);
    QVERIFY(result.message.contains(QLatin1String("deadline")));
    QCOMPARE(static_cast<int>(m_server->requests().size()), 1);
}

void TestRemoteEmbeddingProvider::testCancelledBeforeSend()
{
    sx::OpenAiEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("m")), nullptr);
    sx::CallContext context;
    context.token.cancel();

    const sx::EmbeddingResult result = provider.embedDocuments({QStringLiteral("a")}, context);
    QCOMPARE(result.status, sx::ProviderStatus::Cancelled);
    QVERIFY(m_server->requests().empty());
}

// ── Cross-encoder ────────────────────────────────────────────────

void TestRemoteEmbeddingProvider::testCrossEncoderScoresByIndex()
{
    auto crossEncoder = std::make_unique<sx::RemoteCrossEncoder>(
        m_server->baseUrl().toString() + QStringLiteral("/v1/"), QStringLiteral("rerank-lite"),
        QStringLiteral("sk-test"), fastRetry(2), 5000);
    QVERIFY(crossEncoder->isAvailable());
    sx::OpenAiEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("m")),
        std::move(crossEncoder));

    m_server->enqueue(503, R"({"error": "warming up"})");
    m_server->enqueue(200, R"({"results": [
        {"index": 1, "relevance_score": 0.9},
        {"index": 0, "relevance_score": 0.2}
    ]})");

    const sx::ScoreResult result = provider.scorePairs(
        QStringLiteral("taxes"), {QStringLiteral("recipes"), QStringLiteral("tax forms")},
        sx::CallContext());
    QVERIFY2(result.ok(), qPrintable(result.message));
    QCOMPARE(static_cast<int>(result.scores.size()), 2);
    QVERIFY(near(result.scores[0], 0.2f));
    QVERIFY(near(result.scores[1], 0.9f));

    const auto& request = m_server->requests().back();
    QCOMPARE(request.path, QByteArray("/v1/rerank"));
    const QJsonObject body = bodyOf(request);
    QCOMPARE(body.value(QStringLiteral("model")).toString(), QStringLiteral("rerank-lite"));
    QCOMPARE(body.value(QStringLiteral("query")).toString(), QStringLiteral("taxes"));
    QCOMPARE(body.value(QStringLiteral("documents")).toArray().size(), qsizetype(2));
}

void TestRemoteEmbeddingProvider::testCrossEncoderMissingScore()
{
    sx::RemoteCrossEncoder crossEncoder(m_server->baseUrl().toString() + QStringLiteral("/rerank"),
                                        QString(), QString(), fastRetry(1), 5000);
    m_server->enqueue(200, R"({"results": [{"index": 0, "relevance_score": 0.5}]})");

    const sx::ScoreResult result = crossEncoder.score(
        QStringLiteral("q"), {QStringLiteral("a"), QStringLiteral("b")}, sx::CallContext());
    QCOMPARE(result.status, sx::ProviderStatus::InvalidResponse);
    QVERIFY(result.scores.empty());

    const auto& request = m_server->requests().front();
    QCOMPARE(request.path, QByteArray("/rerank"));
    QVERIFY(!request.headers.contains("authorization"));
    QVERIFY(!bodyOf(request).contains(QStringLiteral("model")));
}

void TestRemoteEmbeddingProvider::testScorePairsWithoutCrossEncoder()
{
    sx::OpenAiEmbeddingProvider provider(
        configFor(*m_server, QStringLiteral("/v1"), QStringLiteral("m")), nullptr);
    const sx::ScoreResult result = provider.scorePairs(QStringLiteral("q"),
                                                       {QStringLiteral("a")}, sx::CallContext());
    QCOMPARE(result.status, sx::ProviderStatus::ModelFailure);
    QVERIFY(m_server->requests().empty());
}

QTEST_MAIN(TestRemoteEmbeddingProvider)
#include "test_remote_embedding_provider.moc"
