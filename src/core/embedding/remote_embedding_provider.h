#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/embedding/http_client.h"
#include "core/embedding/retry_policy.h"

#include <QJsonDocument>
#include <QString>
#include <QUrl>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace sx {

struct RemoteProviderConfig {
    QString model;
    QString endpoint;
    QString apiKey;
    std::optional<int> dimensions;
    QString queryPrefix;
    RetryPolicy retry;
    int timeoutMs = 30000;
};

struct RemoteCallOutcome {
    ProviderStatus status = ProviderStatus::Ok;
    QString message;
    HttpResponse response;
};

// Sends the request built by `send` until it succeeds, fails permanently or
// the retry budget is spent. Transient failures exhausting the budget yield
// ProviderUnavailable; a cancelled context yields Cancelled.
RemoteCallOutcome sendWithRetry(const std::function<HttpResponse()>& send,
                                const RetryPolicy& policy, const CallContext& context,
                                const QString& label);

// Base for HTTP bi-encoders. Subclasses describe the wire format; retries,
// dimension checks and normalization live here.
class RemoteEmbeddingProvider : public EmbeddingProvider {
public:
    RemoteEmbeddingProvider(RemoteProviderConfig config,
                            std::unique_ptr<CrossEncoder> crossEncoder);
    ~RemoteEmbeddingProvider() override;

    QString modelId() const override;
    int dimensions() const override;
    bool isAvailable() const override;

    EmbeddingResult embedDocuments(const std::vector<QString>& texts,
                                   const CallContext& context) override;
    EmbeddingResult embedQuery(const QString& text, const CallContext& context) override;
    ScoreResult scorePairs(const QString& query, const std::vector<QString>& passages,
                           const CallContext& context) override;

    const RemoteProviderConfig& config() const { return m_config; }

protected:
    virtual QString backendName() const = 0;
    virtual QUrl requestUrl() const = 0;
    virtual HttpHeaders requestHeaders() const = 0;
    virtual QJsonDocument requestBody(const std::vector<QString>& texts, bool isQuery) const = 0;
    // One vector per input, in input order, or nullopt when the payload does
    // not have the expected shape.
    virtual std::optional<std::vector<std::vector<float>>>
    parseResponse(const QJsonDocument& document) const = 0;

    static std::optional<std::vector<float>> toVector(const QJsonValue& value);

private:
    EmbeddingResult embed(const std::vector<QString>& texts, bool isQuery,
                          const CallContext& context);

    RemoteProviderConfig m_config;
    std::unique_ptr<CrossEncoder> m_crossEncoder;
    std::atomic<int> m_dimensions{0};
};

// ── OpenAI-compatible ───────────────────────────────────────

// POST {endpoint}/embeddings  {"model", "input": [...], "dimensions"?}
class OpenAiEmbeddingProvider final : public RemoteEmbeddingProvider {
public:
    static constexpr const char* kDefaultEndpoint = "https://api.openai.com/v1";

    using RemoteEmbeddingProvider::RemoteEmbeddingProvider;

protected:
    QString backendName() const override { return QStringLiteral("openai"); }
    QUrl requestUrl() const override;
    HttpHeaders requestHeaders() const override;
    QJsonDocument requestBody(const std::vector<QString>& texts, bool isQuery) const override;
    std::optional<std::vector<std::vector<float>>>
    parseResponse(const QJsonDocument& document) const override;
};

// ── Gemini ──────────────────────────────────────────────────

// POST {endpoint}/models/{model}:batchEmbedContents with RETRIEVAL_DOCUMENT
// or RETRIEVAL_QUERY task types.
class GeminiEmbeddingProvider final : public RemoteEmbeddingProvider {
public:
    static constexpr const char* kDefaultEndpoint =
        "https://generativelanguage.googleapis.com/v1beta";

    using RemoteEmbeddingProvider::RemoteEmbeddingProvider;

protected:
    QString backendName() const override { return QStringLiteral("gemini"); }
    QUrl requestUrl() const override;
    HttpHeaders requestHeaders() const override;
    QJsonDocument requestBody(const std::vector<QString>& texts, bool isQuery) const override;
    std::optional<std::vector<std::vector<float>>>
    parseResponse(const QJsonDocument& document) const override;

private:
    QString qualifiedModel() const;
};

// ── Hugging Face inference ──────────────────────────────────

// POST {endpoint}  {"inputs": [...]}  ->  [[...], ...]
// Token-level output ([[[...]]]) is mean pooled.
class HuggingFaceEmbeddingProvider final : public RemoteEmbeddingProvider {
public:
    static constexpr const char* kDefaultEndpointBase =
        "https://api-inference.huggingface.co/pipeline/feature-extraction";

    using RemoteEmbeddingProvider::RemoteEmbeddingProvider;

protected:
    QString backendName() const override { return QStringLiteral("huggingface"); }
    QUrl requestUrl() const override;
    HttpHeaders requestHeaders() const override;
    QJsonDocument requestBody(const std::vector<QString>& texts, bool isQuery) const override;
    std::optional<std::vector<std::vector<float>>>
    parseResponse(const QJsonDocument& document) const override;
};

} // namespace sx
