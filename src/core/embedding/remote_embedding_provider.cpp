#include "core/embedding/remote_embedding_provider.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonObject>

#include <algorithm>

namespace sx {

namespace {

QString trimmedEndpoint(const QString& configured, const char* fallback)
{
    QString endpoint = configured.trimmed();
    if (endpoint.isEmpty()) {
        endpoint = QString::fromLatin1(fallback);
    }
    while (endpoint.endsWith(QLatin1Char('/'))) {
        endpoint.chop(1);
    }
    return endpoint;
}

QByteArray bearer(const QString& apiKey)
{
    return QByteArrayLiteral("Bearer ") + apiKey.toUtf8();
}

// Mean over the token axis of a [tokens][hidden] matrix.
std::optional<std::vector<float>> meanPool(const QJsonArray& tokens)
{
    if (tokens.isEmpty()) {
        return std::nullopt;
    }

    std::vector<double> sum;
    for (const QJsonValue& token : tokens) {
        const QJsonArray values = token.toArray();
        if (values.isEmpty()) {
            return std::nullopt;
        }
        if (sum.empty()) {
            sum.assign(static_cast<size_t>(values.size()), 0.0);
        } else if (sum.size() != static_cast<size_t>(values.size())) {
            return std::nullopt;
        }
        for (int i = 0; i < values.size(); ++i) {
            sum[static_cast<size_t>(i)] += values.at(i).toDouble();
        }
    }

    std::vector<float> pooled(sum.size());
    const double count = static_cast<double>(tokens.size());
    for (size_t i = 0; i < sum.size(); ++i) {
        pooled[i] = static_cast<float>(sum[i] / count);
    }
    return pooled;
}

} // anonymous namespace

// ── Retry loop ──────────────────────────────────────────────

RemoteCallOutcome sendWithRetry(const std::function<HttpResponse()>& send,
                                const RetryPolicy& policy, const CallContext& context,
                                const QString& label)
{
    RemoteCallOutcome outcome;
    const int maxAttempts = std::max(1, policy.maxAttempts);

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (context.shouldStop()) {
            outcome.status = ProviderStatus::Cancelled;
            outcome.message = context.token.isCancelled()
                ? QStringLiteral("%1: cancelled").arg(label)
                : QStringLiteral("%1: deadline exceeded").arg(label);
            return outcome;
        }

        outcome.response = send();
        if (outcome.response.ok()) {
            outcome.status = ProviderStatus::Ok;
            outcome.message.clear();
            return outcome;
        }

        if (outcome.response.error == HttpResponse::Error::Cancelled) {
            outcome.status = ProviderStatus::Cancelled;
            outcome.message = QStringLiteral("%1: cancelled").arg(label);
            return outcome;
        }
        if (outcome.response.error == HttpResponse::Error::Timeout && context.expired()) {
            outcome.status = ProviderStatus::Cancelled;
            outcome.message = QStringLiteral("%1: deadline exceeded").arg(label);
            return outcome;
        }

        outcome.status = ProviderStatus::ProviderUnavailable;
        outcome.message = QStringLiteral("%1: %2 (attempt %3/%4)")
                              .arg(label, outcome.response.errorString)
                              .arg(attempt)
                              .arg(maxAttempts);

        if (!outcome.response.isRetryable()) {
            LOG_WARN(sxEmbed, "%s, not retrying", qUtf8Printable(outcome.message));
            return outcome;
        }
        if (attempt == maxAttempts) {
            break;
        }

        const int delay = policy.delayForAttempt(attempt);
        LOG_INFO(sxEmbed, "%s, retrying in %dms", qUtf8Printable(outcome.message), delay);
        if (!waitForRetry(delay, context)) {
            outcome.status = ProviderStatus::Cancelled;
            outcome.message = QStringLiteral("%1: cancelled during backoff").arg(label);
            return outcome;
        }
    }

    LOG_WARN(sxEmbed, "%s, giving up", qUtf8Printable(outcome.message));
    return outcome;
}

// ── RemoteEmbeddingProvider ─────────────────────────────────

RemoteEmbeddingProvider::RemoteEmbeddingProvider(RemoteProviderConfig config,
                                                 std::unique_ptr<CrossEncoder> crossEncoder)
    : m_config(std::move(config))
    , m_crossEncoder(std::move(crossEncoder))
    , m_dimensions(m_config.dimensions.value_or(0))
{
}

RemoteEmbeddingProvider::~RemoteEmbeddingProvider() = default;

QString RemoteEmbeddingProvider::modelId() const
{
    return backendName() + QLatin1Char(':') + m_config.model;
}

int RemoteEmbeddingProvider::dimensions() const
{
    return m_dimensions.load();
}

bool RemoteEmbeddingProvider::isAvailable() const
{
    return !m_config.model.isEmpty() && requestUrl().isValid();
}

EmbeddingResult RemoteEmbeddingProvider::embedDocuments(const std::vector<QString>& texts,
                                                        const CallContext& context)
{
    return embed(texts, false, context);
}

EmbeddingResult RemoteEmbeddingProvider::embedQuery(const QString& text,
                                                    const CallContext& context)
{
    return embed({m_config.queryPrefix + text}, true, context);
}

ScoreResult RemoteEmbeddingProvider::scorePairs(const QString& query,
                                                const std::vector<QString>& passages,
                                                const CallContext& context)
{
    if (!m_crossEncoder) {
        ScoreResult result;
        result.status = ProviderStatus::ModelFailure;
        result.message = QStringLiteral("no cross-encoder configured");
        return result;
    }
    return m_crossEncoder->score(query, passages, context);
}

EmbeddingResult RemoteEmbeddingProvider::embed(const std::vector<QString>& texts, bool isQuery,
                                               const CallContext& context)
{
    EmbeddingResult result;
    if (texts.empty()) {
        return result;
    }

    const QUrl url = requestUrl();
    const HttpHeaders headers = requestHeaders();
    const QJsonDocument body = requestBody(texts, isQuery);
    const int timeoutMs = m_config.timeoutMs;

    RemoteCallOutcome outcome = sendWithRetry(
        [&]() { return postJson(url, body, headers, context, timeoutMs); },
        m_config.retry, context, backendName() + QStringLiteral(" embeddings"));
    if (outcome.status != ProviderStatus::Ok) {
        result.status = outcome.status;
        result.message = outcome.message;
        return result;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(outcome.response.body, &parseError);
    std::optional<std::vector<std::vector<float>>> vectors;
    if (parseError.error == QJsonParseError::NoError) {
        vectors = parseResponse(document);
    }

    auto invalid = [&result](const QString& message) {
        LOG_WARN(sxEmbed, "%s", qUtf8Printable(message));
        result.status = ProviderStatus::InvalidResponse;
        result.message = message;
        result.vectors.clear();
        return result;
    };

    if (!vectors) {
        return invalid(QStringLiteral("%1: unexpected response payload").arg(backendName()));
    }
    if (vectors->size() != texts.size()) {
        return invalid(QStringLiteral("%1: expected %2 vectors, got %3")
                           .arg(backendName())
                           .arg(texts.size())
                           .arg(vectors->size()));
    }

    const int width = static_cast<int>(vectors->front().size());
    for (const auto& vector : *vectors) {
        if (vector.empty() || static_cast<int>(vector.size()) != width) {
            return invalid(QStringLiteral("%1: inconsistent vector widths").arg(backendName()));
        }
    }

    int expected = 0;
    if (!m_dimensions.compare_exchange_strong(expected, width) && expected != width) {
        return invalid(QStringLiteral("%1: got %2-dim vectors, model has %3")
                           .arg(backendName())
                           .arg(width)
                           .arg(expected));
    }

    for (auto& vector : *vectors) {
        l2Normalize(vector);
    }
    result.vectors = std::move(*vectors);
    return result;
}

std::optional<std::vector<float>> RemoteEmbeddingProvider::toVector(const QJsonValue& value)
{
    if (!value.isArray()) {
        return std::nullopt;
    }
    const QJsonArray array = value.toArray();
    std::vector<float> vector;
    vector.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& element : array) {
        if (!element.isDouble()) {
            return std::nullopt;
        }
        vector.push_back(static_cast<float>(element.toDouble()));
    }
    return vector;
}

// ── OpenAiEmbeddingProvider ─────────────────────────────────

QUrl OpenAiEmbeddingProvider::requestUrl() const
{
    return QUrl(trimmedEndpoint(config().endpoint, kDefaultEndpoint)
                + QStringLiteral("/embeddings"));
}

HttpHeaders OpenAiEmbeddingProvider::requestHeaders() const
{
    HttpHeaders headers;
    if (!config().apiKey.isEmpty()) {
        headers.append({QByteArrayLiteral("Authorization"), bearer(config().apiKey)});
    }
    return headers;
}

QJsonDocument OpenAiEmbeddingProvider::requestBody(const std::vector<QString>& texts,
                                                   bool /*isQuery*/) const
{
    QJsonArray input;
    for (const QString& text : texts) {
        input.append(text);
    }

    QJsonObject body;
    body[QStringLiteral("model")] = config().model;
    body[QStringLiteral("input")] = input;
    if (config().dimensions) {
        body[QStringLiteral("dimensions")] = *config().dimensions;
    }
    return QJsonDocument(body);
}

std::optional<std::vector<std::vector<float>>>
OpenAiEmbeddingProvider::parseResponse(const QJsonDocument& document) const
{
    const QJsonArray data = document.object().value(QStringLiteral("data")).toArray();
    if (data.isEmpty()) {
        return std::nullopt;
    }

    // Items carry their input index; order is not guaranteed.
    std::vector<std::vector<float>> vectors(static_cast<size_t>(data.size()));
    std::vector<bool> seen(vectors.size(), false);
    for (const QJsonValue& item : data) {
        const QJsonObject object = item.toObject();
        const int index = object.value(QStringLiteral("index")).toInt(-1);
        if (index < 0 || index >= data.size() || seen[static_cast<size_t>(index)]) {
            return std::nullopt;
        }
        auto vector = toVector(object.value(QStringLiteral("embedding")));
        if (!vector) {
            return std::nullopt;
        }
        vectors[static_cast<size_t>(index)] = std::move(*vector);
        seen[static_cast<size_t>(index)] = true;
    }
    return vectors;
}

// ── GeminiEmbeddingProvider ─────────────────────────────────

QString GeminiEmbeddingProvider::qualifiedModel() const
{
    const QString model = config().model;
    return model.startsWith(QStringLiteral("models/")) ? model : QStringLiteral("models/") + model;
}

QUrl GeminiEmbeddingProvider::requestUrl() const
{
    return QUrl(trimmedEndpoint(config().endpoint, kDefaultEndpoint) + QLatin1Char('/')
                + qualifiedModel() + QStringLiteral(":batchEmbedContents"));
}

HttpHeaders GeminiEmbeddingProvider::requestHeaders() const
{
    HttpHeaders headers;
    if (!config().apiKey.isEmpty()) {
        headers.append({QByteArrayLiteral("x-goog-api-key"), config().apiKey.toUtf8()});
    }
    return headers;
}

QJsonDocument GeminiEmbeddingProvider::requestBody(const std::vector<QString>& texts,
                                                   bool isQuery) const
{
    const QString taskType = isQuery ? QStringLiteral("RETRIEVAL_QUERY")
                                     : QStringLiteral("RETRIEVAL_DOCUMENT");
    QJsonArray requests;
    for (const QString& text : texts) {
        QJsonObject part;
        part[QStringLiteral("text")] = text;
        QJsonObject content;
        content[QStringLiteral("parts")] = QJsonArray{part};

        QJsonObject request;
        request[QStringLiteral("model")] = qualifiedModel();
        request[QStringLiteral("content")] = content;
        request[QStringLiteral("taskType")] = taskType;
        if (config().dimensions) {
            request[QStringLiteral("outputDimensionality")] = *config().dimensions;
        }
        requests.append(request);
    }

    QJsonObject body;
    body[QStringLiteral("requests")] = requests;
    return QJsonDocument(body);
}

std::optional<std::vector<std::vector<float>>>
GeminiEmbeddingProvider::parseResponse(const QJsonDocument& document) const
{
    const QJsonArray embeddings = document.object().value(QStringLiteral("embeddings")).toArray();
    if (embeddings.isEmpty()) {
        return std::nullopt;
    }

    std::vector<std::vector<float>> vectors;
    vectors.reserve(static_cast<size_t>(embeddings.size()));
    for (const QJsonValue& embedding : embeddings) {
        auto vector = toVector(embedding.toObject().value(QStringLiteral("values")));
        if (!vector) {
            return std::nullopt;
        }
        vectors.push_back(std::move(*vector));
    }
    return vectors;
}

// ── HuggingFaceEmbeddingProvider ────────────────────────────

QUrl HuggingFaceEmbeddingProvider::requestUrl() const
{
    if (!config().endpoint.trimmed().isEmpty()) {
        return QUrl(config().endpoint.trimmed());
    }
    return QUrl(QString::fromLatin1(kDefaultEndpointBase) + QLatin1Char('/') + config().model);
}

HttpHeaders HuggingFaceEmbeddingProvider::requestHeaders() const
{
    HttpHeaders headers;
    if (!config().apiKey.isEmpty()) {
        headers.append({QByteArrayLiteral("Authorization"), bearer(config().apiKey)});
    }
    return headers;
}

QJsonDocument HuggingFaceEmbeddingProvider::requestBody(const std::vector<QString>& texts,
                                                        bool /*isQuery*/) const
{
    QJsonArray inputs;
    for (const QString& text : texts) {
        inputs.append(text);
    }
    QJsonObject body;
    body[QStringLiteral("inputs")] = inputs;
    return QJsonDocument(body);
}

std::optional<std::vector<std::vector<float>>>
HuggingFaceEmbeddingProvider::parseResponse(const QJsonDocument& document) const
{
    if (!document.isArray() || document.array().isEmpty()) {
        return std::nullopt;
    }

    std::vector<std::vector<float>> vectors;
    for (const QJsonValue& row : document.array()) {
        const QJsonArray values = row.toArray();
        if (values.isEmpty()) {
            return std::nullopt;
        }
        std::optional<std::vector<float>> vector = values.first().isArray()
            ? meanPool(values)
            : toVector(row);
        if (!vector) {
            return std::nullopt;
        }
        vectors.push_back(std::move(*vector));
    }
    return vectors;
}

} // namespace sx
