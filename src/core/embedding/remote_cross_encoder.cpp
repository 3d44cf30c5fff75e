#include "core/embedding/remote_cross_encoder.h"
#include "core/embedding/http_client.h"
#include "core/embedding/remote_embedding_provider.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QUrl>

namespace sx {

RemoteCrossEncoder::RemoteCrossEncoder(QString endpoint, QString model, QString apiKey,
                                       RetryPolicy retry, int timeoutMs)
    : m_endpoint(std::move(endpoint))
    , m_model(std::move(model))
    , m_apiKey(std::move(apiKey))
    , m_retry(retry)
    , m_timeoutMs(timeoutMs)
{
    while (m_endpoint.endsWith(QLatin1Char('/'))) {
        m_endpoint.chop(1);
    }
    if (!m_endpoint.endsWith(QStringLiteral("/rerank"))) {
        m_endpoint += QStringLiteral("/rerank");
    }
}

bool RemoteCrossEncoder::isAvailable() const
{
    return QUrl(m_endpoint).isValid();
}

ScoreResult RemoteCrossEncoder::score(const QString& query,
                                      const std::vector<QString>& passages,
                                      const CallContext& context)
{
    ScoreResult result;
    if (passages.empty()) {
        return result;
    }

    QJsonArray documents;
    for (const QString& passage : passages) {
        documents.append(passage);
    }
    QJsonObject body;
    if (!m_model.isEmpty()) {
        body[QStringLiteral("model")] = m_model;
    }
    body[QStringLiteral("query")] = query;
    body[QStringLiteral("documents")] = documents;
    const QJsonDocument document(body);

    HttpHeaders headers;
    if (!m_apiKey.isEmpty()) {
        headers.append({QByteArrayLiteral("Authorization"),
                        QByteArrayLiteral("Bearer ") + m_apiKey.toUtf8()});
    }

    const QUrl url(m_endpoint);
    RemoteCallOutcome outcome = sendWithRetry(
        [&]() { return postJson(url, document, headers, context, m_timeoutMs); },
        m_retry, context, QStringLiteral("rerank"));
    if (outcome.status != ProviderStatus::Ok) {
        result.status = outcome.status;
        result.message = outcome.message;
        return result;
    }

    const QJsonArray results = QJsonDocument::fromJson(outcome.response.body)
                                   .object()
                                   .value(QStringLiteral("results"))
                                   .toArray();

    std::vector<float> scores(passages.size(), 0.0f);
    std::vector<bool> seen(passages.size(), false);
    for (const QJsonValue& item : results) {
        const QJsonObject object = item.toObject();
        const int index = object.value(QStringLiteral("index")).toInt(-1);
        const QJsonValue score = object.value(QStringLiteral("relevance_score"));
        if (index < 0 || index >= static_cast<int>(passages.size()) || !score.isDouble()) {
            continue;
        }
        scores[static_cast<size_t>(index)] = static_cast<float>(score.toDouble());
        seen[static_cast<size_t>(index)] = true;
    }

    for (bool present : seen) {
        if (!present) {
            result.status = ProviderStatus::InvalidResponse;
            result.message = QStringLiteral("rerank: response does not score every passage");
            LOG_WARN(sxEmbed, "%s", qUtf8Printable(result.message));
            return result;
        }
    }

    result.scores = std::move(scores);
    return result;
}

} // namespace sx
