#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/embedding/retry_policy.h"

#include <QString>

namespace sx {

// Cross-encoder behind a rerank API:
//   POST {endpoint}/rerank {"model"?, "query", "documents": [...]}
//   -> {"results": [{"index", "relevance_score"}, ...]}
class RemoteCrossEncoder final : public CrossEncoder {
public:
    RemoteCrossEncoder(QString endpoint, QString model, QString apiKey,
                       RetryPolicy retry, int timeoutMs);

    bool isAvailable() const override;
    ScoreResult score(const QString& query, const std::vector<QString>& passages,
                      const CallContext& context) override;

private:
    QString m_endpoint;
    QString m_model;
    QString m_apiKey;
    RetryPolicy m_retry;
    int m_timeoutMs;
};

} // namespace sx
