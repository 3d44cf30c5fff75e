#pragma once

#include "core/shared/cancellation.h"
#include "core/shared/types.h"

#include <QString>

#include <vector>

namespace sx {

enum class ProviderStatus {
    Ok,
    ProviderUnavailable,  // remote backend unreachable after every retry
    ModelFailure,         // local model error, not retried
    Cancelled,            // token cancelled or deadline passed
    InvalidResponse,      // backend answered with something unusable
};

QString providerStatusToString(ProviderStatus status);
ErrorCode toErrorCode(ProviderStatus status);

// Either every vector, in input order, or none.
struct EmbeddingResult {
    ProviderStatus status = ProviderStatus::Ok;
    QString message;
    std::vector<std::vector<float>> vectors;

    bool ok() const { return status == ProviderStatus::Ok; }
};

struct ScoreResult {
    ProviderStatus status = ProviderStatus::Ok;
    QString message;
    std::vector<float> scores;

    bool ok() const { return status == ProviderStatus::Ok; }
};

// Scores (query, passage) pairs; higher means more relevant.
class CrossEncoder {
public:
    virtual ~CrossEncoder() = default;

    virtual bool isAvailable() const = 0;
    virtual ScoreResult score(const QString& query, const std::vector<QString>& passages,
                              const CallContext& context) = 0;
};

// A bi-encoder plus the cross-encoder used for reranking its candidates.
// Implementations are safe to call from several threads at once.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual QString modelId() const = 0;
    // Output dimension, or 0 while it is not known yet (remote backends
    // without a configured dimension learn it from the first response).
    virtual int dimensions() const = 0;
    virtual bool isAvailable() const = 0;

    virtual EmbeddingResult embedDocuments(const std::vector<QString>& texts,
                                           const CallContext& context) = 0;
    virtual EmbeddingResult embedQuery(const QString& text, const CallContext& context) = 0;

    virtual ScoreResult scorePairs(const QString& query, const std::vector<QString>& passages,
                                   const CallContext& context) = 0;
};

// Scales to unit L2 norm in place. A zero vector is left unchanged.
void l2Normalize(std::vector<float>& vector);

} // namespace sx
