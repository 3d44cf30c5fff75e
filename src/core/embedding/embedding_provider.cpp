#include "core/embedding/embedding_provider.h"

#include <cmath>

namespace sx {

QString providerStatusToString(ProviderStatus status)
{
    switch (status) {
    case ProviderStatus::Ok:                  return QStringLiteral("ok");
    case ProviderStatus::ProviderUnavailable: return QStringLiteral("provider_unavailable");
    case ProviderStatus::ModelFailure:        return QStringLiteral("model_failure");
    case ProviderStatus::Cancelled:           return QStringLiteral("cancelled");
    case ProviderStatus::InvalidResponse:     return QStringLiteral("invalid_response");
    }
    return QStringLiteral("unknown");
}

ErrorCode toErrorCode(ProviderStatus status)
{
    switch (status) {
    case ProviderStatus::Ok:                  return ErrorCode::None;
    case ProviderStatus::ProviderUnavailable: return ErrorCode::ProviderUnavailable;
    case ProviderStatus::ModelFailure:        return ErrorCode::ModelFailure;
    case ProviderStatus::Cancelled:           return ErrorCode::Cancelled;
    case ProviderStatus::InvalidResponse:     return ErrorCode::ProviderUnavailable;
    }
    return ErrorCode::ProviderUnavailable;
}

void l2Normalize(std::vector<float>& vector)
{
    double sumSquares = 0.0;
    for (const float value : vector) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return;
    }

    for (float& value : vector) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
}

} // namespace sx
