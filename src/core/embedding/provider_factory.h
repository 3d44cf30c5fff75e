#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/shared/settings.h"

#include <QString>
#include <QStringList>

#include <memory>

namespace sx {

// Builds the provider selected by EmbeddingSettings::apiType. The choice is
// made once; nothing downstream branches on the backend.
class ProviderFactory {
public:
    // nullptr with `error` set when the backend is unknown or its model
    // cannot be loaded. A missing cross-encoder is not an error: reranking
    // then degrades to cosine order.
    static std::unique_ptr<EmbeddingProvider> create(const EmbeddingSettings& settings,
                                                     QString* error = nullptr);

    static QStringList supportedApiTypes();
};

} // namespace sx
