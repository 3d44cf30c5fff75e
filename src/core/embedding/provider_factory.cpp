#include "core/embedding/provider_factory.h"
#include "core/embedding/onnx_embedding_provider.h"
#include "core/embedding/remote_cross_encoder.h"
#include "core/embedding/remote_embedding_provider.h"
#include "core/models/model_registry.h"
#include "core/shared/logging.h"

namespace sx {

namespace {

RetryPolicy retryPolicyFrom(const EmbeddingSettings& settings)
{
    RetryPolicy policy;
    policy.maxAttempts = settings.maxAttempts;
    policy.baseDelayMs = settings.baseDelayMs;
    policy.maxDelayMs = settings.maxDelayMs;
    return policy;
}

std::unique_ptr<CrossEncoder> createCrossEncoder(const EmbeddingSettings& settings,
                                                 std::shared_ptr<ModelRegistry>& registry)
{
    if (!settings.crossEncoderEndpoint.isEmpty()) {
        return std::make_unique<RemoteCrossEncoder>(settings.crossEncoderEndpoint,
                                                    settings.crossEncoder,
                                                    settings.apiKey,
                                                    retryPolicyFrom(settings),
                                                    settings.timeoutMs);
    }

    if (!registry) {
        registry = std::make_shared<ModelRegistry>(
            ModelRegistry::resolveModelsDir(settings.modelsDir));
    }
    if (!registry->hasModel("cross-encoder")) {
        LOG_INFO(sxEmbed, "ProviderFactory: no cross-encoder model, reranking disabled");
        return nullptr;
    }

    auto crossEncoder = std::make_unique<OnnxCrossEncoder>(registry);
    if (!crossEncoder->initialize()) {
        LOG_WARN(sxEmbed, "ProviderFactory: cross-encoder failed to load, reranking disabled");
        return nullptr;
    }
    return crossEncoder;
}

} // anonymous namespace

QStringList ProviderFactory::supportedApiTypes()
{
    return {
        QStringLiteral("local"),
        QStringLiteral("openai"),
        QStringLiteral("gemini"),
        QStringLiteral("huggingface"),
    };
}

std::unique_ptr<EmbeddingProvider> ProviderFactory::create(const EmbeddingSettings& settings,
                                                           QString* error)
{
    auto fail = [error](const QString& message) -> std::unique_ptr<EmbeddingProvider> {
        LOG_ERROR(sxEmbed, "ProviderFactory: %s", qUtf8Printable(message));
        if (error) {
            *error = message;
        }
        return nullptr;
    };

    const QString apiType = settings.apiType.trimmed().toLower();
    std::shared_ptr<ModelRegistry> registry;

    if (apiType == QLatin1String("local")) {
        registry = std::make_shared<ModelRegistry>(
            ModelRegistry::resolveModelsDir(settings.modelsDir));
        auto crossEncoder = createCrossEncoder(settings, registry);
        auto provider = std::make_unique<OnnxEmbeddingProvider>(
            registry, std::move(crossEncoder), settings.queryPrefix);
        if (!provider->initialize()) {
            return fail(QStringLiteral("local bi-encoder unavailable (models dir %1)")
                            .arg(registry->modelsDir()));
        }
        if (settings.dimensions && *settings.dimensions != provider->dimensions()) {
            return fail(QStringLiteral("configured dimensions %1 differ from model dimensions %2")
                            .arg(*settings.dimensions)
                            .arg(provider->dimensions()));
        }
        LOG_INFO(sxEmbed, "ProviderFactory: using %s (%d dims)",
                 qUtf8Printable(provider->modelId()), provider->dimensions());
        return provider;
    }

    RemoteProviderConfig config;
    config.model = settings.model;
    config.endpoint = settings.endpoint;
    config.apiKey = settings.apiKey;
    config.dimensions = settings.dimensions;
    config.queryPrefix = settings.queryPrefix;
    config.retry = retryPolicyFrom(settings);
    config.timeoutMs = settings.timeoutMs;

    if (config.model.isEmpty()) {
        return fail(QStringLiteral("no model configured for %1").arg(apiType));
    }

    std::unique_ptr<EmbeddingProvider> provider;
    if (apiType == QLatin1String("openai")) {
        provider = std::make_unique<OpenAiEmbeddingProvider>(
            std::move(config), createCrossEncoder(settings, registry));
    } else if (apiType == QLatin1String("gemini")) {
        provider = std::make_unique<GeminiEmbeddingProvider>(
            std::move(config), createCrossEncoder(settings, registry));
    } else if (apiType == QLatin1String("huggingface")) {
        provider = std::make_unique<HuggingFaceEmbeddingProvider>(
            std::move(config), createCrossEncoder(settings, registry));
    } else {
        return fail(QStringLiteral("unknown api_type '%1'").arg(settings.apiType));
    }

    if (!provider->isAvailable()) {
        return fail(QStringLiteral("%1 provider misconfigured").arg(apiType));
    }
    LOG_INFO(sxEmbed, "ProviderFactory: using %s", qUtf8Printable(provider->modelId()));
    return provider;
}

} // namespace sx
