#include "core/embedding/onnx_embedding_provider.h"
#include "core/embedding/onnx_inference.h"
#include "core/models/model_registry.h"
#include "core/models/model_session.h"
#include "core/models/tokenizer_factory.h"
#include "core/shared/logging.h"

#include <cmath>

namespace sx {

namespace {

constexpr const char* kBiEncoderRole = "bi-encoder";
constexpr const char* kCrossEncoderRole = "cross-encoder";

// Row vectors from a [batch, dim] output, or pooled from a
// [batch, seq, hidden] output using the attention mask.
std::optional<std::vector<std::vector<float>>> poolOutput(const InferenceOutput& output,
                                                          const Encoding& encoding,
                                                          const QString& pooling)
{
    const std::vector<int64_t>& shape = output.shape;
    const int64_t batch = encoding.batchSize;
    std::vector<std::vector<float>> vectors;
    vectors.reserve(static_cast<size_t>(batch));

    if (shape.size() == 2 && shape[0] == batch && shape[1] > 0) {
        const int64_t dim = shape[1];
        for (int64_t i = 0; i < batch; ++i) {
            const float* row = output.data.data() + i * dim;
            vectors.emplace_back(row, row + dim);
        }
        return vectors;
    }

    if (shape.size() == 3 && shape[0] == batch && shape[1] >= 1 && shape[2] > 0) {
        const int64_t seqLen = shape[1];
        const int64_t hidden = shape[2];
        for (int64_t i = 0; i < batch; ++i) {
            const float* base = output.data.data() + i * seqLen * hidden;
            if (pooling != QLatin1String("mean")) {
                vectors.emplace_back(base, base + hidden);
                continue;
            }

            std::vector<double> sum(static_cast<size_t>(hidden), 0.0);
            int64_t counted = 0;
            for (int64_t t = 0; t < seqLen && t < encoding.sequenceLength; ++t) {
                if (encoding.attentionMask[static_cast<size_t>(i * encoding.sequenceLength + t)] == 0) {
                    continue;
                }
                const float* token = base + t * hidden;
                for (int64_t h = 0; h < hidden; ++h) {
                    sum[static_cast<size_t>(h)] += token[h];
                }
                ++counted;
            }
            std::vector<float> pooled(static_cast<size_t>(hidden), 0.0f);
            if (counted > 0) {
                for (int64_t h = 0; h < hidden; ++h) {
                    pooled[static_cast<size_t>(h)] =
                        static_cast<float>(sum[static_cast<size_t>(h)] / static_cast<double>(counted));
                }
            }
            vectors.push_back(std::move(pooled));
        }
        return vectors;
    }

    return std::nullopt;
}

} // anonymous namespace

// ── OnnxEmbeddingProvider ───────────────────────────────────

OnnxEmbeddingProvider::OnnxEmbeddingProvider(std::shared_ptr<ModelRegistry> registry,
                                             std::unique_ptr<CrossEncoder> crossEncoder,
                                             QString queryPrefix)
    : m_registry(std::move(registry))
    , m_crossEncoder(std::move(crossEncoder))
    , m_queryPrefix(std::move(queryPrefix))
{
}

OnnxEmbeddingProvider::~OnnxEmbeddingProvider() = default;

bool OnnxEmbeddingProvider::initialize()
{
    m_available = false;
    if (!m_registry) {
        LOG_WARN(sxEmbed, "OnnxEmbeddingProvider initialize failed: null registry");
        return false;
    }

    m_session = m_registry->getSession(kBiEncoderRole);
    if (!m_session || !m_session->isAvailable()) {
        LOG_WARN(sxEmbed,
                 "OnnxEmbeddingProvider initialize failed: bi-encoder session unavailable");
        return false;
    }

    const ModelManifestEntry& entry = m_session->manifest();
    QString tokenizerError;
    m_tokenizer = TokenizerFactory::create(entry, m_registry->modelsDir(), TokenizerUse::Single,
                                           &tokenizerError);
    if (!m_tokenizer) {
        LOG_WARN(sxEmbed, "OnnxEmbeddingProvider initialize failed: %s",
                 qUtf8Printable(tokenizerError));
        return false;
    }

    m_dimensions = entry.dimensions;
    if (m_dimensions <= 0) {
        LOG_WARN(sxEmbed, "OnnxEmbeddingProvider initialize failed: invalid dimensions %d",
                 m_dimensions);
        return false;
    }

    m_modelId = QStringLiteral("local:")
        + (entry.modelId.isEmpty() ? entry.name : entry.modelId);
    if (m_queryPrefix.isEmpty()) {
        m_queryPrefix = entry.queryPrefix;
    }
    m_pooling = entry.poolingStrategy;
    m_available = true;
    return true;
}

QString OnnxEmbeddingProvider::modelId() const
{
    return m_modelId;
}

int OnnxEmbeddingProvider::dimensions() const
{
    return m_dimensions;
}

bool OnnxEmbeddingProvider::isAvailable() const
{
    return m_available;
}

EmbeddingResult OnnxEmbeddingProvider::embedDocuments(const std::vector<QString>& texts,
                                                      const CallContext& context)
{
    return embed(texts, context);
}

EmbeddingResult OnnxEmbeddingProvider::embedQuery(const QString& text,
                                                  const CallContext& context)
{
    return embed({m_queryPrefix + text}, context);
}

ScoreResult OnnxEmbeddingProvider::scorePairs(const QString& query,
                                              const std::vector<QString>& passages,
                                              const CallContext& context)
{
    if (!m_crossEncoder || !m_crossEncoder->isAvailable()) {
        ScoreResult result;
        result.status = ProviderStatus::ModelFailure;
        result.message = QStringLiteral("cross-encoder unavailable");
        return result;
    }
    return m_crossEncoder->score(query, passages, context);
}

EmbeddingResult OnnxEmbeddingProvider::embed(const std::vector<QString>& texts,
                                             const CallContext& context)
{
    EmbeddingResult result;
    if (texts.empty()) {
        return result;
    }
    if (!m_available) {
        result.status = ProviderStatus::ModelFailure;
        result.message = QStringLiteral("bi-encoder unavailable");
        return result;
    }

    const Encoding encoding = m_tokenizer->encodeBatch(texts);
    const InferenceOutput output = runEncoder(*m_session, encoding, context);
    if (!output.ok()) {
        result.status = output.status;
        result.message = output.message;
        return result;
    }

    auto vectors = poolOutput(output, encoding, m_pooling);
    if (!vectors || vectors->size() != texts.size()
        || static_cast<int>(vectors->front().size()) != m_dimensions) {
        LOG_WARN(sxEmbed,
                 "OnnxEmbeddingProvider inference failed: unsupported output shape");
        result.status = ProviderStatus::ModelFailure;
        result.message = QStringLiteral("unsupported output shape");
        return result;
    }

    for (auto& vector : *vectors) {
        l2Normalize(vector);
    }
    result.vectors = std::move(*vectors);
    return result;
}

// ── OnnxCrossEncoder ────────────────────────────────────────

OnnxCrossEncoder::OnnxCrossEncoder(std::shared_ptr<ModelRegistry> registry)
    : m_registry(std::move(registry))
{
}

OnnxCrossEncoder::~OnnxCrossEncoder() = default;

bool OnnxCrossEncoder::initialize()
{
    m_available = false;
    if (!m_registry) {
        LOG_WARN(sxEmbed, "OnnxCrossEncoder initialize failed: null registry");
        return false;
    }

    m_session = m_registry->getSession(kCrossEncoderRole);
    if (!m_session || !m_session->isAvailable()) {
        LOG_WARN(sxEmbed,
                 "OnnxCrossEncoder initialize failed: cross-encoder session unavailable");
        return false;
    }

    const ModelManifestEntry& entry = m_session->manifest();
    QString tokenizerError;
    m_tokenizer = TokenizerFactory::create(entry, m_registry->modelsDir(), TokenizerUse::Pair,
                                           &tokenizerError);
    if (!m_tokenizer) {
        LOG_WARN(sxEmbed, "OnnxCrossEncoder initialize failed: %s",
                 qUtf8Printable(tokenizerError));
        return false;
    }

    m_applySigmoid = entry.outputTransform != QLatin1String("none");
    m_available = true;
    return true;
}

bool OnnxCrossEncoder::isAvailable() const
{
    return m_available;
}

ScoreResult OnnxCrossEncoder::score(const QString& query, const std::vector<QString>& passages,
                                    const CallContext& context)
{
    ScoreResult result;
    if (passages.empty()) {
        return result;
    }
    if (!m_available) {
        result.status = ProviderStatus::ModelFailure;
        result.message = QStringLiteral("cross-encoder unavailable");
        return result;
    }

    const Encoding encoding = m_tokenizer->encodePairBatch(query, passages);
    const InferenceOutput output = runEncoder(*m_session, encoding, context);
    if (!output.ok()) {
        result.status = output.status;
        result.message = output.message;
        return result;
    }

    // [batch] or [batch, labels]; the last label is the relevance logit.
    const int64_t batch = encoding.batchSize;
    int64_t stride = 0;
    if (output.shape.size() == 1 && output.shape[0] == batch) {
        stride = 1;
    } else if (output.shape.size() == 2 && output.shape[0] == batch && output.shape[1] >= 1) {
        stride = output.shape[1];
    } else {
        LOG_WARN(sxEmbed, "OnnxCrossEncoder inference failed: unsupported output shape");
        result.status = ProviderStatus::ModelFailure;
        result.message = QStringLiteral("unsupported output shape");
        return result;
    }

    result.scores.reserve(passages.size());
    for (int64_t i = 0; i < batch; ++i) {
        const float logit = output.data[static_cast<size_t>(i * stride + stride - 1)];
        result.scores.push_back(m_applySigmoid ? 1.0f / (1.0f + std::exp(-logit)) : logit);
    }
    return result;
}

} // namespace sx
