#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/embedding/tokenizer.h"

#include <QString>

#include <memory>
#include <optional>

namespace sx {

class ModelRegistry;
class ModelSession;

// Local bi-encoder: the "bi-encoder" role of the model registry, run through
// ONNX Runtime with the WordPiece tokenizer its manifest entry names.
class OnnxEmbeddingProvider final : public EmbeddingProvider {
public:
    OnnxEmbeddingProvider(std::shared_ptr<ModelRegistry> registry,
                          std::unique_ptr<CrossEncoder> crossEncoder,
                          QString queryPrefix = {});
    ~OnnxEmbeddingProvider() override;

    // Loads the session and tokenizer. Returns false when either is missing.
    bool initialize();

    QString modelId() const override;
    int dimensions() const override;
    bool isAvailable() const override;

    EmbeddingResult embedDocuments(const std::vector<QString>& texts,
                                   const CallContext& context) override;
    EmbeddingResult embedQuery(const QString& text, const CallContext& context) override;
    ScoreResult scorePairs(const QString& query, const std::vector<QString>& passages,
                           const CallContext& context) override;

private:
    EmbeddingResult embed(const std::vector<QString>& texts, const CallContext& context);

    std::shared_ptr<ModelRegistry> m_registry;
    std::unique_ptr<CrossEncoder> m_crossEncoder;
    ModelSession* m_session = nullptr;  // owned by the registry
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    QString m_modelId;
    QString m_queryPrefix;
    QString m_pooling;
    int m_dimensions = 0;
    bool m_available = false;
};

// Local cross-encoder for the "cross-encoder" role. Scores are sigmoid of
// the relevance logit unless the manifest sets outputTransform to "none".
class OnnxCrossEncoder final : public CrossEncoder {
public:
    explicit OnnxCrossEncoder(std::shared_ptr<ModelRegistry> registry);
    ~OnnxCrossEncoder() override;

    bool initialize();

    bool isAvailable() const override;
    ScoreResult score(const QString& query, const std::vector<QString>& passages,
                      const CallContext& context) override;

private:
    std::shared_ptr<ModelRegistry> m_registry;
    ModelSession* m_session = nullptr;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    bool m_applySigmoid = true;
    bool m_available = false;
};

} // namespace sx
