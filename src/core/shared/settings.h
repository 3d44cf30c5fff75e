#pragma once

#include <QString>
#include <cstdint>
#include <optional>

namespace sx {

struct EmbeddingSettings {
    // Backend: "local", "openai", "gemini" or "huggingface".
    QString apiType = QStringLiteral("local");
    QString model = QStringLiteral("bge-small-en-v1.5");
    // Unset means "take it from the model" (manifest or first response).
    std::optional<int> dimensions;
    QString endpoint;
    QString apiKey;
    QString queryPrefix;
    QString modelsDir;

    // Cross-encoder. An endpoint switches reranking to the remote /rerank API.
    QString crossEncoder = QStringLiteral("ms-marco-MiniLM-L-6-v2");
    QString crossEncoderEndpoint;

    // Throughput and failure policy.
    int batchSize = 32;
    int maxParallelBatches = 4;
    int maxAttempts = 4;
    int baseDelayMs = 250;
    int maxDelayMs = 8000;
    int timeoutMs = 30000;
};

struct ChunkerSettings {
    int maxTokens = 256;
    int overlapTokens = 32;
};

struct IndexerSettings {
    // Upper bound on chunks embedded and committed together.
    int writeBatchChunks = 128;
};

struct SearchSettings {
    int oversampleFactor = 3;
    int minCandidateFloor = 50;
    int queryEmbedTimeoutMs = 10000;
    int rerankTimeoutMs = 5000;
    double dedupOverlapRatio = 0.5;
};

struct Settings {
    // Database
    QString dbPath;

    EmbeddingSettings embedding;
    ChunkerSettings chunker;
    IndexerSettings indexer;
    SearchSettings search;
};

} // namespace sx
