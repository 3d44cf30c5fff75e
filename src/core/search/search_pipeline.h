#pragma once

#include "core/shared/cancellation.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace sx {

class EntryStore;
class EmbeddingProvider;
class ProviderExecutor;
class FilterSet;

struct SearchConfig {
    int oversampleFactor = 3;
    int minCandidateFloor = 50;
    int queryEmbedTimeoutMs = 10000;
    int rerankTimeoutMs = 5000;
    // Two chunks of one file are duplicates when their character ranges
    // overlap by at least this share of the shorter chunk.
    double dedupOverlapRatio = 0.5;
};

struct SearchRequest {
    QString rawQuery;
    QStringList corpusIds;
    bool filtersEnabled = true;
    int topK = 10;
    bool rerank = true;
};

struct SearchHit {
    Entry entry;
    // Exact cosine similarity of the query and entry vectors.
    float similarity = 0.0f;
    // Set when the hit was reranked.
    std::optional<float> crossScore;

    // Score the hit is ranked by.
    float score() const { return crossScore.value_or(similarity); }
};

struct SearchResponse {
    ErrorCode code = ErrorCode::None;
    QString message;

    std::vector<SearchHit> hits;
    QString semanticQuery;
    QStringList appliedFilters;
    int candidateCount = 0;
    // Reranking was requested but failed or timed out; hits are in cosine order.
    bool degraded = false;

    bool ok() const { return code == ErrorCode::None; }
};

// SearchPipeline: query embedding, scoped ANN retrieval, filtering,
// cross-encoder reranking and deduplication.
//
//   1. Extract inline filters; the rest of the query is embedded
//   2. Over-fetch max(topK * oversampleFactor, minCandidateFloor) nearest
//      entries of the requested corpora, file filters applied in the search
//   3. Drop candidates failing the date and word filters
//   4. Rerank by cross-encoder score (ties: cosine, then entry id); on
//      failure or timeout keep cosine order and flag the response degraded
//   5. Drop duplicates, keeping the higher ranked hit, and cut to topK
//
// A failed query embedding fails the request: without a vector there is
// nothing to search.
class SearchPipeline {
public:
    SearchPipeline(EntryStore& store, EmbeddingProvider& provider, ProviderExecutor& executor,
                   const FilterSet& filters, SearchConfig config = {});

    SearchResponse search(const SearchRequest& request, const CancellationToken& token = {});

    // Removes hits duplicating a higher ranked one, preserving order.
    static void deduplicate(std::vector<SearchHit>& hits, double overlapRatio);

    // Lowercased text with whitespace runs collapsed, for duplicate checks.
    static QString normalizeForDedup(const QString& text);

    // Cross score desc, then cosine desc, then entry id asc.
    static void sortReranked(std::vector<SearchHit>& hits);

private:
    EntryStore& m_store;
    EmbeddingProvider& m_provider;
    ProviderExecutor& m_executor;
    const FilterSet& m_filters;
    SearchConfig m_config;
};

} // namespace sx
