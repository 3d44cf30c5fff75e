#include "core/search/search_pipeline.h"
#include "core/embedding/embedding_provider.h"
#include "core/embedding/provider_executor.h"
#include "core/index/entry_store.h"
#include "core/query/filter_set.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QRegularExpression>

#include <algorithm>
#include <chrono>
#include <future>

namespace sx {

namespace {

constexpr int kWaitSliceMs = 10;

enum class WaitOutcome {
    Ready,
    TimedOut,
    Cancelled,
};

// Waits for a provider call on the search path. The caller's cancellation
// and the timeout both cancel the call's own token so the provider stops.
template <typename T>
WaitOutcome awaitCall(std::future<T>& future, int timeoutMs, const CancellationToken& caller,
                      CancellationToken& call)
{
    const int64_t deadline = CallContext::nowMs() + timeoutMs;
    for (;;) {
        if (future.wait_for(std::chrono::milliseconds(kWaitSliceMs))
            == std::future_status::ready) {
            return WaitOutcome::Ready;
        }
        if (caller.isCancelled()) {
            call.cancel();
            return WaitOutcome::Cancelled;
        }
        if (timeoutMs > 0 && CallContext::nowMs() >= deadline) {
            call.cancel();
            return WaitOutcome::TimedOut;
        }
    }
}

bool cosineOrder(const SearchHit& a, const SearchHit& b)
{
    if (a.similarity != b.similarity) {
        return a.similarity > b.similarity;
    }
    return a.entry.id < b.entry.id;
}

} // anonymous namespace

SearchPipeline::SearchPipeline(EntryStore& store, EmbeddingProvider& provider,
                               ProviderExecutor& executor, const FilterSet& filters,
                               SearchConfig config)
    : m_store(store)
    , m_provider(provider)
    , m_executor(executor)
    , m_filters(filters)
    , m_config(config)
{
    m_config.oversampleFactor = std::max(m_config.oversampleFactor, 1);
    m_config.minCandidateFloor = std::max(m_config.minCandidateFloor, 0);
}

// ── Search ──────────────────────────────────────────────────

SearchResponse SearchPipeline::search(const SearchRequest& request, const CancellationToken& token)
{
    SearchResponse response;
    if (request.corpusIds.isEmpty()) {
        response.code = ErrorCode::InvalidArgument;
        response.message = QStringLiteral("Search needs at least one corpus");
        return response;
    }
    if (request.topK <= 0) {
        response.code = ErrorCode::InvalidArgument;
        response.message = QStringLiteral("topK must be positive, got %1").arg(request.topK);
        return response;
    }

    QElapsedTimer timer;
    timer.start();

    // ── 1. Filters ──
    ParsedQuery parsed;
    if (request.filtersEnabled) {
        parsed = m_filters.extract(request.rawQuery);
    } else {
        parsed.semanticQuery = request.rawQuery;
    }
    response.semanticQuery = parsed.semanticQuery.trimmed();
    for (const PredicatePtr& predicate : parsed.predicates) {
        response.appliedFilters.append(predicate->describe());
    }

    if (response.semanticQuery.isEmpty()) {
        LOG_DEBUG(sxSearch, "Nothing left to embed in query '%s'",
                  qUtf8Printable(request.rawQuery));
        return response;
    }

    // ── 2. Query embedding ──
    std::vector<float> queryVector;
    {
        CancellationToken callToken;
        const QString query = response.semanticQuery;
        const int timeoutMs = m_config.queryEmbedTimeoutMs;
        EmbeddingProvider& provider = m_provider;
        std::future<EmbeddingResult> future = m_executor.submit(
            ProviderExecutor::Lane::Live, [&provider, query, callToken, timeoutMs]() {
                return provider.embedQuery(query, CallContext::withTimeout(timeoutMs, callToken));
            });

        const WaitOutcome waited = awaitCall(future, timeoutMs, token, callToken);
        if (waited == WaitOutcome::Cancelled) {
            response.code = ErrorCode::Cancelled;
            response.message = QStringLiteral("Search cancelled");
            return response;
        }
        if (waited == WaitOutcome::TimedOut) {
            response.code = ErrorCode::ProviderUnavailable;
            response.message = QStringLiteral("Query embedding timed out after %1ms")
                                   .arg(timeoutMs);
            LOG_WARN(sxSearch, "%s", qUtf8Printable(response.message));
            return response;
        }

        EmbeddingResult embedded = future.get();
        if (!embedded.ok() || embedded.vectors.size() != 1) {
            response.code = embedded.ok() ? ErrorCode::ProviderUnavailable
                                          : toErrorCode(embedded.status);
            response.message = QStringLiteral("Query embedding failed: %1")
                                   .arg(embedded.message);
            LOG_WARN(sxSearch, "%s", qUtf8Printable(response.message));
            return response;
        }
        queryVector = std::move(embedded.vectors.front());
    }

    // ── 3. Candidate retrieval ──
    VectorQuery vectorQuery;
    vectorQuery.corpusIds = request.corpusIds;
    vectorQuery.queryVector = std::move(queryVector);
    vectorQuery.limit = std::max(request.topK * m_config.oversampleFactor,
                                 m_config.minCandidateFloor);
    vectorQuery.pathFilter = parsed.pathFilter();

    SimilarityResult similar = m_store.searchSimilar(vectorQuery);
    if (!similar.ok()) {
        response.code = similar.code;
        response.message = similar.message;
        return response;
    }

    // ── 4. Residual predicates ──
    const std::vector<PredicatePtr> residual = parsed.residualPredicates();
    std::vector<SearchHit> hits;
    hits.reserve(similar.hits.size());
    for (ScoredEntry& scored : similar.hits) {
        const bool keep = std::all_of(residual.begin(), residual.end(),
                                      [&scored](const PredicatePtr& predicate) {
                                          return predicate->matches(scored.entry);
                                      });
        if (!keep) {
            continue;
        }
        SearchHit hit;
        hit.entry = std::move(scored.entry);
        hit.similarity = scored.similarity;
        hits.push_back(std::move(hit));
    }
    std::stable_sort(hits.begin(), hits.end(), cosineOrder);
    response.candidateCount = static_cast<int>(hits.size());

    // ── 5. Rerank ──
    if (request.rerank && !hits.empty()) {
        std::vector<QString> passages;
        passages.reserve(hits.size());
        for (const SearchHit& hit : hits) {
            passages.push_back(hit.entry.text);
        }

        CancellationToken callToken;
        const QString query = response.semanticQuery;
        const int timeoutMs = m_config.rerankTimeoutMs;
        EmbeddingProvider& provider = m_provider;
        std::future<ScoreResult> future = m_executor.submit(
            ProviderExecutor::Lane::Live,
            [&provider, query, passages = std::move(passages), callToken, timeoutMs]() {
                return provider.scorePairs(query, passages,
                                           CallContext::withTimeout(timeoutMs, callToken));
            });

        const WaitOutcome waited = awaitCall(future, timeoutMs, token, callToken);
        if (waited == WaitOutcome::Cancelled) {
            response.code = ErrorCode::Cancelled;
            response.message = QStringLiteral("Search cancelled");
            return response;
        }

        QString failure;
        if (waited == WaitOutcome::TimedOut) {
            failure = QStringLiteral("timed out after %1ms").arg(timeoutMs);
        } else {
            ScoreResult scored = future.get();
            if (!scored.ok()) {
                failure = QStringLiteral("%1: %2").arg(providerStatusToString(scored.status),
                                                       scored.message);
            } else if (scored.scores.size() != hits.size()) {
                failure = QStringLiteral("got %1 scores for %2 candidates")
                              .arg(scored.scores.size())
                              .arg(hits.size());
            } else {
                for (size_t i = 0; i < hits.size(); ++i) {
                    hits[i].crossScore = scored.scores[i];
                }
                sortReranked(hits);
            }
        }

        if (!failure.isEmpty()) {
            response.degraded = true;
            response.message = QStringLiteral("Rerank skipped: %1").arg(failure);
            LOG_WARN(sxSearch, "%s, returning cosine order", qUtf8Printable(response.message));
        }
    }

    // ── 6. Dedup and cut ──
    deduplicate(hits, m_config.dedupOverlapRatio);
    if (hits.size() > static_cast<size_t>(request.topK)) {
        hits.resize(static_cast<size_t>(request.topK));
    }
    response.hits = std::move(hits);

    LOG_DEBUG(sxSearch, "Search '%s' over %d corpora: %d candidates, %d hits%s in %lldms",
              qUtf8Printable(response.semanticQuery), static_cast<int>(request.corpusIds.size()),
              response.candidateCount, static_cast<int>(response.hits.size()),
              response.degraded ? " (degraded)" : "", static_cast<long long>(timer.elapsed()));
    return response;
}

// ── Ranking helpers ─────────────────────────────────────────

void SearchPipeline::sortReranked(std::vector<SearchHit>& hits)
{
    std::stable_sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        const float crossA = a.crossScore.value_or(0.0f);
        const float crossB = b.crossScore.value_or(0.0f);
        if (crossA != crossB) {
            return crossA > crossB;
        }
        return cosineOrder(a, b);
    });
}

QString SearchPipeline::normalizeForDedup(const QString& text)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    return text.toLower().replace(whitespace, QStringLiteral(" ")).trimmed();
}

void SearchPipeline::deduplicate(std::vector<SearchHit>& hits, double overlapRatio)
{
    std::vector<SearchHit> kept;
    std::vector<QString> keptTexts;
    kept.reserve(hits.size());
    keptTexts.reserve(hits.size());

    for (SearchHit& hit : hits) {
        const QString normalized = normalizeForDedup(hit.entry.text);
        bool duplicate = false;
        for (size_t i = 0; i < kept.size() && !duplicate; ++i) {
            if (keptTexts[i] == normalized) {
                duplicate = true;
                break;
            }

            const Entry& other = kept[i].entry;
            // Ranges only overlap within one file of one corpus.
            if (other.corpusId != hit.entry.corpusId || other.filePath != hit.entry.filePath) {
                continue;
            }
            const int shorter = std::min(hit.entry.charEnd - hit.entry.charStart,
                                         other.charEnd - other.charStart);
            if (shorter <= 0) {
                continue;
            }
            const int overlap = std::min(hit.entry.charEnd, other.charEnd)
                - std::max(hit.entry.charStart, other.charStart);
            if (overlap > 0 && static_cast<double>(overlap) >= overlapRatio * shorter) {
                duplicate = true;
            }
        }

        if (!duplicate) {
            keptTexts.push_back(normalized);
            kept.push_back(std::move(hit));
        }
    }

    hits = std::move(kept);
}

} // namespace sx
