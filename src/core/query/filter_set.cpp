#include "core/query/filter_set.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace sx {

bool ParsedQuery::matches(const Entry& entry) const
{
    return std::all_of(predicates.begin(), predicates.end(),
                       [&entry](const PredicatePtr& predicate) {
                           return predicate->matches(entry);
                       });
}

std::function<bool(const QString&)> ParsedQuery::pathFilter() const
{
    std::vector<PredicatePtr> pathPredicates;
    for (const PredicatePtr& predicate : predicates) {
        if (predicate->isPathPredicate()) {
            pathPredicates.push_back(predicate);
        }
    }
    if (pathPredicates.empty()) {
        return {};
    }
    return [pathPredicates](const QString& filePath) {
        return std::all_of(pathPredicates.begin(), pathPredicates.end(),
                           [&filePath](const PredicatePtr& predicate) {
                               return predicate->matchesPath(filePath);
                           });
    };
}

std::vector<PredicatePtr> ParsedQuery::residualPredicates() const
{
    std::vector<PredicatePtr> residual;
    for (const PredicatePtr& predicate : predicates) {
        if (!predicate->isPathPredicate()) {
            residual.push_back(predicate);
        }
    }
    return residual;
}

FilterSet FilterSet::standard(const QDate& today)
{
    FilterSet set;
    set.addFilter(std::make_unique<DateFilter>(today));
    set.addFilter(std::make_unique<FileFilter>());
    set.addFilter(std::make_unique<WordFilter>());
    return set;
}

void FilterSet::addFilter(std::unique_ptr<QueryFilter> filter)
{
    if (filter) {
        m_filters.push_back(std::move(filter));
    }
}

ParsedQuery FilterSet::extract(const QString& rawQuery) const
{
    ParsedQuery parsed;
    parsed.semanticQuery = rawQuery;

    for (const auto& filter : m_filters) {
        FilterExtraction extraction = filter->extract(parsed.semanticQuery);
        for (PredicatePtr& predicate : extraction.predicates) {
            LOG_DEBUG(sxSearch, "Filter %s: %s",
                      qUtf8Printable(filter->name()),
                      qUtf8Printable(predicate->describe()));
            parsed.predicates.push_back(std::move(predicate));
        }
        parsed.semanticQuery = std::move(extraction.residualQuery);
    }

    return parsed;
}

} // namespace sx
