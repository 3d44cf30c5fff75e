#pragma once

#include "core/query/query_filter.h"

#include <QDate>
#include <QString>

#include <functional>
#include <memory>
#include <vector>

namespace sx {

// Result of running every filter over a raw query.
struct ParsedQuery {
    QString semanticQuery;
    std::vector<PredicatePtr> predicates;

    bool hasPredicates() const { return !predicates.empty(); }

    // True when the entry satisfies every predicate.
    bool matches(const Entry& entry) const;

    // Conjunction of the path-only predicates, for evaluation inside the
    // vector search. Empty when there are none.
    std::function<bool(const QString&)> pathFilter() const;

    // Predicates that must run on hydrated entries.
    std::vector<PredicatePtr> residualPredicates() const;
};

// Ordered collection of query filters. Each filter sees the query left by the
// previous one; the resulting predicates combine with logical AND.
class FilterSet {
public:
    FilterSet() = default;

    FilterSet(FilterSet&&) = default;
    FilterSet& operator=(FilterSet&&) = default;
    FilterSet(const FilterSet&) = delete;
    FilterSet& operator=(const FilterSet&) = delete;

    // Date, file and word filters, in that order.
    static FilterSet standard(const QDate& today = QDate::currentDate());

    void addFilter(std::unique_ptr<QueryFilter> filter);
    size_t size() const { return m_filters.size(); }

    ParsedQuery extract(const QString& rawQuery) const;

private:
    std::vector<std::unique_ptr<QueryFilter>> m_filters;
};

} // namespace sx
