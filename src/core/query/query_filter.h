#pragma once

#include "core/query/date_parser.h"
#include "core/query/glob_matcher.h"
#include "core/shared/types.h"

#include <QDate>
#include <QString>
#include <QStringList>

#include <memory>
#include <vector>

namespace sx {

// A condition an entry must satisfy to stay in the result set.
class EntryPredicate {
public:
    virtual ~EntryPredicate() = default;

    virtual bool matches(const Entry& entry) const = 0;

    // Predicates that only look at the file path can be evaluated inside the
    // vector search instead of after it.
    virtual bool isPathPredicate() const { return false; }
    virtual bool matchesPath(const QString& filePath) const;

    virtual QString describe() const = 0;
};

using PredicatePtr = std::shared_ptr<const EntryPredicate>;

struct FilterExtraction {
    QString residualQuery;
    std::vector<PredicatePtr> predicates;
};

// One kind of inline query filter. extract() strips the syntax it
// recognizes and returns the matching predicates; anything it cannot parse
// stays in the query as literal text.
class QueryFilter {
public:
    virtual ~QueryFilter() = default;

    virtual QString name() const = 0;
    virtual FilterExtraction extract(const QString& query) const = 0;

protected:
    static QString collapseWhitespace(const QString& text);
};

// ── Date ────────────────────────────────────────────────────

enum class DateComparison {
    After,        // dt>
    AfterOrOn,    // dt>=
    Before,       // dt<
    BeforeOrOn,   // dt<=
    Within,       // dt: and dt=
};

class DatePredicate : public EntryPredicate {
public:
    DatePredicate(DateComparison comparison, DateRange range);

    bool matches(const Entry& entry) const override;
    bool matchesDay(const QDate& day) const;
    QString describe() const override;

private:
    DateComparison m_comparison;
    DateRange m_range;
};

// dt>"2024-01-01", dt>=, dt<, dt<=, dt:"2024-03" / dt="2024-03-05"
class DateFilter : public QueryFilter {
public:
    explicit DateFilter(const QDate& today = QDate::currentDate());

    QString name() const override { return QStringLiteral("date"); }
    FilterExtraction extract(const QString& query) const override;

private:
    QDate m_today;
};

// ── File ────────────────────────────────────────────────────

class FilePredicate : public EntryPredicate {
public:
    FilePredicate(const QStringList& includes, const QStringList& excludes);

    bool matches(const Entry& entry) const override;
    bool isPathPredicate() const override { return true; }
    bool matchesPath(const QString& filePath) const override;
    QString describe() const override;

private:
    std::vector<GlobMatcher> m_includes;
    std::vector<GlobMatcher> m_excludes;
};

// file:"finance/*" (several includes are OR'd), -file:"*.org"
class FileFilter : public QueryFilter {
public:
    QString name() const override { return QStringLiteral("file"); }
    FilterExtraction extract(const QString& query) const override;
};

// ── Word ────────────────────────────────────────────────────

class WordPredicate : public EntryPredicate {
public:
    WordPredicate(const QStringList& required, const QStringList& excluded);

    bool matches(const Entry& entry) const override;
    QString describe() const override;

private:
    QStringList m_required;
    QStringList m_excluded;
};

// +"word" must appear, -"word" must not; case-insensitive.
class WordFilter : public QueryFilter {
public:
    QString name() const override { return QStringLiteral("word"); }
    FilterExtraction extract(const QString& query) const override;
};

} // namespace sx
