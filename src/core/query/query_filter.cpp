#include "core/query/query_filter.h"

#include <QRegularExpression>

#include <algorithm>

namespace sx {

bool EntryPredicate::matchesPath(const QString& filePath) const
{
    Q_UNUSED(filePath);
    return true;
}

QString QueryFilter::collapseWhitespace(const QString& text)
{
    return text.simplified();
}

// ── Date ────────────────────────────────────────────────────

DatePredicate::DatePredicate(DateComparison comparison, DateRange range)
    : m_comparison(comparison)
    , m_range(range)
{
}

bool DatePredicate::matchesDay(const QDate& day) const
{
    switch (m_comparison) {
    case DateComparison::After:      return day > m_range.last;
    case DateComparison::AfterOrOn:  return day >= m_range.first;
    case DateComparison::Before:     return day < m_range.first;
    case DateComparison::BeforeOrOn: return day <= m_range.last;
    case DateComparison::Within:     return m_range.contains(day);
    }
    return false;
}

bool DatePredicate::matches(const Entry& entry) const
{
    return std::any_of(entry.dates.begin(), entry.dates.end(),
                       [this](const QDate& day) { return matchesDay(day); });
}

QString DatePredicate::describe() const
{
    QString op;
    switch (m_comparison) {
    case DateComparison::After:      op = QStringLiteral(">"); break;
    case DateComparison::AfterOrOn:  op = QStringLiteral(">="); break;
    case DateComparison::Before:     op = QStringLiteral("<"); break;
    case DateComparison::BeforeOrOn: op = QStringLiteral("<="); break;
    case DateComparison::Within:     op = QStringLiteral(":"); break;
    }
    return QStringLiteral("date%1[%2..%3]")
        .arg(op, m_range.first.toString(Qt::ISODate), m_range.last.toString(Qt::ISODate));
}

DateFilter::DateFilter(const QDate& today)
    : m_today(today)
{
}

FilterExtraction DateFilter::extract(const QString& query) const
{
    static const QRegularExpression pattern(QStringLiteral(R"re(\bdt(>=|<=|>|<|:|=)"([^"]*)")re"));

    FilterExtraction result;
    QString residual;
    qsizetype cursor = 0;

    QRegularExpressionMatchIterator it = pattern.globalMatch(query);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        const std::optional<DateRange> range = DateParser::parse(m.captured(2), m_today);
        if (!range.has_value()) {
            continue;  // stays in the query as literal text
        }

        const QString op = m.captured(1);
        DateComparison comparison = DateComparison::Within;
        if (op == QLatin1String(">")) {
            comparison = DateComparison::After;
        } else if (op == QLatin1String(">=")) {
            comparison = DateComparison::AfterOrOn;
        } else if (op == QLatin1String("<")) {
            comparison = DateComparison::Before;
        } else if (op == QLatin1String("<=")) {
            comparison = DateComparison::BeforeOrOn;
        }

        result.predicates.push_back(std::make_shared<DatePredicate>(comparison, range.value()));
        residual += query.mid(cursor, m.capturedStart(0) - cursor);
        residual += QLatin1Char(' ');
        cursor = m.capturedEnd(0);
    }
    residual += query.mid(cursor);

    result.residualQuery = cursor == 0 ? query : collapseWhitespace(residual);
    return result;
}

// ── File ────────────────────────────────────────────────────

FilePredicate::FilePredicate(const QStringList& includes, const QStringList& excludes)
{
    for (const QString& glob : includes) {
        m_includes.emplace_back(glob);
    }
    for (const QString& glob : excludes) {
        m_excludes.emplace_back(glob);
    }
}

bool FilePredicate::matches(const Entry& entry) const
{
    return matchesPath(entry.filePath);
}

bool FilePredicate::matchesPath(const QString& filePath) const
{
    for (const GlobMatcher& exclude : m_excludes) {
        if (exclude.matches(filePath)) {
            return false;
        }
    }
    if (m_includes.empty()) {
        return true;
    }
    return std::any_of(m_includes.begin(), m_includes.end(),
                       [&filePath](const GlobMatcher& include) {
                           return include.matches(filePath);
                       });
}

QString FilePredicate::describe() const
{
    QStringList parts;
    for (const GlobMatcher& include : m_includes) {
        parts.append(QStringLiteral("+") + include.pattern());
    }
    for (const GlobMatcher& exclude : m_excludes) {
        parts.append(QStringLiteral("-") + exclude.pattern());
    }
    return QStringLiteral("file[%1]").arg(parts.join(QLatin1Char(',')));
}

FilterExtraction FileFilter::extract(const QString& query) const
{
    static const QRegularExpression pattern(QStringLiteral(R"re((?<!\S)(-?)file:"([^"]*)")re"));

    FilterExtraction result;
    QStringList includes;
    QStringList excludes;
    QString residual;
    qsizetype cursor = 0;

    QRegularExpressionMatchIterator it = pattern.globalMatch(query);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        const QString glob = m.captured(2).trimmed();
        if (glob.isEmpty()) {
            continue;
        }
        if (m.captured(1).isEmpty()) {
            includes.append(glob);
        } else {
            excludes.append(glob);
        }
        residual += query.mid(cursor, m.capturedStart(0) - cursor);
        residual += QLatin1Char(' ');
        cursor = m.capturedEnd(0);
    }
    residual += query.mid(cursor);

    if (!includes.isEmpty() || !excludes.isEmpty()) {
        result.predicates.push_back(std::make_shared<FilePredicate>(includes, excludes));
    }
    result.residualQuery = cursor == 0 ? query : collapseWhitespace(residual);
    return result;
}

// ── Word ────────────────────────────────────────────────────

WordPredicate::WordPredicate(const QStringList& required, const QStringList& excluded)
    : m_required(required)
    , m_excluded(excluded)
{
}

bool WordPredicate::matches(const Entry& entry) const
{
    for (const QString& word : m_required) {
        if (!entry.text.contains(word, Qt::CaseInsensitive)) {
            return false;
        }
    }
    for (const QString& word : m_excluded) {
        if (entry.text.contains(word, Qt::CaseInsensitive)) {
            return false;
        }
    }
    return true;
}

QString WordPredicate::describe() const
{
    QStringList parts;
    for (const QString& word : m_required) {
        parts.append(QStringLiteral("+") + word);
    }
    for (const QString& word : m_excluded) {
        parts.append(QStringLiteral("-") + word);
    }
    return QStringLiteral("word[%1]").arg(parts.join(QLatin1Char(',')));
}

FilterExtraction WordFilter::extract(const QString& query) const
{
    static const QRegularExpression pattern(QStringLiteral(R"re((?<!\S)([+-])"([^"]*)")re"));

    FilterExtraction result;
    QStringList required;
    QStringList excluded;
    QString residual;
    qsizetype cursor = 0;

    QRegularExpressionMatchIterator it = pattern.globalMatch(query);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        const QString word = m.captured(2).trimmed();
        if (word.isEmpty()) {
            continue;
        }
        if (m.captured(1) == QLatin1String("+")) {
            required.append(word);
        } else {
            excluded.append(word);
        }
        residual += query.mid(cursor, m.capturedStart(0) - cursor);
        residual += QLatin1Char(' ');
        cursor = m.capturedEnd(0);
    }
    residual += query.mid(cursor);

    if (!required.isEmpty() || !excluded.isEmpty()) {
        result.predicates.push_back(std::make_shared<WordPredicate>(required, excluded));
    }
    result.residualQuery = cursor == 0 ? query : collapseWhitespace(residual);
    return result;
}

} // namespace sx
