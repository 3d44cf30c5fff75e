#include "core/indexing/date_extractor.h"
#include "core/query/date_parser.h"

#include <QRegularExpression>

#include <algorithm>

namespace sx {

namespace {

void addDate(int year, int month, int day, std::vector<QDate>& out)
{
    if (year < 1900 || year > 2199 || month < 1) {
        return;
    }
    const QDate date(year, month, day);
    if (date.isValid()) {
        out.push_back(date);
    }
}

} // namespace

std::vector<QDate> DateExtractor::extract(const QString& text)
{
    static const QRegularExpression isoPattern(
        QStringLiteral(R"(\b(\d{4})[-/](\d{1,2})[-/](\d{1,2})\b)"));
    static const QRegularExpression dayFirstPattern(
        QStringLiteral(R"(\b(\d{1,2})(?:st|nd|rd|th)?\s+([A-Za-z]{3,9})\.?,?\s+(\d{4})\b)"));
    static const QRegularExpression monthFirstPattern(
        QStringLiteral(R"(\b([A-Za-z]{3,9})\.?\s+(\d{1,2})(?:st|nd|rd|th)?,?\s+(\d{4})\b)"));

    std::vector<QDate> dates;

    QRegularExpressionMatchIterator it = isoPattern.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        addDate(m.captured(1).toInt(), m.captured(2).toInt(), m.captured(3).toInt(), dates);
    }

    it = dayFirstPattern.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        addDate(m.captured(3).toInt(), DateParser::monthFromName(m.captured(2)),
                m.captured(1).toInt(), dates);
    }

    it = monthFirstPattern.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        addDate(m.captured(3).toInt(), DateParser::monthFromName(m.captured(1)),
                m.captured(2).toInt(), dates);
    }

    std::sort(dates.begin(), dates.end());
    dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
    return dates;
}

std::vector<QDate> DateExtractor::merge(const std::vector<QDate>& a, const std::vector<QDate>& b)
{
    std::vector<QDate> merged;
    merged.reserve(a.size() + b.size());
    merged.insert(merged.end(), a.begin(), a.end());
    merged.insert(merged.end(), b.begin(), b.end());
    std::sort(merged.begin(), merged.end());
    merged.erase(std::unique(merged.begin(), merged.end()), merged.end());
    return merged;
}

} // namespace sx
