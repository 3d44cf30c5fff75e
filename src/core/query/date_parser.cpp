#include "core/query/date_parser.h"

#include <QRegularExpression>

namespace sx {

namespace {

struct MonthEntry {
    const char* name;
    int month;
};

constexpr MonthEntry kMonths[] = {
    {"january", 1},   {"february", 2},  {"march", 3},
    {"april", 4},     {"may", 5},       {"june", 6},
    {"july", 7},      {"august", 8},    {"september", 9},
    {"october", 10},  {"november", 11}, {"december", 12},
};

std::optional<DateRange> dayRange(int year, int month, int day)
{
    const QDate date(year, month, day);
    if (!date.isValid()) {
        return std::nullopt;
    }
    return DateRange{date, date};
}

std::optional<DateRange> monthRange(int year, int month)
{
    const QDate first(year, month, 1);
    if (!first.isValid()) {
        return std::nullopt;
    }
    return DateRange{first, first.addMonths(1).addDays(-1)};
}

} // namespace

int DateParser::monthFromName(const QString& name)
{
    const QString lower = name.trimmed().toLower();
    if (lower.size() < 3) {
        return 0;
    }
    for (const MonthEntry& entry : kMonths) {
        const QString full = QString::fromLatin1(entry.name);
        if (lower == full || (lower.size() == 3 && full.startsWith(lower))) {
            return entry.month;
        }
    }
    return 0;
}

std::optional<DateRange> DateParser::parse(const QString& text, const QDate& today)
{
    const QString lower = text.trimmed().toLower();
    if (lower.isEmpty()) {
        return std::nullopt;
    }

    if (lower == QLatin1String("today")) {
        return DateRange{today, today};
    }
    if (lower == QLatin1String("yesterday")) {
        const QDate day = today.addDays(-1);
        return DateRange{day, day};
    }

    static const QRegularExpression isoDay(
        QStringLiteral(R"(^(\d{4})[-/](\d{1,2})[-/](\d{1,2})$)"));
    static const QRegularExpression isoMonth(QStringLiteral(R"(^(\d{4})-(\d{1,2})$)"));
    static const QRegularExpression yearOnly(QStringLiteral(R"(^(\d{4})$)"));
    static const QRegularExpression dayMonthYear(
        QStringLiteral(R"(^(\d{1,2})(?:st|nd|rd|th)?\s+([a-z]+)\.?,?\s+(\d{4})$)"));
    static const QRegularExpression monthDayYear(
        QStringLiteral(R"(^([a-z]+)\.?\s+(\d{1,2})(?:st|nd|rd|th)?,?\s+(\d{4})$)"));
    static const QRegularExpression monthYear(QStringLiteral(R"(^([a-z]+)\.?,?\s+(\d{4})$)"));

    QRegularExpressionMatch m = isoDay.match(lower);
    if (m.hasMatch()) {
        return dayRange(m.captured(1).toInt(), m.captured(2).toInt(), m.captured(3).toInt());
    }

    m = isoMonth.match(lower);
    if (m.hasMatch()) {
        return monthRange(m.captured(1).toInt(), m.captured(2).toInt());
    }

    m = yearOnly.match(lower);
    if (m.hasMatch()) {
        const int year = m.captured(1).toInt();
        return DateRange{QDate(year, 1, 1), QDate(year, 12, 31)};
    }

    m = dayMonthYear.match(lower);
    if (m.hasMatch()) {
        const int month = monthFromName(m.captured(2));
        if (month == 0) {
            return std::nullopt;
        }
        return dayRange(m.captured(3).toInt(), month, m.captured(1).toInt());
    }

    m = monthDayYear.match(lower);
    if (m.hasMatch()) {
        const int month = monthFromName(m.captured(1));
        if (month == 0) {
            return std::nullopt;
        }
        return dayRange(m.captured(3).toInt(), month, m.captured(2).toInt());
    }

    m = monthYear.match(lower);
    if (m.hasMatch()) {
        const int month = monthFromName(m.captured(1));
        if (month == 0) {
            return std::nullopt;
        }
        return monthRange(m.captured(2).toInt(), month);
    }

    return std::nullopt;
}

} // namespace sx
