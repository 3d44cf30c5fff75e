#pragma once

#include <QDate>
#include <QString>

#include <optional>

namespace sx {

// Inclusive range of calendar days.
struct DateRange {
    QDate first;
    QDate last;

    bool contains(const QDate& day) const { return day >= first && day <= last; }
};

// Parses the date argument of a dt filter. A full date yields a single day;
// "2024-03" or "March 2024" the whole month; "2024" the whole year.
//
// Accepted forms: yyyy-MM-dd, yyyy/MM/dd, yyyy-MM, yyyy, "5 March 2024",
// "March 5, 2024", "March 2024", "today", "yesterday".
class DateParser {
public:
    static std::optional<DateRange> parse(const QString& text,
                                          const QDate& today = QDate::currentDate());

    // 1-12 for a full or three-letter English month name, 0 otherwise.
    static int monthFromName(const QString& name);
};

} // namespace sx
