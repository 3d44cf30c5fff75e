#pragma once

#include <QDate>
#include <QString>

#include <vector>

namespace sx {

// Finds calendar days mentioned in chunk text (ISO dates and spelled-out
// English dates). Results are sorted and unique; years outside 1900-2199
// are ignored as noise.
class DateExtractor {
public:
    static std::vector<QDate> extract(const QString& text);

    // Sorted union of two date sets.
    static std::vector<QDate> merge(const std::vector<QDate>& a, const std::vector<QDate>& b);
};

} // namespace sx
