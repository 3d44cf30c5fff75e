#pragma once

#include <QByteArray>
#include <QString>

namespace sx {

// Glob matching for file filters.
//
//   *    any run of characters except '/'
//   **   any run of characters including '/'
//   ?    one character except '/'
//
// A pattern without '/' matches any single path component ("*.md" matches
// "notes/today.md"). A pattern with '/' matches the whole path or any suffix
// of it that starts after a '/' ("finance/*" matches "/home/me/finance/q1.md").
class GlobMatcher {
public:
    explicit GlobMatcher(const QString& pattern);

    bool matches(const QString& path) const;
    const QString& pattern() const { return m_pattern; }

    static bool matchGlob(const QString& pattern, const QString& path);

private:
    static bool matchImpl(const char* pattern, const char* path);

    QString m_pattern;
    QByteArray m_patternUtf8;
};

} // namespace sx
