#include "core/query/glob_matcher.h"

#include <cstring>

namespace sx {

GlobMatcher::GlobMatcher(const QString& pattern)
    : m_pattern(pattern)
    , m_patternUtf8(pattern.toUtf8())
{
}

bool GlobMatcher::matches(const QString& path) const
{
    if (m_patternUtf8.isEmpty()) {
        return false;
    }

    const QByteArray pathUtf8 = path.toUtf8();
    const char* pattern = m_patternUtf8.constData();
    const char* fullPath = pathUtf8.constData();

    if (!m_patternUtf8.contains('/')) {
        // Component pattern: match against each path component.
        const char* component = fullPath;
        while (*component) {
            const char* slash = std::strchr(component, '/');
            const QByteArray part = slash
                ? QByteArray(component, static_cast<int>(slash - component))
                : QByteArray(component);
            if (!part.isEmpty() && matchImpl(pattern, part.constData())) {
                return true;
            }
            if (!slash) {
                break;
            }
            component = slash + 1;
        }
        return false;
    }

    // Path pattern: full path first, then each suffix after a '/'.
    if (matchImpl(pattern, fullPath)) {
        return true;
    }
    for (const char* p = std::strchr(fullPath, '/'); p; p = std::strchr(p + 1, '/')) {
        if (*(p + 1) != '\0' && matchImpl(pattern, p + 1)) {
            return true;
        }
    }
    return false;
}

bool GlobMatcher::matchGlob(const QString& pattern, const QString& path)
{
    return GlobMatcher(pattern).matches(path);
}

bool GlobMatcher::matchImpl(const char* pattern, const char* path)
{
    while (*pattern && *path) {
        if (*pattern == '*') {
            if (*(pattern + 1) == '*') {
                pattern += 2;

                // '**/' also matches zero directories.
                if (*pattern == '/') {
                    ++pattern;
                }
                if (*pattern == '\0') {
                    return true;
                }

                for (const char* p = path; *p; ++p) {
                    if (matchImpl(pattern, p)) {
                        return true;
                    }
                }
                return matchImpl(pattern, path + std::strlen(path));
            }

            ++pattern;
            if (*pattern == '\0') {
                return std::strchr(path, '/') == nullptr;
            }

            for (const char* p = path; *p && *p != '/'; ++p) {
                if (matchImpl(pattern, p)) {
                    return true;
                }
            }
            // Zero-length match right before a '/'.
            const char* slash = std::strchr(path, '/');
            return slash && matchImpl(pattern, slash);
        }

        if (*pattern == '?') {
            if (*path == '/') {
                return false;
            }
            ++pattern;
            ++path;
            continue;
        }

        if (*pattern != *path) {
            return false;
        }

        ++pattern;
        ++path;
    }

    // Consume trailing '*' or '**' in pattern.
    while (*pattern == '*') {
        ++pattern;
    }

    return *pattern == '\0' && *path == '\0';
}

} // namespace sx
