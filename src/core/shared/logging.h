#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(sxCore)
Q_DECLARE_LOGGING_CATEGORY(sxIndex)
Q_DECLARE_LOGGING_CATEGORY(sxEmbed)
Q_DECLARE_LOGGING_CATEGORY(sxSearch)
Q_DECLARE_LOGGING_CATEGORY(sxStore)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
