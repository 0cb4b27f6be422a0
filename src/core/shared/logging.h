#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ildCore)
Q_DECLARE_LOGGING_CATEGORY(ildIndex)
Q_DECLARE_LOGGING_CATEGORY(ildExtraction)
Q_DECLARE_LOGGING_CATEGORY(ildRetrieval)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
