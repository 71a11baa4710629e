#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ilCore)
Q_DECLARE_LOGGING_CATEGORY(ilIngest)
Q_DECLARE_LOGGING_CATEGORY(ilRelevance)
Q_DECLARE_LOGGING_CATEGORY(ilAnalytics)
Q_DECLARE_LOGGING_CATEGORY(ilPipeline)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
