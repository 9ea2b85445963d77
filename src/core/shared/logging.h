#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(plCore)
Q_DECLARE_LOGGING_CATEGORY(plStore)
Q_DECLARE_LOGGING_CATEGORY(plEmbedding)
Q_DECLARE_LOGGING_CATEGORY(plRetrieval)
Q_DECLARE_LOGGING_CATEGORY(plEvidence)
Q_DECLARE_LOGGING_CATEGORY(plIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
