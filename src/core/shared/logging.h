#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(grCore)
Q_DECLARE_LOGGING_CATEGORY(grIngest)
Q_DECLARE_LOGGING_CATEGORY(grGraph)
Q_DECLARE_LOGGING_CATEGORY(grTaxonomy)
Q_DECLARE_LOGGING_CATEGORY(grRanking)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
