#include "core/shared/logging.h"

// Debug output is off unless enabled by a filter rule (QT_LOGGING_RULES or
// the CLI's --verbose).
Q_LOGGING_CATEGORY(grCore, "gr.core", QtInfoMsg)
Q_LOGGING_CATEGORY(grIngest, "gr.ingest", QtInfoMsg)
Q_LOGGING_CATEGORY(grGraph, "gr.graph", QtInfoMsg)
Q_LOGGING_CATEGORY(grTaxonomy, "gr.taxonomy", QtInfoMsg)
Q_LOGGING_CATEGORY(grRanking, "gr.ranking", QtInfoMsg)
