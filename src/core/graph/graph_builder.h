#pragma once

#include "core/graph/interaction_graph.h"
#include "core/shared/types.h"

#include <QHash>
#include <QString>

#include <vector>

namespace gr {

class WeightModel;

struct BuildReport {
    int recordsProcessed = 0;
    int recordsSkipped = 0;
    int duplicatePairs = 0;
    int userCount = 0;
    int itemCount = 0;
    int edgeCount = 0;
};

class GraphBuilder {
public:
    // Single pass over the records. Weights are computed against the
    // pre-aggregated per-item statistics; items missing from stats are
    // treated as mean = std = 0. Invalid records are skipped, never fatal.
    static InteractionGraph build(const std::vector<InteractionRecord>& records,
                                  const QHash<QString, ItemStats>& stats,
                                  const WeightModel& weightModel,
                                  BuildReport* report = nullptr);
};

} // namespace gr
