#include "core/graph/graph_builder.h"
#include "core/graph/weight_model.h"
#include "core/shared/logging.h"

namespace gr {

InteractionGraph GraphBuilder::build(const std::vector<InteractionRecord>& records,
                                     const QHash<QString, ItemStats>& stats,
                                     const WeightModel& weightModel,
                                     BuildReport* report)
{
    InteractionGraph graph;
    BuildReport local;

    for (const InteractionRecord& record : records) {
        if (record.userId.isEmpty() || record.itemName.isEmpty() || record.playtime < 0) {
            LOG_WARN(grGraph, "build: skipping invalid record user='%s' item='%s' playtime=%lld",
                     qUtf8Printable(record.userId), qUtf8Printable(record.itemName),
                     static_cast<long long>(record.playtime));
            ++local.recordsSkipped;
            continue;
        }

        const ItemStats itemStats = stats.value(record.itemName);
        const double weight = weightModel.weight(record.playtime,
                                                 itemStats.meanPlaytime,
                                                 itemStats.stdPlaytime,
                                                 record.recommend,
                                                 record.review);

        graph.addVertex(record.userId, VertexKind::User);
        graph.addVertex(record.itemName, VertexKind::Item);

        const bool duplicate = graph.edgeWeight(record.userId, record.itemName).has_value();
        if (!graph.addEdge(record.userId, record.itemName, weight)) {
            // Identity collision between a user id and an item name.
            ++local.recordsSkipped;
            continue;
        }

        if (duplicate) {
            LOG_DEBUG(grGraph, "build: duplicate record for '%s' - '%s', later weight wins",
                      qUtf8Printable(record.userId), qUtf8Printable(record.itemName));
            ++local.duplicatePairs;
        }
        ++local.recordsProcessed;
    }

    local.userCount = graph.vertexCount(VertexKind::User);
    local.itemCount = graph.vertexCount(VertexKind::Item);
    local.edgeCount = graph.edgeCount();

    LOG_INFO(grGraph, "build: %d records -> %d users, %d items, %d edges (%d skipped, %d duplicates)",
             local.recordsProcessed, local.userCount, local.itemCount, local.edgeCount,
             local.recordsSkipped, local.duplicatePairs);

    if (report != nullptr) {
        *report = local;
    }
    return graph;
}

} // namespace gr
