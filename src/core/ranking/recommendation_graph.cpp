#include "core/ranking/recommendation_graph.h"

#include <QJsonArray>

namespace gr {

RecommendationGraph RecommendationGraph::build(const QString& likedItem,
                                               const RecommendationResult& result)
{
    RecommendationGraph graph;
    if (result.rankedItems.isEmpty()) {
        return graph;
    }

    graph.m_nodes.push_back({likedItem, 0.0, true});
    for (const QString& item : result.rankedItems) {
        const double score = result.scores.value(item);
        graph.m_nodes.push_back({item, score, false});
        graph.m_edges.push_back({likedItem, item, score});
    }
    return graph;
}

QJsonObject RecommendationGraph::toJson() const
{
    QJsonArray nodes;
    for (const Node& node : m_nodes) {
        QJsonObject obj;
        obj[QStringLiteral("name")] = node.name;
        obj[QStringLiteral("score")] = node.score;
        obj[QStringLiteral("highlight")] = node.highlight;
        nodes.append(obj);
    }

    QJsonArray edges;
    for (const Edge& edge : m_edges) {
        QJsonObject obj;
        obj[QStringLiteral("source")] = edge.source;
        obj[QStringLiteral("target")] = edge.target;
        obj[QStringLiteral("weight")] = edge.weight;
        edges.append(obj);
    }

    QJsonObject json;
    json[QStringLiteral("nodes")] = nodes;
    json[QStringLiteral("edges")] = edges;
    return json;
}

} // namespace gr
