#pragma once

#include "core/ranking/recommendation_result.h"

#include <QJsonObject>
#include <QString>

#include <vector>

namespace gr {

// Item-only star graph handed to the presentation layer: the liked item at
// the centre, one spoke per ranked item weighted by its score.
class RecommendationGraph {
public:
    struct Node {
        QString name;
        double score = 0.0;
        bool highlight = false;
    };

    struct Edge {
        QString source;
        QString target;
        double weight = 0.0;
    };

    static RecommendationGraph build(const QString& likedItem,
                                     const RecommendationResult& result);

    const std::vector<Node>& nodes() const { return m_nodes; }
    const std::vector<Edge>& edges() const { return m_edges; }

    QJsonObject toJson() const;

private:
    std::vector<Node> m_nodes;
    std::vector<Edge> m_edges;
};

} // namespace gr
