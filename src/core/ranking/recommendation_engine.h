#pragma once

#include "core/ranking/recommendation_result.h"

#include <QHash>
#include <QSet>
#include <QString>

#include <functional>

namespace gr {

class CategoryLookupCache;
class CategoryTree;
class InteractionGraph;
class Vertex;

// Item-to-item recommendation by co-occurrence in the interaction graph,
// gated by shared top-level categories. Holds references only; the graph and
// tree must outlive the engine and stay unmodified while queries run.
class RecommendationEngine {
public:
    RecommendationEngine(const InteractionGraph& graph, const CategoryTree& tree);

    // Empty result when likedItem is not an item vertex, has no categories,
    // or has no user neighbours. topK <= 0 yields an empty ranked list with
    // scores still populated.
    RecommendationResult recommend(const QString& likedItem, int topK, double boostFactor,
                                   CategoryLookupCache& cache) const;

    // Same, with a request-scoped lookup cache.
    RecommendationResult recommend(const QString& likedItem, int topK,
                                   double boostFactor) const;

    // Co-occurrence ranking without the category gate, boost 1.0.
    RecommendationResult recommendUnfiltered(const QString& likedItem, int topK) const;

    // rawScore / log(1 + supportCount) * boostFactor
    static double normalizeScore(double rawScore, int supportCount, double boostFactor);

private:
    using CandidateFilter = std::function<bool(const QString& candidate)>;

    const Vertex* resolveLikedItem(const QString& likedItem) const;
    QHash<QString, CandidateScore> aggregate(const Vertex& liked,
                                             const CandidateFilter& accept) const;
    static void rank(QHash<QString, CandidateScore>& candidates, int topK, double boostFactor,
                     RecommendationResult& result);

    const InteractionGraph& m_graph;
    const CategoryTree& m_tree;
};

} // namespace gr
