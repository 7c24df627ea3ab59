#include "core/ranking/recommendation_engine.h"
#include "core/graph/interaction_graph.h"
#include "core/ranking/category_lookup_cache.h"
#include "core/shared/logging.h"
#include "core/taxonomy/category_tree.h"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace gr {

RecommendationEngine::RecommendationEngine(const InteractionGraph& graph,
                                           const CategoryTree& tree)
    : m_graph(graph)
    , m_tree(tree)
{
}

double RecommendationEngine::normalizeScore(double rawScore, int supportCount,
                                            double boostFactor)
{
    if (supportCount <= 0) {
        return 0.0;
    }
    // Damp items that co-occur only because they are globally popular.
    return rawScore / std::log(1.0 + static_cast<double>(supportCount)) * boostFactor;
}

const Vertex* RecommendationEngine::resolveLikedItem(const QString& likedItem) const
{
    const Vertex* liked = m_graph.vertex(likedItem);
    if (liked == nullptr || liked->kind() != VertexKind::Item) {
        LOG_INFO(grRanking, "recommend: '%s' is not a known item", qUtf8Printable(likedItem));
        return nullptr;
    }
    return liked;
}

QHash<QString, CandidateScore> RecommendationEngine::aggregate(const Vertex& liked,
                                                             const CandidateFilter& accept) const
{
    QHash<QString, CandidateScore> candidates;
    QHash<QString, bool> accepted;

    for (const auto& [user, likedWeight] : liked.neighbours()) {
        Q_UNUSED(likedWeight);
        if (user->kind() != VertexKind::User) {
            continue;
        }

        // At most one edge per user-item pair, so each user supports a
        // candidate once.
        for (const auto& [other, weight] : user->neighbours()) {
            if (other->kind() != VertexKind::Item || other == &liked) {
                continue;
            }

            auto gate = accepted.constFind(other->id());
            if (gate == accepted.constEnd()) {
                gate = accepted.insert(other->id(), accept(other->id()));
            }
            if (!gate.value()) {
                continue;
            }

            CandidateScore& candidate = candidates[other->id()];
            candidate.rawScore += weight;
            candidate.supportCount += 1;
        }
    }
    return candidates;
}

void RecommendationEngine::rank(QHash<QString, CandidateScore>& candidates, int topK,
                                double boostFactor, RecommendationResult& result)
{
    std::vector<std::pair<QString, double>> ordered;
    ordered.reserve(static_cast<size_t>(candidates.size()));

    for (auto it = candidates.begin(); it != candidates.end(); ++it) {
        CandidateScore& candidate = it.value();
        candidate.finalScore = normalizeScore(candidate.rawScore, candidate.supportCount,
                                              boostFactor);
        result.scores.insert(it.key(), candidate.finalScore);
        ordered.emplace_back(it.key(), candidate.finalScore);

        LOG_DEBUG(grRanking, "candidate '%s': raw=%.3f support=%d final=%.3f",
                  qUtf8Printable(it.key()), candidate.rawScore, candidate.supportCount,
                  candidate.finalScore);
    }
    result.breakdown = candidates;

    // Sort by (finalScore DESC, name ASC) for stable tie-breaking
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const std::pair<QString, double>& a,
                        const std::pair<QString, double>& b) {
                         if (a.second != b.second) {
                             return a.second > b.second;
                         }
                         return a.first < b.first;
                     });

    const size_t limit = static_cast<size_t>(std::max(topK, 0));
    for (size_t i = 0; i < ordered.size() && i < limit; ++i) {
        result.rankedItems.append(ordered[i].first);
    }
}

RecommendationResult RecommendationEngine::recommend(const QString& likedItem, int topK,
                                                     double boostFactor,
                                                     CategoryLookupCache& cache) const
{
    RecommendationResult result;

    const Vertex* liked = resolveLikedItem(likedItem);
    if (liked == nullptr) {
        return result;
    }

    const QSet<QString> likedCategories = cache.lookup(likedItem, m_tree);
    if (likedCategories.isEmpty()) {
        LOG_INFO(grRanking, "recommend: '%s' has no categories", qUtf8Printable(likedItem));
        return result;
    }

    QHash<QString, CandidateScore> candidates = aggregate(
        *liked, [&](const QString& candidate) {
            return cache.lookup(candidate, m_tree).intersects(likedCategories);
        });

    rank(candidates, topK, boostFactor, result);

    for (const QString& item : result.rankedItems) {
        result.categories.insert(item, cache.lookup(item, m_tree));
    }

    LOG_INFO(grRanking, "recommend: '%s' -> %lld candidates, %lld ranked",
             qUtf8Printable(likedItem), static_cast<long long>(result.scores.size()),
             static_cast<long long>(result.rankedItems.size()));
    return result;
}

RecommendationResult RecommendationEngine::recommend(const QString& likedItem, int topK,
                                                     double boostFactor) const
{
    CategoryLookupCache cache;
    return recommend(likedItem, topK, boostFactor, cache);
}

RecommendationResult RecommendationEngine::recommendUnfiltered(const QString& likedItem,
                                                               int topK) const
{
    RecommendationResult result;

    const Vertex* liked = resolveLikedItem(likedItem);
    if (liked == nullptr) {
        return result;
    }

    QHash<QString, CandidateScore> candidates = aggregate(
        *liked, [](const QString&) { return true; });
    rank(candidates, topK, 1.0, result);

    const CategoryIndex& index = m_tree.categoryIndex();
    for (const QString& item : result.rankedItems) {
        result.categories.insert(item, index.value(item));
    }
    return result;
}

} // namespace gr
