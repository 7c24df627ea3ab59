#pragma once

#include "core/graph/graph_builder.h"
#include "core/graph/interaction_graph.h"
#include "core/query/recommendation_cache.h"
#include "core/query/search_history.h"
#include "core/ranking/category_lookup_cache.h"
#include "core/ranking/recommendation_result.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QString>

#include <memory>
#include <vector>

namespace gr {

class CategoryTree;
class RecommendationEngine;
class SentimentScorer;

// Owns one build of the graph and taxonomy plus the session state around
// the engine (result cache, lookup cache, search history).
class RecommenderService {
public:
    explicit RecommenderService(const Settings& settings);
    ~RecommenderService();

    // Reads recordsPath and catalogPath and builds everything. Returns false
    // if either file cannot be read; malformed entries are only skipped.
    bool loadData();

    // Builds from already-parsed inputs. Replaces any earlier build and
    // drops all session caches.
    void loadFrom(const std::vector<InteractionRecord>& records,
                  const std::vector<CatalogEntry>& catalog);

    bool isLoaded() const { return m_engine != nullptr; }

    // Records the query in the history, then serves from the result cache or
    // the engine. Returns an empty result before loading.
    RecommendationResult recommend(const QString& likedItem, int topK, double boostFactor);
    RecommendationResult recommend(const QString& likedItem);
    RecommendationResult recommendUnfiltered(const QString& likedItem, int topK);

    const Settings& settings() const { return m_settings; }
    const SearchHistory& history() const { return m_history; }
    const BuildReport& buildReport() const { return m_buildReport; }
    const InteractionGraph& graph() const { return m_graph; }
    const CategoryTree* tree() const { return m_tree.get(); }
    RecommendationCache::Stats cacheStats() const { return m_resultCache.stats(); }

private:
    Settings m_settings;
    std::unique_ptr<SentimentScorer> m_sentiment;

    InteractionGraph m_graph;
    std::unique_ptr<CategoryTree> m_tree;
    std::unique_ptr<RecommendationEngine> m_engine;
    BuildReport m_buildReport;

    CategoryLookupCache m_lookupCache;
    RecommendationCache m_resultCache;
    SearchHistory m_history;
};

} // namespace gr
