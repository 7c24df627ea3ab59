#include "recommender_service.h"

#include "core/graph/sentiment_scorer.h"
#include "core/graph/weight_model.h"
#include "core/ingest/catalog_reader.h"
#include "core/ingest/record_reader.h"
#include "core/ranking/recommendation_engine.h"
#include "core/shared/logging.h"
#include "core/taxonomy/category_tree.h"

#include <QElapsedTimer>

#include <optional>

namespace gr {

namespace {

WeightModelParams weightParamsFor(const Settings& settings)
{
    WeightModelParams params;
    params.playtimeWeight = settings.playtimeWeight;
    params.recommendBonus = settings.recommendBonus;
    params.notRecommendPenalty = settings.notRecommendPenalty;
    return params;
}

} // anonymous namespace

RecommenderService::RecommenderService(const Settings& settings)
    : m_settings(settings)
    , m_resultCache(settings.cacheMaxEntries)
    , m_history(settings.historyLimit)
{
    if (m_settings.sentimentEnabled) {
        m_sentiment = std::make_unique<LexiconSentimentScorer>();
    }
}

RecommenderService::~RecommenderService() = default;

bool RecommenderService::loadData()
{
    QElapsedTimer timer;
    timer.start();

    std::optional<RecordReadResult> records = RecordReader::readFile(m_settings.recordsPath);
    if (!records.has_value()) {
        return false;
    }

    std::optional<CatalogReadResult> catalog = CatalogReader::readFile(m_settings.catalogPath);
    if (!catalog.has_value()) {
        return false;
    }

    loadFrom(records->records, catalog->entries);
    m_buildReport.recordsSkipped += records->linesSkipped;

    LOG_INFO(grCore, "Loaded %s and %s in %lld ms",
             qUtf8Printable(m_settings.recordsPath), qUtf8Printable(m_settings.catalogPath),
             static_cast<long long>(timer.elapsed()));
    return true;
}

void RecommenderService::loadFrom(const std::vector<InteractionRecord>& records,
                                  const std::vector<CatalogEntry>& catalog)
{
    // The engine borrows the graph and tree; drop it before replacing them.
    m_engine.reset();
    m_lookupCache.clear();
    m_resultCache.clear();

    // Two passes: population stats over every record, then weights.
    const QHash<QString, ItemStats> stats = computePlaytimeStats(records);
    const WeightModel weightModel(m_sentiment.get(), weightParamsFor(m_settings));
    m_graph = GraphBuilder::build(records, stats, weightModel, &m_buildReport);

    m_tree = std::make_unique<CategoryTree>(m_settings.rootLabel);
    CatalogReader::buildTree(catalog, *m_tree);
    m_tree->categoryIndex();

    m_engine = std::make_unique<RecommendationEngine>(m_graph, *m_tree);
}

RecommendationResult RecommenderService::recommend(const QString& likedItem, int topK,
                                                   double boostFactor)
{
    m_history.record(likedItem);

    if (!isLoaded()) {
        LOG_WARN(grCore, "recommend called before data was loaded");
        return {};
    }

    const RecommendationRequest request{likedItem, topK, boostFactor};
    if (std::optional<RecommendationResult> cached = m_resultCache.get(request)) {
        return *cached;
    }

    RecommendationResult result = m_engine->recommend(likedItem, topK, boostFactor,
                                                      m_lookupCache);
    m_resultCache.put(request, result);
    return result;
}

RecommendationResult RecommenderService::recommend(const QString& likedItem)
{
    return recommend(likedItem, m_settings.defaultTopK, m_settings.boostFactor);
}

RecommendationResult RecommenderService::recommendUnfiltered(const QString& likedItem, int topK)
{
    m_history.record(likedItem);

    if (!isLoaded()) {
        LOG_WARN(grCore, "recommendUnfiltered called before data was loaded");
        return {};
    }
    return m_engine->recommendUnfiltered(likedItem, topK);
}

} // namespace gr
