#include "core/graph/weight_model.h"
#include "core/graph/sentiment_scorer.h"

#include <algorithm>

namespace gr {

WeightModel::WeightModel(const SentimentScorer* sentiment, const WeightModelParams& params)
    : m_sentiment(sentiment)
    , m_params(params)
{
}

double WeightModel::playtimeZScore(int64_t playtime, double mean, double stdDev)
{
    // A single observation (or identical playtimes) has no spread.
    if (stdDev == 0.0) {
        return 0.0;
    }
    return (static_cast<double>(playtime) - mean) / stdDev;
}

WeightBreakdown WeightModel::breakdown(int64_t playtime, double itemMeanPlaytime,
                                       double itemStdPlaytime,
                                       std::optional<bool> recommend,
                                       const std::optional<QString>& review) const
{
    WeightBreakdown result;

    result.playtimeTerm = m_params.playtimeWeight
                          * playtimeZScore(playtime, itemMeanPlaytime, itemStdPlaytime);

    if (recommend.has_value()) {
        result.recommendTerm = *recommend ? m_params.recommendBonus
                                          : m_params.notRecommendPenalty;
    }

    if (m_sentiment != nullptr && review.has_value() && !review->trimmed().isEmpty()) {
        result.sentimentTerm = m_sentiment->score(*review);
    }

    const double sum = result.playtimeTerm + result.recommendTerm + result.sentimentTerm;
    result.weight = std::max(0.0, sum);
    return result;
}

double WeightModel::weight(int64_t playtime, double itemMeanPlaytime, double itemStdPlaytime,
                           std::optional<bool> recommend,
                           const std::optional<QString>& review) const
{
    return breakdown(playtime, itemMeanPlaytime, itemStdPlaytime, recommend, review).weight;
}

} // namespace gr
