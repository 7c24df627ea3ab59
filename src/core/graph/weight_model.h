#pragma once

#include <QString>

#include <cstdint>
#include <optional>

namespace gr {

class SentimentScorer;

struct WeightModelParams {
    double playtimeWeight = 0.5;
    double recommendBonus = 2.0;
    double notRecommendPenalty = -0.5;
};

// Per-term contributions, kept for transparency in diagnostics and tests.
struct WeightBreakdown {
    double playtimeTerm = 0.0;
    double recommendTerm = 0.0;
    double sentimentTerm = 0.0;
    double weight = 0.0;
};

class WeightModel {
public:
    // sentiment may be null, in which case review text contributes nothing.
    explicit WeightModel(const SentimentScorer* sentiment = nullptr,
                         const WeightModelParams& params = {});

    // Edge weight of one interaction: playtime z-score against the item's
    // population stats, explicit recommendation, and review sentiment,
    // clamped at zero.
    double weight(int64_t playtime, double itemMeanPlaytime, double itemStdPlaytime,
                  std::optional<bool> recommend,
                  const std::optional<QString>& review) const;

    WeightBreakdown breakdown(int64_t playtime, double itemMeanPlaytime, double itemStdPlaytime,
                              std::optional<bool> recommend,
                              const std::optional<QString>& review) const;

    // z = std == 0 ? 0 : (playtime - mean) / std
    static double playtimeZScore(int64_t playtime, double mean, double stdDev);

    const WeightModelParams& params() const { return m_params; }

private:
    const SentimentScorer* m_sentiment = nullptr;
    WeightModelParams m_params;
};

} // namespace gr
