#pragma once

#include <QHash>
#include <QJsonObject>
#include <QSet>
#include <QString>
#include <QStringList>

namespace gr {

// Score breakdown for debugging/transparency
struct CandidateScore {
    double rawScore = 0.0;
    int supportCount = 0;
    double finalScore = 0.0;
};

struct RecommendationResult {
    // At most topK items, by finalScore descending then item name ascending.
    QStringList rankedItems;
    // finalScore of every candidate that passed the category gate.
    QHash<QString, double> scores;
    // Categories of each ranked item.
    QHash<QString, QSet<QString>> categories;
    QHash<QString, CandidateScore> breakdown;

    bool isEmpty() const { return rankedItems.isEmpty() && scores.isEmpty(); }
};

// {likedItem, recommendations: [{name, score, rawScore, supportCount, categories}]}
// with categories sorted for stable output.
QJsonObject recommendationToJson(const QString& likedItem, const RecommendationResult& result);

} // namespace gr
