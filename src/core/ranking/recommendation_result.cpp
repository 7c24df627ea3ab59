#include "core/ranking/recommendation_result.h"

#include <QJsonArray>

namespace gr {

QJsonObject recommendationToJson(const QString& likedItem, const RecommendationResult& result)
{
    QJsonArray recommendations;
    for (const QString& item : result.rankedItems) {
        const CandidateScore candidate = result.breakdown.value(item);

        QStringList categories = result.categories.value(item).values();
        categories.sort();

        QJsonObject obj;
        obj[QStringLiteral("name")] = item;
        obj[QStringLiteral("score")] = result.scores.value(item);
        obj[QStringLiteral("rawScore")] = candidate.rawScore;
        obj[QStringLiteral("supportCount")] = candidate.supportCount;
        obj[QStringLiteral("categories")] = QJsonArray::fromStringList(categories);
        recommendations.append(obj);
    }

    QJsonObject json;
    json[QStringLiteral("likedItem")] = likedItem;
    json[QStringLiteral("candidateCount")] = static_cast<int>(result.scores.size());
    json[QStringLiteral("recommendations")] = recommendations;
    return json;
}

} // namespace gr
