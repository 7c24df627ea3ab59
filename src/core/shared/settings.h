#pragma once

#include <QString>

namespace gr {

struct Settings {
    // Inputs produced by the external loader and classifier
    QString recordsPath;
    QString catalogPath;
    QString rootLabel = QStringLiteral("All Games");

    // Ranking
    int defaultTopK = 15;
    double boostFactor = 1.5;

    // Edge weight synthesis
    double playtimeWeight = 0.5;
    double recommendBonus = 2.0;
    double notRecommendPenalty = -0.5;
    bool sentimentEnabled = true;

    // Session
    int historyLimit = 10;
    int cacheMaxEntries = 64;
};

} // namespace gr
