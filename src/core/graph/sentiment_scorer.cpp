#include "core/graph/sentiment_scorer.h"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>
#include <cmath>

namespace gr {

namespace {

constexpr double kNegationScalar = -0.74;
constexpr int kNegationWindow = 3;

struct LexiconSeed {
    const char* word;
    double valence;
};

// Subset tuned for game reviews.
constexpr LexiconSeed kSeedLexicon[] = {
    {"good", 1.9},      {"great", 3.1},     {"excellent", 2.7}, {"amazing", 2.8},
    {"awesome", 3.1},   {"love", 3.2},      {"loved", 2.9},     {"like", 1.5},
    {"fun", 2.3},       {"enjoy", 2.2},     {"enjoyed", 2.3},   {"best", 3.2},
    {"beautiful", 2.9}, {"masterpiece", 3.1}, {"addictive", 1.4}, {"recommend", 1.5},
    {"nice", 1.8},      {"cool", 1.3},      {"perfect", 2.7},   {"fantastic", 2.6},
    {"wonderful", 2.7}, {"solid", 1.2},     {"worth", 0.9},     {"happy", 2.7},
    {"bad", -2.5},      {"terrible", -2.1}, {"awful", -2.0},    {"horrible", -2.5},
    {"hate", -2.7},     {"hated", -3.2},    {"boring", -1.3},   {"worst", -3.1},
    {"broken", -1.8},   {"bug", -1.2},      {"buggy", -1.5},    {"crash", -1.9},
    {"crashes", -1.9},  {"waste", -1.8},    {"refund", -0.9},   {"disappointing", -2.2},
    {"disappointed", -1.9}, {"annoying", -1.7}, {"poor", -2.1}, {"lag", -1.0},
    {"laggy", -1.3},    {"ugly", -2.3},     {"sad", -2.1},      {"trash", -2.0},
};

} // anonymous namespace

LexiconSentimentScorer::LexiconSentimentScorer()
{
    for (const LexiconSeed& seed : kSeedLexicon) {
        m_lexicon.insert(QString::fromLatin1(seed.word), seed.valence);
    }
}

void LexiconSentimentScorer::setValence(const QString& word, double valence)
{
    m_lexicon.insert(word.toLower(), valence);
}

double LexiconSentimentScorer::normalize(double sum, double alpha)
{
    if (sum == 0.0) {
        return 0.0;
    }
    const double normalized = sum / std::sqrt(sum * sum + alpha);
    return std::clamp(normalized, -1.0, 1.0);
}

bool LexiconSentimentScorer::isNegator(const QString& token)
{
    static const QStringList negators = {
        QStringLiteral("not"), QStringLiteral("no"), QStringLiteral("never"),
        QStringLiteral("nothing"), QStringLiteral("nobody"), QStringLiteral("without"),
        QStringLiteral("neither"), QStringLiteral("nor"), QStringLiteral("cannot"),
    };
    return negators.contains(token) || token.endsWith(QStringLiteral("n't"));
}

double LexiconSentimentScorer::score(const QString& text) const
{
    static const QRegularExpression splitter(QStringLiteral("[^a-z']+"));
    const QStringList tokens = text.toLower().split(splitter, Qt::SkipEmptyParts);

    double sum = 0.0;
    for (int i = 0; i < tokens.size(); ++i) {
        const auto it = m_lexicon.constFind(tokens.at(i));
        if (it == m_lexicon.constEnd()) {
            continue;
        }

        double valence = it.value();
        const int windowStart = std::max(0, i - kNegationWindow);
        for (int j = windowStart; j < i; ++j) {
            if (isNegator(tokens.at(j))) {
                valence *= kNegationScalar;
                break;
            }
        }
        sum += valence;
    }

    return normalize(sum);
}

} // namespace gr
