#pragma once

#include <QHash>
#include <QString>

namespace gr {

// Maps free review text to a compound polarity in [-1, 1].
class SentimentScorer {
public:
    virtual ~SentimentScorer() = default;

    virtual double score(const QString& text) const = 0;
};

// Valence-lexicon scorer. Word valences are on a [-4, 4] scale, a negator in
// the three preceding tokens flips and dampens a word, and the summed valence
// is squashed with x / sqrt(x^2 + alpha).
class LexiconSentimentScorer : public SentimentScorer {
public:
    LexiconSentimentScorer();

    double score(const QString& text) const override;

    // Adds or overrides a lexicon entry. Words are matched lower-cased.
    void setValence(const QString& word, double valence);
    int lexiconSize() const { return m_lexicon.size(); }

    static double normalize(double sum, double alpha = 15.0);

private:
    static bool isNegator(const QString& token);

    QHash<QString, double> m_lexicon;
};

} // namespace gr
