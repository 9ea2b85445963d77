#pragma once

#include "core/shared/scoring_types.h"

#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <vector>

namespace pl {

// One heuristic signal: adds weight once if pattern matches the sentence.
struct ScoringRule {
    QString name;
    QRegularExpression pattern;
    double weight = 0.0;
};

// SentenceScorer -- evaluates an ordered rule set against a sentence.
//
// score = sum(weights of matching rules)
//       + questionNumberBonus  if the question's first 1-3 digit number
//                              appears in the lower-cased sentence
//       - shortSentencePenalty if length < shortSentenceChars
//       - longSentencePenalty  if length > longSentenceChars
//
// Patterns are case-insensitive. The scorer is immutable after construction
// apart from addRule(), and is safe to share between threads once built.
class SentenceScorer {
public:
    explicit SentenceScorer(const SentenceScoringWeights& weights = {});

    // The first standalone 1-3 digit number in the question, or empty.
    static QString questionNumber(const QString& question);

    double score(const QString& sentence, const QString& questionNumber) const;

    // Names of the rules that match, in rule order. Used for debug logging.
    QStringList matchedRules(const QString& sentence) const;

    void addRule(const QString& name, const QString& pattern, double weight);

    const std::vector<ScoringRule>& rules() const { return m_rules; }
    const SentenceScoringWeights& weights() const { return m_weights; }

private:
    SentenceScoringWeights m_weights;
    std::vector<ScoringRule> m_rules;
};

} // namespace pl
