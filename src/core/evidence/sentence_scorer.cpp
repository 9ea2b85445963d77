#include "core/evidence/sentence_scorer.h"
#include "core/shared/logging.h"

namespace pl {

SentenceScorer::SentenceScorer(const SentenceScoringWeights& weights)
    : m_weights(weights)
{
    // Obligation and timing language
    addRule(QStringLiteral("obligation"),
            QStringLiteral(R"(\b(shall|must|will|ensure|require)\b)"),
            m_weights.obligationWeight);
    addRule(QStringLiteral("dayCount"),
            QStringLiteral(R"(\b(\d{1,3}|\b(?:fourteen|ten|fifteen|thirty|seven|two|three|five|twelve)\b)(?:\s*\(\d{1,3}\))?\s+(calendar|business)\s+days?\b)"),
            m_weights.dayCountWeight);

    // Domain concepts
    addRule(QStringLiteral("authorization"),
            QStringLiteral(R"(\b(prior\s+)?authori[sz]e?[sd]?|pre[-\s]?auth(?:orization)?|approval\b)"),
            m_weights.authorizationWeight);
    addRule(QStringLiteral("hospice"), QStringLiteral(R"(\bhospice\b)"), m_weights.hospiceWeight);
    addRule(QStringLiteral("retrospective"), QStringLiteral(R"(\bretrospective\b)"),
            m_weights.retrospectiveWeight);
    addRule(QStringLiteral("directPayment"), QStringLiteral(R"(\bdirect\s+payment\b)"),
            m_weights.directPaymentWeight);
    addRule(QStringLiteral("primaryCare"), QStringLiteral(R"(\b(pcp|primary\s+care\s+provider)\b)"),
            m_weights.primaryCareWeight);
    addRule(QStringLiteral("notify"), QStringLiteral(R"(\bnotify|notification\b)"),
            m_weights.notifyWeight);
    addRule(QStringLiteral("claim"), QStringLiteral(R"(\bclaim[s]?\b)"), m_weights.claimWeight);
    addRule(QStringLiteral("member"), QStringLiteral(R"(\b(member|enrollee|beneficiary)\b)"),
            m_weights.memberWeight);
    addRule(QStringLiteral("roomAndBoard"), QStringLiteral(R"(\broom\s+and\s+board\b)"),
            m_weights.roomAndBoardWeight);
    addRule(QStringLiteral("explanationOfBenefits"),
            QStringLiteral(R"(\b(explanation\s+of\s+benefits|eob|remittance\s+advice|denial\s+letter)\b)"),
            m_weights.explanationOfBenefitsWeight);

    // Generic policy language
    addRule(QStringLiteral("policyGeneric"),
            QStringLiteral(R"(\b(policy|procedure|guideline|standard|requirement|compliance)\b)"),
            m_weights.policyGenericWeight);
    addRule(QStringLiteral("mandate"),
            QStringLiteral(R"(\b(shall|must|will|ensure|require|mandate)\b)"),
            m_weights.mandateWeight);
    addRule(QStringLiteral("timing"),
            QStringLiteral(R"(\b(within|no later than|not to exceed|prior to|before)\b)"),
            m_weights.timingWeight);
}

void SentenceScorer::addRule(const QString& name, const QString& pattern, double weight)
{
    ScoringRule rule;
    rule.name = name;
    rule.pattern = QRegularExpression(pattern, QRegularExpression::CaseInsensitiveOption);
    rule.weight = weight;
    if (!rule.pattern.isValid()) {
        LOG_ERROR(plEvidence, "Scoring rule '%s' has an invalid pattern: %s",
                  qUtf8Printable(name), qUtf8Printable(rule.pattern.errorString()));
        return;
    }
    m_rules.push_back(std::move(rule));
}

QString SentenceScorer::questionNumber(const QString& question)
{
    static const QRegularExpression numberRegex(QStringLiteral(R"(\b(\d{1,3})\b)"));
    const QRegularExpressionMatch match = numberRegex.match(question);
    return match.hasMatch() ? match.captured(1) : QString();
}

double SentenceScorer::score(const QString& sentence, const QString& questionNumber) const
{
    double total = 0.0;
    for (const ScoringRule& rule : m_rules) {
        if (rule.pattern.match(sentence).hasMatch()) {
            total += rule.weight;
        }
    }

    if (!questionNumber.isEmpty() && sentence.toLower().contains(questionNumber)) {
        total += m_weights.questionNumberBonus;
    }

    const auto length = sentence.size();
    if (length < m_weights.shortSentenceChars) {
        total -= m_weights.shortSentencePenalty;
    }
    if (length > m_weights.longSentenceChars) {
        total -= m_weights.longSentencePenalty;
    }
    return total;
}

QStringList SentenceScorer::matchedRules(const QString& sentence) const
{
    QStringList names;
    for (const ScoringRule& rule : m_rules) {
        if (rule.pattern.match(sentence).hasMatch()) {
            names.append(rule.name);
        }
    }
    return names;
}

} // namespace pl
