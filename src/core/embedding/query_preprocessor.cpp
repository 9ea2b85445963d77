#include "core/embedding/query_preprocessor.h"

#include <QRegularExpression>

namespace pl {

const std::vector<QueryPreprocessor::Expansion>& QueryPreprocessor::expansions()
{
    static const std::vector<Expansion> kExpansions = {
        {QStringLiteral("PCP"), QStringLiteral("primary care provider physician doctor")},
        {QStringLiteral("MCP"), QStringLiteral("plan CalOptima Health organization entity")},
        {QStringLiteral("member"), QStringLiteral("enrollee beneficiary patient client")},
        {QStringLiteral("auth"),
         QStringLiteral("authorization prior auth preauthorization approval permission")},
        {QStringLiteral("notify"), QStringLiteral("inform advise alert communicate notification")},
        {QStringLiteral("days"), QStringLiteral("calendar days business days working days")},
        {QStringLiteral("within"), QStringLiteral("no later than not to exceed by")},
        {QStringLiteral("shall"), QStringLiteral("must will ensure require mandate")},
        {QStringLiteral("claim"), QStringLiteral("claims billing")},
        {QStringLiteral("EOB"),
         QStringLiteral("explanation of benefits remittance advice denial letter")},
        {QStringLiteral("hospice"), QStringLiteral("end of life care palliative")},
        {QStringLiteral("retrospective"), QStringLiteral("retro retroactive")},
        {QStringLiteral("direct payment"), QStringLiteral("direct pay")},
        {QStringLiteral("room and board"), QStringLiteral("room board accommodation")},
    };
    return kExpansions;
}

QString QueryPreprocessor::boilerplateTerms()
{
    return QStringLiteral("policy procedure guideline standard requirement compliance healthcare");
}

QString QueryPreprocessor::preprocess(const QString& question)
{
    QString processed = question.toLower();

    for (const Expansion& expansion : expansions()) {
        const QRegularExpression pattern(
            QStringLiteral("\\b") + QRegularExpression::escape(expansion.first.toLower())
                + QStringLiteral("\\b"),
            QRegularExpression::CaseInsensitiveOption);
        processed.replace(pattern, expansion.first + QLatin1Char(' ') + expansion.second);
    }

    processed += QLatin1Char(' ') + boilerplateTerms();
    return processed;
}

} // namespace pl
