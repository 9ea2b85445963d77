#include "core/shared/types.h"

namespace pl {

QString packingTierToString(PackingTier tier)
{
    switch (tier) {
    case PackingTier::None:             return QStringLiteral("none");
    case PackingTier::StrictSentences:  return QStringLiteral("strict");
    case PackingTier::LenientSentences: return QStringLiteral("lenient");
    case PackingTier::WholePages:       return QStringLiteral("whole_pages");
    }
    return QStringLiteral("none");
}

QString pageKey(const QString& documentId, int page)
{
    return documentId + QLatin1Char('#') + QString::number(page);
}

} // namespace pl
