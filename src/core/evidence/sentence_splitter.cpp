#include "core/evidence/sentence_splitter.h"

#include <QRegularExpression>

namespace pl {

QString SentenceSplitter::normalize(const QString& text)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));

    QString normalized = text;
    normalized.replace(QChar(0x00A0), QLatin1Char(' '));
    normalized.replace(whitespace, QStringLiteral(" "));
    return normalized.trimmed();
}

QStringList SentenceSplitter::split(const QString& text)
{
    static const QRegularExpression boundary(QStringLiteral("(?<=[.?!])\\s+(?=[A-Z(])"));

    const QString cleaned = normalize(text);

    QStringList sentences;
    const QStringList parts = cleaned.split(boundary);
    for (const QString& part : parts) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            sentences.append(trimmed);
        }
    }

    if (sentences.isEmpty()) {
        sentences.append(cleaned);
    }
    return sentences;
}

} // namespace pl
