#pragma once

#include <QString>
#include <QStringList>

namespace pl {

// SentenceSplitter -- punctuation-based segmentation of page text.
class SentenceSplitter {
public:
    // Replace non-breaking spaces, collapse whitespace runs to one space, trim.
    static QString normalize(const QString& text);

    // Split normalized text at whitespace that follows '.', '?' or '!' and
    // precedes an uppercase letter or '('. Never returns an empty list for
    // input that is non-empty after normalization: when nothing splits, the
    // whole normalized text is the single sentence.
    static QStringList split(const QString& text);
};

} // namespace pl
