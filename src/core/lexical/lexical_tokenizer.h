#pragma once

#include <QString>
#include <QStringList>

namespace ild {

// LexicalTokenizer -- splits normalized text into index terms for BM25.
//
// A term is a maximal run of letters, digits and combining marks within one
// script. Everything else (spaces, punctuation, danda, hyphens, brackets)
// separates terms, and a switch between Devanagari and any other script
// starts a new term. Latin is lower-cased; nothing is stemmed, so statute
// numbers such as "302" or "498a" survive intact.
class LexicalTokenizer {
public:
    static QStringList tokenize(const QString& normalizedText);

private:
    static bool isTermChar(QChar ch);
};

} // namespace ild
