#pragma once

#include <QChar>
#include <QString>

namespace ild {

// TextNormalizer -- canonical form for mixed Hindi (Devanagari) + English
// text. Applied identically to extracted page text and to queries.
//
// normalize() performs, in order:
// 1. Drop control characters (other than whitespace controls) and
//    zero-width/format characters: ZWSP, ZWNJ, ZWJ, word joiner, BOM,
//    soft hyphen, LRM/RLM
// 2. Unicode NFC
// 3. Collapse every run of whitespace (NBSP, U+2000-U+200A, ideographic
//    space, line/paragraph separators, tabs, newlines) to one ASCII space
// 4. Trim
// Devanagari code points are never transliterated or reordered.
// normalize(normalize(x)) == normalize(x).
class TextNormalizer {
public:
    static QString normalize(const QString& text);

    static bool isDevanagari(QChar ch);
    static bool containsDevanagari(const QString& text);

    struct ScriptSplit {
        QString devanagari;
        QString other;
    };

    // Separates Devanagari runs from everything else. Each side is the
    // space-joined sequence of its runs in original order.
    static ScriptSplit splitMixedScript(const QString& text);

private:
    static bool isStrippedFormatChar(char16_t code);
};

} // namespace ild
