#include "core/text/text_normalizer.h"

#include <QStringList>

namespace ild {

bool TextNormalizer::isStrippedFormatChar(char16_t code)
{
    switch (code) {
    case 0x00AD: // soft hyphen
    case 0x200B: // zero width space
    case 0x200C: // zero width non-joiner
    case 0x200D: // zero width joiner
    case 0x200E: // left-to-right mark
    case 0x200F: // right-to-left mark
    case 0x2060: // word joiner
    case 0xFEFF: // byte order mark
        return true;
    default:
        return false;
    }
}

QString TextNormalizer::normalize(const QString& text)
{
    if (text.isEmpty()) {
        return text;
    }

    // Pass 1: strip controls and zero-width characters. Whitespace controls
    // become a plain space so words on either side stay separated.
    QString stripped;
    stripped.reserve(text.size());
    for (const QChar ch : text) {
        const char16_t code = ch.unicode();
        if (isStrippedFormatChar(code)) {
            continue;
        }
        if (ch.category() == QChar::Other_Control) {
            if (ch.isSpace()) {
                stripped.append(QLatin1Char(' '));
            }
            continue;
        }
        stripped.append(ch);
    }

    // Pass 2: NFC after stripping, so a joiner between base and mark does
    // not block composition.
    const QString composed = stripped.normalized(QString::NormalizationForm_C);

    // Pass 3: collapse whitespace runs and trim.
    QString collapsed;
    collapsed.reserve(composed.size());
    bool pendingSpace = false;
    for (const QChar ch : composed) {
        if (ch.isSpace()) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !collapsed.isEmpty()) {
            collapsed.append(QLatin1Char(' '));
        }
        pendingSpace = false;
        collapsed.append(ch);
    }

    return collapsed;
}

bool TextNormalizer::isDevanagari(QChar ch)
{
    const char16_t code = ch.unicode();
    return code >= 0x0900 && code <= 0x097F;
}

bool TextNormalizer::containsDevanagari(const QString& text)
{
    for (const QChar ch : text) {
        if (isDevanagari(ch)) {
            return true;
        }
    }
    return false;
}

TextNormalizer::ScriptSplit TextNormalizer::splitMixedScript(const QString& text)
{
    QStringList devanagariRuns;
    QStringList otherRuns;

    QString current;
    bool currentIsDevanagari = false;

    auto flush = [&]() {
        const QString run = current.trimmed();
        if (!run.isEmpty()) {
            (currentIsDevanagari ? devanagariRuns : otherRuns).append(run);
        }
        current.clear();
    };

    for (const QChar ch : text) {
        const bool devanagari = isDevanagari(ch);
        if (!current.isEmpty() && devanagari != currentIsDevanagari) {
            flush();
        }
        currentIsDevanagari = devanagari;
        current.append(ch);
    }
    flush();

    ScriptSplit split;
    split.devanagari = devanagariRuns.join(QLatin1Char(' '));
    split.other = otherRuns.join(QLatin1Char(' '));
    return split;
}

} // namespace ild
