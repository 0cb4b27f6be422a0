#include "core/lexical/lexical_tokenizer.h"
#include "core/text/text_normalizer.h"

namespace ild {

bool LexicalTokenizer::isTermChar(QChar ch)
{
    switch (ch.category()) {
    case QChar::Letter_Uppercase:
    case QChar::Letter_Lowercase:
    case QChar::Letter_Titlecase:
    case QChar::Letter_Modifier:
    case QChar::Letter_Other:
    case QChar::Number_DecimalDigit:
    case QChar::Number_Letter:
    case QChar::Number_Other:
    case QChar::Mark_NonSpacing:
    case QChar::Mark_SpacingCombining:
    case QChar::Mark_Enclosing:
        return true;
    default:
        return false;
    }
}

QStringList LexicalTokenizer::tokenize(const QString& normalizedText)
{
    QStringList terms;
    QString current;
    bool currentIsDevanagari = false;

    for (const QChar ch : normalizedText) {
        if (!isTermChar(ch)) {
            if (!current.isEmpty()) {
                terms.append(current);
                current.clear();
            }
            continue;
        }

        const bool devanagari = TextNormalizer::isDevanagari(ch);
        // A leading combining mark stays with whatever precedes it.
        const bool isMark = ch.isMark();
        if (!current.isEmpty() && !isMark && devanagari != currentIsDevanagari) {
            terms.append(current);
            current.clear();
        }
        if (current.isEmpty() || !isMark) {
            currentIsDevanagari = devanagari;
        }
        current.append(ch.toLower());
    }

    if (!current.isEmpty()) {
        terms.append(current);
    }
    return terms;
}

} // namespace ild
