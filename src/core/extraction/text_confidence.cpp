#include "core/extraction/text_confidence.h"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>

namespace ild {

double estimateTextConfidence(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return 0.0;
    }

    int alnum = 0;
    for (const QChar ch : trimmed) {
        if (ch.isLetterOrNumber() || ch.unicode() >= 0x0900) {
            ++alnum;
        }
    }
    const double alnumRatio = static_cast<double>(alnum) / static_cast<double>(trimmed.size());

    static const QRegularExpression whitespaceRegex(QStringLiteral("\\s+"));
    const QStringList words = trimmed.split(whitespaceRegex, Qt::SkipEmptyParts);
    if (words.isEmpty()) {
        return 0.0;
    }

    qsizetype totalWordLength = 0;
    for (const QString& word : words) {
        totalWordLength += word.size();
    }
    const double meanWordLength =
        static_cast<double>(totalWordLength) / static_cast<double>(words.size());

    double lengthScore = 1.0;
    if (meanWordLength < 2.0) {
        lengthScore = 0.5;
    } else if (meanWordLength > 15.0) {
        lengthScore = 0.7;
    }

    const double wordFactor = std::min(1.0, static_cast<double>(words.size()) / 10.0);
    return std::clamp(alnumRatio * lengthScore * wordFactor, 0.0, 1.0);
}

} // namespace ild
