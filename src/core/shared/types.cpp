#include "core/shared/types.h"

namespace ild {

QString pageOutcomeToString(PageOutcome outcome)
{
    switch (outcome) {
    case PageOutcome::Extracted:    return QStringLiteral("extracted");
    case PageOutcome::Exhausted:    return QStringLiteral("exhausted");
    case PageOutcome::RenderFailed: return QStringLiteral("render_failed");
    case PageOutcome::NotAttempted: return QStringLiteral("not_attempted");
    }
    return QStringLiteral("not_attempted");
}

PageOutcome pageOutcomeFromString(const QString& str)
{
    if (str == QLatin1String("extracted"))     return PageOutcome::Extracted;
    if (str == QLatin1String("exhausted"))     return PageOutcome::Exhausted;
    if (str == QLatin1String("render_failed")) return PageOutcome::RenderFailed;
    return PageOutcome::NotAttempted;
}

} // namespace ild
