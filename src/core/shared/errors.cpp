#include "core/shared/errors.h"

namespace ild {

QString ingestionReasonToString(IngestionError::Reason reason)
{
    switch (reason) {
    case IngestionError::Reason::UnreadablePdf:   return QStringLiteral("unreadable_pdf");
    case IngestionError::Reason::NoTextExtracted: return QStringLiteral("no_text_extracted");
    case IngestionError::Reason::StorageFailure:  return QStringLiteral("storage_failure");
    case IngestionError::Reason::Cancelled:       return QStringLiteral("cancelled");
    }
    return QStringLiteral("unreadable_pdf");
}

QString indexErrorKindToString(IndexError::Kind kind)
{
    switch (kind) {
    case IndexError::Kind::StorageUnavailable: return QStringLiteral("storage_unavailable");
    case IndexError::Kind::Corrupt:            return QStringLiteral("corrupt");
    case IndexError::Kind::Missing:            return QStringLiteral("missing");
    case IndexError::Kind::ModelMismatch:      return QStringLiteral("model_mismatch");
    }
    return QStringLiteral("corrupt");
}

} // namespace ild
