#pragma once

#include <QString>

namespace ild {

// Fatal for one document only. Reported at the ingestion boundary with a
// stable reason code; never carries a raw exception.
struct IngestionError {
    enum class Reason {
        UnreadablePdf,
        NoTextExtracted,
        StorageFailure,
        Cancelled,
    };

    Reason reason = Reason::UnreadablePdf;
    QString message;
};

// "unreadable_pdf", "no_text_extracted", "storage_failure", "cancelled"
QString ingestionReasonToString(IngestionError::Reason reason);

// Startup failure of a persisted index. The chunk store stays usable and
// Engine::rebuildIndexes() recovers from any of these.
struct IndexError {
    enum class Kind {
        StorageUnavailable,
        Corrupt,
        Missing,
        ModelMismatch,
    };

    Kind kind = Kind::Corrupt;
    QString message;
};

QString indexErrorKindToString(IndexError::Kind kind);

} // namespace ild
