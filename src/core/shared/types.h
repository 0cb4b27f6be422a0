#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace ild {

// Character range of one page inside the concatenated document text.
// Pages that produced no text have charStart == charEnd.
struct PageOffset {
    int pageIndex = 0;
    int charStart = 0;
    int charEnd = 0;
};

// How a page's text was obtained. NotAttempted is used for pages skipped by
// cancellation; it is never reported for a page that ran through backends.
enum class PageOutcome {
    Extracted,
    Exhausted,
    RenderFailed,
    NotAttempted,
};

QString pageOutcomeToString(PageOutcome outcome);
PageOutcome pageOutcomeFromString(const QString& str);

struct PageResult {
    int pageIndex = 0;
    QString text;
    double confidence = 0.0;
    QString backendName;
    PageOutcome outcome = PageOutcome::NotAttempted;
    QStringList attemptedBackends;
    int durationMs = 0;
};

struct Document {
    QString id;
    QString filename;
    int pageCount = 0;
    QDateTime ingestedAt;
    std::vector<double> pageConfidences;
    QStringList pageBackends;
    QString contentHash;
    int chunkCount = 0;
    int embeddedChunkCount = 0;
};

// One (chunk id, score) pair from a single index. Higher is closer.
struct ScoredChunk {
    QString chunkId;
    double score = 0.0;
};

} // namespace ild
