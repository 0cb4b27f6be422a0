#pragma once

#include <QString>

namespace ild {

// A contiguous window of normalized document text.
// [charStart, charEnd) indexes into the document text the chunk was cut
// from; pageStart/pageEnd are zero-based page indexes.
struct Chunk {
    QString chunkId;
    QString documentId;
    int sequenceIndex = 0;
    int tokenStart = 0;
    int tokenCount = 0;
    int charStart = 0;
    int charEnd = 0;
    int pageStart = 0;
    int pageEnd = 0;
    QString text;
};

// Stable chunk id "documentId:tokenStart", the start zero-padded to eight
// digits so ids of one document sort in window order.
QString computeChunkId(const QString& documentId, int tokenStart);

// -1 when the id was not produced by computeChunkId.
int tokenStartFromChunkId(const QString& chunkId);

} // namespace ild
