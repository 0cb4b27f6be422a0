#include "core/shared/chunk.h"

namespace ild {

QString computeChunkId(const QString& documentId, int tokenStart)
{
    return QStringLiteral("%1:%2").arg(documentId).arg(tokenStart, 8, 10, QLatin1Char('0'));
}

int tokenStartFromChunkId(const QString& chunkId)
{
    const int sep = chunkId.lastIndexOf(QLatin1Char(':'));
    if (sep < 0) {
        return -1;
    }
    bool ok = false;
    const int start = chunkId.mid(sep + 1).toInt(&ok);
    return ok && start >= 0 ? start : -1;
}

} // namespace ild
