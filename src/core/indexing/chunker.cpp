#include "core/indexing/chunker.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace ild {

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    // Sanity-check config bounds
    if (m_config.windowTokens < 1) {
        LOG_WARN(ildIndex, "Chunker window %d clamped to 1", m_config.windowTokens);
        m_config.windowTokens = 1;
    }
    if (m_config.overlapTokens < 0) {
        m_config.overlapTokens = 0;
    }
    if (m_config.overlapTokens >= m_config.windowTokens) {
        LOG_WARN(ildIndex, "Chunker overlap %d >= window %d, clamped to %d",
                 m_config.overlapTokens, m_config.windowTokens, m_config.windowTokens - 1);
        m_config.overlapTokens = m_config.windowTokens - 1;
    }
}

// ── Public API ──────────────────────────────────────────────

std::vector<Chunk> Chunker::chunk(const QString& documentId,
                                  const QString& normalizedText,
                                  const std::vector<PageOffset>& pageOffsets) const
{
    std::vector<Chunk> chunks;

    const std::vector<TokenSpan> tokens = tokenSpans(normalizedText);
    if (tokens.empty()) {
        return chunks;
    }

    const int tokenCount = static_cast<int>(tokens.size());
    const int textLength = static_cast<int>(normalizedText.size());
    const int step = m_config.windowTokens - m_config.overlapTokens;

    int tokenStart = 0;
    int sequenceIndex = 0;
    while (true) {
        const int tokenEnd = std::min(tokenStart + m_config.windowTokens, tokenCount);
        const bool last = tokenEnd == tokenCount;

        // The first chunk also owns any leading text before token 0.
        const int charStart = sequenceIndex == 0 ? 0 : tokens[static_cast<size_t>(tokenStart)].start;
        const int charEnd = last ? textLength
                                 : tokens[static_cast<size_t>(tokenStart + step)].start;

        Chunk c;
        c.chunkId = computeChunkId(documentId, tokenStart);
        c.documentId = documentId;
        c.sequenceIndex = sequenceIndex;
        c.tokenStart = tokenStart;
        c.tokenCount = tokenEnd - tokenStart;
        c.charStart = charStart;
        c.charEnd = std::max(charEnd, tokens[static_cast<size_t>(tokenEnd - 1)].end);
        c.text = normalizedText.mid(tokens[static_cast<size_t>(tokenStart)].start,
                                    tokens[static_cast<size_t>(tokenEnd - 1)].end
                                        - tokens[static_cast<size_t>(tokenStart)].start);
        c.pageStart = pageForPosition(pageOffsets, tokens[static_cast<size_t>(tokenStart)].start);
        c.pageEnd = std::max(c.pageStart,
                             pageForPosition(pageOffsets,
                                             tokens[static_cast<size_t>(tokenEnd - 1)].end - 1));

        chunks.push_back(std::move(c));

        if (last) {
            break;
        }
        tokenStart += step;
        ++sequenceIndex;
    }

    LOG_DEBUG(ildIndex, "Chunked %s: %d chunks from %d tokens (W=%d, O=%d)",
              qUtf8Printable(documentId),
              static_cast<int>(chunks.size()),
              tokenCount,
              m_config.windowTokens,
              m_config.overlapTokens);

    return chunks;
}

// ── Private helpers ─────────────────────────────────────────

std::vector<Chunker::TokenSpan> Chunker::tokenSpans(const QString& text)
{
    std::vector<TokenSpan> spans;
    const int length = static_cast<int>(text.size());
    int i = 0;
    while (i < length) {
        while (i < length && text[i].isSpace()) {
            ++i;
        }
        if (i >= length) {
            break;
        }
        const int start = i;
        while (i < length && !text[i].isSpace()) {
            ++i;
        }
        spans.push_back(TokenSpan{start, i});
    }
    return spans;
}

int Chunker::pageForPosition(const std::vector<PageOffset>& pageOffsets, int pos)
{
    int best = 0;
    bool found = false;
    for (const PageOffset& page : pageOffsets) {
        if (page.charEnd <= page.charStart) {
            continue;
        }
        if (page.charStart <= pos) {
            best = page.pageIndex;
            found = true;
        }
        if (pos < page.charEnd && page.charStart <= pos) {
            return page.pageIndex;
        }
    }
    if (!found && !pageOffsets.empty()) {
        for (const PageOffset& page : pageOffsets) {
            if (page.charEnd > page.charStart) {
                return page.pageIndex;
            }
        }
    }
    return best;
}

} // namespace ild
