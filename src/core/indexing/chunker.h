#pragma once

#include "core/shared/chunk.h"
#include "core/shared/types.h"

#include <QString>
#include <vector>

namespace ild {

// Configuration for the Chunker.
// Defined outside the class to avoid the "default member initializer needed
// within enclosing class" issue in C++.
struct ChunkerConfig {
    int windowTokens = 200;
    int overlapTokens = 40;
};

// Chunker -- sliding token window over normalized document text.
//
// Tokens are whitespace-separated runs. Window i starts at token
// i * (W - O) and spans at most W tokens; the last window ends at the last
// token and may be shorter than W. A document with fewer than W tokens
// yields exactly one chunk, an empty document none.
//
// Span of a chunk: from its first token up to the first token of the next
// window position (or the end of the text for the last chunk), so the
// union of spans is the whole text. Chunk ids come from
// computeChunkId(documentId, tokenStart).
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    std::vector<Chunk> chunk(const QString& documentId,
                             const QString& normalizedText,
                             const std::vector<PageOffset>& pageOffsets) const;

    const Config& config() const { return m_config; }

private:
    struct TokenSpan {
        int start = 0;
        int end = 0;
    };

    static std::vector<TokenSpan> tokenSpans(const QString& text);

    // Page containing the character at pos. Empty pages never match; when
    // pos falls in a separator between pages the preceding page is used.
    static int pageForPosition(const std::vector<PageOffset>& pageOffsets, int pos);

    Config m_config;
};

} // namespace ild
