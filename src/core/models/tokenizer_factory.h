#pragma once

#include "core/embedding/tokenizer.h"
#include "core/models/model_manifest.h"

#include <QString>
#include <QStringList>

#include <memory>

namespace ild {

// Vocabulary files named by manifest entries, resolved against the models
// directory. Encoders get a WordPiece tokenizer; vision decoders get the
// plain piece list their output ids index into.
class TokenizerFactory {
public:
    // "wordpiece" is the only encoder tokenizer type. The sequence limit is
    // the entry's maxSeqLength. Returns nullptr on an unsupported type or a
    // missing/empty vocab.
    static std::unique_ptr<WordPieceTokenizer> create(const ModelManifestEntry& entry,
                                                      const QString& modelsDir);

    // One piece per line, id = line number. A tab-separated score column
    // (SentencePiece .vocab export) is dropped. Empty on failure.
    static QStringList loadPieceVocab(const ModelManifestEntry& entry, const QString& modelsDir);

    static QString vocabPath(const ModelManifestEntry& entry, const QString& modelsDir);
};

} // namespace ild
