#include "core/models/tokenizer_factory.h"

#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QStringConverter>
#include <QTextStream>

namespace ild {

QString TokenizerFactory::vocabPath(const ModelManifestEntry& entry, const QString& modelsDir)
{
    if (entry.vocab.isEmpty()) {
        return QString();
    }
    return QDir(modelsDir).filePath(entry.vocab);
}

std::unique_ptr<WordPieceTokenizer> TokenizerFactory::create(const ModelManifestEntry& entry,
                                                              const QString& modelsDir)
{
    if (entry.tokenizer.compare(QStringLiteral("wordpiece"), Qt::CaseInsensitive) != 0) {
        LOG_WARN(ildCore, "TokenizerFactory: '%s' asks for tokenizer '%s', only wordpiece is built in",
                 qPrintable(entry.name), qPrintable(entry.tokenizer));
        return nullptr;
    }

    const QString path = vocabPath(entry, modelsDir);
    if (path.isEmpty() || !QFile::exists(path)) {
        LOG_WARN(ildCore, "TokenizerFactory: vocab for '%s' not found (%s)",
                 qPrintable(entry.name), qPrintable(path));
        return nullptr;
    }

    auto tokenizer = std::make_unique<WordPieceTokenizer>(path, entry.maxSeqLength);
    if (!tokenizer->isLoaded()) {
        return nullptr;
    }
    LOG_DEBUG(ildCore, "TokenizerFactory: %zu wordpieces for '%s', max %d tokens",
              tokenizer->vocabSize(), qPrintable(entry.name), tokenizer->maxSequenceLength());
    return tokenizer;
}

QStringList TokenizerFactory::loadPieceVocab(const ModelManifestEntry& entry,
                                             const QString& modelsDir)
{
    QStringList pieces;
    const QString path = vocabPath(entry, modelsDir);
    QFile file(path);
    if (path.isEmpty() || !file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_WARN(ildCore, "TokenizerFactory: piece vocab for '%s' unreadable (%s)",
                 qPrintable(entry.name), qPrintable(path));
        return pieces;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);
    while (!in.atEnd()) {
        // Blank lines still occupy an id
        pieces.append(in.readLine().section(QLatin1Char('\t'), 0, 0));
    }
    return pieces;
}

} // namespace ild
