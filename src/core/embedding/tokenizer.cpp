#include <QFile>
#include <QStringConverter>
#include <QTextStream>

#include <algorithm>
#include <utility>

#include "core/embedding/tokenizer.h"
#include "core/shared/logging.h"
#include "core/text/text_normalizer.h"

namespace ild {

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength)
    : m_maxSequenceLength(std::max(8, maxSequenceLength))
    , m_maxContentTokens(std::max(8, maxSequenceLength) - 2)
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_WARN(ildCore, "WordPieceTokenizer: failed to open vocab %s", qPrintable(vocabPath));
        return;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);

    int index = 0;
    while (!in.atEnd()) {
        const QString token = in.readLine().trimmed();
        if (!token.isEmpty()) {
            m_vocab.emplace(token.toStdString(), index);
        }
        ++index;
    }

    if (m_vocab.empty()) {
        LOG_WARN(ildCore, "WordPieceTokenizer: empty vocab in %s", qPrintable(vocabPath));
        return;
    }

    m_padId = specialId("[PAD]", 0);
    m_unkId = specialId("[UNK]", 100);
    m_clsId = specialId("[CLS]", 101);
    m_sepId = specialId("[SEP]", 102);
    m_loaded = true;
}

bool WordPieceTokenizer::isLoaded() const
{
    return m_loaded;
}

int WordPieceTokenizer::maxSequenceLength() const
{
    return m_maxSequenceLength;
}

size_t WordPieceTokenizer::vocabSize() const
{
    return m_vocab.size();
}

int64_t WordPieceTokenizer::specialId(const char* token, int64_t fallback) const
{
    const auto it = m_vocab.find(token);
    return it == m_vocab.end() ? fallback : static_cast<int64_t>(it->second);
}

QString WordPieceTokenizer::normalize(const QString& text) const
{
    const QString decomposed = TextNormalizer::normalize(text).toLower()
                                   .normalized(QString::NormalizationForm_D);

    QString stripped;
    stripped.reserve(decomposed.size());
    for (const QChar ch : decomposed) {
        const QChar::Category category = ch.category();
        const bool isCombiningMark = category == QChar::Mark_NonSpacing
                                   || category == QChar::Mark_SpacingCombining
                                   || category == QChar::Mark_Enclosing;
        if (isCombiningMark && !TextNormalizer::isDevanagari(ch)) {
            continue;
        }
        stripped.append(ch);
    }

    // Back to composed form for vocab lookup
    return stripped.normalized(QString::NormalizationForm_C);
}

QStringList WordPieceTokenizer::basicTokens(const QString& text) const
{
    const QString normalized = normalize(text);

    QStringList tokens;
    QString current;
    for (const QChar ch : normalized) {
        if (ch.isSpace()) {
            if (!current.isEmpty()) {
                tokens.append(current);
                current.clear();
            }
        } else if (ch.isPunct() || ch.isSymbol()) {
            if (!current.isEmpty()) {
                tokens.append(current);
                current.clear();
            }
            tokens.append(QString(ch));
        } else {
            current.append(ch);
        }
    }
    if (!current.isEmpty()) {
        tokens.append(current);
    }
    return tokens;
}

void WordPieceTokenizer::appendWordPieces(const QString& token, std::vector<int64_t>* output) const
{
    if (!output || token.isEmpty() || static_cast<int>(output->size()) >= m_maxContentTokens) {
        return;
    }

    const int tokenLength = token.size();
    int start = 0;
    std::vector<int64_t> pieces;

    while (start < tokenLength) {
        int end = tokenLength;
        int matchedId = -1;

        while (end > start) {
            QString piece = token.mid(start, end - start);
            if (start > 0) {
                piece.prepend(QStringLiteral("##"));
            }

            const auto it = m_vocab.find(piece.toStdString());
            if (it != m_vocab.end()) {
                matchedId = it->second;
                break;
            }
            --end;
        }

        if (matchedId < 0) {
            // A word that cannot be fully covered becomes a single [UNK]
            pieces.assign(1, m_unkId);
            break;
        }

        pieces.push_back(static_cast<int64_t>(matchedId));
        start = end;
    }

    for (int64_t id : pieces) {
        if (static_cast<int>(output->size()) >= m_maxContentTokens) {
            break;
        }
        output->push_back(id);
    }
}

std::vector<int64_t> WordPieceTokenizer::tokenizeContent(const QString& text) const
{
    std::vector<int64_t> content;
    if (!m_loaded || text.isEmpty()) {
        return content;
    }

    const QStringList words = basicTokens(text);
    for (const QString& word : words) {
        if (static_cast<int>(content.size()) >= m_maxContentTokens) {
            break;
        }
        appendWordPieces(word, &content);
    }
    return content;
}

TokenizerOutput WordPieceTokenizer::tokenize(const QString& text, int padToLength) const
{
    TokenizerOutput output;
    if (!m_loaded) {
        return output;
    }

    const std::vector<int64_t> content = tokenizeContent(text);

    output.inputIds.reserve(content.size() + 2);
    output.inputIds.push_back(m_clsId);
    output.inputIds.insert(output.inputIds.end(), content.begin(), content.end());
    output.inputIds.push_back(m_sepId);

    const int unpaddedLength = static_cast<int>(output.inputIds.size());
    const int clampedPadLength = std::min(padToLength, m_maxSequenceLength);
    const int targetLength = std::max(unpaddedLength, clampedPadLength);

    output.attentionMask.assign(static_cast<size_t>(targetLength), 0);
    output.tokenTypeIds.assign(static_cast<size_t>(targetLength), 0);
    std::fill_n(output.attentionMask.begin(), unpaddedLength, 1);

    if (targetLength > unpaddedLength) {
        output.inputIds.resize(static_cast<size_t>(targetLength), m_padId);
    }

    output.seqLength = targetLength;
    return output;
}

BatchTokenizerOutput WordPieceTokenizer::tokenizeBatch(const std::vector<QString>& texts) const
{
    BatchTokenizerOutput batch;
    if (!m_loaded || texts.empty()) {
        return batch;
    }

    std::vector<TokenizerOutput> tokenized;
    tokenized.reserve(texts.size());

    int maxLength = 0;
    for (const QString& text : texts) {
        TokenizerOutput single = tokenize(text);
        maxLength = std::max(maxLength, single.seqLength);
        tokenized.push_back(std::move(single));
    }

    batch.batchSize = static_cast<int>(texts.size());
    batch.seqLength = maxLength;
    const size_t total = static_cast<size_t>(batch.batchSize) * static_cast<size_t>(maxLength);
    batch.inputIds.reserve(total);
    batch.attentionMask.reserve(total);
    batch.tokenTypeIds.reserve(total);

    for (TokenizerOutput& row : tokenized) {
        if (row.seqLength < maxLength) {
            row.inputIds.resize(static_cast<size_t>(maxLength), m_padId);
            row.attentionMask.resize(static_cast<size_t>(maxLength), 0);
            row.tokenTypeIds.resize(static_cast<size_t>(maxLength), 0);
            row.seqLength = maxLength;
        }

        batch.inputIds.insert(batch.inputIds.end(), row.inputIds.begin(), row.inputIds.end());
        batch.attentionMask.insert(batch.attentionMask.end(),
                                   row.attentionMask.begin(), row.attentionMask.end());
        batch.tokenTypeIds.insert(batch.tokenTypeIds.end(),
                                  row.tokenTypeIds.begin(), row.tokenTypeIds.end());
    }

    return batch;
}

} // namespace ild
