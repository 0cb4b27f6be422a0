#pragma once

#include <QString>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace ild {

struct TokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int seqLength = 0;
};

struct BatchTokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int batchSize = 0;
    int seqLength = 0;
};

// BERT WordPiece tokenizer. Latin text is lowercased and accent-stripped;
// Devanagari keeps its combining vowel signs, which carry meaning.
class WordPieceTokenizer {
public:
    explicit WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength = 512);

    bool isLoaded() const;
    int maxSequenceLength() const;
    size_t vocabSize() const;

    TokenizerOutput tokenize(const QString& text, int padToLength = 0) const;
    BatchTokenizerOutput tokenizeBatch(const std::vector<QString>& texts) const;

    // Pre-tokenized word list after normalization and punctuation splitting.
    QStringList basicTokens(const QString& text) const;

private:
    QString normalize(const QString& text) const;
    std::vector<int64_t> tokenizeContent(const QString& normalizedText) const;
    void appendWordPieces(const QString& token, std::vector<int64_t>* output) const;
    int64_t specialId(const char* token, int64_t fallback) const;

    std::unordered_map<std::string, int> m_vocab;
    int m_maxSequenceLength = 512;
    int m_maxContentTokens = 510;
    int64_t m_padId = 0;
    int64_t m_unkId = 100;
    int64_t m_clsId = 101;
    int64_t m_sepId = 102;
    bool m_loaded = false;
};

} // namespace ild
