#pragma once

#include "core/embedding/embedder.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace ild {

class ModelRegistry;
class WordPieceTokenizer;

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

// ONNX Runtime sentence embedder (InLegalBERT by default) bound to one
// manifest role. Output vectors are pooled and L2-normalized.
class EmbeddingManager : public Embedder {
public:
    EmbeddingManager(ModelRegistry* registry, QString role, int batchSize = 16);
    ~EmbeddingManager() override;

    EmbeddingManager(const EmbeddingManager&) = delete;
    EmbeddingManager& operator=(const EmbeddingManager&) = delete;
    EmbeddingManager(EmbeddingManager&&) = delete;
    EmbeddingManager& operator=(EmbeddingManager&&) = delete;

    bool initialize();
    bool isAvailable() const override;
    ModelBinding binding() const override;

    EmbeddingResult embed(const QString& text) override;
    EmbeddingResult embedQuery(const QString& text) override;
    std::vector<EmbeddingResult> embedBatch(const std::vector<QString>& texts) override;

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

    static std::vector<float> normalizeEmbedding(std::vector<float> embedding);

private:
    std::vector<EmbeddingResult> runBatch(const std::vector<QString>& texts);

    class Impl;
    std::unique_ptr<Impl> m_impl;

    ModelRegistry* m_registry = nullptr;
    QString m_role;
    int m_batchSize = 16;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    ModelBinding m_binding;
    QString m_queryPrefix;
    bool m_clsPooling = false;
    bool m_available = false;
    std::mutex m_runMutex;
    EmbeddingCircuitBreaker m_circuitBreaker;
};

} // namespace ild
