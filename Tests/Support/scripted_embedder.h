#pragma once

#include "core/embedding/embedder.h"

#include <QString>

#include <atomic>
#include <mutex>
#include <utility>
#include <vector>

namespace ild::test {

// Deterministic Embedder for tests. A text is mapped to the sum of the
// concept vectors whose key it contains (case-insensitive); a text matching
// no concept hashes its tokens into the remaining dimensions. Output is
// L2-normalized.
class ScriptedEmbedder : public Embedder {
public:
    explicit ScriptedEmbedder(int dimensions = 16,
                              QString modelId = QStringLiteral("scripted-encoder"),
                              QString generationId = QStringLiteral("v1"));

    // Texts containing key get a unit contribution along axis.
    void addConcept(const QString& key, int axis);
    void setAvailable(bool available) { m_available = available; }
    void setFailQueries(bool fail) { m_failQueries = fail; }
    // embed()/embedBatch() fail for texts containing the marker.
    void setFailMarker(const QString& marker);

    bool isAvailable() const override { return m_available.load(); }
    ModelBinding binding() const override { return m_binding; }

    EmbeddingResult embed(const QString& text) override;
    EmbeddingResult embedQuery(const QString& text) override;
    std::vector<EmbeddingResult> embedBatch(const std::vector<QString>& texts) override;

    int queryCount() const { return m_queryCalls.load(); }
    std::vector<float> vectorFor(const QString& text) const;

private:
    ModelBinding m_binding;
    std::vector<std::pair<QString, int>> m_concepts;
    QString m_failMarker;
    mutable std::mutex m_mutex;
    std::atomic<bool> m_available{true};
    std::atomic<bool> m_failQueries{false};
    std::atomic<int> m_queryCalls{0};
};

} // namespace ild::test
