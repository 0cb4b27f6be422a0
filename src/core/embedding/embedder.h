#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace ild {

// Identity of the model that produced a vector. Documents and queries must
// be embedded under the same binding for dense scores to be comparable.
struct ModelBinding {
    QString modelId;
    QString generationId;
    int dimensions = 0;

    bool operator==(const ModelBinding& other) const
    {
        return modelId == other.modelId && generationId == other.generationId
            && dimensions == other.dimensions;
    }
    bool operator!=(const ModelBinding& other) const { return !(*this == other); }
};

struct EmbeddingResult {
    enum class Status {
        Success,
        ModelUnavailable,
        InferenceFailed,
        CircuitOpen,
        InvalidInput,
    };

    Status status = Status::Success;
    std::vector<float> vector;
    std::optional<QString> errorMessage;

    bool ok() const { return status == Status::Success; }
};

QString embeddingStatusToString(EmbeddingResult::Status status);

// Text to unit-length vector. Implementations are thread-safe and
// deterministic for a fixed binding.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual bool isAvailable() const = 0;
    virtual ModelBinding binding() const = 0;

    virtual EmbeddingResult embed(const QString& text) = 0;
    // Applies the model's query prefix, if any.
    virtual EmbeddingResult embedQuery(const QString& text) = 0;
    // One result per input, in input order.
    virtual std::vector<EmbeddingResult> embedBatch(const std::vector<QString>& texts) = 0;
};

} // namespace ild
