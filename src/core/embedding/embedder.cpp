#include "core/embedding/embedder.h"

namespace ild {

QString embeddingStatusToString(EmbeddingResult::Status status)
{
    switch (status) {
    case EmbeddingResult::Status::Success:          return QStringLiteral("success");
    case EmbeddingResult::Status::ModelUnavailable: return QStringLiteral("model_unavailable");
    case EmbeddingResult::Status::InferenceFailed:  return QStringLiteral("inference_failed");
    case EmbeddingResult::Status::CircuitOpen:      return QStringLiteral("circuit_open");
    case EmbeddingResult::Status::InvalidInput:     return QStringLiteral("invalid_input");
    }
    return QStringLiteral("unknown");
}

} // namespace ild
