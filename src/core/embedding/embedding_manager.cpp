#include "core/embedding/embedding_manager.h"
#include "core/embedding/tokenizer.h"
#include "core/models/model_registry.h"
#include "core/models/model_session.h"
#include "core/models/model_manifest.h"
#include "core/models/tokenizer_factory.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

#include <onnxruntime_cxx_api.h>

namespace ild {

namespace {

EmbeddingResult failure(EmbeddingResult::Status status, const QString& message)
{
    EmbeddingResult result;
    result.status = status;
    result.errorMessage = message;
    return result;
}

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // In open state, check if enough time has elapsed for half-open
    if (steadyNowMs() - lastFailureTime.load() >= kHalfOpenDelayMs) {
        return false;  // half-open: allow one attempt
    }
    return true;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

class EmbeddingManager::Impl {
public:
    Ort::Session* session = nullptr;  // Borrowed from ModelSession, not owned
    std::string outputName;
    bool wantsTokenTypeIds = false;
};

EmbeddingManager::EmbeddingManager(ModelRegistry* registry, QString role, int batchSize)
    : m_impl(std::make_unique<Impl>())
    , m_registry(registry)
    , m_role(std::move(role))
    , m_batchSize(std::max(1, batchSize))
{
}

EmbeddingManager::~EmbeddingManager() = default;

bool EmbeddingManager::initialize()
{
    m_available = false;
    if (!m_registry) {
        LOG_WARN(ildCore, "EmbeddingManager: initialize failed, null registry");
        return false;
    }

    ModelSession* modelSession = m_registry->getSession(m_role.toStdString());
    if (!modelSession || !modelSession->isAvailable()) {
        LOG_WARN(ildCore, "EmbeddingManager: '%s' session unavailable", qPrintable(m_role));
        return false;
    }

    const ModelManifestEntry& entry = modelSession->manifest();

    m_tokenizer = TokenizerFactory::create(entry, m_registry->modelsDir());
    if (!m_tokenizer || !m_tokenizer->isLoaded()) {
        LOG_WARN(ildCore, "EmbeddingManager: tokenizer creation failed for '%s'",
                 qPrintable(m_role));
        return false;
    }

    if (entry.dimensions <= 0) {
        LOG_WARN(ildCore, "EmbeddingManager: invalid dimensions %d for '%s'",
                 entry.dimensions, qPrintable(m_role));
        return false;
    }

    m_binding.modelId = entry.modelId;
    m_binding.generationId = entry.generationId;
    m_binding.dimensions = entry.dimensions;
    m_queryPrefix = entry.queryPrefix;
    m_clsPooling = entry.poolingStrategy.compare(QStringLiteral("cls"), Qt::CaseInsensitive) == 0;

    m_impl->session = static_cast<Ort::Session*>(modelSession->rawSession());
    if (!m_impl->session) {
        LOG_WARN(ildCore, "EmbeddingManager: null ONNX session for '%s'", qPrintable(m_role));
        return false;
    }

    m_impl->outputName = modelSession->primaryOutput();
    m_impl->wantsTokenTypeIds = modelSession->hasInput("token_type_ids");

    LOG_INFO(ildCore, "EmbeddingManager: bound to %s/%s (%d dims, %s pooling)",
             qPrintable(m_binding.modelId), qPrintable(m_binding.generationId),
             m_binding.dimensions, m_clsPooling ? "cls" : "mean");

    m_available = true;
    return true;
}

bool EmbeddingManager::isAvailable() const
{
    return m_available;
}

ModelBinding EmbeddingManager::binding() const
{
    return m_binding;
}

std::vector<float> EmbeddingManager::normalizeEmbedding(std::vector<float> embedding)
{
    double sumSquares = 0.0;
    for (const float value : embedding) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return embedding;
    }

    for (float& value : embedding) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
    return embedding;
}

EmbeddingResult EmbeddingManager::embed(const QString& text)
{
    std::vector<EmbeddingResult> results = embedBatch({text});
    return std::move(results.front());
}

EmbeddingResult EmbeddingManager::embedQuery(const QString& text)
{
    return embed(m_queryPrefix + text);
}

std::vector<EmbeddingResult> EmbeddingManager::embedBatch(const std::vector<QString>& texts)
{
    std::vector<EmbeddingResult> results(texts.size());

    // Blank texts are answered here and never reach the model
    std::vector<size_t> pending;
    pending.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        if (texts[i].trimmed().isEmpty()) {
            results[i] = failure(EmbeddingResult::Status::InvalidInput,
                                 QStringLiteral("empty text"));
        } else {
            pending.push_back(i);
        }
    }

    for (size_t offset = 0; offset < pending.size(); offset += static_cast<size_t>(m_batchSize)) {
        const size_t end = std::min(pending.size(), offset + static_cast<size_t>(m_batchSize));
        std::vector<QString> slice;
        slice.reserve(end - offset);
        for (size_t p = offset; p < end; ++p) {
            slice.push_back(texts[pending[p]]);
        }

        std::vector<EmbeddingResult> sliceResults = runBatch(slice);
        const bool batchFailed = std::any_of(sliceResults.begin(), sliceResults.end(),
            [](const EmbeddingResult& r) {
                return r.status == EmbeddingResult::Status::InferenceFailed;
            });

        // A failed batch is retried item by item so one bad chunk cannot
        // take its neighbours down with it
        if (batchFailed && slice.size() > 1) {
            LOG_WARN(ildCore, "EmbeddingManager: batch of %zu failed, retrying per item",
                     slice.size());
            sliceResults.clear();
            for (const QString& text : slice) {
                std::vector<EmbeddingResult> single = runBatch({text});
                sliceResults.push_back(std::move(single.front()));
            }
        }

        for (size_t s = 0; s < sliceResults.size(); ++s) {
            results[pending[offset + s]] = std::move(sliceResults[s]);
        }
    }
    return results;
}

std::vector<EmbeddingResult> EmbeddingManager::runBatch(const std::vector<QString>& texts)
{
    auto failAll = [&texts](EmbeddingResult::Status status, const QString& message) {
        return std::vector<EmbeddingResult>(texts.size(), failure(status, message));
    };

    if (!m_available || !m_impl->session || !m_tokenizer) {
        return failAll(EmbeddingResult::Status::ModelUnavailable,
                       QStringLiteral("embedding model not loaded"));
    }

    if (m_circuitBreaker.isOpen()) {
        LOG_WARN(ildCore, "EmbeddingManager: circuit breaker is open, skipping inference");
        return failAll(EmbeddingResult::Status::CircuitOpen,
                       QStringLiteral("circuit breaker open"));
    }

    const BatchTokenizerOutput tokenized = m_tokenizer->tokenizeBatch(texts);
    if (tokenized.batchSize != static_cast<int>(texts.size()) || tokenized.seqLength <= 0) {
        return failAll(EmbeddingResult::Status::InvalidInput,
                       QStringLiteral("tokenizer produced no tokens"));
    }

    const int64_t inputShape[2] = {
        static_cast<int64_t>(tokenized.batchSize),
        static_cast<int64_t>(tokenized.seqLength),
    };
    const int dims = m_binding.dimensions;

    try {
        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                                 OrtMemTypeDefault);

        std::vector<Ort::Value> inputTensors;
        std::vector<const char*> inputNames;
        inputTensors.push_back(Ort::Value::CreateTensor<int64_t>(
            memoryInfo, const_cast<int64_t*>(tokenized.inputIds.data()),
            tokenized.inputIds.size(), inputShape, 2));
        inputNames.push_back("input_ids");
        inputTensors.push_back(Ort::Value::CreateTensor<int64_t>(
            memoryInfo, const_cast<int64_t*>(tokenized.attentionMask.data()),
            tokenized.attentionMask.size(), inputShape, 2));
        inputNames.push_back("attention_mask");
        if (m_impl->wantsTokenTypeIds) {
            inputTensors.push_back(Ort::Value::CreateTensor<int64_t>(
                memoryInfo, const_cast<int64_t*>(tokenized.tokenTypeIds.data()),
                tokenized.tokenTypeIds.size(), inputShape, 2));
            inputNames.push_back("token_type_ids");
        }
        const char* outputNames[1] = {m_impl->outputName.c_str()};

        std::vector<Ort::Value> outputs;
        {
            std::lock_guard<std::mutex> lock(m_runMutex);
            outputs = m_impl->session->Run(Ort::RunOptions{nullptr},
                                           inputNames.data(), inputTensors.data(),
                                           inputTensors.size(), outputNames, 1);
        }

        if (outputs.empty() || !outputs[0].IsTensor()) {
            m_circuitBreaker.recordFailure();
            return failAll(EmbeddingResult::Status::InferenceFailed,
                           QStringLiteral("missing tensor output"));
        }

        const std::vector<int64_t> shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();
        if (!data) {
            m_circuitBreaker.recordFailure();
            return failAll(EmbeddingResult::Status::InferenceFailed,
                           QStringLiteral("null tensor data"));
        }

        std::vector<EmbeddingResult> results;
        results.reserve(static_cast<size_t>(tokenized.batchSize));

        if (shape.size() == 2 && shape[0] == tokenized.batchSize && shape[1] == dims) {
            // Already pooled by the graph
            for (int i = 0; i < tokenized.batchSize; ++i) {
                const float* row = data + static_cast<size_t>(i) * static_cast<size_t>(dims);
                EmbeddingResult r;
                r.vector = normalizeEmbedding(std::vector<float>(row, row + dims));
                results.push_back(std::move(r));
            }
        } else if (shape.size() == 3 && shape[0] == tokenized.batchSize
                   && shape[2] == dims && shape[1] >= 1) {
            const int64_t seqLen = shape[1];
            for (int i = 0; i < tokenized.batchSize; ++i) {
                const float* base = data + static_cast<size_t>(i * seqLen * dims);
                std::vector<float> pooled(static_cast<size_t>(dims), 0.0f);
                if (m_clsPooling) {
                    std::copy(base, base + dims, pooled.begin());
                } else {
                    // Mean over unmasked token positions
                    int counted = 0;
                    for (int64_t t = 0; t < seqLen && t < tokenized.seqLength; ++t) {
                        const size_t maskIndex = static_cast<size_t>(i * tokenized.seqLength + t);
                        if (tokenized.attentionMask[maskIndex] == 0) {
                            continue;
                        }
                        const float* token = base + static_cast<size_t>(t * dims);
                        for (int j = 0; j < dims; ++j) {
                            pooled[static_cast<size_t>(j)] += token[j];
                        }
                        ++counted;
                    }
                    if (counted > 0) {
                        for (float& v : pooled) {
                            v /= static_cast<float>(counted);
                        }
                    }
                }
                EmbeddingResult r;
                r.vector = normalizeEmbedding(std::move(pooled));
                results.push_back(std::move(r));
            }
        } else {
            LOG_WARN(ildCore, "EmbeddingManager: unsupported output shape (rank %zu)",
                     shape.size());
            m_circuitBreaker.recordFailure();
            return failAll(EmbeddingResult::Status::InferenceFailed,
                           QStringLiteral("unsupported output shape"));
        }

        m_circuitBreaker.recordSuccess();
        return results;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(ildCore, "EmbeddingManager: inference failed: %s", ex.what());
        m_circuitBreaker.recordFailure();
        return failAll(EmbeddingResult::Status::InferenceFailed, QString::fromUtf8(ex.what()));
    }
}

} // namespace ild
