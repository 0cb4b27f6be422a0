#include "core/extraction/onnx_vision_backend.h"
#include "core/extraction/text_confidence.h"
#include "core/models/model_registry.h"
#include "core/models/model_session.h"
#include "core/models/tokenizer_factory.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QPainter>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <onnxruntime_cxx_api.h>

namespace ild {

namespace {

constexpr int kWatchdogPollMs = 100;
const QChar kSentencePieceSpace(0x2581);

std::vector<int64_t> argmaxIds(const float* logits, int64_t steps, int64_t vocabSize)
{
    std::vector<int64_t> ids;
    ids.reserve(static_cast<size_t>(steps));
    for (int64_t t = 0; t < steps; ++t) {
        const float* row = logits + t * vocabSize;
        ids.push_back(static_cast<int64_t>(std::max_element(row, row + vocabSize) - row));
    }
    return ids;
}

// Terminates a running session when the deadline passes or the page is
// cancelled. Joined on destruction.
class RunWatchdog {
public:
    RunWatchdog(Ort::RunOptions& options, const ExtractionContext& context)
        : m_options(options)
        , m_context(context)
        , m_thread([this]() { watch(); })
    {
    }

    ~RunWatchdog()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_done = true;
        }
        m_cv.notify_all();
        m_thread.join();
    }

    bool timedOut() const { return m_timedOut; }

private:
    void watch()
    {
        const auto deadline = std::chrono::steady_clock::now()
            + std::chrono::milliseconds(m_context.timeoutMs);
        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_done) {
            m_cv.wait_for(lock, std::chrono::milliseconds(kWatchdogPollMs));
            if (m_done) {
                break;
            }
            const bool expired = m_context.timeoutMs > 0
                && std::chrono::steady_clock::now() >= deadline;
            if (expired || m_context.cancelled()) {
                m_timedOut = expired;
                m_options.SetTerminate();
                break;
            }
        }
    }

    Ort::RunOptions& m_options;
    const ExtractionContext& m_context;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_done = false;
    bool m_timedOut = false;
    std::thread m_thread;
};

} // anonymous namespace

struct OnnxVisionBackend::Impl {
    ModelSession* session = nullptr;  // Owned by the registry
    QStringList vocab;
    std::mutex runMutex;
};

OnnxVisionBackend::OnnxVisionBackend(ModelRegistry* registry, QString role)
    : m_impl(std::make_unique<Impl>())
    , m_registry(registry)
    , m_role(std::move(role))
{
}

OnnxVisionBackend::~OnnxVisionBackend() = default;

BackendKind OnnxVisionBackend::kind() const
{
    const ModelManifestEntry* entry = m_registry ? m_registry->entry(m_role.toStdString()) : nullptr;
    if (entry && entry->vision.mode == QStringLiteral("flattened_patches")) {
        return BackendKind::VisualQaTransformer;
    }
    return BackendKind::DocumentTransformer;
}

bool OnnxVisionBackend::initialize()
{
    if (!m_registry) {
        return false;
    }
    ModelSession* session = m_registry->getSession(m_role.toStdString());
    if (!session || !session->isAvailable()) {
        return false;
    }

    const ModelManifestEntry& entry = session->manifest();
    m_impl->vocab = TokenizerFactory::loadPieceVocab(entry, m_registry->modelsDir());
    if (m_impl->vocab.isEmpty()) {
        LOG_WARN(ildExtraction, "Vision role '%s': vocab '%s' empty or unreadable",
                 qUtf8Printable(m_role), qUtf8Printable(entry.vocab));
        return false;
    }

    m_impl->session = session;
    return true;
}

std::vector<float> OnnxVisionBackend::pixelValues(const QImage& image,
                                                  const VisionPreprocess& config)
{
    const int width = std::max(1, config.imageWidth);
    const int height = std::max(1, config.imageHeight);

    QImage canvas(width, height, QImage::Format_RGB32);
    canvas.fill(Qt::white);
    {
        QPainter painter(&canvas);
        painter.setRenderHint(QPainter::SmoothPixmapTransform);
        painter.drawImage(0, 0, image.scaled(width, height, Qt::KeepAspectRatio,
                                             Qt::SmoothTransformation));
    }

    const size_t plane = static_cast<size_t>(width) * static_cast<size_t>(height);
    std::vector<float> values(plane * 3);
    const float stdDev = config.std > 0.0f ? config.std : 1.0f;
    for (int y = 0; y < height; ++y) {
        const auto* line = reinterpret_cast<const QRgb*>(canvas.constScanLine(y));
        for (int x = 0; x < width; ++x) {
            const size_t index = static_cast<size_t>(y) * static_cast<size_t>(width)
                + static_cast<size_t>(x);
            values[index] = (qRed(line[x]) / 255.0f - config.mean) / stdDev;
            values[plane + index] = (qGreen(line[x]) / 255.0f - config.mean) / stdDev;
            values[2 * plane + index] = (qBlue(line[x]) / 255.0f - config.mean) / stdDev;
        }
    }
    return values;
}

std::vector<float> OnnxVisionBackend::flattenedPatches(const QImage& image,
                                                       const VisionPreprocess& config,
                                                       std::vector<float>* attentionMask)
{
    const int patch = std::max(1, config.patchSize);
    const int maxPatches = std::max(1, config.maxPatches);
    const int rowWidth = 2 + 3 * patch * patch;

    // Largest grid of whole patches that keeps the aspect ratio
    const double scale = std::sqrt(static_cast<double>(maxPatches)
                                   * (static_cast<double>(patch) / image.height())
                                   * (static_cast<double>(patch) / image.width()));
    const int rows = std::clamp(static_cast<int>(std::floor(scale * image.height() / patch)),
                                1, maxPatches);
    const int cols = std::clamp(static_cast<int>(std::floor(scale * image.width() / patch)),
                                1, std::max(1, maxPatches / rows));

    const QImage resized = image.scaled(cols * patch, rows * patch, Qt::IgnoreAspectRatio,
                                        Qt::SmoothTransformation)
                               .convertToFormat(QImage::Format_RGB32);

    // Per-image standardization over every channel value
    double sum = 0.0;
    double sumSquares = 0.0;
    const double count = static_cast<double>(resized.width()) * resized.height() * 3.0;
    for (int y = 0; y < resized.height(); ++y) {
        const auto* line = reinterpret_cast<const QRgb*>(resized.constScanLine(y));
        for (int x = 0; x < resized.width(); ++x) {
            for (int channel : {qRed(line[x]), qGreen(line[x]), qBlue(line[x])}) {
                sum += channel;
                sumSquares += static_cast<double>(channel) * channel;
            }
        }
    }
    const double mean = sum / count;
    const double variance = std::max(0.0, sumSquares / count - mean * mean);
    const double stdDev = std::max(std::sqrt(variance), 1.0 / std::sqrt(count));

    std::vector<float> patches(static_cast<size_t>(maxPatches) * static_cast<size_t>(rowWidth), 0.0f);
    if (attentionMask) {
        attentionMask->assign(static_cast<size_t>(maxPatches), 0.0f);
    }

    int patchIndex = 0;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols && patchIndex < maxPatches; ++c, ++patchIndex) {
            float* row = patches.data() + static_cast<size_t>(patchIndex) * static_cast<size_t>(rowWidth);
            row[0] = static_cast<float>(r + 1);
            row[1] = static_cast<float>(c + 1);
            int offset = 2;
            for (int py = 0; py < patch; ++py) {
                const auto* line = reinterpret_cast<const QRgb*>(
                    resized.constScanLine(r * patch + py));
                for (int px = 0; px < patch; ++px) {
                    const QRgb pixel = line[c * patch + px];
                    row[offset++] = static_cast<float>((qRed(pixel) - mean) / stdDev);
                    row[offset++] = static_cast<float>((qGreen(pixel) - mean) / stdDev);
                    row[offset++] = static_cast<float>((qBlue(pixel) - mean) / stdDev);
                }
            }
            if (attentionMask) {
                (*attentionMask)[static_cast<size_t>(patchIndex)] = 1.0f;
            }
        }
    }
    return patches;
}

QString OnnxVisionBackend::decodePieces(const std::vector<int64_t>& ids, const QStringList& vocab)
{
    QString text;
    for (int64_t id : ids) {
        if (id < 0 || id >= vocab.size()) {
            continue;
        }
        const QString& piece = vocab.at(static_cast<int>(id));
        if (piece.isEmpty()) {
            continue;
        }
        if (piece == QStringLiteral("</s>")) {
            break;
        }
        if (piece.startsWith(QLatin1Char('<')) && piece.endsWith(QLatin1Char('>'))) {
            continue;
        }
        QString decoded = piece;
        decoded.replace(kSentencePieceSpace, QLatin1Char(' '));
        text.append(decoded);
    }
    return text.simplified();
}

BackendResult OnnxVisionBackend::extract(const QImage& image, const ExtractionContext& context)
{
    QElapsedTimer timer;
    timer.start();

    BackendResult result;
    auto finish = [&](BackendResult::Status status, const QString& message) {
        result.status = status;
        if (!message.isEmpty()) {
            result.errorMessage = message;
        }
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    };

    if (!isReady() || !m_impl->session) {
        return finish(BackendResult::Status::Unavailable, QStringLiteral("model not loaded"));
    }
    if (image.isNull() || image.width() <= 0 || image.height() <= 0) {
        return finish(BackendResult::Status::MalformedImage, QStringLiteral("empty page image"));
    }

    auto* session = static_cast<Ort::Session*>(m_impl->session->rawSession());
    const ModelManifestEntry& entry = m_impl->session->manifest();
    const std::vector<std::string>& inputNames = m_impl->session->inputNames();
    const std::string outputName = m_impl->session->primaryOutput();
    const bool patchMode = entry.vision.mode == QStringLiteral("flattened_patches");

    try {
        std::vector<float> primary;
        std::vector<float> mask;
        std::vector<int64_t> primaryShape;
        if (patchMode) {
            primary = flattenedPatches(image, entry.vision, &mask);
            primaryShape = {1, entry.vision.maxPatches,
                            2 + 3 * entry.vision.patchSize * entry.vision.patchSize};
        } else {
            primary = pixelValues(image, entry.vision);
            primaryShape = {1, 3, entry.vision.imageHeight, entry.vision.imageWidth};
        }
        std::vector<int64_t> maskAsInt(mask.begin(), mask.end());
        const std::vector<int64_t> maskShape = {1, static_cast<int64_t>(mask.size())};

        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                                 OrtMemTypeDefault);
        std::vector<Ort::Value> tensors;
        std::vector<const char*> names;
        for (size_t i = 0; i < inputNames.size(); ++i) {
            const std::string& inputName = inputNames[i];
            if (inputName == "attention_mask" && patchMode) {
                const ONNXTensorElementDataType type = session->GetInputTypeInfo(i)
                    .GetTensorTypeAndShapeInfo().GetElementType();
                if (type == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64) {
                    tensors.push_back(Ort::Value::CreateTensor<int64_t>(
                        memoryInfo, maskAsInt.data(), maskAsInt.size(),
                        maskShape.data(), maskShape.size()));
                } else {
                    tensors.push_back(Ort::Value::CreateTensor<float>(
                        memoryInfo, mask.data(), mask.size(), maskShape.data(), maskShape.size()));
                }
            } else if (tensors.empty()) {
                tensors.push_back(Ort::Value::CreateTensor<float>(
                    memoryInfo, primary.data(), primary.size(),
                    primaryShape.data(), primaryShape.size()));
            } else {
                return finish(BackendResult::Status::InferenceFailed,
                              QStringLiteral("unexpected graph input '%1'")
                                  .arg(QString::fromStdString(inputName)));
            }
            names.push_back(inputName.c_str());
        }
        const char* outputNames[1] = {outputName.c_str()};

        std::vector<Ort::Value> outputs;
        bool timedOut = false;
        {
            std::lock_guard<std::mutex> lock(m_impl->runMutex);
            Ort::RunOptions runOptions;
            RunWatchdog watchdog(runOptions, context);
            try {
                outputs = session->Run(runOptions, names.data(), tensors.data(), tensors.size(),
                                       outputNames, 1);
            } catch (const Ort::Exception&) {
                if (!watchdog.timedOut() && !context.cancelled()) {
                    throw;
                }
            }
            timedOut = watchdog.timedOut();
        }

        if (context.cancelled()) {
            return finish(BackendResult::Status::Cancelled, QString());
        }
        if (timedOut) {
            return finish(BackendResult::Status::Timeout,
                          QStringLiteral("inference exceeded %1 ms").arg(context.timeoutMs));
        }
        if (outputs.empty() || !outputs[0].IsTensor()) {
            return finish(BackendResult::Status::InferenceFailed,
                          QStringLiteral("missing tensor output"));
        }

        const Ort::TensorTypeAndShapeInfo info = outputs[0].GetTensorTypeAndShapeInfo();
        const std::vector<int64_t> shape = info.GetShape();
        std::vector<int64_t> ids;
        if (info.GetElementType() == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64 && shape.size() == 2) {
            const int64_t* data = outputs[0].GetTensorData<int64_t>();
            ids.assign(data, data + shape[1]);
        } else if (info.GetElementType() == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32
                   && shape.size() == 2) {
            const int32_t* data = outputs[0].GetTensorData<int32_t>();
            ids.assign(data, data + shape[1]);
        } else if (info.GetElementType() == ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT
                   && shape.size() == 3) {
            ids = argmaxIds(outputs[0].GetTensorData<float>(), shape[1], shape[2]);
        } else {
            return finish(BackendResult::Status::InferenceFailed,
                          QStringLiteral("unsupported output tensor (rank %1)").arg(shape.size()));
        }

        result.text = decodePieces(ids, m_impl->vocab);
        result.confidence = estimateTextConfidence(result.text);
        finish(BackendResult::Status::Success, QString());
        LOG_DEBUG(ildExtraction, "%s decoded %zu tokens on page %d in %d ms",
                  qUtf8Printable(m_role), ids.size(), context.pageIndex, result.durationMs);
        return result;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(ildExtraction, "%s inference failed on page %d: %s",
                 qUtf8Printable(m_role), context.pageIndex, ex.what());
        return finish(BackendResult::Status::InferenceFailed, QString::fromUtf8(ex.what()));
    } catch (const std::exception& ex) {
        // Preprocessing allocation or the watchdog thread
        LOG_WARN(ildExtraction, "%s failed on page %d: %s", qUtf8Printable(m_role),
                 context.pageIndex, ex.what());
        return finish(BackendResult::Status::InferenceFailed, QString::fromUtf8(ex.what()));
    }
}

} // namespace ild
