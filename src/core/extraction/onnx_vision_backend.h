#pragma once

#include "core/extraction/extractor_backend.h"

#include <QStringList>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ild {

class ModelRegistry;
struct VisionPreprocess;

// OnnxVisionBackend -- local vision-language transcription through an
// exported ONNX generator graph. The manifest role selects the model
// ("donut" or "pix2struct") and its image preprocessing; the graph's first
// output is either generated token ids [1,T] or logits [1,T,V], decoded
// with the role's SentencePiece vocabulary.
class OnnxVisionBackend : public ExtractorBackend {
public:
    OnnxVisionBackend(ModelRegistry* registry, QString role);
    ~OnnxVisionBackend() override;

    OnnxVisionBackend(const OnnxVisionBackend&) = delete;
    OnnxVisionBackend& operator=(const OnnxVisionBackend&) = delete;

    QString name() const override { return m_role; }
    BackendKind kind() const override;

    BackendResult extract(const QImage& image, const ExtractionContext& context) override;

    // [1,3,H,W] planar RGB, resized with aspect kept onto a white canvas.
    static std::vector<float> pixelValues(const QImage& image, const VisionPreprocess& config);
    // [maxPatches, 2 + 3*p*p] rows of (row id, col id, patch pixels); the
    // mask marks real patches.
    static std::vector<float> flattenedPatches(const QImage& image, const VisionPreprocess& config,
                                               std::vector<float>* attentionMask);
    // Joins SentencePiece pieces, drops markup tokens such as <s_answer>.
    static QString decodePieces(const std::vector<int64_t>& ids, const QStringList& vocab);

protected:
    bool initialize() override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    ModelRegistry* m_registry = nullptr;
    QString m_role;
};

} // namespace ild
