#pragma once

#include "core/models/model_manifest.h"

#include <QString>

#include <memory>
#include <string>
#include <vector>

namespace ild {

// One ONNX Runtime session for a manifest role. The graph must expose every
// input and output the manifest entry lists.
class ModelSession {
public:
    explicit ModelSession(const ModelManifestEntry& manifest);
    ~ModelSession();

    ModelSession(const ModelSession&) = delete;
    ModelSession& operator=(const ModelSession&) = delete;
    ModelSession(ModelSession&&) = delete;
    ModelSession& operator=(ModelSession&&) = delete;

    bool initialize(const QString& modelPath, int intraOpThreads = 2);
    bool isAvailable() const;

    const ModelManifestEntry& manifest() const;
    const std::vector<std::string>& inputNames() const;
    const std::vector<std::string>& outputNames() const;

    bool hasInput(const std::string& name) const;
    // First output listed in the manifest, else the graph's first output.
    const std::string& primaryOutput() const;

    // Ort::Session* behind void* so callers without the ONNX headers can
    // hold it; cast back in .cpp files that include onnxruntime_cxx_api.h.
    void* rawSession() const;

private:
    bool declaredNamesPresent(const std::vector<QString>& declared,
                              const std::vector<std::string>& actual,
                              const char* what) const;

    class Impl;
    std::unique_ptr<Impl> m_impl;

    ModelManifestEntry m_manifest;
    std::vector<std::string> m_inputNames;
    std::vector<std::string> m_outputNames;
    std::string m_primaryOutput;
    bool m_available = false;
};

} // namespace ild
