#include "core/models/model_session.h"

#include "core/shared/logging.h"

#include <QFile>

#include <algorithm>

#include <onnxruntime_cxx_api.h>

namespace ild {

namespace {

Ort::Env& ortEnvironment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "inlegaldesk-models");
    return env;
}

template <typename NameFn>
std::vector<std::string> graphNames(size_t count, NameFn nameAt)
{
    Ort::AllocatorWithDefaultOptions allocator;
    std::vector<std::string> names;
    names.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        Ort::AllocatedStringPtr name = nameAt(i, allocator);
        if (name.get() != nullptr && name.get()[0] != '\0') {
            names.emplace_back(name.get());
        }
    }
    return names;
}

} // anonymous namespace

class ModelSession::Impl {
public:
    Ort::SessionOptions sessionOptions;
    std::unique_ptr<Ort::Session> session;
};

ModelSession::ModelSession(const ModelManifestEntry& manifest)
    : m_impl(std::make_unique<Impl>())
    , m_manifest(manifest)
{
}

ModelSession::~ModelSession() = default;

bool ModelSession::declaredNamesPresent(const std::vector<QString>& declared,
                                        const std::vector<std::string>& actual,
                                        const char* what) const
{
    for (const QString& name : declared) {
        if (std::find(actual.begin(), actual.end(), name.toStdString()) == actual.end()) {
            LOG_WARN(ildCore, "ModelSession: %s '%s' of '%s' is not in the graph", what,
                     qPrintable(name), qPrintable(m_manifest.name));
            return false;
        }
    }
    return true;
}

bool ModelSession::initialize(const QString& modelPath, int intraOpThreads)
{
    m_available = false;
    if (modelPath.isEmpty() || !QFile::exists(modelPath)) {
        LOG_WARN(ildCore, "ModelSession: model file missing at %s", qPrintable(modelPath));
        return false;
    }

    try {
        m_impl->sessionOptions.SetIntraOpNumThreads(std::max(1, intraOpThreads));
        m_impl->sessionOptions.SetInterOpNumThreads(1);
        m_impl->sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        m_impl->sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        m_impl->session = std::make_unique<Ort::Session>(
            ortEnvironment(), modelPath.toUtf8().constData(), m_impl->sessionOptions);
        Ort::Session& session = *m_impl->session;

        m_inputNames = graphNames(session.GetInputCount(), [&session](size_t i, auto& alloc) {
            return session.GetInputNameAllocated(i, alloc);
        });
        m_outputNames = graphNames(session.GetOutputCount(), [&session](size_t i, auto& alloc) {
            return session.GetOutputNameAllocated(i, alloc);
        });
    } catch (const Ort::Exception& ex) {
        LOG_WARN(ildCore, "ModelSession: ONNX initialization failed for '%s': %s",
                 qPrintable(m_manifest.name), ex.what());
        m_impl->session.reset();
        return false;
    }

    if (m_outputNames.empty()
        || !declaredNamesPresent(m_manifest.inputs, m_inputNames, "input")
        || !declaredNamesPresent(m_manifest.outputs, m_outputNames, "output")) {
        m_impl->session.reset();
        return false;
    }

    m_primaryOutput = m_manifest.outputs.empty() ? m_outputNames.front()
                                                 : m_manifest.outputs.front().toStdString();

    LOG_INFO(ildCore, "ModelSession: '%s' ready, %zu inputs, output '%s'",
             qPrintable(m_manifest.name), m_inputNames.size(), m_primaryOutput.c_str());
    m_available = true;
    return true;
}

bool ModelSession::isAvailable() const
{
    return m_available;
}

const ModelManifestEntry& ModelSession::manifest() const
{
    return m_manifest;
}

const std::vector<std::string>& ModelSession::inputNames() const
{
    return m_inputNames;
}

const std::vector<std::string>& ModelSession::outputNames() const
{
    return m_outputNames;
}

bool ModelSession::hasInput(const std::string& name) const
{
    return std::find(m_inputNames.begin(), m_inputNames.end(), name) != m_inputNames.end();
}

const std::string& ModelSession::primaryOutput() const
{
    return m_primaryOutput;
}

void* ModelSession::rawSession() const
{
    return m_impl->session ? m_impl->session.get() : nullptr;
}

} // namespace ild
