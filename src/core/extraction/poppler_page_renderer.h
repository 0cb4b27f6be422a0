#pragma once

#include "core/extraction/page_renderer.h"

#include <memory>
#include <mutex>

namespace ild {

// PopplerPageRenderer -- PageRenderer on top of poppler-qt6.
//
// Encrypted documents are rejected with Locked unless the matching password
// was supplied at construction. The parsed document for the most recent
// byte buffer is cached so rendering N pages parses the PDF once; access to
// the cache and to rendering is serialized because Poppler::Document is
// not thread-safe.
class PopplerPageRenderer : public PageRenderer {
public:
    explicit PopplerPageRenderer(const QByteArray& password = {});
    ~PopplerPageRenderer() override;

    PopplerPageRenderer(const PopplerPageRenderer&) = delete;
    PopplerPageRenderer& operator=(const PopplerPageRenderer&) = delete;

    RenderResult probe(const QByteArray& pdfBytes) override;
    RenderResult render(const QByteArray& pdfBytes, int pageIndex, int dpi) override;

private:
    RenderResult loadUnlocked(const QByteArray& pdfBytes);

    struct Impl;
    std::unique_ptr<Impl> m_impl;
    std::mutex m_mutex;
};

} // namespace ild
