#pragma once

#include <QByteArray>
#include <QImage>
#include <QString>
#include <optional>

namespace ild {

// Result of opening or rasterizing a PDF. A non-Success status is the
// RenderError of the taxonomy: it degrades one page (render) or rejects the
// document (pageCount).
struct RenderResult {
    enum class Status {
        Success,
        OutOfRange,
        Corrupt,
        Locked,
        Empty,
    };

    Status status = Status::Corrupt;
    QImage image;
    int pageCount = 0;
    std::optional<QString> errorMessage;

    bool ok() const { return status == Status::Success; }
};

// PageRenderer -- rasterizes PDF pages. Stateless with respect to the
// document: every call receives the PDF bytes. Implementations may cache the
// parsed document for the bytes they saw last.
class PageRenderer {
public:
    static constexpr int kDefaultDpi = 300;

    virtual ~PageRenderer() = default;

    // Parses the document and reports its page count in RenderResult::pageCount.
    virtual RenderResult probe(const QByteArray& pdfBytes) = 0;

    virtual RenderResult render(const QByteArray& pdfBytes, int pageIndex, int dpi) = 0;
};

} // namespace ild
