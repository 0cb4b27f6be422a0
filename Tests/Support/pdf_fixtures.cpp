#include "Support/pdf_fixtures.h"

#include <QBuffer>
#include <QFont>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>

namespace ild::test {

QByteArray makeTextPdf(const QStringList& pageTexts)
{
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);

    QPdfWriter writer(&buffer);
    writer.setPageSize(QPageSize(QPageSize::A4));
    writer.setResolution(150);

    QPainter painter(&writer);
    painter.setFont(QFont(QStringLiteral("DejaVu Sans"), 14));
    for (int i = 0; i < pageTexts.size(); ++i) {
        if (i > 0) {
            writer.newPage();
        }
        const QRect area(100, 100, writer.width() - 200, writer.height() - 200);
        painter.drawText(area, Qt::AlignLeft | Qt::AlignTop | Qt::TextWordWrap, pageTexts.at(i));
    }
    painter.end();
    buffer.close();
    return bytes;
}

} // namespace ild::test
