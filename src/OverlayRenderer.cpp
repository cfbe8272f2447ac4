#include "OverlayRenderer.h"

#include <QFont>
#include <QFontMetrics>
#include <QPainter>
#include <QPen>

#include <algorithm>

QImage OverlayRenderer::renderOverlay(const QImage& frame, const QVector<OCRTextBlock>& regions,
                                      const Style& style)
{
    if (frame.isNull()) {
        return QImage();
    }

    QImage annotated = frame.format() == QImage::Format_RGB32
        ? frame.copy()
        : frame.convertToFormat(QImage::Format_RGB32);
    if (regions.isEmpty()) {
        return annotated;
    }

    QPainter painter(&annotated);
    render(painter, regions, style);
    painter.end();
    return annotated;
}

void OverlayRenderer::render(QPainter& painter, const QVector<OCRTextBlock>& regions,
                             const Style& style)
{
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, false);
    painter.setRenderHint(QPainter::TextAntialiasing, true);

    QFont font = painter.font();
    font.setPointSize(style.labelPointSize);
    painter.setFont(font);
    const QFontMetrics metrics(font);

    const QPen boxPen(style.boxColor, style.penWidth, Qt::SolidLine, Qt::SquareCap, Qt::MiterJoin);
    const QPen labelPen(style.labelColor);

    for (const OCRTextBlock& region : regions) {
        const QRect& box = region.boundingRect;

        painter.setBrush(Qt::NoBrush);
        painter.setPen(boxPen);
        painter.drawRect(box);

        if (region.text.isEmpty()) {
            continue;
        }
        // Label sits above the box, pushed down if it would leave the top edge
        const int baseline = std::max(metrics.ascent(), box.top() - style.labelOffset);
        painter.setPen(labelPen);
        painter.drawText(QPoint(box.left(), baseline), region.text);
    }

    painter.restore();
}

QVector<OCRTextBlock> OverlayRenderer::translated(const QVector<OCRTextBlock>& regions, const QPoint& offset)
{
    QVector<OCRTextBlock> result = regions;
    for (OCRTextBlock& region : result) {
        region.boundingRect.translate(offset);
    }
    return result;
}

QVector<OCRTextBlock> OverlayRenderer::drawable(const QVector<OCRTextBlock>& regions, int minConfidence)
{
    QVector<OCRTextBlock> result;
    result.reserve(regions.size());
    for (const OCRTextBlock& region : regions) {
        if (region.text.trimmed().isEmpty()) {
            continue;
        }
        if (region.confidence >= 0.0f && region.confidence < static_cast<float>(minConfidence)) {
            continue;
        }
        result.append(region);
    }
    return result;
}
