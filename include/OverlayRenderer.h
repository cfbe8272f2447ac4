#ifndef OVERLAYRENDERER_H
#define OVERLAYRENDERER_H

#include <QColor>
#include <QImage>
#include <QPoint>
#include <QVector>

#include "Constants.h"
#include "detection/OCRTypes.h"

class QPainter;

/**
 * @brief Draws recognized regions over a frame for visual feedback.
 *
 * Regions are painted in the order received; overlapping boxes simply
 * paint over each other. The source frame is never modified.
 */
class OverlayRenderer
{
public:
    struct Style {
        QColor boxColor = TextReader::Color::kOverlayBox;
        QColor labelColor = TextReader::Color::kOverlayLabel;
        int penWidth = TextReader::UI::Overlay::kBoxPenWidth;
        int labelPointSize = TextReader::UI::Overlay::kLabelPointSize;
        int labelOffset = TextReader::UI::Overlay::kLabelOffset;
    };

    // Return a copy of frame with every region's box and label drawn on it
    static QImage renderOverlay(const QImage& frame, const QVector<OCRTextBlock>& regions,
                                const Style& style = Style());

    // Paint regions with an already active painter (frame coordinates)
    static void render(QPainter& painter, const QVector<OCRTextBlock>& regions,
                       const Style& style = Style());

    // Shift boxes from ROI-crop coordinates into frame coordinates
    static QVector<OCRTextBlock> translated(const QVector<OCRTextBlock>& regions, const QPoint& offset);

    // Drop blank tokens and tokens below minConfidence (unknown confidence is kept)
    static QVector<OCRTextBlock> drawable(const QVector<OCRTextBlock>& regions, int minConfidence);
};

#endif // OVERLAYRENDERER_H
