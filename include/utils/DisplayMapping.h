#ifndef DISPLAYMAPPING_H
#define DISPLAYMAPPING_H

#include <QPoint>
#include <QPointF>
#include <QRect>
#include <QSize>

/**
 * DisplayMapping - frame <-> widget coordinate conversion
 *
 * The frame is scaled to fit the view while keeping its aspect ratio and
 * centered. Conversions go through the scale and the letterbox offset.
 */
class DisplayMapping {
public:
    DisplayMapping() = default;
    DisplayMapping(const QSize& imageSize, const QSize& viewSize);

    bool isValid() const { return m_scale > 0.0; }

    qreal scale() const { return m_scale; }
    QPoint offset() const { return m_offset; }
    QSize imageSize() const { return m_imageSize; }

    // Where the scaled frame is drawn inside the view
    QRect targetRect() const;

    // View position to frame pixel (not clamped)
    QPoint toImage(const QPointF& viewPos) const;

    // True if the view position falls on the drawn frame
    bool containsViewPoint(const QPointF& viewPos) const;

    // Frame rectangle to view rectangle
    QRect toView(const QRect& imageRect) const;

private:
    QSize m_imageSize;
    qreal m_scale = 0.0;
    QPoint m_offset;
};

#endif // DISPLAYMAPPING_H
