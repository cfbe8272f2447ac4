#include "utils/DisplayMapping.h"

#include <QtMath>

#include <algorithm>

DisplayMapping::DisplayMapping(const QSize& imageSize, const QSize& viewSize)
    : m_imageSize(imageSize)
{
    if (imageSize.isEmpty() || viewSize.isEmpty()) {
        return;
    }

    m_scale = std::min(static_cast<qreal>(viewSize.width()) / imageSize.width(),
                       static_cast<qreal>(viewSize.height()) / imageSize.height());

    const int scaledWidth = static_cast<int>(imageSize.width() * m_scale);
    const int scaledHeight = static_cast<int>(imageSize.height() * m_scale);
    m_offset = QPoint((viewSize.width() - scaledWidth) / 2,
                      (viewSize.height() - scaledHeight) / 2);
}

QRect DisplayMapping::targetRect() const
{
    if (!isValid()) {
        return QRect();
    }
    return QRect(m_offset, QSize(static_cast<int>(m_imageSize.width() * m_scale),
                                 static_cast<int>(m_imageSize.height() * m_scale)));
}

QPoint DisplayMapping::toImage(const QPointF& viewPos) const
{
    if (!isValid()) {
        return QPoint();
    }
    return QPoint(qFloor((viewPos.x() - m_offset.x()) / m_scale),
                  qFloor((viewPos.y() - m_offset.y()) / m_scale));
}

bool DisplayMapping::containsViewPoint(const QPointF& viewPos) const
{
    if (!isValid()) {
        return false;
    }
    const QPoint p = toImage(viewPos);
    return p.x() >= 0 && p.y() >= 0
        && p.x() < m_imageSize.width() && p.y() < m_imageSize.height();
}

QRect DisplayMapping::toView(const QRect& imageRect) const
{
    if (!isValid()) {
        return QRect();
    }
    const int left = m_offset.x() + qRound(imageRect.x() * m_scale);
    const int top = m_offset.y() + qRound(imageRect.y() * m_scale);
    const int right = m_offset.x() + qRound((imageRect.x() + imageRect.width()) * m_scale);
    const int bottom = m_offset.y() + qRound((imageRect.y() + imageRect.height()) * m_scale);
    return QRect(left, top, right - left, bottom - top);
}
