#include "region/RoiSelector.h"

#include <QDebug>

#include <algorithm>
#include <cstdlib>

RoiSelector::RoiSelector(QObject* parent)
    : QObject(parent)
{
}

void RoiSelector::setState(State state)
{
    if (m_state != state) {
        m_state = state;
        emit stateChanged(m_state);
    }
}

void RoiSelector::setBounds(const QRect& bounds)
{
    if (m_bounds == bounds) {
        return;
    }
    m_bounds = bounds;

    if (m_state == State::Idle) {
        return;
    }

    // Frame geometry changed under an existing region: keep what still fits
    const QRect clamped = m_rect.intersected(m_bounds);
    if (clamped.isEmpty()) {
        clear();
        return;
    }
    if (clamped != m_rect) {
        m_rect = clamped;
        emit regionChanged(m_rect);
    }
}

QPoint RoiSelector::clampToBounds(const QPoint& pos) const
{
    // Pixel-edge coordinates: the far edge x == left + width is reachable
    const int x = std::clamp(pos.x(), m_bounds.left(), m_bounds.left() + m_bounds.width());
    const int y = std::clamp(pos.y(), m_bounds.top(), m_bounds.top() + m_bounds.height());
    return QPoint(x, y);
}

QRect RoiSelector::spanTo(const QPoint& pos) const
{
    const QPoint p = clampToBounds(pos);
    const int left = std::min(m_anchor.x(), p.x());
    const int top = std::min(m_anchor.y(), p.y());
    return QRect(left, top, std::abs(p.x() - m_anchor.x()), std::abs(p.y() - m_anchor.y()));
}

// ============================================================================
// Pointer gestures
// ============================================================================

bool RoiSelector::pointerDown(const QPoint& pos)
{
    if (m_bounds.isEmpty() || !m_bounds.contains(pos)) {
        return false;
    }

    m_anchor = pos;
    m_rect = QRect(pos, QSize(0, 0));
    setState(State::Dragging);
    emit regionChanged(m_rect);
    return true;
}

void RoiSelector::pointerMove(const QPoint& pos)
{
    if (m_state != State::Dragging) return;

    const QRect rect = spanTo(pos);
    if (rect != m_rect) {
        m_rect = rect;
        emit regionChanged(m_rect);
    }
}

void RoiSelector::pointerUp(const QPoint& pos)
{
    if (m_state != State::Dragging) return;

    m_rect = spanTo(pos);
    pointerUp();
}

void RoiSelector::pointerUp()
{
    if (m_state != State::Dragging) return;

    if (m_rect.width() <= 0 || m_rect.height() <= 0) {
        clear();
        return;
    }

    qDebug() << "RoiSelector: Region set" << m_rect;
    setState(State::Set);
    emit regionChanged(m_rect);
}

void RoiSelector::clear()
{
    const bool changed = m_state != State::Idle || !m_rect.isNull();
    m_rect = QRect();
    setState(State::Idle);
    if (changed) {
        emit regionChanged(QRect());
    }
}

std::optional<QRect> RoiSelector::currentRegion() const
{
    if (m_state != State::Set) {
        return std::nullopt;
    }
    return m_rect;
}

void RoiSelector::setRegion(const QRect& rect)
{
    const QRect clamped = rect.normalized().intersected(m_bounds);
    if (clamped.width() <= 0 || clamped.height() <= 0) {
        clear();
        return;
    }
    m_rect = clamped;
    setState(State::Set);
    emit regionChanged(m_rect);
}
