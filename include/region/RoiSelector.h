#ifndef ROISELECTOR_H
#define ROISELECTOR_H

#include <QObject>
#include <QRect>
#include <QPoint>

#include <optional>

/**
 * @brief Region-of-interest drag state machine
 *
 * Idle --pointerDown inside bounds--> Dragging --pointerUp--> Set
 * Set --pointerDown--> Dragging (old region discarded)
 * Set --clear--> Idle
 *
 * Positions are in frame pixel coordinates. The rectangle spans the
 * pixel edges between the anchor and the pointer, so a click without
 * movement has zero area and finishes back in Idle.
 */
class RoiSelector : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,       // No region; whole frame is used
        Dragging,   // Pointer held, rectangle follows it
        Set         // Region finalized
    };
    Q_ENUM(State)

    explicit RoiSelector(QObject* parent = nullptr);

    // State queries
    State state() const { return m_state; }
    bool isDragging() const { return m_state == State::Dragging; }
    bool isSet() const { return m_state == State::Set; }

    // Frame bounds the rectangle is clamped to
    void setBounds(const QRect& bounds);
    QRect bounds() const { return m_bounds; }

    // Pointer gestures; pointerDown returns false if pos is outside bounds
    bool pointerDown(const QPoint& pos);
    void pointerMove(const QPoint& pos);
    void pointerUp(const QPoint& pos);
    void pointerUp();
    void clear();

    // Finalized region, or nullopt while Idle or Dragging
    std::optional<QRect> currentRegion() const;

    // Rectangle to draw: the live drag rectangle or the finalized region
    QRect displayRect() const { return m_rect; }

    // Replace the region directly (clamped; zero area clears)
    void setRegion(const QRect& rect);

signals:
    void stateChanged(RoiSelector::State newState);
    void regionChanged(const QRect& rect);

private:
    void setState(State state);
    QPoint clampToBounds(const QPoint& pos) const;
    QRect spanTo(const QPoint& pos) const;

    State m_state = State::Idle;
    QRect m_rect;
    QRect m_bounds;
    QPoint m_anchor;
};

#endif // ROISELECTOR_H
