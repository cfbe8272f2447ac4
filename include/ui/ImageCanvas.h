#ifndef IMAGECANVAS_H
#define IMAGECANVAS_H

#include <QImage>
#include <QPointer>
#include <QWidget>

#include "utils/DisplayMapping.h"

class RoiSelector;

/**
 * @brief Shows the current frame scaled to fit and lets the user drag a ROI.
 *
 * Mouse positions are mapped to frame pixels before they reach the
 * RoiSelector, so the selection is independent of the widget size.
 */
class ImageCanvas : public QWidget
{
    Q_OBJECT

public:
    explicit ImageCanvas(QWidget *parent = nullptr);
    ~ImageCanvas() override;

    void setImage(const QImage &image);
    QImage image() const { return m_image; }

    void setRoiSelector(RoiSelector *selector);

    // Hint painted while there is no image
    void setEmptyText(const QString &text);

    const DisplayMapping &mapping() const { return m_mapping; }

    QSize sizeHint() const override;

protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;

private:
    void updateMapping();

    QImage m_image;
    QPointer<RoiSelector> m_selector;
    DisplayMapping m_mapping;
    QString m_emptyText;
};

#endif // IMAGECANVAS_H
