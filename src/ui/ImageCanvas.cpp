#include "ui/ImageCanvas.h"

#include "Constants.h"
#include "region/RoiSelector.h"

#include <QMouseEvent>
#include <QPainter>
#include <QPen>

ImageCanvas::ImageCanvas(QWidget *parent)
    : QWidget(parent)
    , m_emptyText(tr("Open an image or start the camera"))
{
    setMinimumSize(TextReader::UI::kCanvasMinWidth, TextReader::UI::kCanvasMinHeight);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    setMouseTracking(false);
    setCursor(Qt::CrossCursor);
}

ImageCanvas::~ImageCanvas() = default;

void ImageCanvas::setImage(const QImage &image)
{
    const bool sizeChanged = image.size() != m_image.size();
    m_image = image;
    if (sizeChanged) {
        updateMapping();
    }
    update();
}

void ImageCanvas::setRoiSelector(RoiSelector *selector)
{
    if (m_selector) {
        disconnect(m_selector, nullptr, this, nullptr);
    }
    m_selector = selector;
    if (m_selector) {
        connect(m_selector, &RoiSelector::regionChanged, this, [this]() {
            update();
        });
        connect(m_selector, &RoiSelector::stateChanged, this, [this]() {
            update();
        });
    }
    update();
}

void ImageCanvas::setEmptyText(const QString &text)
{
    m_emptyText = text;
    update();
}

QSize ImageCanvas::sizeHint() const
{
    return QSize(TextReader::Camera::kDefaultFrameWidth, TextReader::Camera::kDefaultFrameHeight);
}

void ImageCanvas::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), TextReader::Color::kCanvasBackground);

    if (m_image.isNull() || !m_mapping.isValid()) {
        painter.setPen(Qt::lightGray);
        painter.drawText(rect(), Qt::AlignCenter, m_emptyText);
        return;
    }

    painter.setRenderHint(QPainter::SmoothPixmapTransform);
    painter.drawImage(m_mapping.targetRect(), m_image);

    if (m_selector && !m_selector->displayRect().isEmpty()) {
        QPen pen(TextReader::Color::kRoiOutline, TextReader::UI::Roi::kPenWidth);
        pen.setStyle(m_selector->isDragging() ? Qt::DashLine : Qt::SolidLine);
        painter.setPen(pen);
        painter.setBrush(Qt::NoBrush);
        painter.drawRect(m_mapping.toView(m_selector->displayRect()));
    }
}

void ImageCanvas::resizeEvent(QResizeEvent *event)
{
    QWidget::resizeEvent(event);
    updateMapping();
}

void ImageCanvas::mousePressEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton || !m_selector || !m_mapping.isValid()) {
        QWidget::mousePressEvent(event);
        return;
    }
    if (!m_mapping.containsViewPoint(event->position())) {
        return;
    }
    m_selector->pointerDown(m_mapping.toImage(event->position()));
    event->accept();
}

void ImageCanvas::mouseMoveEvent(QMouseEvent *event)
{
    if (!m_selector || !m_selector->isDragging()) {
        QWidget::mouseMoveEvent(event);
        return;
    }
    m_selector->pointerMove(m_mapping.toImage(event->position()));
    event->accept();
}

void ImageCanvas::mouseReleaseEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton || !m_selector || !m_selector->isDragging()) {
        QWidget::mouseReleaseEvent(event);
        return;
    }
    m_selector->pointerUp(m_mapping.toImage(event->position()));
    event->accept();
}

void ImageCanvas::updateMapping()
{
    m_mapping = m_image.isNull() ? DisplayMapping() : DisplayMapping(m_image.size(), size());
}
