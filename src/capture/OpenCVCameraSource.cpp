#include "capture/OpenCVCameraSource.h"
#include "utils/MatConverter.h"
#include "AppError.h"

#include <QDebug>

#include <opencv2/core.hpp>

OpenCVCameraSource::OpenCVCameraSource(QObject *parent)
    : ICameraSource(parent)
{
}

OpenCVCameraSource::~OpenCVCameraSource()
{
    close();
}

bool OpenCVCameraSource::open(int deviceIndex, AppError *error)
{
    if (m_capture.isOpened()) {
        AppError::set(error, AppError::Kind::DeviceUnavailable,
                      QStringLiteral("Camera %1 is already in use").arg(m_deviceIndex));
        return false;
    }

    bool opened = false;
    try {
        opened = m_capture.open(deviceIndex);
    } catch (const cv::Exception &ex) {
        qWarning() << "OpenCVCameraSource: open threw:" << ex.what();
        opened = false;
    }

    if (!opened || !m_capture.isOpened()) {
        m_capture.release();
        AppError::set(error, AppError::Kind::DeviceUnavailable,
                      QStringLiteral("Cannot open camera %1. Check the device connection and permissions.")
                          .arg(deviceIndex));
        qWarning() << "OpenCVCameraSource: Cannot open camera" << deviceIndex;
        return false;
    }

    m_deviceIndex = deviceIndex;
    applyRequestedFormat();

    qDebug() << "OpenCVCameraSource: Opened camera" << deviceIndex
             << "backend:" << QString::fromStdString(m_capture.getBackendName());
    return true;
}

void OpenCVCameraSource::applyRequestedFormat()
{
    if (m_requestedSize.isValid()) {
        m_capture.set(cv::CAP_PROP_FRAME_WIDTH, m_requestedSize.width());
        m_capture.set(cv::CAP_PROP_FRAME_HEIGHT, m_requestedSize.height());
    }
    if (m_requestedFps > 0) {
        m_capture.set(cv::CAP_PROP_FPS, m_requestedFps);
    }
}

QImage OpenCVCameraSource::captureFrame(AppError *error)
{
    if (!m_capture.isOpened()) {
        AppError::set(error, AppError::Kind::Capture, QStringLiteral("Camera is not open"));
        return QImage();
    }

    cv::Mat frame;
    bool ok = false;
    try {
        ok = m_capture.read(frame);
    } catch (const cv::Exception &ex) {
        qWarning() << "OpenCVCameraSource: read threw:" << ex.what();
        ok = false;
    }

    if (!ok || frame.empty()) {
        AppError::set(error, AppError::Kind::Capture,
                      QStringLiteral("Failed to read from camera %1").arg(m_deviceIndex));
        return QImage();
    }

    return toFrame(frame, error);
}

QImage OpenCVCameraSource::toFrame(const cv::Mat &mat, AppError *error)
{
    QImage image = MatConverter::toQImage(mat);
    if (image.isNull()) {
        AppError::set(error, AppError::Kind::Capture,
                      QStringLiteral("Unsupported camera frame format (type %1, %2 channels)")
                          .arg(mat.type())
                          .arg(mat.channels()));
        return QImage();
    }
    return image.convertToFormat(QImage::Format_RGB32);
}

void OpenCVCameraSource::close()
{
    if (!m_capture.isOpened()) {
        return;
    }
    m_capture.release();
    qDebug() << "OpenCVCameraSource: Released camera" << m_deviceIndex;
    m_deviceIndex = -1;
}

bool OpenCVCameraSource::isOpen() const
{
    return m_capture.isOpened();
}
