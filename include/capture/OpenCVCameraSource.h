#ifndef OPENCVCAMERASOURCE_H
#define OPENCVCAMERASOURCE_H

#include "capture/ICameraSource.h"

#include <opencv2/videoio.hpp>

/**
 * @brief Webcam source backed by cv::VideoCapture.
 */
class OpenCVCameraSource : public ICameraSource
{
    Q_OBJECT

public:
    explicit OpenCVCameraSource(QObject *parent = nullptr);
    ~OpenCVCameraSource() override;

    bool open(int deviceIndex, AppError *error = nullptr) override;
    QImage captureFrame(AppError *error = nullptr) override;
    void close() override;
    bool isOpen() const override;
    QString sourceName() const override { return QStringLiteral("OpenCVCameraSource"); }

    int deviceIndex() const { return m_deviceIndex; }

    // Camera Mat to Format_RGB32; Capture error for an unsupported Mat type
    static QImage toFrame(const cv::Mat &mat, AppError *error = nullptr);

private:
    void applyRequestedFormat();

    cv::VideoCapture m_capture;
    int m_deviceIndex = -1;
};

#endif // OPENCVCAMERASOURCE_H
