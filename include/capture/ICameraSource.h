#ifndef ICAMERASOURCE_H
#define ICAMERASOURCE_H

#include <QObject>
#include <QImage>
#include <QSize>

struct AppError;

/**
 * @brief Abstract interface for live frame sources
 *
 * A source holds at most one open device. The device is an exclusive OS
 * resource: implementations release it in close() and in their destructor.
 * Implementations:
 * - OpenCVCameraSource: cv::VideoCapture backed webcam
 * - MockCameraSource (tests): scripted frames and failures
 */
class ICameraSource : public QObject
{
    Q_OBJECT

public:
    explicit ICameraSource(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~ICameraSource() = default;

    /**
     * @brief Set the capture size and rate requested on the next open()
     */
    void setRequestedFormat(const QSize &frameSize, int fps)
    {
        m_requestedSize = frameSize;
        m_requestedFps = fps;
    }

    /**
     * @brief Open a capture device
     * @param deviceIndex Device to open
     * @param error Filled with DeviceUnavailable when the index has no
     *        device or a device is already open
     * @return true if the device is open and ready
     */
    virtual bool open(int deviceIndex, AppError *error = nullptr) = 0;

    /**
     * @brief Pull the latest frame
     * @param error Filled with Capture when the stream ended or the device
     *        disconnected
     * @return Format_RGB32 frame, or null QImage on failure
     */
    virtual QImage captureFrame(AppError *error = nullptr) = 0;

    /**
     * @brief Release the device. Safe to call when nothing is open.
     */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    virtual QString sourceName() const = 0;

    /**
     * @brief Create the default camera source for this platform
     * @param parent Parent QObject for ownership
     */
    static ICameraSource *createDefault(QObject *parent = nullptr);

protected:
    QSize m_requestedSize;
    int m_requestedFps = 30;
};

#endif // ICAMERASOURCE_H
