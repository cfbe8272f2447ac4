#ifndef APPCONTROLLER_H
#define APPCONTROLLER_H

#include <QObject>
#include <QImage>
#include <QFutureWatcher>
#include <QPoint>
#include <QString>
#include <QVector>

#include <memory>
#include <optional>

#include "AppError.h"
#include "detection/OCRPreprocessor.h"
#include "detection/OCRTypes.h"
#include "settings/OCRSettingsManager.h"

class QTimer;
class ICameraSource;
class IOCREngine;
class RoiSelector;

/**
 * @brief Owns the pipeline state and sequences user actions.
 *
 * Holds the current frame, the ROI, the camera lifecycle, the extracted
 * text and the overlay. Camera frames are pulled on the GUI thread from a
 * timer tick. Recognition runs on a QtConcurrent worker, one job at a
 * time; results are applied back on the GUI thread. A result whose frame
 * has been replaced in the meantime still updates the text, but its
 * overlay is discarded.
 */
class AppController : public QObject
{
    Q_OBJECT

public:
    enum class CameraState {
        Stopped,    // No device held
        Running,    // Device open, frames refreshing
        Paused      // Device open, frame frozen for OCR
    };
    Q_ENUM(CameraState)

    enum class Action {
        LoadImage,
        StartCamera,
        StopCamera,
        ClearRoi,
        RunOcr
    };
    Q_ENUM(Action)

    struct ActionRequest {
        Action action = Action::RunOcr;
        QString path;   ///< LoadImage only
    };

    /**
     * @param camera Frame source; reparented to the controller. May be null.
     * @param engine Recognition engine shared with the worker. May be null.
     */
    AppController(ICameraSource* camera, std::shared_ptr<IOCREngine> engine,
                  QObject* parent = nullptr);
    ~AppController() override;

    // Settings drive the camera format, the frame tick and the overlay filter
    void setSettings(const OCRSettings& settings);
    const OCRSettings& settings() const { return m_settings; }

    // Takes effect from the next OCR run; an in-flight job keeps its engine
    void setEngine(std::shared_ptr<IOCREngine> engine);
    IOCREngine* engine() const { return m_engine.get(); }

    void dispatch(const ActionRequest& request);

    bool loadImage(const QString& path);
    bool startCamera();     // Stopped: open device. Paused: resume live frames.
    void stopCamera();
    void clearRoi();
    void clearText();       // Explicit clear; OCR and reloads never clear
    bool runOcr();

    // One frame tick; returns false if no frame was taken
    bool captureNextFrame();

    // Block until the in-flight OCR job (if any) has finished and been applied
    void waitForIdle();

    QImage currentFrame() const { return m_frame; }
    QImage displayImage() const { return m_overlay.isNull() ? m_frame : m_overlay; }
    bool hasOverlay() const { return !m_overlay.isNull(); }
    QVector<OCRTextBlock> overlayRegions() const { return m_overlayRegions; }
    QString extractedText() const { return m_extractedText; }

    RoiSelector* roiSelector() const { return m_roiSelector; }
    ICameraSource* cameraSource() const { return m_camera; }
    CameraState cameraState() const { return m_cameraState; }
    bool isBusy() const { return m_busy; }

signals:
    void displayImageChanged(const QImage& image);
    void cameraStateChanged(AppController::CameraState state);
    void busyChanged(bool busy);
    void ocrStarted();
    void ocrFinished(const QString& text, int regionCount);
    void extractedTextChanged(const QString& text);
    void statusMessage(const QString& message);
    void errorOccurred(const AppError& error);

private slots:
    void onOcrJobFinished();

private:
    struct OcrOutcome {
        bool success = false;
        OCRResult result;
        AppError error;
        QPoint offset;
        quint64 generation = 0;
        qint64 elapsedMs = 0;
    };

    void setCameraState(CameraState state);
    void setBusy(bool busy);
    void replaceFrame(const QImage& frame);
    void clearOverlay();
    void reportError(const AppError& error);

    static OcrOutcome runJob(std::shared_ptr<IOCREngine> engine, OCRPreprocessor preprocessor,
                             QImage frame, std::optional<QRect> roi, quint64 generation);

    ICameraSource* m_camera;
    std::shared_ptr<IOCREngine> m_engine;
    OCRPreprocessor m_preprocessor;
    OCRSettings m_settings;

    RoiSelector* m_roiSelector;
    QTimer* m_frameTimer;
    QFutureWatcher<OcrOutcome>* m_ocrWatcher;

    QImage m_frame;
    QImage m_overlay;
    QVector<OCRTextBlock> m_overlayRegions;
    QString m_extractedText;

    CameraState m_cameraState = CameraState::Stopped;
    bool m_busy = false;
    quint64 m_frameGeneration = 0;
};

#endif // APPCONTROLLER_H
