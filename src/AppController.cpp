#include "AppController.h"

#include "OverlayRenderer.h"
#include "capture/ICameraSource.h"
#include "capture/ImageLoader.h"
#include "ocr/IOCREngine.h"
#include "region/RoiSelector.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QTimer>
#include <QtConcurrent/QtConcurrent>

AppController::AppController(ICameraSource* camera, std::shared_ptr<IOCREngine> engine,
                             QObject* parent)
    : QObject(parent)
    , m_camera(camera)
    , m_engine(std::move(engine))
    , m_roiSelector(new RoiSelector(this))
    , m_frameTimer(new QTimer(this))
    , m_ocrWatcher(new QFutureWatcher<OcrOutcome>(this))
{
    qRegisterMetaType<AppError>("AppError");

    if (m_camera) {
        m_camera->setParent(this);
    }

    m_frameTimer->setInterval(m_settings.frameIntervalMs);
    connect(m_frameTimer, &QTimer::timeout, this, [this]() {
        captureNextFrame();
    });
    connect(m_ocrWatcher, &QFutureWatcher<OcrOutcome>::finished,
            this, &AppController::onOcrJobFinished);
}

AppController::~AppController()
{
    m_frameTimer->stop();
    if (m_ocrWatcher->isRunning()) {
        qDebug() << "AppController: Waiting for OCR job before shutdown";
        m_ocrWatcher->waitForFinished();
    }
    if (m_camera) {
        m_camera->close();
    }
}

void AppController::setSettings(const OCRSettings& settings)
{
    m_settings = OCRSettingsManager::sanitized(settings);
    m_frameTimer->setInterval(m_settings.frameIntervalMs);
    if (m_camera) {
        m_camera->setRequestedFormat(QSize(m_settings.frameWidth, m_settings.frameHeight),
                                     TextReader::Camera::kDefaultFps);
    }
}

void AppController::setEngine(std::shared_ptr<IOCREngine> engine)
{
    m_engine = std::move(engine);
}

void AppController::dispatch(const ActionRequest& request)
{
    switch (request.action) {
    case Action::LoadImage:
        loadImage(request.path);
        break;
    case Action::StartCamera:
        startCamera();
        break;
    case Action::StopCamera:
        stopCamera();
        break;
    case Action::ClearRoi:
        clearRoi();
        break;
    case Action::RunOcr:
        runOcr();
        break;
    }
}

bool AppController::loadImage(const QString& path)
{
    AppError error;
    QImage image = ImageLoader::loadImage(path, &error);
    if (image.isNull()) {
        reportError(error);
        return false;
    }

    if (m_cameraState != CameraState::Stopped) {
        stopCamera();
    }

    replaceFrame(image);
    m_roiSelector->clear();
    emit displayImageChanged(displayImage());
    emit statusMessage(tr("Loaded %1 (%2 x %3). Drag on the image to select a region, then run OCR.")
                           .arg(QFileInfo(path).fileName())
                           .arg(image.width())
                           .arg(image.height()));
    return true;
}

bool AppController::startCamera()
{
    if (!m_camera) {
        AppError error;
        AppError::set(&error, AppError::Kind::DeviceUnavailable, tr("No camera source available"));
        reportError(error);
        return false;
    }

    switch (m_cameraState) {
    case CameraState::Running:
        return true;

    case CameraState::Paused:
        ++m_frameGeneration;
        m_roiSelector->clear();
        clearOverlay();
        setCameraState(CameraState::Running);
        m_frameTimer->start();
        emit displayImageChanged(displayImage());
        emit statusMessage(tr("Camera resumed"));
        return true;

    case CameraState::Stopped:
        break;
    }

    m_camera->setRequestedFormat(QSize(m_settings.frameWidth, m_settings.frameHeight),
                                 TextReader::Camera::kDefaultFps);

    AppError error;
    if (!m_camera->open(m_settings.cameraIndex, &error)) {
        reportError(error);
        return false;
    }

    qDebug() << "AppController: Camera" << m_settings.cameraIndex << "opened via"
             << m_camera->sourceName();

    m_roiSelector->clear();
    clearOverlay();
    setCameraState(CameraState::Running);

    // First frame right away so the view is not blank for one tick
    if (!captureNextFrame()) {
        return false;
    }
    m_frameTimer->start();
    emit statusMessage(tr("Camera running. Drag on the preview to select a region, then run OCR."));
    return true;
}

void AppController::stopCamera()
{
    m_frameTimer->stop();
    if (m_camera) {
        m_camera->close();
    }
    if (m_cameraState != CameraState::Stopped) {
        // A pending OCR result no longer belongs to a live frame
        ++m_frameGeneration;
        setCameraState(CameraState::Stopped);
        emit statusMessage(tr("Camera stopped"));
    }
}

void AppController::clearRoi()
{
    m_roiSelector->clear();
    emit statusMessage(tr("Region cleared. OCR will use the whole frame."));
}

void AppController::clearText()
{
    if (m_extractedText.isEmpty()) {
        return;
    }
    m_extractedText.clear();
    emit extractedTextChanged(m_extractedText);
}

bool AppController::runOcr()
{
    if (m_busy) {
        emit statusMessage(tr("OCR is already running"));
        return false;
    }

    if (m_frame.isNull()) {
        AppError error;
        AppError::set(&error, AppError::Kind::InvalidImage,
                      tr("No image loaded. Open an image or start the camera first."));
        reportError(error);
        return false;
    }

    if (!m_engine) {
        AppError error;
        AppError::set(&error, AppError::Kind::EngineUnavailable, tr("No OCR engine configured"));
        reportError(error);
        return false;
    }

    // Freeze the preview so the overlay matches the recognized frame
    if (m_cameraState == CameraState::Running) {
        m_frameTimer->stop();
        setCameraState(CameraState::Paused);
    }

    const std::optional<QRect> roi = m_roiSelector->currentRegion();
    const QImage frame = m_frame;
    const quint64 generation = m_frameGeneration;
    std::shared_ptr<IOCREngine> engine = m_engine;
    const OCRPreprocessor preprocessor = m_preprocessor;

    setBusy(true);
    emit ocrStarted();
    emit statusMessage(roi ? tr("Running OCR on the selected region...")
                           : tr("Running OCR on the whole frame..."));

    m_ocrWatcher->setFuture(QtConcurrent::run([engine, preprocessor, frame, roi, generation]() {
        return runJob(engine, preprocessor, frame, roi, generation);
    }));
    return true;
}

AppController::OcrOutcome AppController::runJob(std::shared_ptr<IOCREngine> engine,
                                                OCRPreprocessor preprocessor, QImage frame,
                                                std::optional<QRect> roi, quint64 generation)
{
    QElapsedTimer timer;
    timer.start();

    OcrOutcome outcome;
    outcome.generation = generation;
    outcome.offset = OCRPreprocessor::effectiveRegion(frame.size(), roi).topLeft();

    QImage prepared = preprocessor.preprocess(frame, roi, &outcome.error);
    if (!prepared.isNull()) {
        outcome.success = engine->recognize(prepared, outcome.result, &outcome.error);
    }

    outcome.elapsedMs = timer.elapsed();
    return outcome;
}

void AppController::onOcrJobFinished()
{
    // Already applied by waitForIdle()
    if (!m_busy) {
        return;
    }

    const OcrOutcome outcome = m_ocrWatcher->result();
    setBusy(false);

    if (!outcome.success) {
        qWarning() << "AppController: OCR failed:" << AppError::kindName(outcome.error.kind)
                   << outcome.error.message;
        reportError(outcome.error);
        return;
    }

    qDebug() << "AppController: OCR finished in" << outcome.elapsedMs << "ms with"
             << outcome.result.blocks.size() << "tokens";

    m_extractedText = outcome.result.text;
    emit extractedTextChanged(m_extractedText);

    const QVector<OCRTextBlock> regions = OverlayRenderer::drawable(
        OverlayRenderer::translated(outcome.result.blocks, outcome.offset),
        m_settings.minConfidence);

    if (outcome.generation == m_frameGeneration) {
        m_overlayRegions = regions;
        m_overlay = OverlayRenderer::renderOverlay(m_frame, m_overlayRegions);
        emit displayImageChanged(displayImage());
    } else {
        qDebug() << "AppController: Frame replaced during OCR, overlay discarded";
    }

    // Status first so listeners of ocrFinished can still refine it
    if (m_extractedText.isEmpty()) {
        emit statusMessage(tr("No text detected. Try a larger region or better lighting."));
    } else {
        emit statusMessage(tr("OCR finished: %n word(s) recognized", nullptr, regions.size()));
    }
    emit ocrFinished(m_extractedText, regions.size());
}

bool AppController::captureNextFrame()
{
    if (m_cameraState != CameraState::Running || !m_camera) {
        return false;
    }

    AppError error;
    QImage frame = m_camera->captureFrame(&error);
    if (frame.isNull()) {
        qWarning() << "AppController: Frame capture failed, stopping camera";
        stopCamera();
        reportError(error);
        return false;
    }

    replaceFrame(frame);
    emit displayImageChanged(displayImage());
    return true;
}

void AppController::waitForIdle()
{
    if (!m_busy) {
        return;
    }
    m_ocrWatcher->waitForFinished();
    // finished() is delivered through the event loop; apply it now
    if (m_busy) {
        onOcrJobFinished();
    }
}

void AppController::setCameraState(CameraState state)
{
    if (m_cameraState == state) {
        return;
    }
    m_cameraState = state;
    emit cameraStateChanged(state);
}

void AppController::setBusy(bool busy)
{
    if (m_busy == busy) {
        return;
    }
    m_busy = busy;
    emit busyChanged(busy);
}

void AppController::replaceFrame(const QImage& frame)
{
    m_frame = frame;
    ++m_frameGeneration;
    clearOverlay();
    m_roiSelector->setBounds(m_frame.rect());
}

void AppController::clearOverlay()
{
    m_overlay = QImage();
    m_overlayRegions.clear();
}

void AppController::reportError(const AppError& error)
{
    qWarning() << "AppController:" << AppError::kindName(error.kind) << error.message;
    emit errorOccurred(error);
}
