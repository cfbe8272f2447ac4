#include "MainWindow.h"

#include "AppError.h"
#include "Constants.h"
#include "SettingsDialog.h"
#include "capture/ICameraSource.h"
#include "capture/ImageLoader.h"
#include "ocr/TesseractOCREngine.h"
#include "region/RoiSelector.h"
#include "ui/ImageCanvas.h"
#include "ui/TextPanel.h"
#include "version.h"

#include <QAction>
#include <QCloseEvent>
#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QSplitter>
#include <QStatusBar>
#include <QToolBar>
#include <QVBoxLayout>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_controller(nullptr)
    , m_canvas(nullptr)
    , m_textPanel(nullptr)
    , m_cameraStatusLabel(nullptr)
    , m_busyLabel(nullptr)
    , m_loadImageAction(nullptr)
    , m_saveTextAction(nullptr)
    , m_exitAction(nullptr)
    , m_copyTextAction(nullptr)
    , m_clearTextAction(nullptr)
    , m_findAction(nullptr)
    , m_settingsAction(nullptr)
    , m_startCameraAction(nullptr)
    , m_stopCameraAction(nullptr)
    , m_runOcrAction(nullptr)
    , m_clearRoiAction(nullptr)
    , m_aboutAction(nullptr)
{
    m_settingsManager.load();

    m_controller = new AppController(ICameraSource::createDefault(),
                                     createEngine(m_settingsManager.settings()), this);
    m_controller->setSettings(m_settingsManager.settings());

    setWindowTitle(QStringLiteral(TEXTREADER_APP_NAME));
    resize(TextReader::UI::kDefaultWindowWidth, TextReader::UI::kDefaultWindowHeight);
    setMinimumSize(TextReader::UI::kMinWindowWidth, TextReader::UI::kMinWindowHeight);

    setupActions();
    setupUi();
    setupMenus();
    setupToolbar();

    connect(m_controller, &AppController::displayImageChanged,
            this, &MainWindow::onDisplayImageChanged);
    connect(m_controller, &AppController::cameraStateChanged,
            this, &MainWindow::onCameraStateChanged);
    connect(m_controller, &AppController::busyChanged, this, &MainWindow::onBusyChanged);
    connect(m_controller, &AppController::ocrFinished, this, &MainWindow::onOcrFinished);
    connect(m_controller, &AppController::errorOccurred, this, &MainWindow::onError);
    connect(m_controller, &AppController::statusMessage, this, &MainWindow::showStatus);
    connect(m_controller->roiSelector(), &RoiSelector::stateChanged, this, [this]() {
        updateActions();
    });

    connect(m_textPanel, &TextPanel::copyRequested, this, &MainWindow::onCopyText);
    connect(m_textPanel, &TextPanel::saveRequested, this, &MainWindow::onSaveText);
    connect(m_textPanel, &TextPanel::clearRequested, this, &MainWindow::onClearText);
    connect(m_textPanel, &TextPanel::searchFinished, this, &MainWindow::onSearchFinished);
    connect(m_textPanel, &TextPanel::textChanged, this, [this]() {
        updateActions();
    });

    onCameraStateChanged(m_controller->cameraState());
    showStatus(tr("Open an image or start the camera to begin."));
}

MainWindow::~MainWindow() = default;

void MainWindow::initialize()
{
    QString version;
    AppError error;
    if (TesseractOCREngine::probe(m_settingsManager.settings().tesseractPath, &version, &error)) {
        m_engineVersion = version;
        qDebug() << "MainWindow: OCR engine available:" << version;
        return;
    }

    qWarning() << "MainWindow: OCR engine probe failed:" << error.message;
    statusBar()->showMessage(tr("%1: %2 Set the Tesseract path in Edit > Settings.")
                                 .arg(AppError::kindName(error.kind), error.message));
}

std::shared_ptr<IOCREngine> MainWindow::createEngine(const OCRSettings &settings)
{
    TesseractOCREngine::Config config;
    config.executablePath = settings.tesseractPath;
    config.pageSegMode = settings.pageSegMode;
    config.language = settings.language;
    config.timeoutMs = settings.timeoutMs;
    return std::make_shared<TesseractOCREngine>(config);
}

void MainWindow::setupUi()
{
    QSplitter *splitter = new QSplitter(Qt::Vertical, this);

    m_canvas = new ImageCanvas(splitter);
    m_canvas->setRoiSelector(m_controller->roiSelector());
    splitter->addWidget(m_canvas);

    QWidget *panelContainer = new QWidget(splitter);
    QVBoxLayout *panelLayout = new QVBoxLayout(panelContainer);
    panelLayout->setContentsMargins(8, 8, 8, 8);
    m_textPanel = new TextPanel(panelContainer);
    panelLayout->addWidget(m_textPanel);
    splitter->addWidget(panelContainer);

    splitter->setStretchFactor(0, 3);
    splitter->setStretchFactor(1, 2);
    setCentralWidget(splitter);

    m_cameraStatusLabel = new QLabel(this);
    m_busyLabel = new QLabel(tr("Processing..."), this);
    m_busyLabel->setVisible(false);
    statusBar()->addPermanentWidget(m_busyLabel);
    statusBar()->addPermanentWidget(m_cameraStatusLabel);
}

void MainWindow::setupActions()
{
    m_loadImageAction = new QAction(tr("&Load Image..."), this);
    m_loadImageAction->setShortcut(QKeySequence::Open);
    connect(m_loadImageAction, &QAction::triggered, this, &MainWindow::onLoadImage);

    m_saveTextAction = new QAction(tr("&Save Text..."), this);
    m_saveTextAction->setShortcut(QKeySequence::Save);
    connect(m_saveTextAction, &QAction::triggered, this, &MainWindow::onSaveText);

    m_exitAction = new QAction(tr("E&xit"), this);
    m_exitAction->setShortcut(QKeySequence::Quit);
    connect(m_exitAction, &QAction::triggered, this, &QWidget::close);

    m_copyTextAction = new QAction(tr("&Copy Text"), this);
    connect(m_copyTextAction, &QAction::triggered, this, &MainWindow::onCopyText);

    m_clearTextAction = new QAction(tr("C&lear Text"), this);
    connect(m_clearTextAction, &QAction::triggered, this, &MainWindow::onClearText);

    m_findAction = new QAction(tr("&Find..."), this);
    m_findAction->setShortcut(QKeySequence::Find);
    connect(m_findAction, &QAction::triggered, this, [this]() {
        m_textPanel->focusSearch();
    });

    m_settingsAction = new QAction(tr("Se&ttings..."), this);
    m_settingsAction->setMenuRole(QAction::PreferencesRole);
    connect(m_settingsAction, &QAction::triggered, this, &MainWindow::onSettings);

    m_startCameraAction = new QAction(tr("&Start Camera"), this);
    connect(m_startCameraAction, &QAction::triggered, this, [this]() {
        m_controller->dispatch({AppController::Action::StartCamera, QString()});
    });

    m_stopCameraAction = new QAction(tr("S&top Camera"), this);
    connect(m_stopCameraAction, &QAction::triggered, this, [this]() {
        m_controller->dispatch({AppController::Action::StopCamera, QString()});
    });

    m_runOcrAction = new QAction(tr("&Run OCR"), this);
    m_runOcrAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_R));
    connect(m_runOcrAction, &QAction::triggered, this, [this]() {
        m_controller->dispatch({AppController::Action::RunOcr, QString()});
    });

    m_clearRoiAction = new QAction(tr("&Clear Selection"), this);
    m_clearRoiAction->setShortcut(QKeySequence(Qt::Key_Escape));
    connect(m_clearRoiAction, &QAction::triggered, this, [this]() {
        m_controller->dispatch({AppController::Action::ClearRoi, QString()});
    });

    m_aboutAction = new QAction(tr("&About %1").arg(QStringLiteral(TEXTREADER_APP_NAME)), this);
    m_aboutAction->setMenuRole(QAction::AboutRole);
    connect(m_aboutAction, &QAction::triggered, this, &MainWindow::onAbout);
}

void MainWindow::setupMenus()
{
    QMenu *fileMenu = menuBar()->addMenu(tr("&File"));
    fileMenu->addAction(m_loadImageAction);
    fileMenu->addAction(m_saveTextAction);
    fileMenu->addSeparator();
    fileMenu->addAction(m_exitAction);

    QMenu *editMenu = menuBar()->addMenu(tr("&Edit"));
    editMenu->addAction(m_copyTextAction);
    editMenu->addAction(m_clearTextAction);
    editMenu->addAction(m_findAction);
    editMenu->addSeparator();
    editMenu->addAction(m_settingsAction);

    QMenu *cameraMenu = menuBar()->addMenu(tr("&Camera"));
    cameraMenu->addAction(m_startCameraAction);
    cameraMenu->addAction(m_stopCameraAction);

    QMenu *ocrMenu = menuBar()->addMenu(tr("&OCR"));
    ocrMenu->addAction(m_runOcrAction);
    ocrMenu->addAction(m_clearRoiAction);

    QMenu *helpMenu = menuBar()->addMenu(tr("&Help"));
    helpMenu->addAction(m_aboutAction);
}

void MainWindow::setupToolbar()
{
    QToolBar *toolbar = addToolBar(tr("Main"));
    toolbar->setObjectName("mainToolbar");
    toolbar->setMovable(false);
    toolbar->setToolButtonStyle(Qt::ToolButtonTextOnly);
    toolbar->addAction(m_loadImageAction);
    toolbar->addSeparator();
    toolbar->addAction(m_startCameraAction);
    toolbar->addAction(m_stopCameraAction);
    toolbar->addSeparator();
    toolbar->addAction(m_clearRoiAction);
    toolbar->addAction(m_runOcrAction);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    m_controller->stopCamera();
    if (m_controller->isBusy()) {
        showStatus(tr("Waiting for OCR to finish..."));
        m_controller->waitForIdle();
    }
    QMainWindow::closeEvent(event);
}

void MainWindow::onLoadImage()
{
    QString path = QFileDialog::getOpenFileName(this, tr("Load Image"), QDir::homePath(),
                                                ImageLoader::dialogFilter());
    if (path.isEmpty()) {
        return;
    }
    m_controller->dispatch({AppController::Action::LoadImage, path});
}

void MainWindow::onSaveText()
{
    if (m_textPanel->isEmpty()) {
        QMessageBox::warning(this, tr("Save Text"), tr("There is no text to save. Run OCR first."));
        return;
    }

    QString defaultPath = QDir(QDir::homePath()).filePath(QStringLiteral("extracted_text.txt"));
    QString path = QFileDialog::getSaveFileName(this, tr("Save Text"), defaultPath,
                                                tr("Text files (*.txt);;All files (*)"));
    if (path.isEmpty()) {
        return;
    }
    if (QFileInfo(path).suffix().isEmpty()) {
        path += QStringLiteral(".txt");
    }

    AppError error;
    if (!m_textPanel->saveToFile(path, &error)) {
        onError(error);
        return;
    }
    showStatus(tr("Text saved to %1").arg(QDir::toNativeSeparators(path)));
}

void MainWindow::onCopyText()
{
    if (!m_textPanel->copyToClipboard()) {
        QMessageBox::warning(this, tr("Copy Text"), tr("There is no text to copy. Run OCR first."));
        return;
    }
    showStatus(tr("Text copied to clipboard"));
}

void MainWindow::onClearText()
{
    m_controller->clearText();
    m_textPanel->clear();
    m_textPanel->setPlaceholderText(tr("Run OCR to extract text from the image."));
    showStatus(tr("Text cleared"));
}

void MainWindow::onSettings()
{
    SettingsDialog dialog(m_settingsManager.settings(), this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }

    m_settingsManager.setSettings(dialog.settings());
    m_settingsManager.save();

    m_controller->setSettings(m_settingsManager.settings());
    m_controller->setEngine(createEngine(m_settingsManager.settings()));
    m_engineVersion.clear();
    showStatus(tr("Settings saved"));
}

void MainWindow::onAbout()
{
    QString engineLine = m_engineVersion.isEmpty()
        ? tr("OCR engine: not detected")
        : tr("OCR engine: %1").arg(m_engineVersion);

    QMessageBox::about(this, tr("About %1").arg(QStringLiteral(TEXTREADER_APP_NAME)),
                       tr("<b>%1</b> %2<br><br>"
                          "Extract text from images and live camera frames.<br>"
                          "Drag on the picture to limit OCR to a region.<br><br>%3")
                           .arg(QStringLiteral(TEXTREADER_APP_NAME),
                                QStringLiteral(TEXTREADER_VERSION),
                                engineLine.toHtmlEscaped()));
}

void MainWindow::onDisplayImageChanged(const QImage &image)
{
    m_canvas->setImage(image);
    updateActions();
}

void MainWindow::onCameraStateChanged(AppController::CameraState state)
{
    switch (state) {
    case AppController::CameraState::Stopped:
        m_cameraStatusLabel->setText(tr("Camera: off"));
        m_startCameraAction->setText(tr("&Start Camera"));
        break;
    case AppController::CameraState::Running:
        m_cameraStatusLabel->setText(tr("Camera: live"));
        m_startCameraAction->setText(tr("&Start Camera"));
        break;
    case AppController::CameraState::Paused:
        m_cameraStatusLabel->setText(tr("Camera: paused"));
        m_startCameraAction->setText(tr("Re&sume Camera"));
        break;
    }
    updateActions();
}

void MainWindow::onBusyChanged(bool busy)
{
    m_busyLabel->setVisible(busy);
    updateActions();
}

void MainWindow::onOcrFinished(const QString &text, int regionCount)
{
    Q_UNUSED(regionCount);

    m_textPanel->setText(text);
    if (text.isEmpty()) {
        m_textPanel->setPlaceholderText(tr("[No text detected]"));
    }
}

void MainWindow::onError(const AppError &error)
{
    showStatus(tr("%1: %2").arg(AppError::kindName(error.kind), error.message));
    QMessageBox::warning(this, AppError::kindName(error.kind), error.message);
}

void MainWindow::onSearchFinished(const QString &query, int matchCount)
{
    if (query.isEmpty()) {
        statusBar()->clearMessage();
        return;
    }
    showStatus(tr("%n match(es) for \"%1\"", nullptr, matchCount).arg(query));
}

void MainWindow::updateActions()
{
    const AppController::CameraState state = m_controller->cameraState();
    const bool busy = m_controller->isBusy();
    const bool hasFrame = !m_controller->currentFrame().isNull();
    const bool hasText = !m_textPanel->isEmpty();

    m_startCameraAction->setEnabled(state != AppController::CameraState::Running);
    m_stopCameraAction->setEnabled(state != AppController::CameraState::Stopped);
    m_runOcrAction->setEnabled(hasFrame && !busy);
    m_clearRoiAction->setEnabled(m_controller->roiSelector()->state() != RoiSelector::State::Idle);
    // Copy and Save stay enabled so an empty panel gets a warning
    m_clearTextAction->setEnabled(hasText);
}

void MainWindow::showStatus(const QString &message)
{
    statusBar()->showMessage(message, TextReader::Timer::kStatusMessage);
}
