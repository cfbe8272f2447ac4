#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>

#include "AppController.h"
#include "settings/OCRSettingsManager.h"

#include <memory>

class QAction;
class QLabel;
class ImageCanvas;
class TextPanel;
class IOCREngine;
struct AppError;

/**
 * @brief Top-level window: canvas, text panel, menus, toolbar, status bar.
 *
 * Forwards user gestures to the AppController and renders its signals.
 * Every AppError is shown as a warning dialog plus a status message.
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    // Post-show setup: engine availability probe
    void initialize();

    AppController *controller() const { return m_controller; }

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onLoadImage();
    void onSaveText();
    void onCopyText();
    void onClearText();
    void onSettings();
    void onAbout();

    void onDisplayImageChanged(const QImage &image);
    void onCameraStateChanged(AppController::CameraState state);
    void onBusyChanged(bool busy);
    void onOcrFinished(const QString &text, int regionCount);
    void onError(const AppError &error);
    void onSearchFinished(const QString &query, int matchCount);

private:
    void setupUi();
    void setupActions();
    void setupMenus();
    void setupToolbar();
    void updateActions();
    void showStatus(const QString &message);

    static std::shared_ptr<IOCREngine> createEngine(const OCRSettings &settings);

    OCRSettingsManager m_settingsManager;
    AppController *m_controller;

    ImageCanvas *m_canvas;
    TextPanel *m_textPanel;
    QLabel *m_cameraStatusLabel;
    QLabel *m_busyLabel;
    QString m_engineVersion;

    QAction *m_loadImageAction;
    QAction *m_saveTextAction;
    QAction *m_exitAction;
    QAction *m_copyTextAction;
    QAction *m_clearTextAction;
    QAction *m_findAction;
    QAction *m_settingsAction;
    QAction *m_startCameraAction;
    QAction *m_stopCameraAction;
    QAction *m_runOcrAction;
    QAction *m_clearRoiAction;
    QAction *m_aboutAction;
};

#endif // MAINWINDOW_H
