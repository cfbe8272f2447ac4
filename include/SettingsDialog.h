#ifndef SETTINGSDIALOG_H
#define SETTINGSDIALOG_H

#include <QDialog>

#include "settings/OCRSettingsManager.h"

class QTabWidget;
class QLabel;
class QLineEdit;
class QPushButton;
class QSpinBox;

class SettingsDialog : public QDialog
{
    Q_OBJECT

public:
    explicit SettingsDialog(const OCRSettings &settings, QWidget *parent = nullptr);
    ~SettingsDialog();

    // Values currently entered, clamped into range
    OCRSettings settings() const;

private slots:
    void onBrowseEngine();
    void onCheckEngine();
    void onRestoreDefaults();

private:
    void setupUi();
    void setupOcrTab(QWidget *tab);
    void setupCameraTab(QWidget *tab);
    void applyToControls(const OCRSettings &settings);

    // UI elements
    QTabWidget *m_tabWidget;

    // OCR tab
    QLineEdit *m_enginePathEdit;
    QPushButton *m_engineBrowseBtn;
    QPushButton *m_engineCheckBtn;
    QLabel *m_engineStatusLabel;
    QSpinBox *m_pageSegModeSpin;
    QLineEdit *m_languageEdit;
    QSpinBox *m_timeoutSpin;
    QSpinBox *m_minConfidenceSpin;

    // Camera tab
    QSpinBox *m_cameraIndexSpin;
    QSpinBox *m_frameIntervalSpin;
    QSpinBox *m_frameWidthSpin;
    QSpinBox *m_frameHeightSpin;

    QPushButton *m_restoreDefaultsBtn;
};

#endif // SETTINGSDIALOG_H
