#include "SettingsDialog.h"
#include "AppError.h"
#include "ocr/TesseractOCREngine.h"

#include <QDebug>
#include <QDialogButtonBox>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSpinBox>
#include <QTabWidget>
#include <QVBoxLayout>

SettingsDialog::SettingsDialog(const OCRSettings &settings, QWidget *parent)
    : QDialog(parent)
    , m_tabWidget(nullptr)
    , m_enginePathEdit(nullptr)
    , m_engineBrowseBtn(nullptr)
    , m_engineCheckBtn(nullptr)
    , m_engineStatusLabel(nullptr)
    , m_pageSegModeSpin(nullptr)
    , m_languageEdit(nullptr)
    , m_timeoutSpin(nullptr)
    , m_minConfidenceSpin(nullptr)
    , m_cameraIndexSpin(nullptr)
    , m_frameIntervalSpin(nullptr)
    , m_frameWidthSpin(nullptr)
    , m_frameHeightSpin(nullptr)
    , m_restoreDefaultsBtn(nullptr)
{
    setWindowTitle(tr("Settings"));
    setMinimumWidth(460);
    setupUi();
    applyToControls(OCRSettingsManager::sanitized(settings));
}

SettingsDialog::~SettingsDialog() = default;

void SettingsDialog::setupUi()
{
    QVBoxLayout *mainLayout = new QVBoxLayout(this);

    m_tabWidget = new QTabWidget(this);

    QWidget *ocrTab = new QWidget();
    setupOcrTab(ocrTab);
    m_tabWidget->addTab(ocrTab, tr("OCR"));

    QWidget *cameraTab = new QWidget();
    setupCameraTab(cameraTab);
    m_tabWidget->addTab(cameraTab, tr("Camera"));

    mainLayout->addWidget(m_tabWidget);

    QHBoxLayout *buttonLayout = new QHBoxLayout();
    m_restoreDefaultsBtn = new QPushButton(tr("Restore Defaults"), this);
    connect(m_restoreDefaultsBtn, &QPushButton::clicked,
            this, &SettingsDialog::onRestoreDefaults);
    buttonLayout->addWidget(m_restoreDefaultsBtn);
    buttonLayout->addStretch();

    QDialogButtonBox *buttonBox =
        new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    buttonLayout->addWidget(buttonBox);

    mainLayout->addLayout(buttonLayout);
}

void SettingsDialog::setupOcrTab(QWidget *tab)
{
    QFormLayout *form = new QFormLayout(tab);

    // Engine path row: edit + browse + check
    QHBoxLayout *pathLayout = new QHBoxLayout();
    m_enginePathEdit = new QLineEdit(tab);
    m_enginePathEdit->setPlaceholderText(tr("Auto-detect (PATH)"));
    pathLayout->addWidget(m_enginePathEdit, 1);

    m_engineBrowseBtn = new QPushButton(tr("Browse..."), tab);
    connect(m_engineBrowseBtn, &QPushButton::clicked, this, &SettingsDialog::onBrowseEngine);
    pathLayout->addWidget(m_engineBrowseBtn);

    m_engineCheckBtn = new QPushButton(tr("Check"), tab);
    connect(m_engineCheckBtn, &QPushButton::clicked, this, &SettingsDialog::onCheckEngine);
    pathLayout->addWidget(m_engineCheckBtn);
    form->addRow(tr("Tesseract:"), pathLayout);

    m_engineStatusLabel = new QLabel(tab);
    m_engineStatusLabel->setWordWrap(true);
    form->addRow(QString(), m_engineStatusLabel);

    m_pageSegModeSpin = new QSpinBox(tab);
    m_pageSegModeSpin->setRange(0, TextReader::OCR::kMaxPageSegMode);
    m_pageSegModeSpin->setToolTip(tr("6 assumes a single uniform block of text"));
    form->addRow(tr("Page segmentation mode:"), m_pageSegModeSpin);

    m_languageEdit = new QLineEdit(tab);
    m_languageEdit->setPlaceholderText(QString::fromLatin1(TextReader::OCR::kDefaultLanguage));
    m_languageEdit->setToolTip(tr("Tesseract language code, e.g. eng or eng+deu"));
    form->addRow(tr("Language:"), m_languageEdit);

    m_timeoutSpin = new QSpinBox(tab);
    m_timeoutSpin->setRange(0, 600000);
    m_timeoutSpin->setSingleStep(1000);
    m_timeoutSpin->setSuffix(tr(" ms"));
    m_timeoutSpin->setSpecialValueText(tr("No timeout"));
    form->addRow(tr("Timeout:"), m_timeoutSpin);

    m_minConfidenceSpin = new QSpinBox(tab);
    m_minConfidenceSpin->setRange(0, 100);
    m_minConfidenceSpin->setToolTip(tr("Boxes below this confidence are not drawn"));
    form->addRow(tr("Minimum box confidence:"), m_minConfidenceSpin);
}

void SettingsDialog::setupCameraTab(QWidget *tab)
{
    QFormLayout *form = new QFormLayout(tab);

    m_cameraIndexSpin = new QSpinBox(tab);
    m_cameraIndexSpin->setRange(0, TextReader::Camera::kMaxDeviceIndex);
    form->addRow(tr("Device index:"), m_cameraIndexSpin);

    m_frameIntervalSpin = new QSpinBox(tab);
    m_frameIntervalSpin->setRange(1, 1000);
    m_frameIntervalSpin->setSuffix(tr(" ms"));
    form->addRow(tr("Frame interval:"), m_frameIntervalSpin);

    m_frameWidthSpin = new QSpinBox(tab);
    m_frameWidthSpin->setRange(1, 7680);
    m_frameWidthSpin->setSuffix(tr(" px"));
    form->addRow(tr("Frame width:"), m_frameWidthSpin);

    m_frameHeightSpin = new QSpinBox(tab);
    m_frameHeightSpin->setRange(1, 4320);
    m_frameHeightSpin->setSuffix(tr(" px"));
    form->addRow(tr("Frame height:"), m_frameHeightSpin);

    QLabel *note = new QLabel(tr("Camera changes apply the next time the camera is started."), tab);
    note->setWordWrap(true);
    form->addRow(note);
}

void SettingsDialog::applyToControls(const OCRSettings &settings)
{
    m_enginePathEdit->setText(settings.tesseractPath);
    m_pageSegModeSpin->setValue(settings.pageSegMode);
    m_languageEdit->setText(settings.language);
    m_timeoutSpin->setValue(settings.timeoutMs);
    m_minConfidenceSpin->setValue(settings.minConfidence);
    m_cameraIndexSpin->setValue(settings.cameraIndex);
    m_frameIntervalSpin->setValue(settings.frameIntervalMs);
    m_frameWidthSpin->setValue(settings.frameWidth);
    m_frameHeightSpin->setValue(settings.frameHeight);
    m_engineStatusLabel->clear();
}

OCRSettings SettingsDialog::settings() const
{
    OCRSettings settings;
    settings.tesseractPath = m_enginePathEdit->text();
    settings.pageSegMode = m_pageSegModeSpin->value();
    settings.language = m_languageEdit->text();
    settings.timeoutMs = m_timeoutSpin->value();
    settings.minConfidence = m_minConfidenceSpin->value();
    settings.cameraIndex = m_cameraIndexSpin->value();
    settings.frameIntervalMs = m_frameIntervalSpin->value();
    settings.frameWidth = m_frameWidthSpin->value();
    settings.frameHeight = m_frameHeightSpin->value();
    return OCRSettingsManager::sanitized(settings);
}

void SettingsDialog::onBrowseEngine()
{
    QString path = QFileDialog::getOpenFileName(this, tr("Select Tesseract Executable"),
                                                m_enginePathEdit->text());
    if (!path.isEmpty()) {
        m_enginePathEdit->setText(path);
        m_engineStatusLabel->clear();
    }
}

void SettingsDialog::onCheckEngine()
{
    QString version;
    AppError error;
    if (TesseractOCREngine::probe(m_enginePathEdit->text().trimmed(), &version, &error)) {
        m_engineStatusLabel->setText(tr("Found: %1").arg(version));
    } else {
        m_engineStatusLabel->setText(error.message);
    }
}

void SettingsDialog::onRestoreDefaults()
{
    applyToControls(OCRSettingsManager::defaults());
}
