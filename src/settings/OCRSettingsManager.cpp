#include "settings/OCRSettingsManager.h"
#include "settings/Settings.h"
#include "Constants.h"

#include <QDebug>

#include <algorithm>

void OCRSettingsManager::setSettings(const OCRSettings& settings)
{
    m_settings = sanitized(settings);
}

OCRSettings OCRSettingsManager::sanitized(const OCRSettings& settings)
{
    OCRSettings result = settings;
    result.tesseractPath = result.tesseractPath.trimmed();
    result.language = result.language.trimmed();
    if (result.language.isEmpty()) {
        result.language = QString::fromLatin1(TextReader::OCR::kDefaultLanguage);
    }
    result.pageSegMode = std::clamp(result.pageSegMode, 0, TextReader::OCR::kMaxPageSegMode);
    result.timeoutMs = std::max(0, result.timeoutMs);
    result.minConfidence = std::clamp(result.minConfidence, 0, 100);
    result.cameraIndex = std::clamp(result.cameraIndex, 0, TextReader::Camera::kMaxDeviceIndex);
    result.frameIntervalMs = std::max(1, result.frameIntervalMs);
    result.frameWidth = std::max(1, result.frameWidth);
    result.frameHeight = std::max(1, result.frameHeight);
    return result;
}

void OCRSettingsManager::load()
{
    QSettings store = TextReader::getSettings();
    load(store);
}

void OCRSettingsManager::save() const
{
    QSettings store = TextReader::getSettings();
    save(store);
}

void OCRSettingsManager::load(QSettings& store)
{
    using namespace TextReader;
    const OCRSettings d = defaults();

    OCRSettings loaded;
    loaded.tesseractPath = store.value(kSettingsKeyTesseractPath, d.tesseractPath).toString();
    loaded.pageSegMode = store.value(kSettingsKeyPageSegMode, d.pageSegMode).toInt();
    loaded.language = store.value(kSettingsKeyLanguage, d.language).toString();
    loaded.timeoutMs = store.value(kSettingsKeyOcrTimeout, d.timeoutMs).toInt();
    loaded.minConfidence = store.value(kSettingsKeyMinConfidence, d.minConfidence).toInt();
    loaded.cameraIndex = store.value(kSettingsKeyCameraIndex, d.cameraIndex).toInt();
    loaded.frameIntervalMs = store.value(kSettingsKeyCameraInterval, d.frameIntervalMs).toInt();
    loaded.frameWidth = store.value(kSettingsKeyCameraWidth, d.frameWidth).toInt();
    loaded.frameHeight = store.value(kSettingsKeyCameraHeight, d.frameHeight).toInt();

    m_settings = sanitized(loaded);

    qDebug() << "OCRSettingsManager: Loaded psm:" << m_settings.pageSegMode
             << "lang:" << m_settings.language
             << "timeout:" << m_settings.timeoutMs
             << "camera:" << m_settings.cameraIndex;
}

void OCRSettingsManager::save(QSettings& store) const
{
    using namespace TextReader;
    store.setValue(kSettingsKeyTesseractPath, m_settings.tesseractPath);
    store.setValue(kSettingsKeyPageSegMode, m_settings.pageSegMode);
    store.setValue(kSettingsKeyLanguage, m_settings.language);
    store.setValue(kSettingsKeyOcrTimeout, m_settings.timeoutMs);
    store.setValue(kSettingsKeyMinConfidence, m_settings.minConfidence);
    store.setValue(kSettingsKeyCameraIndex, m_settings.cameraIndex);
    store.setValue(kSettingsKeyCameraInterval, m_settings.frameIntervalMs);
    store.setValue(kSettingsKeyCameraWidth, m_settings.frameWidth);
    store.setValue(kSettingsKeyCameraHeight, m_settings.frameHeight);
    store.sync();

    if (store.status() != QSettings::NoError) {
        qWarning() << "OCRSettingsManager: Failed to save settings, status" << store.status();
        return;
    }
    qDebug() << "OCRSettingsManager: Saved settings";
}
