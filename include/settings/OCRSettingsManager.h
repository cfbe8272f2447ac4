#ifndef OCRSETTINGSMANAGER_H
#define OCRSETTINGSMANAGER_H

#include <QString>

#include "Constants.h"

class QSettings;

/**
 * @brief Persisted OCR engine and camera configuration.
 */
struct OCRSettings {
    QString tesseractPath;      ///< Empty = well-known locations, then PATH
    int pageSegMode = TextReader::OCR::kSingleBlockPageSegMode;
    QString language = QString::fromLatin1(TextReader::OCR::kDefaultLanguage);
    int timeoutMs = TextReader::Timer::kDefaultOcrTimeout;  ///< 0 disables the engine timeout
    int minConfidence = TextReader::OCR::kDefaultMinConfidence;  ///< Overlay drops regions below this
    int cameraIndex = TextReader::Camera::kDefaultDeviceIndex;
    int frameIntervalMs = TextReader::Timer::kCameraFrameInterval;
    int frameWidth = TextReader::Camera::kDefaultFrameWidth;
    int frameHeight = TextReader::Camera::kDefaultFrameHeight;
};

/**
 * @brief Loads, validates and saves OCRSettings through QSettings.
 *
 * Owned by the main window and handed to the controller; there is no
 * global instance. Out-of-range stored values are clamped on load.
 */
class OCRSettingsManager
{
public:
    OCRSettingsManager() = default;

    const OCRSettings& settings() const { return m_settings; }
    void setSettings(const OCRSettings& settings);

    // Load from / save to the application settings store
    void load();
    void save() const;

    // Variants used by tests to target an explicit store
    void load(QSettings& store);
    void save(QSettings& store) const;

    static OCRSettings defaults() { return OCRSettings(); }

    // Clamp every field into its valid range
    static OCRSettings sanitized(const OCRSettings& settings);

private:
    OCRSettings m_settings;
};

#endif // OCRSETTINGSMANAGER_H
