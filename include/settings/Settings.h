#pragma once

#include <QSettings>
#include "version.h"

namespace TextReader {

inline constexpr const char* kOrganizationName = "TextReader";
inline constexpr const char* kApplicationName = TEXTREADER_APP_NAME;

// OCR settings keys
inline constexpr const char* kSettingsKeyTesseractPath = "ocr/tesseractPath";
inline constexpr const char* kSettingsKeyPageSegMode = "ocr/pageSegMode";
inline constexpr const char* kSettingsKeyLanguage = "ocr/language";
inline constexpr const char* kSettingsKeyOcrTimeout = "ocr/timeoutMs";
inline constexpr const char* kSettingsKeyMinConfidence = "ocr/minConfidence";

// Camera settings keys
inline constexpr const char* kSettingsKeyCameraIndex = "camera/deviceIndex";
inline constexpr const char* kSettingsKeyCameraInterval = "camera/frameIntervalMs";
inline constexpr const char* kSettingsKeyCameraWidth = "camera/frameWidth";
inline constexpr const char* kSettingsKeyCameraHeight = "camera/frameHeight";

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace TextReader
