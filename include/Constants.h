#ifndef TEXTREADER_CONSTANTS_H
#define TEXTREADER_CONSTANTS_H

#include <QColor>

namespace TextReader {

// ============================================================================
// TIMER (milliseconds)
// ============================================================================
namespace Timer {
constexpr int kCameraFrameInterval = 30;      // Live preview polling (~33fps)
constexpr int kEngineProbeTimeout = 3000;     // tesseract --version
constexpr int kEngineStartTimeout = 5000;     // QProcess::waitForStarted
constexpr int kDefaultOcrTimeout = 30000;     // OCR engine run
constexpr int kStatusMessage = 5000;          // Transient status bar text
}  // namespace Timer

// ============================================================================
// CAMERA
// ============================================================================
namespace Camera {
constexpr int kDefaultDeviceIndex = 1;
constexpr int kMaxDeviceIndex = 99;
constexpr int kDefaultFrameWidth = 640;
constexpr int kDefaultFrameHeight = 480;
constexpr int kDefaultFps = 30;
}  // namespace Camera

// ============================================================================
// OCR
// ============================================================================
namespace OCR {
constexpr int kSingleBlockPageSegMode = 6;    // "--psm 6"
constexpr int kMaxPageSegMode = 13;
constexpr int kDefaultMinConfidence = 10;
inline constexpr const char* kDefaultLanguage = "eng";
}  // namespace OCR

// ============================================================================
// UI DIMENSIONS (pixels)
// ============================================================================
namespace UI {
constexpr int kDefaultWindowWidth = 1000;
constexpr int kDefaultWindowHeight = 800;
constexpr int kMinWindowWidth = 800;
constexpr int kMinWindowHeight = 600;
constexpr int kCanvasMinWidth = 320;
constexpr int kCanvasMinHeight = 240;

namespace Overlay {
constexpr int kBoxPenWidth = 2;
constexpr int kLabelOffset = 5;               // Gap between label baseline and box top
constexpr int kLabelPointSize = 10;
}  // namespace Overlay

namespace Roi {
constexpr int kPenWidth = 2;
}  // namespace Roi
}  // namespace UI

// ============================================================================
// COLORS
// ============================================================================
namespace Color {
inline const QColor kOverlayBox{0, 255, 0};         // Green
inline const QColor kOverlayLabel{255, 0, 0};       // Red
inline const QColor kRoiOutline{255, 255, 0};       // Yellow
inline const QColor kSearchHighlight{255, 255, 0};  // Yellow
inline const QColor kCanvasBackground{0, 0, 0};
}  // namespace Color

}  // namespace TextReader

#endif  // TEXTREADER_CONSTANTS_H
