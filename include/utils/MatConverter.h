#ifndef TEXTREADER_MATCONVERTER_H
#define TEXTREADER_MATCONVERTER_H

#include <QImage>

#include <opencv2/core.hpp>

// QImage <-> cv::Mat conversion utilities.
//
// Qt's Format_RGB32 stores pixels as 0xAARRGGBB, which on little-endian
// architectures gives byte order B-G-R-A. That matches OpenCV's 4-channel
// layout (CV_8UC4 / BGRA), so QImage data can be wrapped without cvtColor.

namespace MatConverter {

// Returns a deep-copy CV_8UC4 Mat, safe to use after the QImage is destroyed.
cv::Mat toMatCopy(const QImage& image);

// Converts a QImage to a single-channel grayscale Mat (CV_8UC1).
cv::Mat toGray(const QImage& image);

// Converts a cv::Mat to QImage. Supports CV_8UC4 and CV_8UC3 (BGR, as
// delivered by cv::VideoCapture) to Format_RGB32, and CV_8UC1 to
// Format_Grayscale8. Returns a deep copy.
QImage toQImage(const cv::Mat& mat);

} // namespace MatConverter

#endif // TEXTREADER_MATCONVERTER_H
