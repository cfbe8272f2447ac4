#include "detection/OCRPreprocessor.h"
#include "utils/MatConverter.h"
#include "AppError.h"

#include <QDebug>

#include <opencv2/imgproc.hpp>

OCRPreprocessor::OCRPreprocessor(const Config& config)
    : m_config(config)
{
}

QRect OCRPreprocessor::effectiveRegion(const QSize& frameSize, const std::optional<QRect>& roi)
{
    const QRect frameRect(QPoint(0, 0), frameSize);
    if (!roi) {
        return frameRect;
    }
    return roi->normalized().intersected(frameRect);
}

QImage OCRPreprocessor::preprocess(const QImage& frame, const std::optional<QRect>& roi,
                                   AppError* error) const
{
    if (frame.isNull() || frame.width() <= 0 || frame.height() <= 0) {
        AppError::set(error, AppError::Kind::InvalidImage,
                      QStringLiteral("No image to process"));
        return QImage();
    }

    const QRect region = effectiveRegion(frame.size(), roi);
    if (region.width() <= 0 || region.height() <= 0) {
        AppError::set(error, AppError::Kind::InvalidImage,
                      QStringLiteral("Selected region has zero width or height"));
        return QImage();
    }

    const QImage cropped = (region == frame.rect()) ? frame : frame.copy(region);
    cv::Mat gray = MatConverter::toGray(cropped);
    if (gray.empty()) {
        AppError::set(error, AppError::Kind::InvalidImage,
                      QStringLiteral("Image conversion failed"));
        return QImage();
    }

    int blockSize = m_config.thresholdBlockSize;
    if (blockSize < 3) {
        blockSize = 3;
    }
    if (blockSize % 2 == 0) {
        ++blockSize;
    }

    cv::Mat binary;
    try {
        cv::Mat denoised;
        cv::bilateralFilter(gray, denoised, m_config.bilateralDiameter,
                            m_config.bilateralSigmaColor, m_config.bilateralSigmaSpace);
        cv::adaptiveThreshold(denoised, binary, 255,
                              cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY,
                              blockSize, m_config.thresholdOffset);
    } catch (const cv::Exception& ex) {
        qWarning() << "OCRPreprocessor: OpenCV failure:" << ex.what();
        AppError::set(error, AppError::Kind::InvalidImage,
                      QStringLiteral("Preprocessing failed: %1").arg(QString::fromUtf8(ex.what())));
        return QImage();
    }

    return MatConverter::toQImage(binary);
}
