#ifndef OCRPREPROCESSOR_H
#define OCRPREPROCESSOR_H

#include <QImage>
#include <QRect>

#include <optional>

struct AppError;

/**
 * @brief Prepares a frame for the OCR engine.
 *
 * Steps: crop to the ROI (or use the whole frame), convert to grayscale,
 * bilateral filter to suppress sensor noise while keeping stroke edges,
 * then Gaussian adaptive threshold so uneven lighting does not defeat
 * binarization. Deterministic; no state between calls.
 */
class OCRPreprocessor
{
public:
    /**
     * @brief Filter parameters.
     */
    struct Config {
        int bilateralDiameter = 5;      ///< Pixel neighborhood diameter
        double bilateralSigmaColor = 50.0;
        double bilateralSigmaSpace = 50.0;
        int thresholdBlockSize = 31;    ///< Odd, > 1
        double thresholdOffset = 10.0;  ///< Subtracted from the local mean
    };

    OCRPreprocessor() = default;
    explicit OCRPreprocessor(const Config& config);

    void setConfig(const Config& config) { m_config = config; }
    Config config() const { return m_config; }

    /**
     * @brief Produce the binarized image handed to the OCR engine.
     * @param frame Source frame
     * @param roi Region in frame coordinates; nullopt uses the whole frame.
     *        Parts outside the frame are ignored.
     * @param error Filled with InvalidImage when the frame or the cropped
     *        region has zero width or height
     * @return Format_Grayscale8 image with values 0 or 255, or null QImage
     */
    QImage preprocess(const QImage& frame, const std::optional<QRect>& roi,
                      AppError* error = nullptr) const;

    /**
     * @brief Rectangle actually cropped for a frame of the given size.
     *
     * Returns the full frame for nullopt, otherwise the ROI clipped to the
     * frame. May be empty.
     */
    static QRect effectiveRegion(const QSize& frameSize, const std::optional<QRect>& roi);

private:
    Config m_config;
};

#endif // OCRPREPROCESSOR_H
