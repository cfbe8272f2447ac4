#ifndef IMAGELOADER_H
#define IMAGELOADER_H

#include <QImage>
#include <QString>
#include <QStringList>

struct AppError;

/**
 * @brief Decodes raster files from disk into frames.
 */
class ImageLoader
{
public:
    ImageLoader() = delete;

    /**
     * @brief Decode an image file.
     * @param path File to read (PNG, JPEG, BMP, TIFF, ... as supported by Qt)
     * @param error Filled with AppError::Kind::Decode on failure
     * @return Format_RGB32 frame, or null QImage on failure
     */
    static QImage loadImage(const QString& path, AppError* error = nullptr);

    /**
     * @brief Name filter for file dialogs, e.g. "Image files (*.png *.jpg ...)".
     */
    static QString dialogFilter();

    static QStringList supportedSuffixes();
};

#endif // IMAGELOADER_H
