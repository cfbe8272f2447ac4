#ifndef IOCRENGINE_H
#define IOCRENGINE_H

#include <QImage>
#include <QString>

#include "detection/OCRTypes.h"

struct AppError;

/**
 * @brief Interface for OCR engines.
 *
 * recognize() blocks and is called from a worker thread, one call at a
 * time. Implementations must not touch GUI objects.
 */
class IOCREngine
{
public:
    virtual ~IOCREngine() = default;

    /**
     * @brief Recognize text in an image.
     * @param image Preprocessed image; box coordinates are relative to it
     * @param result Filled on success. No text is a successful empty result.
     * @param error Filled with EngineUnavailable, Engine or EngineTimeout
     * @return true on success
     */
    virtual bool recognize(const QImage& image, OCRResult& result, AppError* error = nullptr) = 0;

    /**
     * @brief Name used in logs and the About box.
     */
    virtual QString engineName() const = 0;
};

#endif // IOCRENGINE_H
