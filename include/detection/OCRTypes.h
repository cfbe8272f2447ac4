#ifndef OCRTYPES_H
#define OCRTYPES_H

#include <QRect>
#include <QString>
#include <QVector>
#include <QMetaType>

/**
 * @brief One recognized token with its bounding box.
 *
 * The box is in pixel coordinates of the image that was handed to the
 * engine. Callers translate by the ROI offset before drawing on the frame.
 */
struct OCRTextBlock {
    QString text;       ///< Recognized token
    QRect boundingRect; ///< Pixel box, top-left origin
    float confidence = -1.0f; ///< Engine confidence 0..100, -1 when unavailable
    int blockNum = 0;   ///< Layout position reported by the engine
    int parNum = 0;
    int lineNum = 0;
    int wordNum = 0;
};

/**
 * @brief Output of one OCR run.
 */
struct OCRResult {
    QString text;                  ///< Tokens joined in engine order
    QVector<OCRTextBlock> blocks;  ///< Engine order, not guaranteed reading order
};

Q_DECLARE_METATYPE(OCRTextBlock)
Q_DECLARE_METATYPE(OCRResult)

#endif // OCRTYPES_H
