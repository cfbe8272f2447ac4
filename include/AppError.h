#ifndef APPERROR_H
#define APPERROR_H

#include <QMetaType>
#include <QString>

/**
 * @brief Error reported by a pipeline component.
 *
 * Components return a null value or false and fill an optional
 * AppError* out-parameter. The controller forwards these to the UI,
 * where every kind is shown as a non-fatal notification.
 */
struct AppError {
    enum class Kind {
        Decode,             ///< Image file unreadable or unsupported format
        DeviceUnavailable,  ///< Camera index has no device or is already open
        Capture,            ///< Camera stream ended or device disconnected
        InvalidImage,       ///< Zero-sized input to the preprocessor
        EngineUnavailable,  ///< OCR executable cannot be located or started
        Engine,             ///< OCR engine crashed or produced malformed output
        EngineTimeout,      ///< OCR engine exceeded the configured timeout
        IO                  ///< Saving text failed
    };

    Kind kind = Kind::IO;
    QString message;

    static QString kindName(Kind kind);

    // Fills *error when error is non-null.
    static void set(AppError* error, Kind kind, const QString& message);
};

Q_DECLARE_METATYPE(AppError)

#endif // APPERROR_H
