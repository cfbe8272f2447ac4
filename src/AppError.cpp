#include "AppError.h"

QString AppError::kindName(Kind kind)
{
    switch (kind) {
    case Kind::Decode:
        return QStringLiteral("DecodeError");
    case Kind::DeviceUnavailable:
        return QStringLiteral("DeviceUnavailable");
    case Kind::Capture:
        return QStringLiteral("CaptureError");
    case Kind::InvalidImage:
        return QStringLiteral("InvalidImageError");
    case Kind::EngineUnavailable:
        return QStringLiteral("EngineUnavailable");
    case Kind::Engine:
        return QStringLiteral("EngineError");
    case Kind::EngineTimeout:
        return QStringLiteral("EngineTimeout");
    case Kind::IO:
        return QStringLiteral("IOError");
    }
    return QStringLiteral("UnknownError");
}

void AppError::set(AppError* error, Kind kind, const QString& message)
{
    if (!error) {
        return;
    }
    error->kind = kind;
    error->message = message;
}
