#include "capture/ImageLoader.h"
#include "AppError.h"

#include <QDebug>
#include <QFileInfo>
#include <QImageReader>

QImage ImageLoader::loadImage(const QString& path, AppError* error)
{
    const QFileInfo info(path);
    if (path.isEmpty() || !info.exists() || !info.isFile()) {
        AppError::set(error, AppError::Kind::Decode,
                      QStringLiteral("File not found: %1").arg(path));
        qWarning() << "ImageLoader: File not found:" << path;
        return QImage();
    }
    if (!info.isReadable()) {
        AppError::set(error, AppError::Kind::Decode,
                      QStringLiteral("File is not readable: %1").arg(path));
        qWarning() << "ImageLoader: File is not readable:" << path;
        return QImage();
    }

    QImageReader reader(path);
    reader.setAutoTransform(true);
    QImage image = reader.read();
    if (image.isNull()) {
        const QString readerError = reader.errorString().trimmed();
        AppError::set(error, AppError::Kind::Decode,
                      readerError.isEmpty()
                          ? QStringLiteral("Could not decode %1").arg(info.fileName())
                          : QStringLiteral("Could not decode %1: %2").arg(info.fileName(), readerError));
        qWarning() << "ImageLoader: Decode failed for" << path << ":" << readerError;
        return QImage();
    }

    qDebug() << "ImageLoader: Loaded" << info.fileName() << image.size()
             << "format:" << reader.format();
    return image.convertToFormat(QImage::Format_RGB32);
}

QStringList ImageLoader::supportedSuffixes()
{
    QStringList suffixes;
    const QList<QByteArray> formats = QImageReader::supportedImageFormats();
    suffixes.reserve(formats.size());
    for (const QByteArray& format : formats) {
        suffixes.append(QString::fromLatin1(format).toLower());
    }
    suffixes.removeDuplicates();
    suffixes.sort();
    return suffixes;
}

QString ImageLoader::dialogFilter()
{
    QStringList patterns;
    for (const QString& suffix : supportedSuffixes()) {
        patterns.append(QStringLiteral("*.") + suffix);
    }
    return QStringLiteral("Image files (%1);;All files (*)").arg(patterns.join(QLatin1Char(' ')));
}
