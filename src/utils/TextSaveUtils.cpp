#include "utils/TextSaveUtils.h"
#include "AppError.h"

#include <QFile>
#include <QSaveFile>

bool TextSaveUtils::saveTextAtomically(const QString& text,
                                       const QString& filePath,
                                       AppError* error)
{
    if (filePath.isEmpty()) {
        AppError::set(error, AppError::Kind::IO, QStringLiteral("No file name given"));
        return false;
    }

    QSaveFile saveFile(filePath);
    // Preserve overwrite behavior on filesystems where the target file is writable
    // but the directory disallows creating a temp sibling for atomic rename.
    saveFile.setDirectWriteFallback(true);
    if (!saveFile.open(QIODevice::WriteOnly)) {
        const QString saveError = saveFile.errorString().trimmed();
        AppError::set(error, AppError::Kind::IO,
                      QStringLiteral("open: %1").arg(saveError.isEmpty()
                          ? QStringLiteral("Failed to open output file") : saveError));
        return false;
    }

    const QByteArray bytes = text.toUtf8();
    if (saveFile.write(bytes) != bytes.size()) {
        const QString writeError = saveFile.errorString().trimmed();
        saveFile.cancelWriting();
        AppError::set(error, AppError::Kind::IO,
                      QStringLiteral("write: %1").arg(writeError.isEmpty()
                          ? QStringLiteral("Failed to write text") : writeError));
        return false;
    }

    if (!saveFile.commit()) {
        const QString commitError = saveFile.errorString().trimmed();
        AppError::set(error, AppError::Kind::IO,
                      QStringLiteral("commit: %1").arg(commitError.isEmpty()
                          ? QStringLiteral("Failed to commit output file") : commitError));
        return false;
    }

    return true;
}

bool TextSaveUtils::readText(const QString& filePath, QString* text, AppError* error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        AppError::set(error, AppError::Kind::IO,
                      QStringLiteral("open: %1").arg(file.errorString()));
        return false;
    }
    if (text) {
        *text = QString::fromUtf8(file.readAll());
    }
    return true;
}
