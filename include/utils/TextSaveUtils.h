#ifndef TEXTSAVEUTILS_H
#define TEXTSAVEUTILS_H

#include <QString>

struct AppError;

class TextSaveUtils
{
public:
    // Write text as UTF-8 through QSaveFile; nothing is appended or
    // converted. On failure error->kind is IO and the message names the
    // failing stage (open / write / commit).
    static bool saveTextAtomically(const QString& text,
                                   const QString& filePath,
                                   AppError* error = nullptr);

    // Read a UTF-8 text file back verbatim
    static bool readText(const QString& filePath, QString* text, AppError* error = nullptr);
};

#endif // TEXTSAVEUTILS_H
