#ifndef TESSERACTOCRENGINE_H
#define TESSERACTOCRENGINE_H

#include "ocr/IOCREngine.h"
#include "Constants.h"

#include <QStringList>

/**
 * @brief Runs the tesseract command-line program as a subprocess.
 *
 * The image is written to a private temporary directory as PNG and the
 * engine is invoked as `tesseract <png> stdout --psm N -l LANG tsv`.
 * Each recognize() call owns its QProcess, so the engine can be used from
 * a worker thread.
 */
class TesseractOCREngine : public IOCREngine
{
public:
    struct Config {
        QString executablePath;     ///< Empty = well-known locations, then PATH
        int pageSegMode = TextReader::OCR::kSingleBlockPageSegMode;
        QString language = QString::fromLatin1(TextReader::OCR::kDefaultLanguage);
        int timeoutMs = TextReader::Timer::kDefaultOcrTimeout;  ///< 0 waits forever
    };

    TesseractOCREngine() = default;
    explicit TesseractOCREngine(const Config& config);
    ~TesseractOCREngine() override = default;

    void setConfig(const Config& config) { m_config = config; }
    Config config() const { return m_config; }

    bool recognize(const QImage& image, OCRResult& result, AppError* error = nullptr) override;
    QString engineName() const override { return QStringLiteral("Tesseract"); }

    /**
     * @brief Arguments passed to the engine for the given input file.
     */
    QStringList buildArguments(const QString& inputPath) const;

    /**
     * @brief Locate the engine executable.
     * @param configuredPath User-configured path; used exclusively when set
     * @return Absolute path, or empty if nothing usable was found
     */
    static QString resolveExecutable(const QString& configuredPath);

    /**
     * @brief Run `<engine> --version` to check that the engine can start.
     * @param version Receives the first line of the version banner
     * @return true if the engine started and exited cleanly
     */
    static bool probe(const QString& configuredPath, QString* version = nullptr,
                      AppError* error = nullptr);

private:
    Config m_config;
};

#endif // TESSERACTOCRENGINE_H
