#include "ocr/TesseractOCREngine.h"
#include "ocr/TesseractTsvParser.h"
#include "Constants.h"
#include "AppError.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <QTemporaryDir>

namespace {

bool isExecutableFile(const QString& path)
{
    const QFileInfo info(path);
    return info.exists() && info.isFile() && info.isExecutable();
}

QString readStandardError(QProcess& process)
{
    return QString::fromLocal8Bit(process.readAllStandardError()).trimmed();
}

} // namespace

TesseractOCREngine::TesseractOCREngine(const Config& config)
    : m_config(config)
{
}

QString TesseractOCREngine::resolveExecutable(const QString& configuredPath)
{
    const QString custom = configuredPath.trimmed();
    if (!custom.isEmpty()) {
        // An explicit path is never second-guessed
        return isExecutableFile(custom) ? QFileInfo(custom).absoluteFilePath() : QString();
    }

#ifdef Q_OS_MAC
    // Check Homebrew locations first
    if (isExecutableFile("/opt/homebrew/bin/tesseract")) {
        return "/opt/homebrew/bin/tesseract";
    }
    if (isExecutableFile("/usr/local/bin/tesseract")) {
        return "/usr/local/bin/tesseract";
    }
#endif

#ifdef Q_OS_WIN
    // Default UB-Mannheim installer location
    if (isExecutableFile("C:/Program Files/Tesseract-OCR/tesseract.exe")) {
        return "C:/Program Files/Tesseract-OCR/tesseract.exe";
    }
#endif

    // Fall back to PATH
    return QStandardPaths::findExecutable(QStringLiteral("tesseract"));
}

bool TesseractOCREngine::probe(const QString& configuredPath, QString* version, AppError* error)
{
    const QString path = resolveExecutable(configuredPath);
    if (path.isEmpty()) {
        AppError::set(error, AppError::Kind::EngineUnavailable,
                      configuredPath.trimmed().isEmpty()
                          ? QStringLiteral("Tesseract was not found on PATH. Install it or set its path in Settings.")
                          : QStringLiteral("Tesseract not found at %1").arg(configuredPath));
        return false;
    }

    QProcess test;
    test.start(path, QStringList() << QStringLiteral("--version"));
    if (!test.waitForStarted(TextReader::Timer::kEngineProbeTimeout)) {
        AppError::set(error, AppError::Kind::EngineUnavailable,
                      QStringLiteral("Failed to start %1: %2").arg(path, test.errorString()));
        return false;
    }
    if (!test.waitForFinished(TextReader::Timer::kEngineProbeTimeout)) {
        test.kill();
        test.waitForFinished(1000);
        AppError::set(error, AppError::Kind::EngineTimeout,
                      QStringLiteral("%1 --version timed out").arg(path));
        return false;
    }
    if (test.exitStatus() != QProcess::NormalExit || test.exitCode() != 0) {
        AppError::set(error, AppError::Kind::EngineUnavailable,
                      QStringLiteral("%1 --version failed: %2").arg(path, readStandardError(test)));
        return false;
    }

    if (version) {
        // Older releases print the banner on stderr
        QString banner = QString::fromLocal8Bit(test.readAllStandardOutput()).trimmed();
        if (banner.isEmpty()) {
            banner = readStandardError(test);
        }
        *version = banner.section(QLatin1Char('\n'), 0, 0).trimmed();
    }
    qDebug() << "TesseractOCREngine: Probe succeeded for" << path;
    return true;
}

QStringList TesseractOCREngine::buildArguments(const QString& inputPath) const
{
    QStringList args;
    args << inputPath
         << QStringLiteral("stdout")
         << QStringLiteral("--psm") << QString::number(m_config.pageSegMode);
    if (!m_config.language.isEmpty()) {
        args << QStringLiteral("-l") << m_config.language;
    }
    args << QStringLiteral("tsv");
    return args;
}

bool TesseractOCREngine::recognize(const QImage& image, OCRResult& result, AppError* error)
{
    result = OCRResult();

    if (image.isNull()) {
        AppError::set(error, AppError::Kind::InvalidImage, QStringLiteral("No image to recognize"));
        return false;
    }

    const QString program = resolveExecutable(m_config.executablePath);
    if (program.isEmpty()) {
        AppError::set(error, AppError::Kind::EngineUnavailable,
                      m_config.executablePath.trimmed().isEmpty()
                          ? QStringLiteral("Tesseract was not found on PATH. Install it or set its path in Settings.")
                          : QStringLiteral("Tesseract not found at %1").arg(m_config.executablePath));
        qWarning() << "TesseractOCREngine: Engine not found, configured path:" << m_config.executablePath;
        return false;
    }

    QTemporaryDir workDir;
    if (!workDir.isValid()) {
        AppError::set(error, AppError::Kind::Engine,
                      QStringLiteral("Cannot create a temporary directory: %1").arg(workDir.errorString()));
        return false;
    }
    const QString inputPath = workDir.filePath(QStringLiteral("ocr_input.png"));
    if (!image.save(inputPath, "PNG")) {
        AppError::set(error, AppError::Kind::Engine,
                      QStringLiteral("Cannot write engine input to %1").arg(inputPath));
        return false;
    }

    const QStringList args = buildArguments(inputPath);
    qDebug() << "TesseractOCREngine: Starting" << program << args;

    QElapsedTimer timer;
    timer.start();

    QProcess process;
    process.start(program, args);
    if (!process.waitForStarted(TextReader::Timer::kEngineStartTimeout)) {
        AppError::set(error, AppError::Kind::EngineUnavailable,
                      QStringLiteral("Failed to start %1: %2").arg(program, process.errorString()));
        qWarning() << "TesseractOCREngine: Failed to start:" << process.errorString();
        return false;
    }

    const int waitMs = m_config.timeoutMs > 0 ? m_config.timeoutMs : -1;
    if (!process.waitForFinished(waitMs)) {
        if (process.error() == QProcess::Timedout) {
            process.kill();
            process.waitForFinished(1000);
            AppError::set(error, AppError::Kind::EngineTimeout,
                          QStringLiteral("OCR engine did not finish within %1 ms").arg(m_config.timeoutMs));
            qWarning() << "TesseractOCREngine: Timed out after" << m_config.timeoutMs << "ms";
            return false;
        }
        AppError::set(error, AppError::Kind::Engine,
                      QStringLiteral("OCR engine failed: %1").arg(process.errorString()));
        return false;
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        AppError::set(error, AppError::Kind::Engine,
                      QStringLiteral("OCR engine terminated abnormally"));
        qWarning() << "TesseractOCREngine: Engine crashed";
        return false;
    }
    if (process.exitCode() != 0) {
        const QString stderrText = readStandardError(process);
        AppError::set(error, AppError::Kind::Engine,
                      stderrText.isEmpty()
                          ? QStringLiteral("OCR engine exited with code %1").arg(process.exitCode())
                          : QStringLiteral("OCR engine exited with code %1: %2").arg(process.exitCode()).arg(stderrText));
        qWarning() << "TesseractOCREngine: Exit code" << process.exitCode() << stderrText;
        return false;
    }

    const QString output = QString::fromUtf8(process.readAllStandardOutput());
    QString parseError;
    if (!TesseractTsvParser::parse(output, result, &parseError)) {
        AppError::set(error, AppError::Kind::Engine,
                      QStringLiteral("Malformed OCR engine output: %1").arg(parseError));
        qWarning() << "TesseractOCREngine: Parse failed:" << parseError;
        return false;
    }

    qDebug() << "TesseractOCREngine: Recognized" << result.blocks.size()
             << "words in" << timer.elapsed() << "ms";
    return true;
}
