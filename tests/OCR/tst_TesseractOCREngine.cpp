#include <QtTest>

#include <QElapsedTimer>
#include <QFile>
#include <QTemporaryDir>

#include "AppError.h"
#include "ocr/TesseractOCREngine.h"

/**
 * @brief Test class for TesseractOCREngine.
 *
 * A small POSIX shell script stands in for the engine executable so that
 * process handling can be checked without tesseract installed.
 */
class tst_TesseractOCREngine : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    void testBuildArguments();
    void testRecognizeParsesCannedOutput();
    void testArgumentsReachEngine();
    void testNonZeroExitIsEngineError();
    void testGarbageOutputIsEngineError();
    void testEmptyOutputIsEngineError();
    void testTimeoutKillsEngine();
    void testMissingExecutableIsUnavailable();
    void testNullImageIsInvalid();
    void testProbe();

private:
    QString writeScript(const QString &name, const QString &body);
    static QImage sampleImage();

    QTemporaryDir m_dir;
};

void tst_TesseractOCREngine::initTestCase()
{
#ifdef Q_OS_WIN
    QSKIP("Fake engine scripts require a POSIX shell");
#endif
    QVERIFY(m_dir.isValid());
}

QString tst_TesseractOCREngine::writeScript(const QString &name, const QString &body)
{
    const QString path = m_dir.filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    file.write("#!/bin/sh\n");
    file.write(body.toUtf8());
    file.close();
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    return path;
}

QImage tst_TesseractOCREngine::sampleImage()
{
    QImage image(40, 20, QImage::Format_Grayscale8);
    image.fill(255);
    return image;
}

void tst_TesseractOCREngine::testBuildArguments()
{
    TesseractOCREngine engine;
    const QStringList args = engine.buildArguments(QStringLiteral("/tmp/in.png"));

    QCOMPARE(args, QStringList({QStringLiteral("/tmp/in.png"), QStringLiteral("stdout"),
                                QStringLiteral("--psm"), QStringLiteral("6"),
                                QStringLiteral("-l"), QStringLiteral("eng"),
                                QStringLiteral("tsv")}));
}

void tst_TesseractOCREngine::testRecognizeParsesCannedOutput()
{
    const QString script = writeScript(QStringLiteral("canned.sh"), QStringLiteral(
        "printf 'level\\tpage_num\\tblock_num\\tpar_num\\tline_num\\tword_num\\tleft\\ttop\\twidth\\theight\\tconf\\ttext\\n'\n"
        "printf '5\\t1\\t1\\t1\\t1\\t1\\t2\\t3\\t30\\t12\\t88.0\\tHELLO\\n'\n"));
    QVERIFY(!script.isEmpty());

    TesseractOCREngine::Config config;
    config.executablePath = script;
    TesseractOCREngine engine(config);

    OCRResult result;
    AppError error;
    QVERIFY2(engine.recognize(sampleImage(), result, &error), qPrintable(error.message));
    QCOMPARE(result.text, QStringLiteral("HELLO"));
    QCOMPARE(result.blocks.size(), 1);
    QCOMPARE(result.blocks.at(0).boundingRect, QRect(2, 3, 30, 12));
}

void tst_TesseractOCREngine::testArgumentsReachEngine()
{
    const QString argsFile = m_dir.filePath(QStringLiteral("args.txt"));
    const QString script = writeScript(QStringLiteral("echoargs.sh"), QStringLiteral(
        "echo \"$2 $3 $4 $5 $6 $7\" > '%1'\n"
        "test -f \"$1\" || exit 3\n"
        "printf 'level\\tpage_num\\tblock_num\\tpar_num\\tline_num\\tword_num\\tleft\\ttop\\twidth\\theight\\tconf\\ttext\\n'\n")
        .arg(argsFile));

    TesseractOCREngine::Config config;
    config.executablePath = script;
    config.pageSegMode = 7;
    config.language = QStringLiteral("deu");
    TesseractOCREngine engine(config);

    OCRResult result;
    AppError error;
    QVERIFY2(engine.recognize(sampleImage(), result, &error), qPrintable(error.message));
    QVERIFY(result.text.isEmpty());

    QFile file(argsFile);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(QString::fromUtf8(file.readAll()).trimmed(), QStringLiteral("stdout --psm 7 -l deu tsv"));
}

void tst_TesseractOCREngine::testNonZeroExitIsEngineError()
{
    const QString script = writeScript(QStringLiteral("fail.sh"),
                                       QStringLiteral("echo 'Error opening data file' >&2\nexit 1\n"));
    TesseractOCREngine::Config config;
    config.executablePath = script;
    TesseractOCREngine engine(config);

    OCRResult result;
    AppError error;
    QVERIFY(!engine.recognize(sampleImage(), result, &error));
    QCOMPARE(error.kind, AppError::Kind::Engine);
    QVERIFY(error.message.contains(QStringLiteral("Error opening data file")));
}

void tst_TesseractOCREngine::testGarbageOutputIsEngineError()
{
    const QString script = writeScript(QStringLiteral("garbage.sh"),
                                       QStringLiteral("echo 'this is not a tsv report'\n"));
    TesseractOCREngine::Config config;
    config.executablePath = script;
    TesseractOCREngine engine(config);

    OCRResult result;
    AppError error;
    QVERIFY(!engine.recognize(sampleImage(), result, &error));
    QCOMPARE(error.kind, AppError::Kind::Engine);
}

void tst_TesseractOCREngine::testEmptyOutputIsEngineError()
{
    const QString script = writeScript(QStringLiteral("silent.sh"), QStringLiteral("exit 0\n"));
    TesseractOCREngine::Config config;
    config.executablePath = script;
    TesseractOCREngine engine(config);

    OCRResult result;
    AppError error;
    QVERIFY(!engine.recognize(sampleImage(), result, &error));
    QCOMPARE(error.kind, AppError::Kind::Engine);
}

void tst_TesseractOCREngine::testTimeoutKillsEngine()
{
    const QString script = writeScript(QStringLiteral("slow.sh"), QStringLiteral("exec sleep 30\n"));
    TesseractOCREngine::Config config;
    config.executablePath = script;
    config.timeoutMs = 300;
    TesseractOCREngine engine(config);

    QElapsedTimer timer;
    timer.start();

    OCRResult result;
    AppError error;
    QVERIFY(!engine.recognize(sampleImage(), result, &error));
    QCOMPARE(error.kind, AppError::Kind::EngineTimeout);
    QVERIFY(timer.elapsed() < 10000);
}

void tst_TesseractOCREngine::testMissingExecutableIsUnavailable()
{
    TesseractOCREngine::Config config;
    config.executablePath = m_dir.filePath(QStringLiteral("does-not-exist"));
    TesseractOCREngine engine(config);

    OCRResult result;
    AppError error;
    QVERIFY(!engine.recognize(sampleImage(), result, &error));
    QCOMPARE(error.kind, AppError::Kind::EngineUnavailable);
    QVERIFY(TesseractOCREngine::resolveExecutable(config.executablePath).isEmpty());
}

void tst_TesseractOCREngine::testNullImageIsInvalid()
{
    TesseractOCREngine engine;
    OCRResult result;
    AppError error;
    QVERIFY(!engine.recognize(QImage(), result, &error));
    QCOMPARE(error.kind, AppError::Kind::InvalidImage);
}

void tst_TesseractOCREngine::testProbe()
{
    const QString good = writeScript(QStringLiteral("version.sh"),
                                     QStringLiteral("echo 'tesseract 5.3.0'\necho ' leptonica-1.82.0'\n"));
    QString version;
    AppError error;
    QVERIFY2(TesseractOCREngine::probe(good, &version, &error), qPrintable(error.message));
    QCOMPARE(version, QStringLiteral("tesseract 5.3.0"));

    const QString bad = writeScript(QStringLiteral("badversion.sh"), QStringLiteral("exit 2\n"));
    QVERIFY(!TesseractOCREngine::probe(bad, nullptr, &error));
    QCOMPARE(error.kind, AppError::Kind::EngineUnavailable);

    QVERIFY(!TesseractOCREngine::probe(m_dir.filePath(QStringLiteral("missing")), nullptr, &error));
    QCOMPARE(error.kind, AppError::Kind::EngineUnavailable);
}

QTEST_MAIN(tst_TesseractOCREngine)
#include "tst_TesseractOCREngine.moc"
