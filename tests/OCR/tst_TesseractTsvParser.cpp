#include <QtTest>

#include "ocr/TesseractTsvParser.h"

class tst_TesseractTsvParser : public QObject
{
    Q_OBJECT

private slots:
    void testParseWords();
    void testNonWordRowsSkipped();
    void testBlankWordsSkipped();
    void testLineAndParagraphBreaks();
    void testHeaderOnlyIsEmptyResult();
    void testEmptyOutputIsError();
    void testMissingColumnIsError();
    void testNonNumericFieldIsError();
    void testTruncatedRowIsError();
    void testUnparsableConfidenceIsUnknown();
    void testCrLfLineEndings();
};

namespace {

const QString kHeader = QStringLiteral(
    "level\tpage_num\tblock_num\tpar_num\tline_num\tword_num\tleft\ttop\twidth\theight\tconf\ttext\n");

QString row(int level, int block, int par, int line, int word,
            int left, int top, int width, int height, const QString& conf, const QString& text)
{
    return QStringLiteral("%1\t1\t%2\t%3\t%4\t%5\t%6\t%7\t%8\t%9\t%10\t%11\n")
        .arg(level).arg(block).arg(par).arg(line).arg(word)
        .arg(left).arg(top).arg(width).arg(height).arg(conf, text);
}

} // namespace

void tst_TesseractTsvParser::testParseWords()
{
    const QString tsv = kHeader
        + row(1, 0, 0, 0, 0, 0, 0, 400, 300, QStringLiteral("-1"), QString())
        + row(5, 1, 1, 1, 1, 12, 20, 60, 18, QStringLiteral("96.5"), QStringLiteral("HELLO"))
        + row(5, 1, 1, 1, 2, 80, 20, 70, 18, QStringLiteral("91"), QStringLiteral("WORLD"));

    OCRResult result;
    QString message;
    QVERIFY2(TesseractTsvParser::parse(tsv, result, &message), qPrintable(message));

    QCOMPARE(result.blocks.size(), 2);
    QCOMPARE(result.blocks.at(0).text, QStringLiteral("HELLO"));
    QCOMPARE(result.blocks.at(0).boundingRect, QRect(12, 20, 60, 18));
    QCOMPARE(result.blocks.at(0).confidence, 96.5f);
    QCOMPARE(result.blocks.at(1).wordNum, 2);
    QCOMPARE(result.text, QStringLiteral("HELLO WORLD"));
}

void tst_TesseractTsvParser::testNonWordRowsSkipped()
{
    const QString tsv = kHeader
        + row(2, 1, 0, 0, 0, 0, 0, 100, 100, QStringLiteral("-1"), QString())
        + row(3, 1, 1, 0, 0, 0, 0, 100, 100, QStringLiteral("-1"), QString())
        + row(4, 1, 1, 1, 0, 0, 0, 100, 100, QStringLiteral("-1"), QString());

    OCRResult result;
    QVERIFY(TesseractTsvParser::parse(tsv, result));
    QVERIFY(result.blocks.isEmpty());
    QVERIFY(result.text.isEmpty());
}

void tst_TesseractTsvParser::testBlankWordsSkipped()
{
    const QString tsv = kHeader
        + row(5, 1, 1, 1, 1, 0, 0, 10, 10, QStringLiteral("95"), QStringLiteral("   "))
        + row(5, 1, 1, 1, 2, 20, 0, 10, 10, QStringLiteral("95"), QStringLiteral("ok"));

    OCRResult result;
    QVERIFY(TesseractTsvParser::parse(tsv, result));
    QCOMPARE(result.blocks.size(), 1);
    QCOMPARE(result.text, QStringLiteral("ok"));
}

void tst_TesseractTsvParser::testLineAndParagraphBreaks()
{
    const QString tsv = kHeader
        + row(5, 1, 1, 1, 1, 0, 0, 10, 10, QStringLiteral("90"), QStringLiteral("one"))
        + row(5, 1, 1, 1, 2, 20, 0, 10, 10, QStringLiteral("90"), QStringLiteral("two"))
        + row(5, 1, 1, 2, 1, 0, 20, 10, 10, QStringLiteral("90"), QStringLiteral("three"))
        + row(5, 1, 2, 1, 1, 0, 60, 10, 10, QStringLiteral("90"), QStringLiteral("four"))
        + row(5, 2, 1, 1, 1, 0, 99, 10, 10, QStringLiteral("90"), QStringLiteral("five"));

    OCRResult result;
    QVERIFY(TesseractTsvParser::parse(tsv, result));
    QCOMPARE(result.text, QStringLiteral("one two\nthree\n\nfour\n\nfive"));
}

void tst_TesseractTsvParser::testHeaderOnlyIsEmptyResult()
{
    OCRResult result;
    QVERIFY(TesseractTsvParser::parse(kHeader, result));
    QVERIFY(result.blocks.isEmpty());
    QCOMPARE(result.text, QString());
}

void tst_TesseractTsvParser::testEmptyOutputIsError()
{
    OCRResult result;
    QString message;
    QVERIFY(!TesseractTsvParser::parse(QStringLiteral("\n \n"), result, &message));
    QVERIFY(!message.isEmpty());
}

void tst_TesseractTsvParser::testMissingColumnIsError()
{
    OCRResult result;
    QString message;
    const QString tsv = QStringLiteral("level\tleft\ttop\twidth\theight\ttext\n5\t0\t0\t1\t1\tx\n");
    QVERIFY(!TesseractTsvParser::parse(tsv, result, &message));
    QVERIFY(message.contains(QStringLiteral("column")));
}

void tst_TesseractTsvParser::testNonNumericFieldIsError()
{
    const QString tsv = kHeader
        + QStringLiteral("5\t1\t1\t1\t1\t1\tabc\t0\t10\t10\t90\tword\n");

    OCRResult result;
    QVERIFY(!TesseractTsvParser::parse(tsv, result));
}

void tst_TesseractTsvParser::testTruncatedRowIsError()
{
    const QString tsv = kHeader + QStringLiteral("5\t1\t1\t1\n");

    OCRResult result;
    QString message;
    QVERIFY(!TesseractTsvParser::parse(tsv, result, &message));
    QVERIFY(message.contains(QStringLiteral("line 2")));
}

void tst_TesseractTsvParser::testUnparsableConfidenceIsUnknown()
{
    const QString tsv = kHeader
        + row(5, 1, 1, 1, 1, 0, 0, 10, 10, QStringLiteral("n/a"), QStringLiteral("word"));

    OCRResult result;
    QVERIFY(TesseractTsvParser::parse(tsv, result));
    QCOMPARE(result.blocks.size(), 1);
    QCOMPARE(result.blocks.at(0).confidence, -1.0f);
}

void tst_TesseractTsvParser::testCrLfLineEndings()
{
    QString tsv = kHeader
        + row(5, 1, 1, 1, 1, 0, 0, 10, 10, QStringLiteral("90"), QStringLiteral("crlf"));
    tsv.replace(QStringLiteral("\n"), QStringLiteral("\r\n"));

    OCRResult result;
    QVERIFY(TesseractTsvParser::parse(tsv, result));
    QCOMPARE(result.text, QStringLiteral("crlf"));
}

QTEST_MAIN(tst_TesseractTsvParser)
#include "tst_TesseractTsvParser.moc"
