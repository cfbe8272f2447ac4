#include <QtTest>

#include <opencv2/core.hpp>

#include "utils/MatConverter.h"

class tst_MatConverter : public QObject
{
    Q_OBJECT

private slots:
    void testToGrayFromRgb();
    void testToGrayFromGrayscaleKeepsValues();
    void testToGrayNullImage();
    void testToQImageBgr();
    void testToQImageGray();
    void testToQImageEmpty();
    void testToMatCopyIsDeep();
};

void tst_MatConverter::testToGrayFromRgb()
{
    QImage image(8, 4, QImage::Format_RGB32);
    image.fill(QColor(255, 255, 255));

    cv::Mat gray = MatConverter::toGray(image);
    QCOMPARE(gray.type(), CV_8UC1);
    QCOMPARE(gray.cols, 8);
    QCOMPARE(gray.rows, 4);
    QCOMPARE(int(gray.at<uchar>(2, 5)), 255);
}

void tst_MatConverter::testToGrayFromGrayscaleKeepsValues()
{
    QImage image(5, 5, QImage::Format_Grayscale8);
    image.fill(77);

    cv::Mat gray = MatConverter::toGray(image);
    QCOMPARE(int(gray.at<uchar>(4, 4)), 77);
}

void tst_MatConverter::testToGrayNullImage()
{
    QVERIFY(MatConverter::toGray(QImage()).empty());
}

void tst_MatConverter::testToQImageBgr()
{
    // OpenCV frames are BGR: pure blue in BGR order
    cv::Mat bgr(3, 6, CV_8UC3, cv::Scalar(255, 0, 0));

    QImage image = MatConverter::toQImage(bgr);
    QCOMPARE(image.size(), QSize(6, 3));
    QCOMPARE(image.pixelColor(1, 1), QColor(0, 0, 255));
}

void tst_MatConverter::testToQImageGray()
{
    cv::Mat gray(4, 4, CV_8UC1, cv::Scalar(200));

    QImage image = MatConverter::toQImage(gray);
    QCOMPARE(image.format(), QImage::Format_Grayscale8);
    QCOMPARE(qGray(image.pixel(0, 0)), 200);
}

void tst_MatConverter::testToQImageEmpty()
{
    QVERIFY(MatConverter::toQImage(cv::Mat()).isNull());
}

void tst_MatConverter::testToMatCopyIsDeep()
{
    QImage image(4, 4, QImage::Format_RGB32);
    image.fill(Qt::black);

    cv::Mat mat = MatConverter::toMatCopy(image);
    image.fill(Qt::white);
    QCOMPARE(int(mat.at<cv::Vec4b>(0, 0)[0]), 0);
}

QTEST_MAIN(tst_MatConverter)
#include "tst_MatConverter.moc"
