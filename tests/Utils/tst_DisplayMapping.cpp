#include <QtTest>
#include "utils/DisplayMapping.h"

/**
 * @brief Unit tests for DisplayMapping.
 *
 * Tests scale-to-fit, letterbox offsets and conversions between widget
 * and frame coordinates.
 */
class tst_DisplayMapping : public QObject
{
    Q_OBJECT

private slots:
    // Construction tests
    void testInvalidForEmptySizes();
    void testSameSizeIsIdentity();
    void testWideViewLetterboxesHorizontally();
    void testTallViewLetterboxesVertically();
    void testUpscaleSmallImage();

    // Conversion tests
    void testToImage_Corners();
    void testToImage_OutsideIsUnclamped();
    void testContainsViewPoint();
    void testToView_RoundTripsRect();
};

void tst_DisplayMapping::testInvalidForEmptySizes()
{
    QVERIFY(!DisplayMapping().isValid());
    QVERIFY(!DisplayMapping(QSize(0, 0), QSize(100, 100)).isValid());
    QVERIFY(!DisplayMapping(QSize(100, 100), QSize(0, 50)).isValid());
    QVERIFY(DisplayMapping(QSize(100, 100), QSize(0, 50)).targetRect().isNull());
}

void tst_DisplayMapping::testSameSizeIsIdentity()
{
    DisplayMapping mapping(QSize(640, 480), QSize(640, 480));
    QCOMPARE(mapping.scale(), 1.0);
    QCOMPARE(mapping.offset(), QPoint(0, 0));
    QCOMPARE(mapping.toImage(QPointF(123, 45)), QPoint(123, 45));
    QCOMPARE(mapping.targetRect(), QRect(0, 0, 640, 480));
}

void tst_DisplayMapping::testWideViewLetterboxesHorizontally()
{
    DisplayMapping mapping(QSize(640, 480), QSize(1000, 480));
    QCOMPARE(mapping.scale(), 1.0);
    QCOMPARE(mapping.offset(), QPoint(180, 0));
    QCOMPARE(mapping.targetRect(), QRect(180, 0, 640, 480));
}

void tst_DisplayMapping::testTallViewLetterboxesVertically()
{
    DisplayMapping mapping(QSize(640, 480), QSize(320, 400));
    QCOMPARE(mapping.scale(), 0.5);
    QCOMPARE(mapping.offset(), QPoint(0, 80));
    QCOMPARE(mapping.targetRect(), QRect(0, 80, 320, 240));
}

void tst_DisplayMapping::testUpscaleSmallImage()
{
    DisplayMapping mapping(QSize(100, 50), QSize(400, 400));
    QCOMPARE(mapping.scale(), 4.0);
    QCOMPARE(mapping.offset(), QPoint(0, 100));
    QCOMPARE(mapping.toImage(QPointF(8, 108)), QPoint(2, 2));
}

void tst_DisplayMapping::testToImage_Corners()
{
    DisplayMapping mapping(QSize(640, 480), QSize(320, 400));

    QCOMPARE(mapping.toImage(QPointF(0, 80)), QPoint(0, 0));
    QCOMPARE(mapping.toImage(QPointF(319.9, 319.9)), QPoint(639, 479));
    QCOMPARE(mapping.toImage(QPointF(160, 200)), QPoint(320, 240));
}

void tst_DisplayMapping::testToImage_OutsideIsUnclamped()
{
    DisplayMapping mapping(QSize(640, 480), QSize(320, 400));

    QCOMPARE(mapping.toImage(QPointF(10, 0)), QPoint(20, -160));
    QCOMPARE(mapping.toImage(QPointF(10, 79.5)), QPoint(20, -1));
}

void tst_DisplayMapping::testContainsViewPoint()
{
    DisplayMapping mapping(QSize(640, 480), QSize(320, 400));

    QVERIFY(mapping.containsViewPoint(QPointF(0, 80)));
    QVERIFY(mapping.containsViewPoint(QPointF(160, 200)));
    QVERIFY(!mapping.containsViewPoint(QPointF(160, 40)));    // Top letterbox
    QVERIFY(!mapping.containsViewPoint(QPointF(160, 330)));   // Bottom letterbox
    QVERIFY(!DisplayMapping().containsViewPoint(QPointF(0, 0)));
}

void tst_DisplayMapping::testToView_RoundTripsRect()
{
    DisplayMapping mapping(QSize(640, 480), QSize(320, 400));

    QCOMPARE(mapping.toView(QRect(10, 10, 100, 50)), QRect(5, 85, 50, 25));
    QCOMPARE(mapping.toView(QRect(0, 0, 640, 480)), mapping.targetRect());
}

QTEST_MAIN(tst_DisplayMapping)
#include "tst_DisplayMapping.moc"
