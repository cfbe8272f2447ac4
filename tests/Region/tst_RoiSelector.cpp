#include <QtTest>
#include "region/RoiSelector.h"
#include <QPoint>
#include <QRect>
#include <QSignalSpy>

/**
 * @brief Test class for RoiSelector.
 *
 * Tests drag gestures, clamping, zero-area handling and state transitions.
 */
class tst_RoiSelector : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Initial state tests
    void testInitialState();

    // Drag tests
    void testDragProducesRegion();
    void testDragUpLeftNormalizes();
    void testRegionUnavailableWhileDragging();
    void testClickWithoutMoveStaysIdle();
    void testZeroHeightDragStaysIdle();
    void testPointerDownOutsideBoundsIgnored();
    void testPointerDownWithoutBoundsIgnored();
    void testDragClampedToBounds();
    void testNewDragReplacesRegion();
    void testMoveAndUpIgnoredWhenIdle();

    // Clear / bounds tests
    void testClear();
    void testClearWhenIdleEmitsNothing();
    void testShrinkingBoundsClampsRegion();
    void testBoundsMovedAwayClearsRegion();
    void testSetRegionClamps();

    // Signal tests
    void testStateChangedSignal();

private:
    RoiSelector* m_selector;
};

void tst_RoiSelector::init()
{
    m_selector = new RoiSelector();
    m_selector->setBounds(QRect(0, 0, 640, 480));
}

void tst_RoiSelector::cleanup()
{
    delete m_selector;
    m_selector = nullptr;
}

void tst_RoiSelector::testInitialState()
{
    QCOMPARE(m_selector->state(), RoiSelector::State::Idle);
    QVERIFY(!m_selector->currentRegion().has_value());
    QVERIFY(m_selector->displayRect().isNull());
}

void tst_RoiSelector::testDragProducesRegion()
{
    QVERIFY(m_selector->pointerDown(QPoint(10, 10)));
    QCOMPARE(m_selector->state(), RoiSelector::State::Dragging);
    m_selector->pointerMove(QPoint(60, 30));
    m_selector->pointerUp(QPoint(110, 60));

    QCOMPARE(m_selector->state(), RoiSelector::State::Set);
    QVERIFY(m_selector->currentRegion().has_value());
    QCOMPARE(*m_selector->currentRegion(), QRect(10, 10, 100, 50));
}

void tst_RoiSelector::testDragUpLeftNormalizes()
{
    m_selector->pointerDown(QPoint(110, 60));
    m_selector->pointerUp(QPoint(10, 10));

    QCOMPARE(*m_selector->currentRegion(), QRect(10, 10, 100, 50));
}

void tst_RoiSelector::testRegionUnavailableWhileDragging()
{
    m_selector->pointerDown(QPoint(10, 10));
    m_selector->pointerMove(QPoint(200, 200));

    QVERIFY(!m_selector->currentRegion().has_value());
    QCOMPARE(m_selector->displayRect(), QRect(10, 10, 190, 190));
}

void tst_RoiSelector::testClickWithoutMoveStaysIdle()
{
    m_selector->pointerDown(QPoint(50, 50));
    m_selector->pointerUp(QPoint(50, 50));

    QCOMPARE(m_selector->state(), RoiSelector::State::Idle);
    QVERIFY(!m_selector->currentRegion().has_value());
}

void tst_RoiSelector::testZeroHeightDragStaysIdle()
{
    m_selector->pointerDown(QPoint(10, 50));
    m_selector->pointerUp(QPoint(300, 50));

    QCOMPARE(m_selector->state(), RoiSelector::State::Idle);
    QVERIFY(!m_selector->currentRegion().has_value());
}

void tst_RoiSelector::testPointerDownOutsideBoundsIgnored()
{
    QVERIFY(!m_selector->pointerDown(QPoint(700, 10)));
    QVERIFY(!m_selector->pointerDown(QPoint(-1, 10)));
    QCOMPARE(m_selector->state(), RoiSelector::State::Idle);
}

void tst_RoiSelector::testPointerDownWithoutBoundsIgnored()
{
    RoiSelector selector;
    QVERIFY(!selector.pointerDown(QPoint(0, 0)));
    QCOMPARE(selector.state(), RoiSelector::State::Idle);
}

void tst_RoiSelector::testDragClampedToBounds()
{
    m_selector->pointerDown(QPoint(600, 400));
    m_selector->pointerUp(QPoint(2000, 2000));

    QCOMPARE(*m_selector->currentRegion(), QRect(600, 400, 40, 80));
    QVERIFY(QRect(0, 0, 640, 480).contains(*m_selector->currentRegion()));
}

void tst_RoiSelector::testNewDragReplacesRegion()
{
    m_selector->pointerDown(QPoint(10, 10));
    m_selector->pointerUp(QPoint(110, 60));
    QVERIFY(m_selector->isSet());

    m_selector->pointerDown(QPoint(200, 200));
    QCOMPARE(m_selector->state(), RoiSelector::State::Dragging);
    QVERIFY(!m_selector->currentRegion().has_value());

    m_selector->pointerUp(QPoint(220, 240));
    QCOMPARE(*m_selector->currentRegion(), QRect(200, 200, 20, 40));
}

void tst_RoiSelector::testMoveAndUpIgnoredWhenIdle()
{
    QSignalSpy spy(m_selector, &RoiSelector::regionChanged);
    m_selector->pointerMove(QPoint(10, 10));
    m_selector->pointerUp(QPoint(20, 20));

    QCOMPARE(m_selector->state(), RoiSelector::State::Idle);
    QCOMPARE(spy.count(), 0);
}

void tst_RoiSelector::testClear()
{
    m_selector->pointerDown(QPoint(10, 10));
    m_selector->pointerUp(QPoint(110, 60));

    QSignalSpy spy(m_selector, &RoiSelector::regionChanged);
    m_selector->clear();

    QCOMPARE(m_selector->state(), RoiSelector::State::Idle);
    QVERIFY(!m_selector->currentRegion().has_value());
    QCOMPARE(spy.count(), 1);
    QVERIFY(spy.at(0).at(0).toRect().isNull());
}

void tst_RoiSelector::testClearWhenIdleEmitsNothing()
{
    QSignalSpy spy(m_selector, &RoiSelector::regionChanged);
    m_selector->clear();
    QCOMPARE(spy.count(), 0);
}

void tst_RoiSelector::testShrinkingBoundsClampsRegion()
{
    m_selector->pointerDown(QPoint(300, 200));
    m_selector->pointerUp(QPoint(500, 400));

    m_selector->setBounds(QRect(0, 0, 400, 300));
    QVERIFY(m_selector->isSet());
    QCOMPARE(*m_selector->currentRegion(), QRect(300, 200, 100, 100));
}

void tst_RoiSelector::testBoundsMovedAwayClearsRegion()
{
    m_selector->pointerDown(QPoint(300, 200));
    m_selector->pointerUp(QPoint(500, 400));

    m_selector->setBounds(QRect(0, 0, 100, 100));
    QCOMPARE(m_selector->state(), RoiSelector::State::Idle);
}

void tst_RoiSelector::testSetRegionClamps()
{
    m_selector->setRegion(QRect(600, 450, 100, 100));
    QCOMPARE(*m_selector->currentRegion(), QRect(600, 450, 40, 30));

    m_selector->setRegion(QRect(10, 10, 0, 20));
    QCOMPARE(m_selector->state(), RoiSelector::State::Idle);
}

void tst_RoiSelector::testStateChangedSignal()
{
    QSignalSpy spy(m_selector, &RoiSelector::stateChanged);

    m_selector->pointerDown(QPoint(10, 10));
    m_selector->pointerUp(QPoint(50, 50));
    m_selector->clear();

    QCOMPARE(spy.count(), 3);
    QCOMPARE(spy.at(0).at(0).value<RoiSelector::State>(), RoiSelector::State::Dragging);
    QCOMPARE(spy.at(1).at(0).value<RoiSelector::State>(), RoiSelector::State::Set);
    QCOMPARE(spy.at(2).at(0).value<RoiSelector::State>(), RoiSelector::State::Idle);
}

QTEST_MAIN(tst_RoiSelector)
#include "tst_RoiSelector.moc"
