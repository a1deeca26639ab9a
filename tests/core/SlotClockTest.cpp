#include <QtTest/QtTest>

#include "custody/core/SlotClock.hpp"

using custody::core::CareWindow;
using custody::core::SlotClock;

class SlotClockTest : public QObject
{
    Q_OBJECT

private slots:
    void slotRoundTrip();
    void convertsWallClock();
    void roundsToNearestSlot();
    void validatesRanges();
    void durations();
    void formatsSlots();
    void careWindowContainment();
    void clampsToCareWindow();
};

void SlotClockTest::slotRoundTrip()
{
    for (int slot = 0; slot < SlotClock::SlotsPerDay; ++slot) {
        const auto time = SlotClock::timeFromSlot(slot);
        QCOMPARE(SlotClock::slotFromTime(time.hour, time.minute), slot);
    }
}

void SlotClockTest::convertsWallClock()
{
    QCOMPARE(SlotClock::slotFromTime(0, 0), 0);
    QCOMPARE(SlotClock::slotFromTime(7, 0), 28);
    QCOMPARE(SlotClock::slotFromTime(7, 14), 28);
    QCOMPARE(SlotClock::slotFromTime(19, 30), 78);
    QCOMPARE(SlotClock::slotFromTime(QTime(12, 45)), 51);

    const auto endOfDay = SlotClock::timeFromSlot(96);
    QCOMPARE(endOfDay.hour, 24);
    QCOMPARE(endOfDay.minute, 0);

    // Out-of-range input is clamped.
    QCOMPARE(SlotClock::timeFromSlot(-4).hour, 0);
    QCOMPARE(SlotClock::timeFromSlot(200).hour, 24);
}

void SlotClockTest::roundsToNearestSlot()
{
    QCOMPARE(SlotClock::roundedSlot(8, 7), 32);
    QCOMPARE(SlotClock::roundedSlot(8, 8), 33);
    QCOMPARE(SlotClock::roundedSlot(8, 53), 36);
    QCOMPARE(SlotClock::roundedSlot(QTime(9, 22)), 37);
}

void SlotClockTest::validatesRanges()
{
    QVERIFY(SlotClock::isValidSlot(0));
    QVERIFY(SlotClock::isValidSlot(96));
    QVERIFY(!SlotClock::isValidSlot(-1));
    QVERIFY(!SlotClock::isValidSlot(97));

    QVERIFY(SlotClock::isValidRange(0, 96));
    QVERIFY(SlotClock::isValidRange(28, 29));
    QVERIFY(!SlotClock::isValidRange(40, 40));
    QVERIFY(!SlotClock::isValidRange(50, 40));
    QVERIFY(!SlotClock::isValidRange(90, 100));
}

void SlotClockTest::durations()
{
    QCOMPARE(SlotClock::durationMinutes(28, 78), 750);
    QCOMPARE(SlotClock::durationHours(28, 78), 12.5);
    QCOMPARE(SlotClock::durationMinutes(0, 96), 1440);
    QCOMPARE(SlotClock::durationMinutes(40, 40), 0);
    QCOMPARE(SlotClock::durationHours(60, 20), 0.0);
}

void SlotClockTest::formatsSlots()
{
    QCOMPARE(SlotClock::formatSlot(0), QStringLiteral("12:00 AM"));
    QCOMPARE(SlotClock::formatSlot(32), QStringLiteral("8:00 AM"));
    QCOMPARE(SlotClock::formatSlot(48), QStringLiteral("12:00 PM"));
    QCOMPARE(SlotClock::formatSlot(78), QStringLiteral("7:30 PM"));
    QCOMPARE(SlotClock::formatSlot(96), QStringLiteral("12:00 AM"));
    QCOMPARE(SlotClock::formatSlotRange(32, 48), QStringLiteral("8:00 AM - 12:00 PM"));
}

void SlotClockTest::careWindowContainment()
{
    const CareWindow window;
    QVERIFY(window.isValid());
    QCOMPARE(window.hours(), 12.5);
    QVERIFY(SlotClock::isWithinCareWindow(28, 78, window));
    QVERIFY(SlotClock::isWithinCareWindow(32, 48, window));
    QVERIFY(!SlotClock::isWithinCareWindow(24, 48, window));
    QVERIFY(!SlotClock::isWithinCareWindow(60, 80, window));

    const CareWindow inverted{ 60, 30 };
    QVERIFY(!inverted.isValid());
}

void SlotClockTest::clampsToCareWindow()
{
    const CareWindow window;

    const auto clamped = SlotClock::clampToCareWindow(24, 88, window);
    QVERIFY(clamped.has_value());
    QCOMPARE(clamped->start, 28);
    QCOMPARE(clamped->end, 78);

    const auto inside = SlotClock::clampToCareWindow(32, 48, window);
    QVERIFY(inside.has_value());
    QCOMPARE(inside->start, 32);
    QCOMPARE(inside->end, 48);

    QVERIFY(!SlotClock::clampToCareWindow(0, 20, window).has_value());
    QVERIFY(!SlotClock::clampToCareWindow(78, 90, window).has_value());
}

QTEST_GUILESS_MAIN(SlotClockTest)
#include "SlotClockTest.moc"
