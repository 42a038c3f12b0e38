#include <QtTest/QtTest>

#include "weekgrid/data/Event.hpp"
#include "weekgrid/layout/ColumnAssigner.hpp"
#include "weekgrid/layout/OverlapDetector.hpp"

using namespace weekgrid;

namespace {

data::CalendarEvent makeEvent(const QTime &start, const QTime &end)
{
    data::CalendarEvent event;
    event.start = QDateTime(QDate(2024, 5, 15), start);
    event.end = QDateTime(QDate(2024, 5, 15), end);
    return event;
}

} // namespace

class ColumnAssignerTest : public QObject
{
    Q_OBJECT

private slots:
    void overlapIsHalfOpen();
    void overlapIsSymmetric();
    void emptyInputHasNoColumns();
    void isolatedEventsShareColumnZero();
    void collidingEventsTakeNextFreeColumn();
    void freedColumnIsReused();
    void followsInputOrder();
};

void ColumnAssignerTest::overlapIsHalfOpen()
{
    const auto first = makeEvent(QTime(9, 0), QTime(10, 0));
    const auto touching = makeEvent(QTime(10, 0), QTime(11, 0));
    const auto crossing = makeEvent(QTime(9, 59), QTime(10, 30));
    QVERIFY(!layout::overlaps(first, touching));
    QVERIFY(layout::overlaps(first, crossing));
    QVERIFY(layout::overlaps(first, first));
}

void ColumnAssignerTest::overlapIsSymmetric()
{
    const auto outer = makeEvent(QTime(9, 0), QTime(12, 0));
    const auto inner = makeEvent(QTime(10, 0), QTime(10, 30));
    const auto later = makeEvent(QTime(13, 0), QTime(14, 0));
    QCOMPARE(layout::overlaps(outer, inner), layout::overlaps(inner, outer));
    QCOMPARE(layout::overlaps(outer, later), layout::overlaps(later, outer));
    QVERIFY(layout::overlaps(inner, outer));
    QVERIFY(!layout::overlaps(later, outer));
}

void ColumnAssignerTest::emptyInputHasNoColumns()
{
    QVERIFY(layout::assignColumns({}).empty());
}

void ColumnAssignerTest::isolatedEventsShareColumnZero()
{
    const std::vector<data::CalendarEvent> events = {
        makeEvent(QTime(8, 0), QTime(9, 0)),
        makeEvent(QTime(9, 0), QTime(10, 0)),
        makeEvent(QTime(15, 0), QTime(16, 0)),
    };
    QCOMPARE(layout::assignColumns(events), std::vector<int>({ 0, 0, 0 }));
}

void ColumnAssignerTest::collidingEventsTakeNextFreeColumn()
{
    const std::vector<data::CalendarEvent> events = {
        makeEvent(QTime(9, 0), QTime(12, 0)),
        makeEvent(QTime(9, 0), QTime(10, 0)),
        makeEvent(QTime(9, 30), QTime(10, 30)),
    };
    QCOMPARE(layout::assignColumns(events), std::vector<int>({ 0, 1, 2 }));
}

void ColumnAssignerTest::freedColumnIsReused()
{
    const std::vector<data::CalendarEvent> events = {
        makeEvent(QTime(9, 0), QTime(10, 0)),
        makeEvent(QTime(9, 30), QTime(11, 0)),
        makeEvent(QTime(10, 0), QTime(11, 0)),
    };
    // The third event only collides with the second, so lane 0 is free again.
    QCOMPARE(layout::assignColumns(events), std::vector<int>({ 0, 1, 0 }));
}

void ColumnAssignerTest::followsInputOrder()
{
    const std::vector<data::CalendarEvent> events = {
        makeEvent(QTime(10, 0), QTime(11, 0)),
        makeEvent(QTime(9, 0), QTime(10, 30)),
    };
    QCOMPARE(layout::assignColumns(events), std::vector<int>({ 0, 1 }));
}

QTEST_GUILESS_MAIN(ColumnAssignerTest)
#include "ColumnAssignerTest.moc"
