#include <QtTest/QtTest>

#include "weekgrid/data/Event.hpp"
#include "weekgrid/layout/WeekLayout.hpp"

using namespace weekgrid;

namespace {

// Sunday
const QDate WeekStart(2024, 5, 12);

data::CalendarEvent makeEvent(const QString &title, const QDate &date, const QTime &start, const QTime &end)
{
    data::CalendarEvent event;
    event.title = title;
    event.start = QDateTime(date, start);
    event.end = QDateTime(date, end);
    return event;
}

layout::WeekLayout hourUnitLayout()
{
    return layout::WeekLayout(layout::DayLayoutEngine(layout::TimeCoordinateMapper(1.0)));
}

} // namespace

class WeekLayoutTest : public QObject
{
    Q_OBJECT

private slots:
    void startOfWeekHonoursFirstDay();
    void buildsSevenDays();
    void bucketsByStartDate();
    void sortsEachDayByStart();
    void ignoresEventsOutsideWeek();
    void locatesCurrentTime();
    void mapsPositionToDay();
};

void WeekLayoutTest::startOfWeekHonoursFirstDay()
{
    const QDate wednesday(2024, 5, 15);
    QCOMPARE(layout::startOfWeek(wednesday), WeekStart);
    QCOMPARE(layout::startOfWeek(WeekStart), WeekStart);
    QCOMPARE(layout::startOfWeek(wednesday, Qt::Monday), QDate(2024, 5, 13));
    QCOMPARE(layout::startOfWeek(QDate(2024, 5, 18), Qt::Sunday), WeekStart);
    QVERIFY(!layout::startOfWeek(QDate()).isValid());
}

void WeekLayoutTest::buildsSevenDays()
{
    const auto days = hourUnitLayout().build(WeekStart, {});
    QCOMPARE(days.size(), static_cast<std::size_t>(layout::WeekLayout::DaysPerWeek));
    for (int day = 0; day < layout::WeekLayout::DaysPerWeek; ++day) {
        QCOMPARE(days[static_cast<std::size_t>(day)].date, WeekStart.addDays(day));
        QVERIFY(days[static_cast<std::size_t>(day)].placements.empty());
    }
    QVERIFY(hourUnitLayout().build(QDate(), {}).empty());
}

void WeekLayoutTest::bucketsByStartDate()
{
    const auto days = hourUnitLayout().build(WeekStart, {
        makeEvent(QStringLiteral("Monday"), WeekStart.addDays(1), QTime(9, 0), QTime(10, 0)),
        makeEvent(QStringLiteral("Saturday"), WeekStart.addDays(6), QTime(9, 30), QTime(10, 30)),
    });
    QCOMPARE(days[1].placements.size(), static_cast<std::size_t>(1));
    QCOMPARE(days[6].placements.size(), static_cast<std::size_t>(1));
    // Same time on different days never shares a group.
    QCOMPARE(days[1].placements.front().horizontalExtent(), 1.0);
    QCOMPARE(days[6].placements.front().horizontalExtent(), 1.0);
}

void WeekLayoutTest::sortsEachDayByStart()
{
    const QDate monday = WeekStart.addDays(1);
    const auto days = hourUnitLayout().build(WeekStart, {
        makeEvent(QStringLiteral("Late"), monday, QTime(10, 0), QTime(11, 0)),
        makeEvent(QStringLiteral("Early"), monday, QTime(9, 0), QTime(10, 30)),
        makeEvent(QStringLiteral("Tie"), monday, QTime(9, 0), QTime(9, 45)),
    });
    const auto &placements = days[1].placements;
    QCOMPARE(placements.size(), static_cast<std::size_t>(3));
    QCOMPARE(placements[0].event().title, QStringLiteral("Early"));
    QCOMPARE(placements[1].event().title, QStringLiteral("Tie"));
    QCOMPARE(placements[2].event().title, QStringLiteral("Late"));
    QCOMPARE(placements[0].column(), 0);
    QCOMPARE(placements[1].column(), 1);
    QCOMPARE(placements[2].column(), 1);
}

void WeekLayoutTest::ignoresEventsOutsideWeek()
{
    auto overnight = makeEvent(QStringLiteral("Overnight"), WeekStart.addDays(-1), QTime(22, 0), QTime(23, 0));
    overnight.end = QDateTime(WeekStart, QTime(2, 0));
    const auto days = hourUnitLayout().build(WeekStart, {
        overnight,
        makeEvent(QStringLiteral("NextWeek"), WeekStart.addDays(7), QTime(0, 0), QTime(1, 0)),
        makeEvent(QStringLiteral("Invalid"), QDate(), QTime(9, 0), QTime(10, 0)),
    });
    for (const auto &day : days) {
        QVERIFY(day.placements.empty());
    }
}

void WeekLayoutTest::locatesCurrentTime()
{
    const auto weekLayout = hourUnitLayout();
    const auto marker = weekLayout.currentTimeMarker(WeekStart, QDateTime(WeekStart.addDays(3), QTime(14, 30)));
    QVERIFY(marker.has_value());
    QCOMPARE(marker->dayIndex, 3);
    QCOMPARE(marker->offset, 14.5);

    QVERIFY(!weekLayout.currentTimeMarker(WeekStart, QDateTime(WeekStart.addDays(7), QTime(0, 0))).has_value());
    QVERIFY(!weekLayout.currentTimeMarker(WeekStart, QDateTime(WeekStart.addDays(-1), QTime(23, 59))).has_value());
}

void WeekLayoutTest::mapsPositionToDay()
{
    QCOMPARE(layout::WeekLayout::dayIndexAt(0.0, 700.0), 0);
    QCOMPARE(layout::WeekLayout::dayIndexAt(99.9, 700.0), 0);
    QCOMPARE(layout::WeekLayout::dayIndexAt(100.0, 700.0), 1);
    QCOMPARE(layout::WeekLayout::dayIndexAt(650.0, 700.0), 6);
    QCOMPARE(layout::WeekLayout::dayIndexAt(900.0, 700.0), 6);
    QCOMPARE(layout::WeekLayout::dayIndexAt(-20.0, 700.0), 0);
    QCOMPARE(layout::WeekLayout::dayIndexAt(50.0, 0.0), 0);
}

QTEST_GUILESS_MAIN(WeekLayoutTest)
#include "WeekLayoutTest.moc"
