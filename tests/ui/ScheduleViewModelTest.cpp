#include <QtTest/QtTest>

#include <QSignalSpy>

#include "weekgrid/data/Event.hpp"
#include "weekgrid/data/InMemoryEventRepository.hpp"
#include "weekgrid/ui/viewmodels/ScheduleViewModel.hpp"

using namespace weekgrid;

namespace {

data::CalendarEvent makeEvent(const QString &title, const QDate &date, const QTime &start, int minutes)
{
    data::CalendarEvent event;
    event.title = title;
    event.start = QDateTime(date, start);
    event.end = event.start.addSecs(minutes * 60);
    return event;
}

layout::WeekLayout hourUnitLayout()
{
    return layout::WeekLayout(layout::DayLayoutEngine(layout::TimeCoordinateMapper(1.0)));
}

} // namespace

class ScheduleViewModelTest : public QObject
{
    Q_OBJECT

private slots:
    void loadsWeek();
    void laysOutOverlaps();
    void shiftsWeeks();
    void honoursFirstDayOfWeek();
};

void ScheduleViewModelTest::loadsWeek()
{
    data::InMemoryEventRepository repo;
    repo.addEvent(makeEvent(QStringLiteral("Meeting"), QDate(2024, 5, 15), QTime(10, 0), 60));
    repo.addEvent(makeEvent(QStringLiteral("Elsewhere"), QDate(2024, 6, 15), QTime(10, 0), 60));

    ui::ScheduleViewModel model(repo, hourUnitLayout());
    QSignalSpy layoutSpy(&model, &ui::ScheduleViewModel::layoutChanged);
    model.setWeek(QDate(2024, 5, 15));
    model.refresh();

    QCOMPARE(model.weekStart(), QDate(2024, 5, 12));
    QCOMPARE(model.events().size(), static_cast<size_t>(1));
    QCOMPARE(model.events().front().title, QStringLiteral("Meeting"));
    QCOMPARE(model.days().size(), static_cast<size_t>(7));
    QCOMPARE(model.days()[3].placements.size(), static_cast<size_t>(1));
    QCOMPARE(model.days()[3].placements.front().verticalOffset(), 10.0);
    QCOMPARE(layoutSpy.count(), 1);
}

void ScheduleViewModelTest::laysOutOverlaps()
{
    data::InMemoryEventRepository repo;
    const QDate monday(2024, 5, 13);
    repo.addEvent(makeEvent(QStringLiteral("Review"), monday, QTime(9, 30), 60));
    repo.addEvent(makeEvent(QStringLiteral("Standup"), monday, QTime(9, 0), 60));

    ui::ScheduleViewModel model(repo, hourUnitLayout());
    model.setWeek(monday);
    model.refresh();

    const auto &placements = model.days()[1].placements;
    QCOMPARE(placements.size(), static_cast<size_t>(2));
    QCOMPARE(placements[0].event().title, QStringLiteral("Standup"));
    QCOMPARE(placements[0].horizontalOffset(), 0.0);
    QCOMPARE(placements[1].horizontalOffset(), 0.5);
    QCOMPARE(placements[1].horizontalExtent(), 0.5);
}

void ScheduleViewModelTest::shiftsWeeks()
{
    data::InMemoryEventRepository repo;
    repo.addEvent(makeEvent(QStringLiteral("Next"), QDate(2024, 5, 21), QTime(8, 0), 30));

    ui::ScheduleViewModel model(repo, hourUnitLayout());
    model.setWeek(QDate(2024, 5, 15));
    model.refresh();
    QVERIFY(model.events().empty());

    model.shiftWeek(1);
    model.refresh();
    QCOMPARE(model.weekStart(), QDate(2024, 5, 19));
    QCOMPARE(model.events().size(), static_cast<size_t>(1));

    model.shiftWeek(-2);
    QCOMPARE(model.weekStart(), QDate(2024, 5, 5));
}

void ScheduleViewModelTest::honoursFirstDayOfWeek()
{
    data::InMemoryEventRepository repo;
    ui::ScheduleViewModel model(repo);
    model.setFirstDayOfWeek(Qt::Monday);
    model.setWeek(QDate(2024, 5, 12));
    QCOMPARE(model.weekStart(), QDate(2024, 5, 6));
}

QTEST_GUILESS_MAIN(ScheduleViewModelTest)
#include "ScheduleViewModelTest.moc"
