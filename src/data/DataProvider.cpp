#include "weekgrid/data/DataProvider.hpp"

#include "weekgrid/core/Logging.hpp"
#include "weekgrid/data/Event.hpp"
#include "weekgrid/data/InMemoryEventRepository.hpp"

#include <QDateTime>
#include <QObject>
#include <QTime>

namespace weekgrid {
namespace data {

namespace {

CalendarEvent makeEvent(const QString &title, const QDate &date, const QTime &start, int durationMinutes)
{
    CalendarEvent event;
    event.title = title;
    event.start = QDateTime(date, start);
    event.end = event.start.addSecs(durationMinutes * 60);
    return event;
}

} // namespace

DataProvider::DataProvider()
    : m_eventRepository(std::make_unique<InMemoryEventRepository>())
{
}

DataProvider::~DataProvider() = default;

EventRepository &DataProvider::eventRepository()
{
    return *m_eventRepository;
}

void DataProvider::seedDemoData(const QDate &weekStart)
{
    if (!weekStart.isValid()) {
        return;
    }
    if (!m_eventRepository->fetchWeek(weekStart).empty()) {
        return;
    }

    const QDate monday = weekStart.addDays(1);
    const QDate wednesday = weekStart.addDays(3);

    auto standup = makeEvent(QObject::tr("Daily Standup"), monday, QTime(9, 0), 30);
    standup.location = QObject::tr("Huddle Room");

    auto review = makeEvent(QObject::tr("Design Review"), monday, QTime(9, 15), 75);
    review.location = QObject::tr("Room A");
    review.advice = QObject::tr("Bring the latest mockups.");

    auto oneOnOne = makeEvent(QObject::tr("1:1"), monday, QTime(10, 0), 30);

    auto lunch = makeEvent(QObject::tr("Team Lunch"), monday, QTime(12, 0), 60);
    lunch.location = QObject::tr("Canteen");
    lunch.placeStatus = QObject::tr("Break time 15:00-17:00");

    auto workshop = makeEvent(QObject::tr("Workshop"), wednesday, QTime(13, 0), 180);
    auto sync = makeEvent(QObject::tr("Vendor Sync"), wednesday, QTime(16, 0), 60);

    m_eventRepository->addEvent(std::move(standup));
    m_eventRepository->addEvent(std::move(review));
    m_eventRepository->addEvent(std::move(oneOnOne));
    m_eventRepository->addEvent(std::move(lunch));
    m_eventRepository->addEvent(std::move(workshop));
    m_eventRepository->addEvent(std::move(sync));
    qCDebug(lcData) << "Seeded demo events for week of" << weekStart;
}

} // namespace data
} // namespace weekgrid
