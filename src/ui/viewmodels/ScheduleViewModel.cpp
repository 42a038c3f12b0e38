#include "weekgrid/ui/viewmodels/ScheduleViewModel.hpp"

#include <utility>

#include "weekgrid/core/Logging.hpp"
#include "weekgrid/data/EventRepository.hpp"

namespace weekgrid {
namespace ui {

ScheduleViewModel::ScheduleViewModel(data::EventRepository &repository,
                                     layout::WeekLayout weekLayout,
                                     QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_weekLayout(std::move(weekLayout))
{
}

void ScheduleViewModel::setFirstDayOfWeek(Qt::DayOfWeek day)
{
    m_firstDayOfWeek = day;
    if (m_weekStart.isValid()) {
        m_weekStart = layout::startOfWeek(m_weekStart, m_firstDayOfWeek);
    }
}

void ScheduleViewModel::setWeekLayout(layout::WeekLayout weekLayout)
{
    m_weekLayout = std::move(weekLayout);
}

void ScheduleViewModel::setWeek(const QDate &date)
{
    if (!date.isValid()) {
        return;
    }
    m_weekStart = layout::startOfWeek(date, m_firstDayOfWeek);
}

void ScheduleViewModel::shiftWeek(int weeks)
{
    if (!m_weekStart.isValid()) {
        return;
    }
    m_weekStart = m_weekStart.addDays(static_cast<qint64>(weeks) * layout::WeekLayout::DaysPerWeek);
}

void ScheduleViewModel::refresh()
{
    if (!m_weekStart.isValid()) {
        return;
    }
    m_events = m_repository.fetchWeek(m_weekStart);
    m_days = m_weekLayout.build(m_weekStart, m_events);
    qCDebug(lcUi) << "Week of" << m_weekStart << "has" << m_events.size() << "events";
    emit eventsChanged(m_events);
    emit layoutChanged(m_weekStart, m_days);
}

QDate ScheduleViewModel::weekStart() const
{
    return m_weekStart;
}

const std::vector<data::CalendarEvent> &ScheduleViewModel::events() const
{
    return m_events;
}

const std::vector<layout::DayColumn> &ScheduleViewModel::days() const
{
    return m_days;
}

const layout::WeekLayout &ScheduleViewModel::weekLayout() const
{
    return m_weekLayout;
}

} // namespace ui
} // namespace weekgrid
