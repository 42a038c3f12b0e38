#pragma once

#include <QDate>
#include <QObject>
#include <vector>

#include "weekgrid/data/Event.hpp"
#include "weekgrid/layout/WeekLayout.hpp"

namespace weekgrid {
namespace data {
class EventRepository;
}

namespace ui {

class ScheduleViewModel : public QObject
{
    Q_OBJECT

public:
    ScheduleViewModel(data::EventRepository &repository,
                      layout::WeekLayout weekLayout = layout::WeekLayout(),
                      QObject *parent = nullptr);

    void setFirstDayOfWeek(Qt::DayOfWeek day);
    void setWeekLayout(layout::WeekLayout weekLayout);
    // Shows the week containing date.
    void setWeek(const QDate &date);
    void shiftWeek(int weeks);
    void refresh();

    QDate weekStart() const;
    const std::vector<data::CalendarEvent> &events() const;
    const std::vector<layout::DayColumn> &days() const;
    const layout::WeekLayout &weekLayout() const;

signals:
    void eventsChanged(const std::vector<data::CalendarEvent> &events);
    void layoutChanged(const QDate &weekStart, const std::vector<layout::DayColumn> &days);

private:
    data::EventRepository &m_repository;
    layout::WeekLayout m_weekLayout;
    Qt::DayOfWeek m_firstDayOfWeek = Qt::Sunday;
    QDate m_weekStart;
    std::vector<data::CalendarEvent> m_events;
    std::vector<layout::DayColumn> m_days;
};

} // namespace ui
} // namespace weekgrid
