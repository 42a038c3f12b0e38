#pragma once

#include <QDate>
#include <optional>
#include <vector>

#include "weekgrid/data/Event.hpp"

namespace weekgrid {
namespace data {

// Event storage behind the week grid. Implementations own malformed-event
// repair: whatever addEvent or updateEvent stores has end > start.
class EventRepository
{
public:
    static constexpr int DaysPerWeek = 7;

    virtual ~EventRepository() = default;

    // Events touching the inclusive date range, in storage order.
    virtual std::vector<CalendarEvent> fetchEvents(const QDate &from, const QDate &to) const = 0;
    virtual std::optional<CalendarEvent> findById(const QUuid &id) const = 0;
    // Returns the stored event, with id, end and colour filled in.
    virtual CalendarEvent addEvent(CalendarEvent event) = 0;
    // False when no event carries the id.
    virtual bool updateEvent(const CalendarEvent &event) = 0;
    virtual bool removeEvent(const QUuid &id) = 0;

    std::vector<CalendarEvent> fetchWeek(const QDate &weekStart) const
    {
        return fetchEvents(weekStart, weekStart.addDays(DaysPerWeek - 1));
    }
};

} // namespace data
} // namespace weekgrid
