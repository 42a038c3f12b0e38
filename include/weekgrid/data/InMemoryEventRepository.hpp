#pragma once

#include <cstddef>

#include "weekgrid/data/EventRepository.hpp"

namespace weekgrid {
namespace data {

class InMemoryEventRepository : public EventRepository
{
public:
    InMemoryEventRepository();
    ~InMemoryEventRepository() override;

    std::vector<CalendarEvent> fetchEvents(const QDate &from, const QDate &to) const override;
    std::optional<CalendarEvent> findById(const QUuid &id) const override;
    CalendarEvent addEvent(CalendarEvent event) override;
    bool updateEvent(const CalendarEvent &event) override;
    bool removeEvent(const QUuid &id) override;

private:
    // Repairs an end at or before start and fills in a missing colour.
    void normalize(CalendarEvent &event);

    std::vector<CalendarEvent>::iterator find(const QUuid &id);
    std::vector<CalendarEvent>::const_iterator find(const QUuid &id) const;

    std::vector<CalendarEvent> m_events;
    std::size_t m_colorCursor = 0;
};

} // namespace data
} // namespace weekgrid
