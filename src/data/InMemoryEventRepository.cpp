#include "weekgrid/data/InMemoryEventRepository.hpp"

#include <algorithm>

#include "weekgrid/core/Logging.hpp"
#include "weekgrid/data/EventStyle.hpp"

namespace weekgrid {
namespace data {

namespace {
constexpr int DefaultDurationMinutes = 30;
}

InMemoryEventRepository::InMemoryEventRepository() = default;
InMemoryEventRepository::~InMemoryEventRepository() = default;

std::vector<CalendarEvent> InMemoryEventRepository::fetchEvents(const QDate &from, const QDate &to) const
{
    std::vector<CalendarEvent> events;
    for (const auto &event : m_events) {
        if (event.end.date() < from || event.start.date() > to) {
            continue;
        }
        events.push_back(event);
    }
    return events;
}

std::optional<CalendarEvent> InMemoryEventRepository::findById(const QUuid &id) const
{
    const auto it = find(id);
    if (it != m_events.end()) {
        return *it;
    }
    return std::nullopt;
}

CalendarEvent InMemoryEventRepository::addEvent(CalendarEvent event)
{
    if (event.id.isNull()) {
        event.id = QUuid::createUuid();
    }
    normalize(event);
    const auto existing = find(event.id);
    if (existing != m_events.end()) {
        *existing = event;
    } else {
        m_events.push_back(event);
    }
    return event;
}

bool InMemoryEventRepository::updateEvent(const CalendarEvent &event)
{
    const auto it = find(event.id);
    if (it == m_events.end()) {
        return false;
    }
    CalendarEvent updated = event;
    if (!updated.color.isValid()) {
        updated.color = it->color;
    }
    normalize(updated);
    *it = updated;
    return true;
}

bool InMemoryEventRepository::removeEvent(const QUuid &id)
{
    const auto it = find(id);
    if (it == m_events.end()) {
        return false;
    }
    m_events.erase(it);
    return true;
}

void InMemoryEventRepository::normalize(CalendarEvent &event)
{
    if (!event.end.isValid() || event.end <= event.start) {
        qCWarning(lcData) << "Normalizing malformed interval of" << event.title << event.start << event.end;
        event.end = event.start.addSecs(DefaultDurationMinutes * 60);
    }
    if (!event.color.isValid()) {
        event.color = paletteColor(m_colorCursor++);
    }
}

std::vector<CalendarEvent>::iterator InMemoryEventRepository::find(const QUuid &id)
{
    return std::find_if(m_events.begin(), m_events.end(), [&id](const CalendarEvent &event) {
        return event.id == id;
    });
}

std::vector<CalendarEvent>::const_iterator InMemoryEventRepository::find(const QUuid &id) const
{
    return std::find_if(m_events.cbegin(), m_events.cend(), [&id](const CalendarEvent &event) {
        return event.id == id;
    });
}

} // namespace data
} // namespace weekgrid
