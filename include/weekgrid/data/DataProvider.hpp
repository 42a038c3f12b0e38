#pragma once

#include <QDate>
#include <memory>

namespace weekgrid {
namespace data {

class EventRepository;

class DataProvider
{
public:
    DataProvider();
    ~DataProvider();

    EventRepository &eventRepository();

    // Adds a few sample events to the week containing weekStart when it is empty.
    void seedDemoData(const QDate &weekStart);

private:
    std::unique_ptr<EventRepository> m_eventRepository;
};

} // namespace data
} // namespace weekgrid
