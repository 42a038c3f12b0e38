#pragma once

#include <memory>

#include "weekgrid/core/GridSettings.hpp"

namespace weekgrid {
namespace data {
class DataProvider;
class EventRepository;
}

namespace core {

class AppContext
{
public:
    AppContext();
    ~AppContext();

    data::DataProvider &dataProvider();
    data::EventRepository &eventRepository();
    GridSettings &gridSettings();
    void saveSettings() const;

private:
    std::unique_ptr<data::DataProvider> m_dataProvider;
    GridSettings m_gridSettings;
};

} // namespace core
} // namespace weekgrid
