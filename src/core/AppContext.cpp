#include "weekgrid/core/AppContext.hpp"

#include <QSettings>

#include "weekgrid/data/DataProvider.hpp"

namespace weekgrid {
namespace core {

AppContext::AppContext()
    : m_dataProvider(std::make_unique<data::DataProvider>())
{
    QSettings settings;
    m_gridSettings = GridSettings::load(settings);
}

AppContext::~AppContext() = default;

data::DataProvider &AppContext::dataProvider()
{
    return *m_dataProvider;
}

data::EventRepository &AppContext::eventRepository()
{
    return m_dataProvider->eventRepository();
}

GridSettings &AppContext::gridSettings()
{
    return m_gridSettings;
}

void AppContext::saveSettings() const
{
    QSettings settings;
    m_gridSettings.save(settings);
}

} // namespace core
} // namespace weekgrid
