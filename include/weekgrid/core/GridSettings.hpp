#pragma once

#include <QtCore/qnamespace.h>

class QSettings;

namespace weekgrid {
namespace core {

struct GridSettings
{
    static constexpr double DefaultHourHeight = 64.0;
    static constexpr double MinHourHeight = 20.0;
    static constexpr double MaxHourHeight = 160.0;
    static constexpr double DefaultTimeAxisWidth = 60.0;

    double hourHeight = DefaultHourHeight;
    double timeAxisWidth = DefaultTimeAxisWidth;
    Qt::DayOfWeek firstDayOfWeek = Qt::Sunday;

    // Reads the grid/ group; missing or unusable values keep their defaults.
    static GridSettings load(QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace weekgrid
