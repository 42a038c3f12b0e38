#include "weekgrid/core/GridSettings.hpp"

#include <QSettings>
#include <QString>
#include <QVariant>
#include <QtGlobal>

#include "weekgrid/core/Logging.hpp"

namespace weekgrid {
namespace core {

namespace {
const QString HourHeightKey = QStringLiteral("grid/hourHeight");
const QString TimeAxisWidthKey = QStringLiteral("grid/timeAxisWidth");
const QString FirstDayKey = QStringLiteral("grid/firstDayOfWeek");
} // namespace

GridSettings GridSettings::load(QSettings &settings)
{
    GridSettings result;

    if (settings.contains(HourHeightKey)) {
        bool ok = false;
        const double stored = settings.value(HourHeightKey).toDouble(&ok);
        if (ok && stored > 0.0) {
            result.hourHeight = qBound(MinHourHeight, stored, MaxHourHeight);
        } else {
            qCWarning(lcCore) << "Invalid" << HourHeightKey << settings.value(HourHeightKey);
        }
    }

    if (settings.contains(TimeAxisWidthKey)) {
        bool ok = false;
        const double stored = settings.value(TimeAxisWidthKey).toDouble(&ok);
        if (ok && stored >= 0.0) {
            result.timeAxisWidth = stored;
        } else {
            qCWarning(lcCore) << "Invalid" << TimeAxisWidthKey << settings.value(TimeAxisWidthKey);
        }
    }

    if (settings.contains(FirstDayKey)) {
        bool ok = false;
        const int stored = settings.value(FirstDayKey).toInt(&ok);
        if (ok && stored >= Qt::Monday && stored <= Qt::Sunday) {
            result.firstDayOfWeek = static_cast<Qt::DayOfWeek>(stored);
        } else {
            qCWarning(lcCore) << "Invalid" << FirstDayKey << settings.value(FirstDayKey);
        }
    }

    return result;
}

void GridSettings::save(QSettings &settings) const
{
    settings.setValue(HourHeightKey, hourHeight);
    settings.setValue(TimeAxisWidthKey, timeAxisWidth);
    settings.setValue(FirstDayKey, static_cast<int>(firstDayOfWeek));
}

} // namespace core
} // namespace weekgrid
