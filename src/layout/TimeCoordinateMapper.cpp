#include "weekgrid/layout/TimeCoordinateMapper.hpp"

#include <QtGlobal>
#include <cmath>

#include "weekgrid/core/Logging.hpp"

namespace weekgrid {
namespace layout {

namespace {
constexpr int MinutesPerDay = 24 * 60;
// Absorbs rounding of minutesToOffset so whole minutes survive the round trip.
constexpr double MinuteTolerance = 1e-6;
}

TimeCoordinateMapper::TimeCoordinateMapper(double unitHeight)
{
    if (!(unitHeight > 0.0)) {
        qCWarning(lcLayout) << "Ignoring non-positive unit height" << unitHeight;
        return;
    }
    m_unitHeight = unitHeight;
}

double TimeCoordinateMapper::toOffset(const QTime &time) const
{
    if (!time.isValid()) {
        return 0.0;
    }
    return minutesToOffset(time.hour() * 60 + time.minute());
}

double TimeCoordinateMapper::minutesToOffset(double minutes) const
{
    return minutes * m_unitHeight / 60.0;
}

QDateTime TimeCoordinateMapper::toTime(double offset, const QDate &date) const
{
    const double bounded = qBound(0.0, offset, dayHeight());
    int minutes = static_cast<int>(std::floor(bounded * 60.0 / m_unitHeight + MinuteTolerance));
    minutes = qBound(0, minutes, MinutesPerDay - 1);
    return QDateTime(date, QTime::fromMSecsSinceStartOfDay(minutes * 60 * 1000));
}

} // namespace layout
} // namespace weekgrid
