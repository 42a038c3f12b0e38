#pragma once

#include <QDate>
#include <QDateTime>
#include <QTime>

namespace weekgrid {
namespace layout {

// Maps a time of day onto the vertical axis of a day column and back.
// One hour spans unitHeight units; the calendar date never affects the offset.
class TimeCoordinateMapper
{
public:
    static constexpr double DefaultUnitHeight = 64.0;

    explicit TimeCoordinateMapper(double unitHeight = DefaultUnitHeight);

    double unitHeight() const { return m_unitHeight; }
    double dayHeight() const { return 24.0 * m_unitHeight; }

    double toOffset(const QTime &time) const;
    double minutesToOffset(double minutes) const;
    // Inverse of toOffset on the given date; offsets outside the day are clamped to it.
    QDateTime toTime(double offset, const QDate &date) const;

private:
    double m_unitHeight = DefaultUnitHeight;
};

} // namespace layout
} // namespace weekgrid
