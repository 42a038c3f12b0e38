#include "weekgrid/layout/WeekLayout.hpp"

#include <QTime>
#include <QtGlobal>
#include <algorithm>
#include <cmath>
#include <utility>

#include "weekgrid/core/Logging.hpp"

namespace weekgrid {
namespace layout {

QDate startOfWeek(const QDate &date, Qt::DayOfWeek firstDay)
{
    if (!date.isValid()) {
        return {};
    }
    const int back = (date.dayOfWeek() - static_cast<int>(firstDay) + 7) % 7;
    return date.addDays(-back);
}

WeekLayout::WeekLayout(DayLayoutEngine engine)
    : m_engine(std::move(engine))
{
}

std::vector<DayColumn> WeekLayout::build(const QDate &weekStart,
                                         const std::vector<data::CalendarEvent> &events) const
{
    std::vector<DayColumn> days;
    if (!weekStart.isValid()) {
        qCWarning(lcLayout) << "Cannot lay out a week without a valid start date";
        return days;
    }

    std::vector<std::vector<data::CalendarEvent>> buckets(DaysPerWeek);
    const QDateTime windowStart(weekStart, QTime(0, 0));
    const QDateTime windowEnd(weekStart.addDays(DaysPerWeek), QTime(0, 0));
    for (const auto &event : events) {
        if (!event.start.isValid() || event.start < windowStart || event.start >= windowEnd) {
            continue;
        }
        const qint64 dayIndex = weekStart.daysTo(event.start.date());
        if (dayIndex < 0 || dayIndex >= DaysPerWeek) {
            continue;
        }
        buckets[static_cast<std::size_t>(dayIndex)].push_back(event);
    }

    days.reserve(DaysPerWeek);
    for (int day = 0; day < DaysPerWeek; ++day) {
        auto &bucket = buckets[static_cast<std::size_t>(day)];
        std::stable_sort(bucket.begin(), bucket.end(), [](const data::CalendarEvent &a, const data::CalendarEvent &b) {
            return a.start < b.start;
        });
        DayColumn column;
        column.date = weekStart.addDays(day);
        column.placements = m_engine.layout(bucket);
        days.push_back(std::move(column));
    }
    return days;
}

std::optional<TimeMarker> WeekLayout::currentTimeMarker(const QDate &weekStart, const QDateTime &now) const
{
    if (!weekStart.isValid() || !now.isValid()) {
        return std::nullopt;
    }
    const qint64 dayIndex = weekStart.daysTo(now.date());
    if (dayIndex < 0 || dayIndex >= DaysPerWeek) {
        return std::nullopt;
    }
    TimeMarker marker;
    marker.dayIndex = static_cast<int>(dayIndex);
    marker.offset = m_engine.mapper().toOffset(now.time());
    return marker;
}

int WeekLayout::dayIndexAt(double x, double totalWidth)
{
    if (totalWidth <= 0.0) {
        return 0;
    }
    const double dayWidth = totalWidth / DaysPerWeek;
    const int index = static_cast<int>(std::floor(x / dayWidth));
    return qBound(0, index, DaysPerWeek - 1);
}

} // namespace layout
} // namespace weekgrid
