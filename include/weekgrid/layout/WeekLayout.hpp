#pragma once

#include <QDate>
#include <QDateTime>
#include <optional>
#include <vector>

#include "weekgrid/data/Event.hpp"
#include "weekgrid/layout/DayLayoutEngine.hpp"
#include "weekgrid/layout/Placement.hpp"

namespace weekgrid {
namespace layout {

struct DayColumn
{
    QDate date;
    std::vector<Placement> placements;
};

struct TimeMarker
{
    int dayIndex = -1;
    double offset = 0.0;
};

// Most recent firstDay on or before date.
QDate startOfWeek(const QDate &date, Qt::DayOfWeek firstDay = Qt::Sunday);

class WeekLayout
{
public:
    static constexpr int DaysPerWeek = 7;

    explicit WeekLayout(DayLayoutEngine engine = DayLayoutEngine());

    const DayLayoutEngine &engine() const { return m_engine; }

    // Seven day columns starting at weekStart. Events belong to the day they
    // start on; each day is ordered by start time before layout.
    std::vector<DayColumn> build(const QDate &weekStart, const std::vector<data::CalendarEvent> &events) const;

    std::optional<TimeMarker> currentTimeMarker(const QDate &weekStart, const QDateTime &now) const;

    static int dayIndexAt(double x, double totalWidth);

private:
    DayLayoutEngine m_engine;
};

} // namespace layout
} // namespace weekgrid
