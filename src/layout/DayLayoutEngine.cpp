#include "weekgrid/layout/DayLayoutEngine.hpp"

#include "weekgrid/core/Logging.hpp"
#include "weekgrid/layout/ColumnAssigner.hpp"
#include "weekgrid/layout/OverlapGroupMerger.hpp"

namespace weekgrid {
namespace layout {

DayLayoutEngine::DayLayoutEngine(TimeCoordinateMapper mapper)
    : m_mapper(mapper)
{
}

std::vector<Placement> DayLayoutEngine::layout(const std::vector<data::CalendarEvent> &events) const
{
    std::vector<Placement> placements;
    if (events.empty()) {
        return placements;
    }

    const std::vector<int> columns = assignColumns(events);
    const std::vector<OverlapGroup> groups = mergeOverlapGroups(events, columns);
    const std::vector<HorizontalSpan> spans = horizontalSpans(groups, columns);

    std::vector<int> columnCounts(events.size(), 1);
    for (const auto &group : groups) {
        for (const std::size_t member : group.members) {
            columnCounts[member] = group.columnCount;
        }
    }

    placements.reserve(events.size());
    for (std::size_t index = 0; index < events.size(); ++index) {
        const auto &event = events[index];
        const double top = m_mapper.toOffset(event.start.time());
        const double height = verticalEnd(event) - top;
        if (height <= 0.0) {
            qCDebug(lcLayout) << "Degenerate interval for event" << event.id << event.start << event.end;
        }
        placements.emplace_back(event,
                                index,
                                columns[index],
                                columnCounts[index],
                                top,
                                height,
                                spans[index].offset,
                                spans[index].extent);
    }
    qCDebug(lcLayout) << "Laid out" << events.size() << "events in" << groups.size() << "groups";
    return placements;
}

double DayLayoutEngine::verticalEnd(const data::CalendarEvent &event) const
{
    // Runs past midnight are clipped to the bottom of the start day.
    if (event.start.isValid() && event.end.isValid() && event.end.date() > event.start.date()) {
        return m_mapper.dayHeight();
    }
    return m_mapper.toOffset(event.end.time());
}

} // namespace layout
} // namespace weekgrid
