#include "weekgrid/layout/ColumnAssigner.hpp"

#include <set>

#include "weekgrid/layout/OverlapDetector.hpp"

namespace weekgrid {
namespace layout {

std::vector<int> assignColumns(const std::vector<data::CalendarEvent> &events)
{
    std::vector<int> columns;
    columns.reserve(events.size());
    for (std::size_t i = 0; i < events.size(); ++i) {
        std::set<int> occupied;
        for (std::size_t j = 0; j < i; ++j) {
            if (overlaps(events[i], events[j])) {
                occupied.insert(columns[j]);
            }
        }
        int column = 0;
        while (occupied.count(column) > 0) {
            ++column;
        }
        columns.push_back(column);
    }
    return columns;
}

} // namespace layout
} // namespace weekgrid
