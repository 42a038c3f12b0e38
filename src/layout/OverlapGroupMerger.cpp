#include "weekgrid/layout/OverlapGroupMerger.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>

#include "weekgrid/layout/OverlapDetector.hpp"

namespace weekgrid {
namespace layout {

std::vector<OverlapGroup> mergeOverlapGroups(const std::vector<data::CalendarEvent> &events,
                                             const std::vector<int> &columns)
{
    if (columns.size() != events.size()) {
        throw std::invalid_argument("column assignment does not match the event list");
    }

    std::vector<OverlapGroup> groups;
    std::vector<bool> visited(events.size(), false);
    for (std::size_t seed = 0; seed < events.size(); ++seed) {
        if (visited[seed]) {
            continue;
        }
        OverlapGroup group;
        std::deque<std::size_t> queue;
        visited[seed] = true;
        group.members.push_back(seed);
        queue.push_back(seed);

        while (!queue.empty()) {
            const std::size_t current = queue.front();
            queue.pop_front();
            for (std::size_t other = 0; other < events.size(); ++other) {
                if (visited[other] || !overlaps(events[current], events[other])) {
                    continue;
                }
                visited[other] = true;
                group.members.push_back(other);
                queue.push_back(other);
            }
        }

        int maxColumn = 0;
        for (const std::size_t member : group.members) {
            maxColumn = std::max(maxColumn, columns[member]);
        }
        group.columnCount = maxColumn + 1;
        groups.push_back(std::move(group));
    }
    return groups;
}

std::vector<HorizontalSpan> horizontalSpans(const std::vector<OverlapGroup> &groups,
                                            const std::vector<int> &columns)
{
    std::vector<HorizontalSpan> spans(columns.size());
    for (const auto &group : groups) {
        const double extent = 1.0 / static_cast<double>(group.columnCount);
        for (const std::size_t member : group.members) {
            if (member >= columns.size()) {
                throw std::invalid_argument("overlap group refers to an unknown event");
            }
            spans[member].extent = extent;
            spans[member].offset = columns[member] * extent;
        }
    }
    return spans;
}

} // namespace layout
} // namespace weekgrid
