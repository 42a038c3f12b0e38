#pragma once

#include <cstddef>
#include <vector>

#include "weekgrid/data/Event.hpp"

namespace weekgrid {
namespace layout {

// Maximal set of events connected through pairwise overlaps.
// Members are input indices in discovery order.
struct OverlapGroup
{
    std::vector<std::size_t> members;
    int columnCount = 1;
};

struct HorizontalSpan
{
    double offset = 0.0;
    double extent = 1.0;
};

// Connected components of the overlap graph, found breadth-first from each
// not yet visited event in input order. columns must be index-aligned with events.
std::vector<OverlapGroup> mergeOverlapGroups(const std::vector<data::CalendarEvent> &events,
                                             const std::vector<int> &columns);

// Index-aligned horizontal geometry: every group splits the day column into
// columnCount equal lanes.
std::vector<HorizontalSpan> horizontalSpans(const std::vector<OverlapGroup> &groups,
                                            const std::vector<int> &columns);

} // namespace layout
} // namespace weekgrid
