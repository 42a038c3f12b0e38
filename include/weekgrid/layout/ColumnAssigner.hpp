#pragma once

#include <vector>

#include "weekgrid/data/Event.hpp"

namespace weekgrid {
namespace layout {

// Greedy lane assignment in input order: every event takes the lowest column
// not held by an earlier event it overlaps. Result is index-aligned with events.
std::vector<int> assignColumns(const std::vector<data::CalendarEvent> &events);

} // namespace layout
} // namespace weekgrid
