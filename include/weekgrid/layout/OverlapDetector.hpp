#pragma once

#include "weekgrid/data/Event.hpp"

namespace weekgrid {
namespace layout {

// Half-open interval intersection: [a.start, a.end) and [b.start, b.end) share an instant.
// Events that merely touch (one ends when the other starts) do not overlap.
bool overlaps(const data::CalendarEvent &a, const data::CalendarEvent &b);

} // namespace layout
} // namespace weekgrid
