#include "weekgrid/layout/OverlapDetector.hpp"

namespace weekgrid {
namespace layout {

bool overlaps(const data::CalendarEvent &a, const data::CalendarEvent &b)
{
    return a.start < b.end && b.start < a.end;
}

} // namespace layout
} // namespace weekgrid
