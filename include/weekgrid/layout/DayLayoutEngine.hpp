#pragma once

#include <vector>

#include "weekgrid/data/Event.hpp"
#include "weekgrid/layout/Placement.hpp"
#include "weekgrid/layout/TimeCoordinateMapper.hpp"

namespace weekgrid {
namespace layout {

class DayLayoutEngine
{
public:
    explicit DayLayoutEngine(TimeCoordinateMapper mapper = TimeCoordinateMapper());

    const TimeCoordinateMapper &mapper() const { return m_mapper; }

    // One placement per event, in input order. Events are laid out in the
    // order given; callers wanting chronological lanes sort beforehand.
    std::vector<Placement> layout(const std::vector<data::CalendarEvent> &events) const;

private:
    double verticalEnd(const data::CalendarEvent &event) const;

    TimeCoordinateMapper m_mapper;
};

} // namespace layout
} // namespace weekgrid
