#pragma once

#include <cstddef>
#include <utility>

#include "weekgrid/data/Event.hpp"

namespace weekgrid {
namespace layout {

// Geometry of one event inside one day column. Vertical values are in the
// mapper's time units, horizontal values are fractions of the column width.
class Placement
{
public:
    Placement(data::CalendarEvent event,
              std::size_t sourceIndex,
              int column,
              int columnCount,
              double verticalOffset,
              double verticalExtent,
              double horizontalOffset,
              double horizontalExtent)
        : m_event(std::move(event))
        , m_sourceIndex(sourceIndex)
        , m_column(column)
        , m_columnCount(columnCount)
        , m_verticalOffset(verticalOffset)
        , m_verticalExtent(verticalExtent)
        , m_horizontalOffset(horizontalOffset)
        , m_horizontalExtent(horizontalExtent)
    {
    }

    const data::CalendarEvent &event() const { return m_event; }
    std::size_t sourceIndex() const { return m_sourceIndex; }
    int column() const { return m_column; }
    int columnCount() const { return m_columnCount; }
    double verticalOffset() const { return m_verticalOffset; }
    double verticalExtent() const { return m_verticalExtent; }
    double horizontalOffset() const { return m_horizontalOffset; }
    double horizontalExtent() const { return m_horizontalExtent; }
    double horizontalEnd() const { return m_horizontalOffset + m_horizontalExtent; }

    bool operator==(const Placement &other) const
    {
        return m_event.id == other.m_event.id && m_sourceIndex == other.m_sourceIndex
            && m_column == other.m_column && m_columnCount == other.m_columnCount
            && m_verticalOffset == other.m_verticalOffset && m_verticalExtent == other.m_verticalExtent
            && m_horizontalOffset == other.m_horizontalOffset
            && m_horizontalExtent == other.m_horizontalExtent;
    }
    bool operator!=(const Placement &other) const { return !(*this == other); }

private:
    data::CalendarEvent m_event;
    std::size_t m_sourceIndex = 0;
    int m_column = 0;
    int m_columnCount = 1;
    double m_verticalOffset = 0.0;
    double m_verticalExtent = 0.0;
    double m_horizontalOffset = 0.0;
    double m_horizontalExtent = 1.0;
};

} // namespace layout
} // namespace weekgrid
