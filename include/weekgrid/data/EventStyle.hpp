#pragma once

#include <QColor>
#include <QString>
#include <cstddef>

namespace weekgrid {
namespace data {

// Number of colours in the event palette.
constexpr std::size_t EventPaletteSize = 8;

// Palette colour for the n-th stored event, wrapping around.
QColor paletteColor(std::size_t index);

// True when a place status reports a break or a closure at the event's location.
bool isRiskyPlaceStatus(const QString &status);

} // namespace data
} // namespace weekgrid
