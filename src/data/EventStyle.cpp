#include "weekgrid/data/EventStyle.hpp"

#include <QStringList>
#include <array>

namespace weekgrid {
namespace data {

namespace {
const std::array<QRgb, EventPaletteSize> Palette = {
    0xFF7986CB, 0xFF4DB6AC, 0xFFE57373, 0xFF9575CD,
    0xFFF06292, 0xFFFF8A65, 0xFFAED581, 0xFF4DD0E1,
};
} // namespace

QColor paletteColor(std::size_t index)
{
    return QColor::fromRgba(Palette[index % Palette.size()]);
}

bool isRiskyPlaceStatus(const QString &status)
{
    if (status.isEmpty()) {
        return false;
    }
    static const QStringList keywords = {
        QStringLiteral("break"),
        QStringLiteral("closed"),
        QString::fromUtf8("\xEB\xB8\x8C\xEB\xA0\x88\xEC\x9D\xB4\xED\x81\xAC"), // "브레이크"
        QString::fromUtf8("\xEC\xA2\x85\xEB\xA3\x8C"),                         // "종료"
    };
    for (const auto &keyword : keywords) {
        if (status.contains(keyword, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

} // namespace data
} // namespace weekgrid
