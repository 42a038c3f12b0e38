#pragma once

#include <QColor>
#include <QDateTime>
#include <QString>
#include <QUuid>

namespace weekgrid {
namespace data {

struct CalendarEvent
{
    QUuid id = QUuid::createUuid();
    QString title;
    QDateTime start;
    QDateTime end;
    QString location;
    QString placeStatus; // e.g. opening hours reported for the location
    QString advice;
    QColor color;
};

} // namespace data
} // namespace weekgrid
