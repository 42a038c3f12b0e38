#pragma once

#include <QAbstractScrollArea>
#include <QDate>
#include <QDateTime>
#include <QRectF>
#include <optional>
#include <vector>

#include "weekgrid/core/GridSettings.hpp"
#include "weekgrid/data/Event.hpp"
#include "weekgrid/layout/WeekLayout.hpp"

class QTimer;

namespace weekgrid {
namespace ui {

// Paints a seven day time grid from precomputed placements. Placement
// offsets must use the same hour height as the grid settings given here.
class WeekView : public QAbstractScrollArea
{
    Q_OBJECT

public:
    explicit WeekView(QWidget *parent = nullptr);
    ~WeekView() override;

    void setGridSettings(const core::GridSettings &settings);
    void setWeek(const QDate &weekStart, std::vector<layout::DayColumn> days);
    void scrollToTime(const QTime &time);

    QDate weekStart() const { return m_weekStart; }
    const std::vector<layout::DayColumn> &days() const { return m_days; }

signals:
    void eventActivated(const data::CalendarEvent &event);
    void emptySlotActivated(const QDateTime &start);

protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;

private:
    void updateScrollBars();
    double dayAreaWidth() const;
    double dayWidth() const;
    double bodyOriginY() const;
    QRectF placementRect(int dayIndex, const layout::Placement &placement) const;
    const layout::Placement *placementAt(const QPointF &pos) const;
    std::optional<QDateTime> dateTimeAt(const QPointF &pos) const;
    void paintHeader(QPainter &painter) const;
    void paintTimeAxis(QPainter &painter) const;
    void paintPlacement(QPainter &painter, const QRectF &rect, const layout::Placement &placement) const;
    void paintCurrentTime(QPainter &painter) const;

    core::GridSettings m_settings;
    layout::WeekLayout m_weekLayout;
    QDate m_weekStart;
    std::vector<layout::DayColumn> m_days;
    QTimer *m_clockTimer = nullptr;
    double m_headerHeight = 40.0;
};

} // namespace ui
} // namespace weekgrid
