#include "weekgrid/ui/widgets/WeekView.hpp"

#include <QFontMetricsF>
#include <QLocale>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QScrollBar>
#include <QTimer>
#include <QtMath>
#include <cmath>
#include <utility>

#include "weekgrid/core/Logging.hpp"
#include "weekgrid/data/EventStyle.hpp"

namespace weekgrid {
namespace ui {

namespace {
constexpr double EventCornerRadius = 6.0;
constexpr double EventGap = 2.0;
constexpr double TextPadding = 4.0;
constexpr int ClockIntervalMs = 60 * 1000;
const QColor GridLineColor(0xEE, 0xEE, 0xEE);
const QColor CurrentTimeColor(0xFF, 0x52, 0x52);
const QColor TodayColor(0x5E, 0x5C, 0xE6);

layout::WeekLayout makeWeekLayout(const core::GridSettings &settings)
{
    return layout::WeekLayout(layout::DayLayoutEngine(layout::TimeCoordinateMapper(settings.hourHeight)));
}
} // namespace

WeekView::WeekView(QWidget *parent)
    : QAbstractScrollArea(parent)
    , m_weekLayout(makeWeekLayout(m_settings))
    , m_clockTimer(new QTimer(this))
{
    setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    setVerticalScrollBarPolicy(Qt::ScrollBarAsNeeded);
    m_clockTimer->setInterval(ClockIntervalMs);
    connect(m_clockTimer, &QTimer::timeout, viewport(), qOverload<>(&QWidget::update));
    m_clockTimer->start();
    setWeek(layout::startOfWeek(QDate::currentDate(), m_settings.firstDayOfWeek), {});
}

WeekView::~WeekView() = default;

void WeekView::setGridSettings(const core::GridSettings &settings)
{
    m_settings = settings;
    m_weekLayout = makeWeekLayout(m_settings);
    updateScrollBars();
    viewport()->update();
}

void WeekView::setWeek(const QDate &weekStart, std::vector<layout::DayColumn> days)
{
    if (!weekStart.isValid()) {
        return;
    }
    m_weekStart = weekStart;
    m_days = std::move(days);
    updateScrollBars();
    viewport()->update();
}

void WeekView::scrollToTime(const QTime &time)
{
    const double offset = m_weekLayout.engine().mapper().toOffset(time);
    verticalScrollBar()->setValue(qRound(offset));
}

void WeekView::resizeEvent(QResizeEvent *event)
{
    QAbstractScrollArea::resizeEvent(event);
    updateScrollBars();
}

void WeekView::updateScrollBars()
{
    const double contentHeight = m_weekLayout.engine().mapper().dayHeight() + m_headerHeight;
    const int overflow = qMax(0, qCeil(contentHeight - viewport()->height()));
    verticalScrollBar()->setRange(0, overflow);
    verticalScrollBar()->setPageStep(viewport()->height());
    verticalScrollBar()->setSingleStep(qMax(1, qRound(m_settings.hourHeight / 4.0)));
}

double WeekView::dayAreaWidth() const
{
    return qMax(0.0, viewport()->width() - m_settings.timeAxisWidth);
}

double WeekView::dayWidth() const
{
    return dayAreaWidth() / layout::WeekLayout::DaysPerWeek;
}

double WeekView::bodyOriginY() const
{
    return m_headerHeight - verticalScrollBar()->value();
}

QRectF WeekView::placementRect(int dayIndex, const layout::Placement &placement) const
{
    const double columnLeft = m_settings.timeAxisWidth + dayIndex * dayWidth();
    const double x = columnLeft + dayWidth() * placement.horizontalOffset();
    const double width = qMax(0.0, dayWidth() * placement.horizontalExtent() - EventGap);
    const double y = bodyOriginY() + placement.verticalOffset();
    const double height = qMax(0.0, placement.verticalExtent());
    return QRectF(x, y, width, height);
}

const layout::Placement *WeekView::placementAt(const QPointF &pos) const
{
    if (pos.y() < m_headerHeight) {
        return nullptr;
    }
    for (int day = 0; day < static_cast<int>(m_days.size()); ++day) {
        const auto &placements = m_days[static_cast<std::size_t>(day)].placements;
        for (auto it = placements.rbegin(); it != placements.rend(); ++it) {
            if (placementRect(day, *it).contains(pos)) {
                return &*it;
            }
        }
    }
    return nullptr;
}

std::optional<QDateTime> WeekView::dateTimeAt(const QPointF &pos) const
{
    if (pos.y() < m_headerHeight || pos.x() < m_settings.timeAxisWidth || !m_weekStart.isValid()) {
        return std::nullopt;
    }
    const int dayIndex = layout::WeekLayout::dayIndexAt(pos.x() - m_settings.timeAxisWidth, dayAreaWidth());
    const QDate date = m_weekStart.addDays(dayIndex);
    return m_weekLayout.engine().mapper().toTime(pos.y() - bodyOriginY(), date);
}

void WeekView::mousePressEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton) {
        QAbstractScrollArea::mousePressEvent(event);
        return;
    }
    const QPointF pos = event->position();
    if (const auto *placement = placementAt(pos)) {
        qCDebug(lcUi) << "Activated event" << placement->event().id;
        emit eventActivated(placement->event());
        event->accept();
        return;
    }
    if (const auto dateTime = dateTimeAt(pos)) {
        emit emptySlotActivated(*dateTime);
        event->accept();
        return;
    }
    QAbstractScrollArea::mousePressEvent(event);
}

void WeekView::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    QPainter painter(viewport());
    painter.setRenderHint(QPainter::Antialiasing);
    painter.fillRect(viewport()->rect(), palette().base());

    const double originY = bodyOriginY();
    const double right = m_settings.timeAxisWidth + dayAreaWidth();

    painter.setPen(GridLineColor);
    for (int hour = 0; hour <= 24; ++hour) {
        const double y = originY + hour * m_settings.hourHeight;
        painter.drawLine(QPointF(m_settings.timeAxisWidth, y), QPointF(right, y));
    }
    for (int day = 0; day <= layout::WeekLayout::DaysPerWeek; ++day) {
        const double x = m_settings.timeAxisWidth + day * dayWidth();
        painter.drawLine(QPointF(x, originY), QPointF(x, originY + m_weekLayout.engine().mapper().dayHeight()));
    }

    for (int day = 0; day < static_cast<int>(m_days.size()); ++day) {
        for (const auto &placement : m_days[static_cast<std::size_t>(day)].placements) {
            const QRectF rect = placementRect(day, placement);
            if (rect.bottom() < m_headerHeight || rect.top() > viewport()->height()) {
                continue;
            }
            paintPlacement(painter, rect, placement);
        }
    }

    paintCurrentTime(painter);
    paintTimeAxis(painter);
    paintHeader(painter);
}

void WeekView::paintPlacement(QPainter &painter, const QRectF &rect, const layout::Placement &placement) const
{
    const auto &event = placement.event();
    const QColor fill = event.color.isValid() ? event.color : palette().highlight().color();

    QPainterPath path;
    path.addRoundedRect(rect, EventCornerRadius, EventCornerRadius);
    painter.fillPath(path, fill);
    if (data::isRiskyPlaceStatus(event.placeStatus)) {
        painter.setPen(QPen(CurrentTimeColor, 2.0));
        painter.drawPath(path);
    }

    painter.save();
    painter.setClipRect(rect);
    painter.setPen(Qt::white);
    QFont titleFont = painter.font();
    titleFont.setBold(true);
    painter.setFont(titleFont);
    const QRectF textRect = rect.adjusted(TextPadding, TextPadding / 2, -TextPadding, -TextPadding / 2);
    const QFontMetricsF titleMetrics(titleFont);
    painter.drawText(textRect, Qt::AlignLeft | Qt::AlignTop,
                     titleMetrics.elidedText(event.title, Qt::ElideRight, textRect.width()));
    if (!event.location.isEmpty() && textRect.height() > titleMetrics.height() * 2) {
        QFont detailFont = titleFont;
        detailFont.setBold(false);
        painter.setFont(detailFont);
        const QFontMetricsF detailMetrics(detailFont);
        const QRectF detailRect = textRect.adjusted(0, titleMetrics.height(), 0, 0);
        painter.drawText(detailRect, Qt::AlignLeft | Qt::AlignTop,
                         detailMetrics.elidedText(event.location, Qt::ElideRight, detailRect.width()));
    }
    painter.restore();
}

void WeekView::paintCurrentTime(QPainter &painter) const
{
    const auto marker = m_weekLayout.currentTimeMarker(m_weekStart, QDateTime::currentDateTime());
    if (!marker) {
        return;
    }
    const double y = bodyOriginY() + marker->offset;
    const double xStart = m_settings.timeAxisWidth + marker->dayIndex * dayWidth();
    painter.save();
    painter.setPen(QPen(CurrentTimeColor, 2.0));
    painter.setBrush(CurrentTimeColor);
    painter.drawEllipse(QPointF(xStart, y), 5.0, 5.0);
    painter.drawLine(QPointF(xStart, y), QPointF(xStart + dayWidth(), y));
    painter.restore();
}

void WeekView::paintTimeAxis(QPainter &painter) const
{
    const double originY = bodyOriginY();
    painter.fillRect(QRectF(0, m_headerHeight, m_settings.timeAxisWidth, viewport()->height()), palette().base());
    painter.setPen(palette().windowText().color());
    const QLocale locale;
    for (int hour = 1; hour < 24; ++hour) {
        const double y = originY + hour * m_settings.hourHeight;
        if (y < m_headerHeight || y > viewport()->height() + m_settings.hourHeight) {
            continue;
        }
        const QRectF labelRect(0, y - m_settings.hourHeight / 2.0, m_settings.timeAxisWidth - TextPadding,
                               m_settings.hourHeight);
        painter.drawText(labelRect, Qt::AlignRight | Qt::AlignVCenter,
                         locale.toString(QTime(hour, 0), QLocale::ShortFormat));
    }
}

void WeekView::paintHeader(QPainter &painter) const
{
    painter.fillRect(QRectF(0, 0, viewport()->width(), m_headerHeight), palette().alternateBase());
    painter.setPen(palette().dark().color());
    painter.drawLine(QPointF(0, m_headerHeight - 0.5), QPointF(viewport()->width(), m_headerHeight - 0.5));

    const QDate today = QDate::currentDate();
    const QLocale locale;
    const QFont baseFont = painter.font();
    for (int day = 0; day < layout::WeekLayout::DaysPerWeek; ++day) {
        const QDate date = m_weekStart.addDays(day);
        const QRectF headerRect(m_settings.timeAxisWidth + day * dayWidth(), 0, dayWidth(), m_headerHeight);
        const bool isToday = date == today;
        QFont font = baseFont;
        font.setBold(isToday);
        painter.setFont(font);
        painter.setPen(isToday ? TodayColor : palette().windowText().color());
        const QString label = QStringLiteral("%1\n%2")
                                  .arg(locale.dayName(date.dayOfWeek(), QLocale::ShortFormat).toUpper())
                                  .arg(date.day());
        painter.drawText(headerRect, Qt::AlignCenter, label);
    }
    painter.setFont(baseFont);
}

} // namespace ui
} // namespace weekgrid
