#include "weekgrid/ui/MainWindow.hpp"

#include <QAction>
#include <QDate>
#include <QDateTime>
#include <QKeySequence>
#include <QLabel>
#include <QLocale>
#include <QMessageBox>
#include <QSizePolicy>
#include <QStatusBar>
#include <QStringList>
#include <QTime>
#include <QToolBar>

#include "weekgrid/core/AppContext.hpp"
#include "weekgrid/core/GridSettings.hpp"
#include "weekgrid/core/Logging.hpp"
#include "weekgrid/data/DataProvider.hpp"
#include "weekgrid/data/EventRepository.hpp"
#include "weekgrid/data/EventStyle.hpp"
#include "weekgrid/layout/WeekLayout.hpp"
#include "weekgrid/ui/dialogs/EventEditorDialog.hpp"
#include "weekgrid/ui/viewmodels/ScheduleViewModel.hpp"
#include "weekgrid/ui/widgets/WeekView.hpp"

namespace weekgrid {
namespace ui {

namespace {
layout::WeekLayout weekLayoutFor(const core::GridSettings &settings)
{
    return layout::WeekLayout(layout::DayLayoutEngine(layout::TimeCoordinateMapper(settings.hourHeight)));
}
} // namespace

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_context(std::make_unique<core::AppContext>())
{
    const auto &settings = m_context->gridSettings();
    m_scheduleViewModel = std::make_unique<ScheduleViewModel>(m_context->eventRepository(), weekLayoutFor(settings));
    m_scheduleViewModel->setFirstDayOfWeek(settings.firstDayOfWeek);
    m_scheduleViewModel->setWeek(QDate::currentDate());
    m_context->dataProvider().seedDemoData(m_scheduleViewModel->weekStart());
    setupUi();
    m_scheduleViewModel->refresh();
    m_weekView->scrollToTime(QTime(8, 0));
}

MainWindow::~MainWindow()
{
    m_context->saveSettings();
}

void MainWindow::setupUi()
{
    setWindowTitle(tr("WeekGrid"));
    resize(1200, 800);

    addToolBar(Qt::TopToolBarArea, createNavigationBar());

    m_weekView = new WeekView(this);
    m_weekView->setGridSettings(m_context->gridSettings());
    setCentralWidget(m_weekView);

    connect(m_scheduleViewModel.get(),
            &ScheduleViewModel::layoutChanged,
            this,
            [this](const QDate &weekStart, const std::vector<layout::DayColumn> &days) {
                m_weekView->setWeek(weekStart, days);
                updateWeekLabel();
            });
    connect(m_weekView, &WeekView::eventActivated, this, &MainWindow::showEventDetails);
    connect(m_weekView, &WeekView::emptySlotActivated, this, &MainWindow::createEventAt);

    statusBar()->showMessage(tr("Ready"));
}

QToolBar *MainWindow::createNavigationBar()
{
    auto *toolbar = new QToolBar(tr("Navigation"), this);
    toolbar->setMovable(false);

    auto *todayAction = toolbar->addAction(tr("Today"));
    todayAction->setShortcut(QKeySequence(Qt::Key_T));
    connect(todayAction, &QAction::triggered, this, &MainWindow::goToday);

    auto *backAction = toolbar->addAction(tr("Previous"));
    backAction->setShortcut(QKeySequence(Qt::Key_Left));
    connect(backAction, &QAction::triggered, this, &MainWindow::navigateBackward);

    auto *forwardAction = toolbar->addAction(tr("Next"));
    forwardAction->setShortcut(QKeySequence(Qt::Key_Right));
    connect(forwardAction, &QAction::triggered, this, &MainWindow::navigateForward);

    toolbar->addSeparator();

    m_weekLabel = new QLabel(toolbar);
    toolbar->addWidget(m_weekLabel);
    return toolbar;
}

void MainWindow::goToday()
{
    m_scheduleViewModel->setWeek(QDate::currentDate());
    m_scheduleViewModel->refresh();
}

void MainWindow::navigateBackward()
{
    m_scheduleViewModel->shiftWeek(-1);
    m_scheduleViewModel->refresh();
}

void MainWindow::navigateForward()
{
    m_scheduleViewModel->shiftWeek(1);
    m_scheduleViewModel->refresh();
}

void MainWindow::updateWeekLabel()
{
    if (!m_weekLabel) {
        return;
    }
    const QDate start = m_scheduleViewModel->weekStart();
    m_weekLabel->setText(QLocale().toString(start, QStringLiteral("MMMM yyyy")));
    statusBar()->showMessage(tr("%n event(s) this week", nullptr, static_cast<int>(m_scheduleViewModel->events().size())));
}

void MainWindow::showEventDetails(const data::CalendarEvent &event)
{
    const QLocale locale;
    QStringList lines;
    lines << tr("%1 - %2").arg(locale.toString(event.start, QLocale::ShortFormat),
                               locale.toString(event.end.time(), QLocale::ShortFormat));
    if (!event.location.isEmpty()) {
        lines << tr("Location: %1").arg(event.location);
    }
    if (!event.placeStatus.isEmpty()) {
        const QString status = data::isRiskyPlaceStatus(event.placeStatus)
            ? tr("Warning: %1").arg(event.placeStatus)
            : event.placeStatus;
        lines << status;
    }
    if (!event.advice.isEmpty()) {
        lines << QString() << event.advice;
    }
    QMessageBox::information(this, event.title, lines.join(QLatin1Char('\n')));
}

void MainWindow::createEventAt(const QDateTime &start)
{
    EventEditorDialog dialog(start, this);
    if (dialog.exec() != QDialog::Accepted || !dialog.canSave()) {
        return;
    }
    const auto stored = m_context->eventRepository().addEvent(dialog.event());
    qCDebug(lcUi) << "Created event" << stored.id << "at" << stored.start;
    m_scheduleViewModel->refresh();
}

} // namespace ui
} // namespace weekgrid
