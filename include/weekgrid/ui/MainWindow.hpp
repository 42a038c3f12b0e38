#pragma once

#include <QMainWindow>
#include <memory>

#include "weekgrid/data/Event.hpp"

class QLabel;
class QToolBar;

namespace weekgrid {
namespace core {
class AppContext;
}

namespace ui {

class ScheduleViewModel;
class WeekView;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

private:
    void setupUi();
    QToolBar *createNavigationBar();
    void goToday();
    void navigateBackward();
    void navigateForward();
    void updateWeekLabel();
    void showEventDetails(const data::CalendarEvent &event);
    void createEventAt(const QDateTime &start);

    std::unique_ptr<core::AppContext> m_context;
    std::unique_ptr<ScheduleViewModel> m_scheduleViewModel;
    WeekView *m_weekView = nullptr;
    QLabel *m_weekLabel = nullptr;
};

} // namespace ui
} // namespace weekgrid
