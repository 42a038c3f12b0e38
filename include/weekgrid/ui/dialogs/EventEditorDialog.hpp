#pragma once

#include <QDate>
#include <QDialog>

#include "weekgrid/data/Event.hpp"

class QDialogButtonBox;
class QLabel;
class QLineEdit;
class QTimeEdit;

namespace weekgrid {
namespace ui {

// Collects a new event for the day of the slot that was clicked.
class EventEditorDialog : public QDialog
{
    Q_OBJECT

public:
    explicit EventEditorDialog(const QDateTime &start, QWidget *parent = nullptr);

    // Title is non-blank and the end lies after the start.
    bool canSave() const;
    data::CalendarEvent event() const;

private:
    void updateState();

    QDate m_date;
    QLineEdit *m_titleEdit = nullptr;
    QLineEdit *m_locationEdit = nullptr;
    QTimeEdit *m_startEdit = nullptr;
    QTimeEdit *m_endEdit = nullptr;
    QLineEdit *m_placeStatusEdit = nullptr;
    QLabel *m_statusWarning = nullptr;
    QDialogButtonBox *m_buttonBox = nullptr;
};

} // namespace ui
} // namespace weekgrid
