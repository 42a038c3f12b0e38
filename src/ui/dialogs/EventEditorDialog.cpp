#include "weekgrid/ui/dialogs/EventEditorDialog.hpp"

#include <QDateTime>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QTimeEdit>
#include <QVBoxLayout>

#include "weekgrid/data/EventStyle.hpp"

namespace weekgrid {
namespace ui {

namespace {
constexpr int DefaultDurationSecs = 60 * 60;

QTime defaultEndFor(const QTime &start)
{
    const QTime end = start.addSecs(DefaultDurationSecs);
    // An hour past a late start would wrap into the next day.
    return end > start ? end : QTime(23, 59);
}
} // namespace

EventEditorDialog::EventEditorDialog(const QDateTime &start, QWidget *parent)
    : QDialog(parent)
    , m_date(start.date())
{
    setWindowTitle(tr("New event"));
    auto *layout = new QVBoxLayout(this);
    auto *formLayout = new QFormLayout();

    m_titleEdit = new QLineEdit(this);
    m_titleEdit->setObjectName(QStringLiteral("titleEdit"));
    formLayout->addRow(tr("Title"), m_titleEdit);

    m_locationEdit = new QLineEdit(this);
    m_locationEdit->setObjectName(QStringLiteral("locationEdit"));
    formLayout->addRow(tr("Location"), m_locationEdit);

    m_startEdit = new QTimeEdit(start.time(), this);
    m_startEdit->setObjectName(QStringLiteral("startEdit"));
    m_startEdit->setDisplayFormat(QStringLiteral("hh:mm"));
    formLayout->addRow(tr("Start"), m_startEdit);

    m_endEdit = new QTimeEdit(defaultEndFor(start.time()), this);
    m_endEdit->setObjectName(QStringLiteral("endEdit"));
    m_endEdit->setDisplayFormat(QStringLiteral("hh:mm"));
    formLayout->addRow(tr("End"), m_endEdit);

    m_placeStatusEdit = new QLineEdit(this);
    m_placeStatusEdit->setObjectName(QStringLiteral("placeStatusEdit"));
    m_placeStatusEdit->setPlaceholderText(tr("e.g. Break time 15:00-17:00"));
    formLayout->addRow(tr("Place status"), m_placeStatusEdit);

    layout->addLayout(formLayout);

    m_statusWarning = new QLabel(this);
    m_statusWarning->setObjectName(QStringLiteral("statusWarning"));
    m_statusWarning->setStyleSheet(QStringLiteral("color: #C62828;"));
    m_statusWarning->setWordWrap(true);
    m_statusWarning->hide();
    layout->addWidget(m_statusWarning);

    m_buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(m_buttonBox, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(m_buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    layout->addWidget(m_buttonBox);

    connect(m_titleEdit, &QLineEdit::textChanged, this, &EventEditorDialog::updateState);
    connect(m_placeStatusEdit, &QLineEdit::textChanged, this, &EventEditorDialog::updateState);
    connect(m_startEdit, &QTimeEdit::timeChanged, this, &EventEditorDialog::updateState);
    connect(m_endEdit, &QTimeEdit::timeChanged, this, &EventEditorDialog::updateState);
    updateState();
}

bool EventEditorDialog::canSave() const
{
    return !m_titleEdit->text().trimmed().isEmpty() && m_endEdit->time() > m_startEdit->time();
}

data::CalendarEvent EventEditorDialog::event() const
{
    data::CalendarEvent created;
    created.title = m_titleEdit->text().trimmed();
    created.location = m_locationEdit->text().trimmed();
    created.placeStatus = m_placeStatusEdit->text().trimmed();
    created.start = QDateTime(m_date, m_startEdit->time());
    created.end = QDateTime(m_date, m_endEdit->time());
    return created;
}

void EventEditorDialog::updateState()
{
    m_buttonBox->button(QDialogButtonBox::Ok)->setEnabled(canSave());

    const QString status = m_placeStatusEdit->text().trimmed();
    if (data::isRiskyPlaceStatus(status)) {
        m_statusWarning->setText(tr("Warning: the place reports '%1' at this time.").arg(status));
        m_statusWarning->show();
    } else {
        m_statusWarning->hide();
    }
}

} // namespace ui
} // namespace weekgrid
