#include <QApplication>
#include <QCoreApplication>
#include <QString>

#include "version.h"

#include "weekgrid/ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("WeekGrid"));
    QCoreApplication::setApplicationName(QStringLiteral("WeekGrid"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kWeekGridVersion));

    QApplication app(argc, argv);

    weekgrid::ui::MainWindow mainWindow;
    mainWindow.setWindowTitle(QObject::tr("WeekGrid %1").arg(QString::fromLatin1(kWeekGridVersion)));
    mainWindow.show();

    return app.exec();
}
