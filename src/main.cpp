#include <QApplication>
#include <QTimer>

#include "MainWindow.h"
#include "settings/Settings.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName(QString::fromLatin1(TextReader::kApplicationName));
    app.setOrganizationName(QString::fromLatin1(TextReader::kOrganizationName));
    app.setApplicationVersion(QStringLiteral(TEXTREADER_VERSION));

    MainWindow window;
    window.show();

    // Probe after the window is up so a slow engine start does not delay it
    QTimer::singleShot(0, &window, &MainWindow::initialize);

    return app.exec();
}
