// Application entry point: initialize Qt and show MainWindow.
#include <QApplication>
#include "MainWindow.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName("MediaGrab");
    QCoreApplication::setOrganizationName("MediaGrab");

    MainWindow w;
    w.show();
    return app.exec();
}
