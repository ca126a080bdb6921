// DropShelf entry point.
#include "IngestSettings.hpp"
#include "ShelfController.hpp"
#include "ShelfWindow.hpp"
#include "dropshelf/RuntimeLogging.hpp"
#include <QApplication>
#include <QLoggingCategory>
Q_DECLARE_LOGGING_CATEGORY(dsShelf)

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("DropShelf"));
    QCoreApplication::setApplicationName(QStringLiteral("DropShelf"));
    QCoreApplication::setApplicationVersion(QStringLiteral(DROPSHELF_VERSION));

    if (dropshelf::sensitiveLoggingEnabled())
        qCWarning(dsShelf) << "sensitive logging enabled: full paths are logged";

    ShelfController controller(IngestSettings::load());
    // Workers are joined and staging is cleaned before the window goes away.
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &controller,
                     [&controller] { controller.shutdown(); });

    ShelfWindow window(&controller);
    window.show();
    return app.exec();
}
