// ============================================================================
// inkcore - Main Entry Point
// ============================================================================

#include <QGuiApplication>
#include <QTranslator>
#include <QLocale>
#include <QStandardPaths>

#include "cli/CliParser.h"

// Platform-specific includes
#ifdef Q_OS_WIN
#include <windows.h>
#include <cstdio>
#endif

// ============================================================================
// Platform Helpers
// ============================================================================

#ifdef Q_OS_WIN
// Console output when started from a terminal
static void attachParentConsole()
{
    if (AttachConsole(ATTACH_PARENT_PROCESS)) {
        freopen("CONOUT$", "w", stdout);
        freopen("CONOUT$", "w", stderr);
    }
}
#endif

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QGuiApplication& app, QTranslator& translator)
{
    const QString langCode = QLocale::system().name().section('_', 0, 0);

    const QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/inkcore/translations",
        "/usr/local/share/inkcore/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "inkcore/translations", QStandardPaths::LocateDirectory),
    };

    for (const QString& path : translationPaths) {
        if (!path.isEmpty() && translator.load(path + "/inkcore_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
#ifdef Q_OS_WIN
    attachParentConsole();
#endif

    // Exports paint text and images but never open a window
    if (!qEnvironmentVariableIsSet("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QGuiApplication app(argc, argv);
    app.setOrganizationName("InkCore");
    app.setApplicationName("inkcore");
    app.setApplicationVersion("0.4.0");

    QTranslator translator;
    loadTranslations(app, translator);

    return Cli::run(app, argc, argv);
}
