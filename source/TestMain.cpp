// ============================================================================
// inkcore_tests - Runs one test suite per invocation for CTest
// ============================================================================

#include <QDebug>
#include <QGuiApplication>

#include "TestRunner.h"

int main(int argc, char* argv[])
{
    // Rendering needs a platform plugin but no display
    if (!qEnvironmentVariableIsSet("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QGuiApplication app(argc, argv);
    app.setOrganizationName("InkCore");
    app.setApplicationName("inkcore_tests");

    const QString suite = argc > 1 ? QString::fromLocal8Bit(argv[1]) : QStringLiteral("all");
    if (!isKnownTestSuite(suite)) {
        qWarning() << "Unknown test suite" << suite << "- available:" << testSuiteNames();
        return 2;
    }
    return runTests(suite) ? 0 : 1;
}
