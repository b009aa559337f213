#include "TestRunner.h"

#include "batch/BatchTests.h"
#include "core/DocumentTests.h"
#include "core/SnapshotTests.h"
#include "export/ExportTests.h"
#include "render/RenderSchedulerTests.h"
#include "store/HistoryTests.h"
#include "store/SpatialIndexTests.h"
#include "store/StrokeStoreTests.h"
#include "strokes/StrokeTests.h"

#include <QDebug>
#include <QVector>
#include <functional>

#ifdef Q_OS_WIN
#include <windows.h>
#include <cstdio>
#endif

namespace {

struct TestSuite {
    const char* name;
    std::function<bool()> run;
};

const QVector<TestSuite>& testSuites()
{
    static const QVector<TestSuite> suites = {
        {"strokes", &StrokeTests::runAllTests},
        {"spatial_index", &SpatialIndexTests::runAllTests},
        {"stroke_store", &StrokeStoreTests::runAllTests},
        {"history", &HistoryTests::runAllTests},
        {"render_scheduler", &RenderSchedulerTests::runAllTests},
        {"document", &DocumentTests::runAllTests},
        {"export", &ExportTests::runAllTests},
        {"snapshot", &SnapshotTests::runAllTests},
        {"batch", &BatchTests::runAllTests},
    };
    return suites;
}

} // namespace

QStringList testSuiteNames()
{
    QStringList names;
    for (const TestSuite& suite : testSuites()) {
        names << QString::fromLatin1(suite.name);
    }
    return names;
}

bool isKnownTestSuite(const QString& suite)
{
    return suite == QLatin1String("all") || testSuiteNames().contains(suite);
}

bool runTests(const QString& suite)
{
#ifdef Q_OS_WIN
    if (AttachConsole(ATTACH_PARENT_PROCESS) || AllocConsole()) {
        freopen("CONOUT$", "w", stdout);
        freopen("CONOUT$", "w", stderr);
    }
#endif

    bool success = true;
    int ran = 0;
    for (const TestSuite& testSuite : testSuites()) {
        if (suite == QLatin1String("all") || suite == QLatin1String(testSuite.name)) {
            success &= testSuite.run();
            ++ran;
        }
    }

    if (ran == 0) {
        qWarning() << "Unknown test suite:" << suite;
        return false;
    }
    return success;
}
