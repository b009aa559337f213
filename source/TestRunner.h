#pragma once

// ============================================================================
// TestRunner - Dispatch of the built-in unit test suites
// ============================================================================
// Used by `inkcore test [suite]` and by the inkcore_tests executable that
// CTest runs once per suite. The suites render text and images, so a
// QGuiApplication must exist.
// ============================================================================

#include <QString>
#include <QStringList>

/// Suite names in run order, "all" excluded.
QStringList testSuiteNames();

/// True for a name of testSuiteNames() and for "all".
bool isKnownTestSuite(const QString& suite);

/**
 * @brief Run one suite, or every suite for "all".
 * @return True if every test passed.
 */
bool runTests(const QString& suite);
