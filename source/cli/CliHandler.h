#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers of the inkcore tool.
 *
 * Each handler reads its options, expands the input paths, runs the
 * operation and reports the results.
 */

#include "CliParser.h"
#include "../batch/BatchOperations.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief Handle the export command.
 *
 * Validates the format against --pages/--selection, rejects a single output
 * file for several documents, then runs BatchOps::exportBatch().
 *
 * @return Exit code (see ExitCode namespace)
 */
int handleExport(const QCommandLineParser& parser);

/**
 * @brief Handle the info command.
 * @return Exit code (see ExitCode namespace)
 */
int handleInfo(const QCommandLineParser& parser);

/**
 * @brief Handle the test command.
 * @return Success if every test of the suite passed, TotalFailure otherwise
 */
int handleTest(const QCommandLineParser& parser);

/**
 * @brief Output mode from --json and --verbose. --json wins.
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

/**
 * @brief Map a batch result to an exit code.
 *
 * - No errors → Success (0)
 * - Some errors → PartialFailure (1)
 * - Only errors → TotalFailure (2)
 */
int exitCodeFromResult(const BatchOps::BatchResult& result);

} // namespace Cli

#endif // CLIHANDLER_H
