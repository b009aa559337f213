#include "CliHandler.h"
#include "CliProgress.h"
#include "CliSignal.h"
#include "../batch/DocumentDiscovery.h"
#include "../TestRunner.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QDir>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.optionNames().contains(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Simple;
}

int exitCodeFromResult(const BatchOps::BatchResult& result)
{
    if (result.totalCount() == 0) {
        return ExitCode::InvalidArgs;
    }
    if (result.errorCount == 0) {
        return ExitCode::Success;
    }
    if (result.successCount == 0 && result.skippedCount == 0) {
        return ExitCode::TotalFailure;
    }
    return ExitCode::PartialFailure;
}

/**
 * @brief Read a positive number option.
 * @return false if the option is set but not a positive number.
 */
static bool readPositive(const QCommandLineParser& parser, const QString& name, qreal& value)
{
    if (!parser.isSet(name)) {
        return true;
    }
    bool ok = false;
    const qreal parsed = parser.value(name).toDouble(&ok);
    if (!ok || parsed <= 0.0) {
        return false;
    }
    value = parsed;
    return true;
}

/// Format names are case insensitive and "jpg" means JPEG.
static QString normalizedFormat(const QString& format)
{
    const QString lower = format.toLower();
    return lower == QLatin1String("jpg") ? QStringLiteral("jpeg") : lower;
}

// =============================================================================
// Export Handler
// =============================================================================

int handleExport(const QCommandLineParser& parser)
{
    const OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);

    const QStringList inputPaths = parser.positionalArguments();
    if (inputPaths.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "No input files specified. Use 'inkcore export --help' for usage."));
        return ExitCode::InvalidArgs;
    }

    QString outputPath = parser.value(QStringLiteral("output"));
    if (outputPath.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Output path required. Use -o or --output to specify destination."));
        return ExitCode::InvalidArgs;
    }
    const bool trailingSeparator = outputPath.endsWith('/') || outputPath.endsWith('\\');
    outputPath = QDir::cleanPath(QDir::current().absoluteFilePath(outputPath));
    if (trailingSeparator) {
        outputPath += '/';
    }

    BatchOps::ExportOptions options;
    options.outputPath = outputPath;

    const bool pages = parser.isSet(QStringLiteral("pages"));
    const bool selection = parser.isSet(QStringLiteral("selection"));
    if (pages && selection) {
        progress.reportError(QCoreApplication::translate("CLI",
            "--pages and --selection cannot be combined."));
        return ExitCode::InvalidArgs;
    }
    if (pages) {
        options.target = BatchOps::ExportTarget::Pages;
    } else if (selection) {
        options.target = BatchOps::ExportTarget::Selection;
    }

    // A single output file names its format by its extension
    const QString suffix = QFileInfo(outputPath).suffix().toLower();
    const bool outputLooksLikeFile = !trailingSeparator && !suffix.isEmpty()
                                     && !QFileInfo(outputPath).isDir();

    options.format = normalizedFormat(parser.value(QStringLiteral("format")));
    if (outputLooksLikeFile) {
        if (options.format.isEmpty()) {
            options.format = normalizedFormat(suffix);
        } else if (options.format != normalizedFormat(suffix)) {
            progress.reportError(QCoreApplication::translate("CLI",
                "Output file extension '.%1' does not match the format '%2'.")
                .arg(suffix, options.format));
            return ExitCode::InvalidArgs;
        }
    }

    // Bitmaps are always written per page when exporting the document
    if (options.target == BatchOps::ExportTarget::Document
        && (options.format == "png" || options.format == "jpeg")) {
        options.target = BatchOps::ExportTarget::Pages;
    }
    const QString formatError = BatchOps::validateFormat(options.target, options.format);
    if (!formatError.isEmpty()) {
        progress.reportError(formatError);
        return ExitCode::InvalidArgs;
    }

    options.noBackground = parser.isSet(QStringLiteral("no-background"));
    options.noPattern = parser.isSet(QStringLiteral("no-pattern"));
    options.optimizePrinting = parser.isSet(QStringLiteral("optimize-printing"));
    options.columnMajor = parser.isSet(QStringLiteral("column-major"));
    options.overwrite = parser.isSet(QStringLiteral("overwrite"));
    options.dryRun = parser.isSet(QStringLiteral("dry-run"));

    if (!readPositive(parser, QStringLiteral("scale"), options.bitmapScale)) {
        progress.reportError(QCoreApplication::translate("CLI", "--scale expects a positive number."));
        return ExitCode::InvalidArgs;
    }
    if (parser.isSet(QStringLiteral("quality"))) {
        bool ok = false;
        const int quality = parser.value(QStringLiteral("quality")).toInt(&ok);
        if (!ok || quality < 1 || quality > 100) {
            progress.reportError(QCoreApplication::translate("CLI",
                "--quality expects a number from 1 to 100."));
            return ExitCode::InvalidArgs;
        }
        options.jpegQuality = quality;
    }
    if (parser.isSet(QStringLiteral("margin"))) {
        bool ok = false;
        const qreal margin = parser.value(QStringLiteral("margin")).toDouble(&ok);
        if (!ok || margin < 0.0) {
            progress.reportError(QCoreApplication::translate("CLI",
                "--margin expects a non-negative number."));
            return ExitCode::InvalidArgs;
        }
        options.selectionMargin = margin;
    }

    const QStringList documents =
        BatchOps::expandInputPaths(inputPaths, parser.isSet(QStringLiteral("recursive")));
    if (documents.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "No .inkc documents found in the specified paths."));
        return ExitCode::InvalidArgs;
    }

    if (outputLooksLikeFile && options.target == BatchOps::ExportTarget::Pages) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Per-page exports write one file per page. Use a directory as output, e.g.: -o ~/Images/"));
        return ExitCode::InvalidArgs;
    }
    if (outputLooksLikeFile && documents.size() > 1) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Cannot export %1 documents to a single file.\n"
            "Use a directory as output destination, e.g.: -o ~/Export/")
            .arg(documents.size()));
        return ExitCode::InvalidArgs;
    }

    const QString outputDir = outputLooksLikeFile ? QFileInfo(outputPath).absolutePath() : outputPath;
    if (!options.dryRun && !QDir().mkpath(outputDir)) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Cannot create output directory: %1").arg(outputDir));
        return ExitCode::IoError;
    }

    const bool failFast = parser.isSet(QStringLiteral("fail-fast"));
    bool stoppedEarly = false;

    auto resultCb = [&](int current, int total, const BatchOps::FileResult& fileResult) {
        progress.reportFile(current, total, fileResult);
        if (wasCancelled()) {
            reportCancellation();
        }
        if (failFast && fileResult.status == BatchOps::FileStatus::Error) {
            if (current < total) {
                stoppedEarly = true;
            }
            return false;
        }
        return true;
    };

    const BatchOps::BatchResult result = BatchOps::exportBatch(
        documents, options, progress.callback(), getCancellationFlag(), resultCb);

    if (stoppedEarly) {
        progress.reportWarning(QCoreApplication::translate("CLI",
            "Stopping due to --fail-fast flag."));
    }
    progress.reportSummary(result, options.dryRun);

    if (wasCancelled()) {
        return ExitCode::Cancelled;
    }
    return exitCodeFromResult(result);
}

// =============================================================================
// Info Handler
// =============================================================================

int handleInfo(const QCommandLineParser& parser)
{
    const OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);

    const QStringList inputPaths = parser.positionalArguments();
    if (inputPaths.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "No input files specified. Use 'inkcore info --help' for usage."));
        return ExitCode::InvalidArgs;
    }

    const QStringList documents =
        BatchOps::expandInputPaths(inputPaths, parser.isSet(QStringLiteral("recursive")));
    if (documents.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "No .inkc documents found in the specified paths."));
        return ExitCode::InvalidArgs;
    }

    int failures = 0;
    for (const QString& path : documents) {
        if (wasCancelled()) {
            reportCancellation();
            return ExitCode::Cancelled;
        }

        BatchOps::DocumentInfo info;
        QString error;
        if (BatchOps::inspectDocument(path, info, &error)) {
            progress.reportInfo(info);
        } else {
            progress.reportError(QStringLiteral("%1: %2").arg(QFileInfo(path).fileName(), error));
            ++failures;
        }
    }

    if (failures == 0) {
        return ExitCode::Success;
    }
    return failures == documents.size() ? ExitCode::TotalFailure : ExitCode::PartialFailure;
}

// =============================================================================
// Test Handler
// =============================================================================

int handleTest(const QCommandLineParser& parser)
{
    const QStringList args = parser.positionalArguments();
    const QString suite = args.isEmpty() ? QStringLiteral("all") : args.first();
    if (!isKnownTestSuite(suite)) {
        ConsoleProgress progress(OutputMode::Simple);
        progress.reportError(QCoreApplication::translate("CLI", "Unknown test suite '%1'. Available: %2")
            .arg(suite, testSuiteNames().join(QStringLiteral(", "))));
        return ExitCode::InvalidArgs;
    }
    return runTests(suite) ? ExitCode::Success : ExitCode::TotalFailure;
}

} // namespace Cli
