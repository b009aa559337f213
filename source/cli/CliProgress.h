#ifndef CLIPROGRESS_H
#define CLIPROGRESS_H

/**
 * @file CliProgress.h
 * @brief Console reporter for the inkcore commands.
 *
 * Three output modes:
 * - Simple: One line per file (`[1/10] Lecture.inkc... OK (3 pages)`)
 * - Verbose: Input, output and size of every file
 * - JSON: One compact JSON object per line for scripting
 */

#include "CliParser.h"
#include "../batch/BatchOperations.h"

#include <QJsonObject>
#include <QTextStream>

namespace Cli {

/**
 * @brief Progress reporter for console output.
 *
 * Usage:
 * @code
 *   ConsoleProgress progress(OutputMode::Simple);
 *   auto result = BatchOps::exportBatch(documents, options, progress.callback(), nullptr,
 *       [&](int current, int total, const BatchOps::FileResult& r) {
 *           progress.reportFile(current, total, r);
 *           return true;
 *       });
 *   progress.reportSummary(result, options.dryRun);
 * @endcode
 */
class ConsoleProgress {
public:
    explicit ConsoleProgress(OutputMode mode = OutputMode::Simple);

    /**
     * @brief Progress callback for BatchOps functions.
     *
     * Only prints in Verbose mode. Simple mode shows progress as part of
     * reportFile().
     */
    BatchOps::ProgressCallback callback();

    /**
     * @brief Report the result of one file.
     * @param index Current file index (1-based)
     * @param total Total file count
     */
    void reportFile(int index, int total, const BatchOps::FileResult& result);

    /**
     * @brief Report the final batch summary.
     * @param dryRun Whether this was a dry run (affects messaging)
     */
    void reportSummary(const BatchOps::BatchResult& result, bool dryRun);

    /// @brief Report a document summary (info command).
    void reportInfo(const BatchOps::DocumentInfo& info);

    /// @brief Report an error to stderr.
    void reportError(const QString& message);

    /// @brief Report a warning to stderr.
    void reportWarning(const QString& message);

    // Format file size for display (e.g., "1.5 MB")
    static QString formatSize(qint64 bytes);

    // Format duration for display (e.g., "1.5 s" or "125 ms")
    static QString formatDuration(qint64 ms);

private:
    void reportFileSimple(int index, int total, const BatchOps::FileResult& result);
    void reportFileVerbose(const BatchOps::FileResult& result);
    void reportFileJson(const BatchOps::FileResult& result);

    void reportSummaryText(const BatchOps::BatchResult& result, bool dryRun);
    void reportSummaryJson(const BatchOps::BatchResult& result, bool dryRun);

    /// Write one JSON object as a single line.
    void writeJsonLine(QTextStream& stream, const QJsonObject& obj);

    static QString shortName(const QString& path);
    static QString statusString(BatchOps::FileStatus status);
    static QString formatRect(const QRectF& rect);

private:
    OutputMode m_mode;
    QTextStream m_out;      ///< stdout stream
    QTextStream m_err;      ///< stderr stream
};

} // namespace Cli

#endif // CLIPROGRESS_H
