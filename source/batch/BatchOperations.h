#ifndef BATCHOPERATIONS_H
#define BATCHOPERATIONS_H

/**
 * @file BatchOperations.h
 * @brief Headless batch export of InkCore documents.
 *
 * This module loads .inkc documents without any UI and runs them through
 * the ExportAssembler:
 * - Whole document as SVG, PDF or Xournal++
 * - One file per page as SVG, PNG or JPEG
 * - The persisted selection as SVG, PNG or JPEG
 *
 * Used by the `inkcore` command line tool.
 */

#include "../export/ExportPrefs.h"

#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include <QRectF>
#include <QJsonObject>
#include <functional>
#include <atomic>

namespace BatchOps {

// =============================================================================
// Result Types
// =============================================================================

/**
 * @brief Status of a single file operation.
 */
enum class FileStatus {
    Success,        ///< Operation completed successfully
    Skipped,        ///< Skipped (output exists, nothing selected, cancelled)
    Error           ///< Operation failed
};

/**
 * @brief Result for a single file operation.
 */
struct FileResult {
    QString inputPath;              ///< Path to the .inkc document
    QString outputPath;             ///< Output file, or the first page file of a per-page export
    FileStatus status = FileStatus::Error;
    QString message;                ///< Error message or skip reason
    qint64 outputSize = 0;          ///< Bytes written over all output files
    int pagesProcessed = 0;         ///< Pages exported (PDF, Xopp and per-page exports)
};

/**
 * @brief Summary result for a batch operation.
 */
struct BatchResult {
    QList<FileResult> results;      ///< Per-file results
    int successCount = 0;
    int skippedCount = 0;
    int errorCount = 0;
    qint64 totalOutputSize = 0;     ///< Total size of all output files
    qint64 elapsedMs = 0;

    bool hasErrors() const { return errorCount > 0; }
    bool allSucceeded() const { return errorCount == 0 && skippedCount == 0; }
    int totalCount() const { return successCount + skippedCount + errorCount; }
};

// =============================================================================
// Callbacks
// =============================================================================

/**
 * @brief Progress callback, called before each file is processed.
 *
 * @param current Current file index (1-based)
 * @param total Total number of files to process
 * @param currentFile Path to file being processed
 * @param status Brief status message (e.g., "Exporting to PDF...")
 */
using ProgressCallback = std::function<void(int current, int total,
                                            const QString& currentFile,
                                            const QString& status)>;

/**
 * @brief Result callback, called after each file is processed.
 *
 * Return false to stop before the next file (--fail-fast).
 */
using ResultCallback = std::function<bool(int current, int total,
                                         const FileResult& result)>;

// =============================================================================
// Export Options
// =============================================================================

/**
 * @brief What part of the document is exported.
 */
enum class ExportTarget {
    Document,       ///< One file per document (svg, pdf, xopp)
    Pages,          ///< One file per page with content (svg, png, jpeg)
    Selection       ///< One file with the selected strokes (svg, png, jpeg)
};

/**
 * @brief Options for a batch export.
 *
 * Preferences that are not overridden here come from the export
 * preferences stored inside each document.
 */
struct ExportOptions {
    QString outputPath;             ///< Output file (single document) or directory
    ExportTarget target = ExportTarget::Document;
    QString format;                 ///< Format name, empty for the stored preference

    bool noBackground = false;      ///< Leave out the background color and pattern
    bool noPattern = false;         ///< Leave out the background pattern only
    bool optimizePrinting = false;  ///< Force a white background and dark strokes
    bool columnMajor = false;       ///< Split pages column by column
    qreal bitmapScale = 0.0;        ///< Pixels per document unit, 0 for the stored preference
    int jpegQuality = 0;            ///< 1 to 100, 0 for the stored preference
    qreal selectionMargin = -1.0;   ///< Negative for the stored preference

    bool overwrite = false;         ///< Overwrite existing output files
    bool dryRun = false;            ///< Preview only, don't create files
};

/**
 * @brief Check that the format name is valid for the target.
 * @return An empty string when valid, otherwise the error message.
 */
QString validateFormat(ExportTarget target, const QString& format);

/**
 * @brief Apply the command line overrides to the stored preferences.
 */
void applyOverrides(ExportPrefs& prefs, const ExportOptions& options);

/**
 * @brief Output file extension (with dot) for the target after overrides.
 */
QString outputExtension(ExportTarget target, const ExportPrefs& prefs);

// =============================================================================
// Batch Operation Functions
// =============================================================================

/**
 * @brief Export multiple documents.
 *
 * Output path handling:
 * - Single document + file path with the right extension: that exact file
 * - Otherwise a directory, filenames generated from the document names
 * - Per-page exports always write into a directory, one file per page
 *   named "<name> - page <N>.<ext>" with N zero padded to the page count
 *
 * Documents without a selection are skipped by selection exports.
 *
 * @param documentPaths List of .inkc files
 * @param options Export options
 * @param progress Optional progress callback (called before each file)
 * @param cancelled Optional cancellation flag (checked between files)
 * @param resultCb Optional result callback (called after each file)
 * @return BatchResult with per-file results and summary
 */
BatchResult exportBatch(const QStringList& documentPaths,
                        const ExportOptions& options,
                        ProgressCallback progress = nullptr,
                        std::atomic<bool>* cancelled = nullptr,
                        ResultCallback resultCb = nullptr);

// =============================================================================
// Document Inspection
// =============================================================================

/**
 * @brief Summary of a .inkc document for `inkcore info`.
 */
struct DocumentInfo {
    QString path;
    QString name;
    QString layout;
    QRectF documentBounds;
    QRectF contentBounds;           ///< Bounds of the non-trashed strokes, null when empty
    int pageCount = 0;
    int strokeCount = 0;
    int trashedCount = 0;
    int selectedCount = 0;
    QMap<QString, int> strokesByType;

    QJsonObject toJson() const;
};

/**
 * @brief Load a document and summarize it.
 * @return false with @p errorMessage set if the document can't be loaded.
 */
bool inspectDocument(const QString& path, DocumentInfo& info, QString* errorMessage = nullptr);

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Generate output file path for export.
 *
 * Example: "/path/to/Lecture.inkc" + "/output/" + ".pdf" -> "/output/Lecture.pdf"
 *
 * @param inputPath Input document path
 * @param outputDir Output directory
 * @param extension Output file extension (including dot, e.g., ".pdf")
 * @param suffix Appended to the document name (e.g., " - selection")
 */
QString generateOutputPath(const QString& inputPath,
                           const QString& outputDir,
                           const QString& extension,
                           const QString& suffix = QString());

/**
 * @brief Path of one page file of a per-page export.
 *
 * @param pageIndex Zero-based page index
 * @param pageCount Number of exported pages, decides the zero padding
 */
QString generatePageOutputPath(const QString& inputPath,
                               const QString& outputDir,
                               const QString& extension,
                               int pageIndex,
                               int pageCount);

/**
 * @brief Determine if output path represents a single file or directory.
 *
 * - Ends with the expected extension: single file
 * - Anything else (trailing separator, existing directory, no extension): directory
 */
bool isSingleFileOutput(const QString& outputPath, const QString& extension);

} // namespace BatchOps

#endif // BATCHOPERATIONS_H
