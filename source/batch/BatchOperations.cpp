#include "BatchOperations.h"
#include "DocumentDiscovery.h"

#include "../core/EngineSnapshot.h"
#include "../export/ExportAssembler.h"
#include "../store/StrokeStore.h"
#include "../strokes/Stroke.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QDebug>

/**
 * @file BatchOperations.cpp
 * @brief Implementation of batch export operations.
 *
 * @see BatchOperations.h for API documentation
 */

namespace BatchOps {

// =============================================================================
// Utility Functions
// =============================================================================

static QString documentBaseName(const QString& inputPath)
{
    QString name = QFileInfo(inputPath).fileName();
    const QString ext = QStringLiteral(".") + QLatin1String(EngineSnapshot::FILE_EXTENSION);
    if (name.endsWith(ext, Qt::CaseInsensitive)) {
        name.chop(ext.length());
    }
    return name;
}

static QString withTrailingSeparator(const QString& dir)
{
    if (dir.endsWith('/') || dir.endsWith('\\')) {
        return dir;
    }
    return dir + '/';
}

static QString withLeadingDot(const QString& extension)
{
    return extension.startsWith('.') ? extension : QStringLiteral(".") + extension;
}

QString generateOutputPath(const QString& inputPath,
                           const QString& outputDir,
                           const QString& extension,
                           const QString& suffix)
{
    return withTrailingSeparator(outputDir) + documentBaseName(inputPath) + suffix
           + withLeadingDot(extension);
}

QString generatePageOutputPath(const QString& inputPath,
                               const QString& outputDir,
                               const QString& extension,
                               int pageIndex,
                               int pageCount)
{
    // User facing page numbers start at 1
    const int width = QString::number(qMax(pageCount, 1)).length();
    const QString number = QStringLiteral("%1").arg(pageIndex + 1, width, 10, QLatin1Char('0'));
    return generateOutputPath(inputPath, outputDir, extension, QStringLiteral(" - page ") + number);
}

bool isSingleFileOutput(const QString& outputPath, const QString& extension)
{
    if (outputPath.isEmpty()) {
        return false;
    }
    if (outputPath.endsWith('/') || outputPath.endsWith('\\')) {
        return false;
    }
    const QFileInfo info(outputPath);
    if (info.exists() && info.isDir()) {
        return false;
    }
    if (outputPath.endsWith(withLeadingDot(extension), Qt::CaseInsensitive)) {
        return true;
    }
    // JPEG files come with either extension
    return extension.endsWith(QLatin1String("jpg"), Qt::CaseInsensitive)
           && outputPath.endsWith(QLatin1String(".jpeg"), Qt::CaseInsensitive);
}

// =============================================================================
// Export Preferences
// =============================================================================

QString validateFormat(ExportTarget target, const QString& format)
{
    if (format.isEmpty()) {
        return QString();
    }

    bool ok = false;
    switch (target) {
        case ExportTarget::Document:
            docExportFormatFromString(format, &ok);
            if (!ok) {
                return QCoreApplication::translate("CLI",
                    "Unknown document format '%1'. Expected svg, pdf or xopp.").arg(format);
            }
            break;
        case ExportTarget::Pages:
            docPagesExportFormatFromString(format, &ok);
            if (!ok) {
                return QCoreApplication::translate("CLI",
                    "Unknown page format '%1'. Expected svg, png or jpeg.").arg(format);
            }
            break;
        case ExportTarget::Selection:
            selectionExportFormatFromString(format, &ok);
            if (!ok) {
                return QCoreApplication::translate("CLI",
                    "Unknown selection format '%1'. Expected svg, png or jpeg.").arg(format);
            }
            break;
    }
    return QString();
}

void applyOverrides(ExportPrefs& prefs, const ExportOptions& options)
{
    const bool withBackground = !options.noBackground;
    const bool withPattern = !options.noBackground && !options.noPattern;

    switch (options.target) {
        case ExportTarget::Document:
            if (!options.format.isEmpty()) {
                prefs.doc.format = docExportFormatFromString(options.format);
            }
            prefs.doc.withBackground &= withBackground;
            prefs.doc.withPattern &= withPattern;
            prefs.doc.optimizePrinting |= options.optimizePrinting;
            if (options.columnMajor) {
                prefs.doc.pageOrder = SplitOrder::ColumnMajor;
            }
            break;

        case ExportTarget::Pages:
            if (!options.format.isEmpty()) {
                prefs.docPages.format = docPagesExportFormatFromString(options.format);
            }
            prefs.docPages.withBackground &= withBackground;
            prefs.docPages.withPattern &= withPattern;
            prefs.docPages.optimizePrinting |= options.optimizePrinting;
            if (options.columnMajor) {
                prefs.docPages.pageOrder = SplitOrder::ColumnMajor;
            }
            if (options.bitmapScale > 0.0) {
                prefs.docPages.bitmapScaleFactor = options.bitmapScale;
            }
            if (options.jpegQuality > 0) {
                prefs.docPages.jpegQuality = qBound(1, options.jpegQuality, 100);
            }
            break;

        case ExportTarget::Selection:
            if (!options.format.isEmpty()) {
                prefs.selection.format = selectionExportFormatFromString(options.format);
            }
            prefs.selection.withBackground &= withBackground;
            prefs.selection.withPattern &= withPattern;
            prefs.selection.optimizePrinting |= options.optimizePrinting;
            if (options.bitmapScale > 0.0) {
                prefs.selection.bitmapScaleFactor = options.bitmapScale;
            }
            if (options.jpegQuality > 0) {
                prefs.selection.jpegQuality = qBound(1, options.jpegQuality, 100);
            }
            if (options.selectionMargin >= 0.0) {
                prefs.selection.margin = options.selectionMargin;
            }
            break;
    }
}

QString outputExtension(ExportTarget target, const ExportPrefs& prefs)
{
    switch (target) {
        case ExportTarget::Document:
            return withLeadingDot(DocExportPrefs::fileExtension(prefs.doc.format));
        case ExportTarget::Pages:
            return withLeadingDot(DocPagesExportPrefs::fileExtension(prefs.docPages.format));
        case ExportTarget::Selection:
            return withLeadingDot(SelectionExportPrefs::fileExtension(prefs.selection.format));
    }
    return QString();
}

static QString targetStatus(ExportTarget target)
{
    switch (target) {
        case ExportTarget::Document:  return QCoreApplication::translate("CLI", "Exporting document...");
        case ExportTarget::Pages:     return QCoreApplication::translate("CLI", "Exporting pages...");
        case ExportTarget::Selection: return QCoreApplication::translate("CLI", "Exporting selection...");
    }
    return QString();
}

// =============================================================================
// Writing
// =============================================================================

/**
 * @brief Write bytes to a file, creating the parent directory.
 * @return Empty on success, otherwise the error message.
 */
static QString writeOutputFile(const QString& path, const QByteArray& data)
{
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        return QCoreApplication::translate("CLI", "Failed to create directory: %1")
            .arg(info.absolutePath());
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QCoreApplication::translate("CLI", "Cannot write %1: %2").arg(path, file.errorString());
    }
    if (file.write(data) != data.size()) {
        return QCoreApplication::translate("CLI", "Failed to write %1: %2").arg(path, file.errorString());
    }
    return QString();
}

// =============================================================================
// Batch Export
// =============================================================================

static void tally(BatchResult& result, const FileResult& fr)
{
    switch (fr.status) {
        case FileStatus::Success:
            result.successCount++;
            result.totalOutputSize += fr.outputSize;
            break;
        case FileStatus::Skipped:
            result.skippedCount++;
            break;
        case FileStatus::Error:
            result.errorCount++;
            break;
    }
    result.results.append(fr);
}

/**
 * @brief Export one loaded document.
 *
 * @param outputPath The output file, or the output directory of a per-page export
 */
static void exportLoadedDocument(const EngineSnapshot& snapshot, const StrokeStore& store,
                                 const ExportPrefs& prefs, ExportTarget target,
                                 const QString& outputPath, bool overwrite, FileResult& fr)
{
    ExportAssembler assembler(snapshot.document, store);

    if (target == ExportTarget::Pages) {
        const ExportResult exported = assembler.exportDocPages(prefs.docPages).result();
        if (!exported.success) {
            fr.status = FileStatus::Error;
            fr.message = exported.errorMessage;
            return;
        }

        const QString ext = outputExtension(target, prefs);
        const int count = exported.pages.size();
        for (int i = 0; i < count; ++i) {
            const QString pagePath = generatePageOutputPath(fr.inputPath, outputPath, ext, i, count);
            if (i == 0) {
                fr.outputPath = pagePath;
            }
            if (QFile::exists(pagePath) && !overwrite) {
                fr.status = FileStatus::Skipped;
                fr.message = QCoreApplication::translate("CLI", "Output file already exists: %1")
                    .arg(QFileInfo(pagePath).fileName());
                return;
            }
            const QString error = writeOutputFile(pagePath, exported.pages.at(i));
            if (!error.isEmpty()) {
                fr.status = FileStatus::Error;
                fr.message = error;
                return;
            }
            fr.outputSize += exported.pages.at(i).size();
        }
        fr.pagesProcessed = count;
        fr.status = FileStatus::Success;
        return;
    }

    ExportResult exported;
    if (target == ExportTarget::Selection) {
        exported = assembler.exportSelection(prefs.selection).result();
    } else {
        QString title = snapshot.document.name;
        if (title.isEmpty()) {
            title = documentBaseName(fr.inputPath);
        }
        exported = assembler.exportDoc(title, prefs.doc).result();
        if (prefs.doc.format != DocExportFormat::Svg) {
            fr.pagesProcessed = assembler.extractPagesContent(prefs.doc.pageOrder).size();
        }
    }

    if (!exported.success) {
        fr.status = FileStatus::Error;
        fr.message = exported.errorMessage;
        fr.pagesProcessed = 0;
        return;
    }

    const QString error = writeOutputFile(outputPath, exported.data);
    if (!error.isEmpty()) {
        fr.status = FileStatus::Error;
        fr.message = error;
        fr.pagesProcessed = 0;
        return;
    }
    fr.outputSize = exported.data.size();
    fr.status = FileStatus::Success;
}

BatchResult exportBatch(const QStringList& documentPaths,
                        const ExportOptions& options,
                        ProgressCallback progress,
                        std::atomic<bool>* cancelled,
                        ResultCallback resultCb)
{
    BatchResult result;
    QElapsedTimer timer;
    timer.start();

    const int total = documentPaths.size();
    if (documentPaths.isEmpty()) {
        result.elapsedMs = timer.elapsed();
        return result;
    }

    if (options.outputPath.isEmpty()) {
        for (const QString& path : documentPaths) {
            FileResult fr;
            fr.inputPath = path;
            fr.status = FileStatus::Error;
            fr.message = QCoreApplication::translate("CLI", "No output path specified");
            tally(result, fr);
        }
        result.elapsedMs = timer.elapsed();
        return result;
    }

    for (int i = 0; i < total; ++i) {
        const QString& path = documentPaths.at(i);
        FileResult fr;
        fr.inputPath = path;

        if (cancelled && cancelled->load()) {
            fr.status = FileStatus::Skipped;
            fr.message = QCoreApplication::translate("CLI", "Cancelled");
            tally(result, fr);
            if (resultCb) {
                resultCb(i + 1, total, fr);
            }
            continue;
        }

        if (progress) {
            progress(i + 1, total, path, targetStatus(options.target));
        }

        // Every document carries its own preferences, so the output
        // extension is known only after loading
        StrokeStore store;
        EngineSnapshot snapshot;
        const EngineSnapshot::SnapshotResult loaded = EngineSnapshot::loadFromFile(path, snapshot, store);
        if (!loaded.success) {
            fr.status = FileStatus::Error;
            fr.message = loaded.errorMessage;
        } else {
            ExportPrefs prefs = snapshot.exportPrefs;
            applyOverrides(prefs, options);
            const QString ext = outputExtension(options.target, prefs);

            QString outputPath;
            if (options.target == ExportTarget::Pages) {
                outputPath = options.outputPath;
            } else if (total == 1 && isSingleFileOutput(options.outputPath, ext)) {
                outputPath = options.outputPath;
            } else if (options.target == ExportTarget::Selection) {
                outputPath = generateOutputPath(path, options.outputPath, ext, QStringLiteral(" - selection"));
            } else {
                outputPath = generateOutputPath(path, options.outputPath, ext);
            }
            fr.outputPath = outputPath;

            if (options.target != ExportTarget::Pages && QFile::exists(outputPath) && !options.overwrite) {
                fr.status = FileStatus::Skipped;
                fr.message = QCoreApplication::translate("CLI", "Output file already exists");
            } else if (options.target == ExportTarget::Selection && store.selectionKeysAsRendered().isEmpty()) {
                fr.status = FileStatus::Skipped;
                fr.message = QCoreApplication::translate("CLI", "Nothing selected");
            } else if (options.dryRun) {
                fr.status = FileStatus::Success;
                fr.message = QCoreApplication::translate("CLI", "Would export to: %1").arg(outputPath);
            } else {
                exportLoadedDocument(snapshot, store, prefs, options.target, outputPath,
                                     options.overwrite, fr);
            }
        }

        tally(result, fr);
        if (resultCb && !resultCb(i + 1, total, fr)) {
            break;
        }
    }

    result.elapsedMs = timer.elapsed();

#ifdef QT_DEBUG
    qDebug() << "[BatchOps] exportBatch complete:"
             << result.successCount << "success,"
             << result.skippedCount << "skipped,"
             << result.errorCount << "errors,"
             << result.elapsedMs << "ms";
#endif

    return result;
}

// =============================================================================
// Document Inspection
// =============================================================================

static QJsonObject rectToJson(const QRectF& rect)
{
    QJsonObject obj;
    obj["x"] = rect.x();
    obj["y"] = rect.y();
    obj["width"] = rect.width();
    obj["height"] = rect.height();
    return obj;
}

QJsonObject DocumentInfo::toJson() const
{
    QJsonObject obj;
    obj["path"] = path;
    obj["name"] = name;
    obj["layout"] = layout;
    obj["document_bounds"] = rectToJson(documentBounds);
    if (!contentBounds.isNull()) {
        obj["content_bounds"] = rectToJson(contentBounds);
    }
    obj["pages"] = pageCount;
    obj["strokes"] = strokeCount;
    obj["trashed"] = trashedCount;
    obj["selected"] = selectedCount;

    QJsonObject byType;
    for (auto it = strokesByType.constBegin(); it != strokesByType.constEnd(); ++it) {
        byType[it.key()] = it.value();
    }
    obj["strokes_by_type"] = byType;
    return obj;
}

bool inspectDocument(const QString& path, DocumentInfo& info, QString* errorMessage)
{
    StrokeStore store;
    EngineSnapshot snapshot;
    const EngineSnapshot::SnapshotResult loaded = EngineSnapshot::loadFromFile(path, snapshot, store);
    if (!loaded.success) {
        if (errorMessage) {
            *errorMessage = loaded.errorMessage;
        }
        return false;
    }

    info = DocumentInfo();
    info.path = QFileInfo(path).absoluteFilePath();
    info.name = snapshot.document.name;
    info.layout = Document::layoutToString(snapshot.document.layout);
    info.documentBounds = snapshot.document.bounds();
    info.contentBounds = store.boundsNonTrashed();
    info.pageCount = snapshot.document.pageCount();
    info.strokeCount = store.strokeCount();
    info.trashedCount = store.trashedKeysUnordered().size();
    info.selectedCount = store.selectionKeysUnordered().size();

    for (const StrokeKey& key : store.keysUnordered()) {
        const std::shared_ptr<const Stroke> stroke = store.getStrokeRef(key);
        if (stroke) {
            info.strokesByType[stroke->type()]++;
        }
    }
    return true;
}

} // namespace BatchOps
