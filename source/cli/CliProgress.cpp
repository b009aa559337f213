#include "CliProgress.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QJsonDocument>

/**
 * @file CliProgress.cpp
 * @brief Implementation of the console reporter.
 *
 * @see CliProgress.h for API documentation
 */

namespace Cli {

ConsoleProgress::ConsoleProgress(OutputMode mode)
    : m_mode(mode)
    , m_out(stdout)
    , m_err(stderr)
{
}

// =============================================================================
// Progress Callback
// =============================================================================

BatchOps::ProgressCallback ConsoleProgress::callback()
{
    return [this](int current, int total, const QString& currentFile, const QString& status) {
        if (m_mode != OutputMode::Verbose) {
            return;
        }
        m_out << QStringLiteral("[%1/%2] %3: %4\n")
                 .arg(current)
                 .arg(total)
                 .arg(shortName(currentFile), status);
        m_out.flush();
    };
}

// =============================================================================
// File Result Reporting
// =============================================================================

void ConsoleProgress::reportFile(int index, int total, const BatchOps::FileResult& result)
{
    switch (m_mode) {
        case OutputMode::Simple:
            reportFileSimple(index, total, result);
            break;
        case OutputMode::Verbose:
            reportFileVerbose(result);
            break;
        case OutputMode::Json:
            reportFileJson(result);
            break;
    }
}

void ConsoleProgress::reportFileSimple(int index, int total, const BatchOps::FileResult& result)
{
    // [1/3] Lecture.inkc... OK (4 pages)
    // [2/3] Sketch.inkc... SKIPPED (Nothing selected)
    // [3/3] Broken.inkc... ERROR: store.json is not valid JSON
    QString statusStr;
    switch (result.status) {
        case BatchOps::FileStatus::Success:
            statusStr = QCoreApplication::translate("CLI", "OK");
            if (result.pagesProcessed > 0) {
                statusStr += QCoreApplication::translate("CLI", " (%n page(s))", nullptr,
                                                         result.pagesProcessed);
            }
            break;
        case BatchOps::FileStatus::Skipped:
            statusStr = QCoreApplication::translate("CLI", "SKIPPED");
            if (!result.message.isEmpty()) {
                statusStr += QStringLiteral(" (%1)").arg(result.message);
            }
            break;
        case BatchOps::FileStatus::Error:
            statusStr = QCoreApplication::translate("CLI", "ERROR");
            if (!result.message.isEmpty()) {
                statusStr += QStringLiteral(": %1").arg(result.message);
            }
            break;
    }

    m_out << QStringLiteral("[%1/%2] %3... %4\n")
             .arg(index)
             .arg(total)
             .arg(shortName(result.inputPath), statusStr);
    m_out.flush();
}

void ConsoleProgress::reportFileVerbose(const BatchOps::FileResult& result)
{
    m_out << QCoreApplication::translate("CLI", "  Input:  ") << result.inputPath << "\n";
    if (!result.outputPath.isEmpty()) {
        m_out << QCoreApplication::translate("CLI", "  Output: ") << result.outputPath << "\n";
    }

    m_out << QCoreApplication::translate("CLI", "  Status: ");
    switch (result.status) {
        case BatchOps::FileStatus::Success: {
            m_out << QCoreApplication::translate("CLI", "Success");
            QStringList details;
            if (result.pagesProcessed > 0) {
                details << QCoreApplication::translate("CLI", "%n page(s)", nullptr, result.pagesProcessed);
            }
            if (result.outputSize > 0) {
                details << formatSize(result.outputSize);
            }
            if (!details.isEmpty()) {
                m_out << " (" << details.join(QStringLiteral(", ")) << ")";
            }
            if (!result.message.isEmpty()) {
                m_out << " - " << result.message;
            }
            break;
        }
        case BatchOps::FileStatus::Skipped:
            m_out << QCoreApplication::translate("CLI", "Skipped");
            if (!result.message.isEmpty()) {
                m_out << " - " << result.message;
            }
            break;
        case BatchOps::FileStatus::Error:
            m_out << QCoreApplication::translate("CLI", "Error");
            if (!result.message.isEmpty()) {
                m_out << " - " << result.message;
            }
            break;
    }
    m_out << "\n\n";
    m_out.flush();
}

void ConsoleProgress::reportFileJson(const BatchOps::FileResult& result)
{
    // {"type":"file","input":"/notes/Lecture.inkc","output":"/out/Lecture.pdf","status":"success","size":24500,"pages":4}
    QJsonObject obj;
    obj["type"] = QStringLiteral("file");
    obj["input"] = result.inputPath;
    obj["output"] = result.outputPath;
    obj["status"] = statusString(result.status);
    if (result.outputSize > 0) {
        obj["size"] = result.outputSize;
    }
    if (result.pagesProcessed > 0) {
        obj["pages"] = result.pagesProcessed;
    }
    if (!result.message.isEmpty()) {
        obj["message"] = result.message;
    }
    writeJsonLine(m_out, obj);
}

// =============================================================================
// Summary Reporting
// =============================================================================

void ConsoleProgress::reportSummary(const BatchOps::BatchResult& result, bool dryRun)
{
    if (m_mode == OutputMode::Json) {
        reportSummaryJson(result, dryRun);
    } else {
        reportSummaryText(result, dryRun);
    }
}

void ConsoleProgress::reportSummaryText(const BatchOps::BatchResult& result, bool dryRun)
{
    m_out << "\n";
    if (dryRun) {
        m_out << QCoreApplication::translate("CLI", "=== Dry Run Summary ===\n");
    } else {
        m_out << QCoreApplication::translate("CLI", "=== Summary ===\n");
    }

    m_out << QCoreApplication::translate("CLI", "Total:    ")
          << result.totalCount() << QCoreApplication::translate("CLI", " files\n");
    m_out << QCoreApplication::translate("CLI", "Success:  ") << result.successCount << "\n";
    if (result.skippedCount > 0) {
        m_out << QCoreApplication::translate("CLI", "Skipped:  ") << result.skippedCount << "\n";
    }
    if (result.errorCount > 0) {
        m_out << QCoreApplication::translate("CLI", "Errors:   ") << result.errorCount << "\n";
    }
    if (result.totalOutputSize > 0 && !dryRun) {
        m_out << QCoreApplication::translate("CLI", "Size:     ")
              << formatSize(result.totalOutputSize) << "\n";
    }
    m_out << QCoreApplication::translate("CLI", "Time:     ")
          << formatDuration(result.elapsedMs) << "\n";
    m_out.flush();
}

void ConsoleProgress::reportSummaryJson(const BatchOps::BatchResult& result, bool dryRun)
{
    QJsonObject obj;
    obj["type"] = QStringLiteral("summary");
    obj["total"] = result.totalCount();
    obj["success"] = result.successCount;
    obj["skipped"] = result.skippedCount;
    obj["errors"] = result.errorCount;
    obj["total_size"] = result.totalOutputSize;
    obj["elapsed_ms"] = result.elapsedMs;
    obj["dry_run"] = dryRun;
    writeJsonLine(m_out, obj);
}

// =============================================================================
// Document Info
// =============================================================================

void ConsoleProgress::reportInfo(const BatchOps::DocumentInfo& info)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject obj = info.toJson();
        obj["type"] = QStringLiteral("info");
        writeJsonLine(m_out, obj);
        return;
    }

    m_out << shortName(info.path) << "\n";
    m_out << QCoreApplication::translate("CLI", "  Name:     ") << info.name << "\n";
    m_out << QCoreApplication::translate("CLI", "  Layout:   ") << info.layout << "\n";
    m_out << QCoreApplication::translate("CLI", "  Pages:    ") << info.pageCount << "\n";
    m_out << QCoreApplication::translate("CLI", "  Bounds:   ") << formatRect(info.documentBounds) << "\n";
    m_out << QCoreApplication::translate("CLI", "  Content:  ")
          << (info.contentBounds.isNull() ? QCoreApplication::translate("CLI", "empty")
                                          : formatRect(info.contentBounds))
          << "\n";
    m_out << QCoreApplication::translate("CLI", "  Strokes:  ") << info.strokeCount
          << QCoreApplication::translate("CLI", " (%1 trashed, %2 selected)")
                 .arg(info.trashedCount)
                 .arg(info.selectedCount)
          << "\n";
    for (auto it = info.strokesByType.constBegin(); it != info.strokesByType.constEnd(); ++it) {
        m_out << "    " << it.key() << ": " << it.value() << "\n";
    }
    m_out << "\n";
    m_out.flush();
}

// =============================================================================
// Error/Warning Reporting
// =============================================================================

void ConsoleProgress::reportError(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        writeJsonLine(m_err, QJsonObject{{"type", "error"}, {"message", message}});
        return;
    }
    m_err << QCoreApplication::translate("CLI", "Error: ") << message << "\n";
    m_err.flush();
}

void ConsoleProgress::reportWarning(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        writeJsonLine(m_err, QJsonObject{{"type", "warning"}, {"message", message}});
        return;
    }
    m_err << QCoreApplication::translate("CLI", "Warning: ") << message << "\n";
    m_err.flush();
}

// =============================================================================
// Utility Functions
// =============================================================================

void ConsoleProgress::writeJsonLine(QTextStream& stream, const QJsonObject& obj)
{
    stream << QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact)) << "\n";
    stream.flush();
}

QString ConsoleProgress::formatSize(qint64 bytes)
{
    if (bytes < 1024) {
        return QStringLiteral("%1 B").arg(bytes);
    }
    if (bytes < 1024 * 1024) {
        return QStringLiteral("%1 KB").arg(bytes / 1024.0, 0, 'f', 1);
    }
    if (bytes < 1024 * 1024 * 1024) {
        return QStringLiteral("%1 MB").arg(bytes / (1024.0 * 1024.0), 0, 'f', 1);
    }
    return QStringLiteral("%1 GB").arg(bytes / (1024.0 * 1024.0 * 1024.0), 0, 'f', 2);
}

QString ConsoleProgress::formatDuration(qint64 ms)
{
    if (ms < 1000) {
        return QStringLiteral("%1 ms").arg(ms);
    }
    if (ms < 60 * 1000) {
        return QStringLiteral("%1 s").arg(ms / 1000.0, 0, 'f', 1);
    }
    const qint64 minutes = ms / (60 * 1000);
    const qint64 seconds = (ms % (60 * 1000)) / 1000;
    return QStringLiteral("%1m %2s").arg(minutes).arg(seconds);
}

QString ConsoleProgress::shortName(const QString& path)
{
    return QFileInfo(path).fileName();
}

QString ConsoleProgress::statusString(BatchOps::FileStatus status)
{
    switch (status) {
        case BatchOps::FileStatus::Success: return QStringLiteral("success");
        case BatchOps::FileStatus::Skipped: return QStringLiteral("skipped");
        case BatchOps::FileStatus::Error:   return QStringLiteral("error");
    }
    return QStringLiteral("unknown");
}

QString ConsoleProgress::formatRect(const QRectF& rect)
{
    return QStringLiteral("(%1, %2) %3 x %4")
        .arg(rect.x(), 0, 'f', 1)
        .arg(rect.y(), 0, 'f', 1)
        .arg(rect.width(), 0, 'f', 1)
        .arg(rect.height(), 0, 'f', 1);
}

} // namespace Cli
