#pragma once

// ============================================================================
// BatchTests - Unit tests for headless batch export
// ============================================================================
// Tests for:
// - Output path generation
// - Document discovery from command line inputs
// - Document, page and selection batch export
// - Cancellation and stopping early
// - Document inspection
// ============================================================================

#include "BatchOperations.h"
#include "DocumentDiscovery.h"
#include "../core/EngineSnapshot.h"
#include "../export/ExportTests.h"
#include "../store/StrokeStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

namespace BatchTests {

/// Save the three page export test document as @p path.
inline bool writeTestDocument(const QString& path, bool withSelection = false)
{
    EngineSnapshot snapshot;
    snapshot.document = ExportTests::makeThreePageDocument();
    snapshot.exportPrefs.doc.format = DocExportFormat::Pdf;

    StrokeStore store;
    ExportTests::fillStore(store);
    if (withSelection) {
        store.setSelected(store.strokeKeysAsRendered().first(), true);
    }

    const EngineSnapshot::SnapshotResult result = EngineSnapshot::saveToFile(path, snapshot, store);
    if (!result.success) {
        qDebug() << "FAIL: could not write test document" << path << result.errorMessage;
    }
    return result.success;
}

inline bool writeGarbage(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    return file.write("not a zip archive") > 0;
}

/**
 * @brief Output file names for documents, pages and single files.
 */
inline bool testOutputPaths()
{
    qDebug() << "=== Test: Output Paths ===";
    bool success = true;

    const QString input = QStringLiteral("/notes/Lecture.inkc");

    if (BatchOps::generateOutputPath(input, QStringLiteral("/out"), QStringLiteral(".pdf"))
        != QStringLiteral("/out/Lecture.pdf")) {
        qDebug() << "FAIL: document output path";
        success = false;
    }
    if (BatchOps::generateOutputPath(input, QStringLiteral("/out/"), QStringLiteral("svg"),
                                     QStringLiteral(" - selection"))
        != QStringLiteral("/out/Lecture - selection.svg")) {
        qDebug() << "FAIL: selection output path";
        success = false;
    }

    // Page numbers start at 1 and are padded to the page count
    const QString first = BatchOps::generatePageOutputPath(input, QStringLiteral("/out"),
                                                           QStringLiteral(".png"), 0, 12);
    const QString last = BatchOps::generatePageOutputPath(input, QStringLiteral("/out"),
                                                          QStringLiteral(".png"), 11, 12);
    if (first != QStringLiteral("/out/Lecture - page 01.png")
        || last != QStringLiteral("/out/Lecture - page 12.png")) {
        qDebug() << "FAIL: page output paths" << first << last;
        success = false;
    }

    if (!BatchOps::isSingleFileOutput(QStringLiteral("/out/lecture.pdf"), QStringLiteral(".pdf"))
        || !BatchOps::isSingleFileOutput(QStringLiteral("/out/figure.jpeg"), QStringLiteral(".jpg"))) {
        qDebug() << "FAIL: paths with the format's extension are single files";
        success = false;
    }
    if (BatchOps::isSingleFileOutput(QStringLiteral("/out/"), QStringLiteral(".pdf"))
        || BatchOps::isSingleFileOutput(QStringLiteral("/out/lecture.svg"), QStringLiteral(".pdf"))
        || BatchOps::isSingleFileOutput(QString(), QStringLiteral(".pdf"))) {
        qDebug() << "FAIL: other paths are directories";
        success = false;
    }

    qDebug() << "  - Output paths:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Input expansion finds .inkc files, deduplicated and sorted.
 */
inline bool testDiscovery()
{
    qDebug() << "=== Test: Discovery ===";
    bool success = true;

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: could not create a temporary directory";
        return false;
    }
    const QString a = dir.filePath(QStringLiteral("b-notes.inkc"));
    const QString b = dir.filePath(QStringLiteral("sub/a-notes.inkc"));
    if (!writeTestDocument(a) || !writeTestDocument(b)) {
        return false;
    }
    writeGarbage(dir.filePath(QStringLiteral("readme.txt")));

    const QStringList flat = BatchOps::expandInputPaths({dir.path()});
    if (flat.size() != 1 || !flat.first().endsWith(QStringLiteral("b-notes.inkc"))) {
        qDebug() << "FAIL: non-recursive discovery" << flat;
        success = false;
    }

    const QStringList deep = BatchOps::expandInputPaths({dir.path()}, true);
    if (deep.size() != 2) {
        qDebug() << "FAIL: recursive discovery should find 2 documents, got" << deep;
        success = false;
    }

    const QStringList mixed = BatchOps::expandInputPaths(
        {a, a, dir.filePath(QStringLiteral("readme.txt")), dir.filePath(QStringLiteral("missing.inkc"))});
    if (mixed.size() != 1) {
        qDebug() << "FAIL: duplicates, other files and missing paths should be dropped" << mixed;
        success = false;
    }

    qDebug() << "  - Discovery:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Document and per-page export into a directory.
 */
inline bool testExportBatch()
{
    qDebug() << "=== Test: Export Batch ===";
    bool success = true;

    QTemporaryDir dir;
    if (!dir.isValid()) {
        return false;
    }
    const QString first = dir.filePath(QStringLiteral("First.inkc"));
    const QString second = dir.filePath(QStringLiteral("Second.inkc"));
    if (!writeTestDocument(first) || !writeTestDocument(second)) {
        return false;
    }
    const QString outDir = dir.filePath(QStringLiteral("out"));

    // The stored preference is PDF
    BatchOps::ExportOptions options;
    options.outputPath = outDir;
    BatchOps::BatchResult result = BatchOps::exportBatch({first, second}, options);
    if (result.successCount != 2 || result.totalOutputSize <= 0) {
        qDebug() << "FAIL: both documents should export, errors:" << result.errorCount;
        success = false;
    }
    if (!QFile::exists(QDir(outDir).filePath(QStringLiteral("First.pdf")))) {
        qDebug() << "FAIL: First.pdf was not written";
        success = false;
    }
    if (!result.results.isEmpty() && result.results.first().pagesProcessed != 2) {
        qDebug() << "FAIL: two pages have content, got" << result.results.first().pagesProcessed;
        success = false;
    }

    // Existing outputs are kept without overwrite
    result = BatchOps::exportBatch({first, second}, options);
    if (result.skippedCount != 2) {
        qDebug() << "FAIL: existing outputs should be skipped, skipped" << result.skippedCount;
        success = false;
    }

    // Per-page bitmaps
    options.target = BatchOps::ExportTarget::Pages;
    options.format = QStringLiteral("png");
    options.bitmapScale = 0.5;
    result = BatchOps::exportBatch({first}, options);
    if (result.successCount != 1
        || !QFile::exists(QDir(outDir).filePath(QStringLiteral("First - page 1.png")))
        || !QFile::exists(QDir(outDir).filePath(QStringLiteral("First - page 2.png")))) {
        qDebug() << "FAIL: per-page export should write one PNG per page with content";
        success = false;
    }

    // Dry run writes nothing
    options.target = BatchOps::ExportTarget::Document;
    options.format = QStringLiteral("xopp");
    options.dryRun = true;
    result = BatchOps::exportBatch({first}, options);
    if (result.successCount != 1 || QFile::exists(QDir(outDir).filePath(QStringLiteral("First.xopp")))) {
        qDebug() << "FAIL: dry run should succeed without writing";
        success = false;
    }

    qDebug() << "  - Export batch:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Selection export skips documents without a selection.
 */
inline bool testSelectionBatch()
{
    qDebug() << "=== Test: Selection Batch ===";
    bool success = true;

    QTemporaryDir dir;
    if (!dir.isValid()) {
        return false;
    }
    const QString plain = dir.filePath(QStringLiteral("Plain.inkc"));
    const QString selected = dir.filePath(QStringLiteral("Selected.inkc"));
    if (!writeTestDocument(plain) || !writeTestDocument(selected, true)) {
        return false;
    }

    BatchOps::ExportOptions options;
    options.outputPath = dir.filePath(QStringLiteral("out"));
    options.target = BatchOps::ExportTarget::Selection;
    options.format = QStringLiteral("svg");

    const BatchOps::BatchResult result = BatchOps::exportBatch({plain, selected}, options);
    if (result.skippedCount != 1 || result.successCount != 1) {
        qDebug() << "FAIL: expected one skipped and one exported document";
        success = false;
    }
    if (!QFile::exists(QDir(options.outputPath).filePath(QStringLiteral("Selected - selection.svg")))) {
        qDebug() << "FAIL: selection output was not written";
        success = false;
    }

    qDebug() << "  - Selection batch:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Cancellation, load errors and stopping after an error.
 */
inline bool testCancelAndStop()
{
    qDebug() << "=== Test: Cancel And Stop ===";
    bool success = true;

    QTemporaryDir dir;
    if (!dir.isValid()) {
        return false;
    }
    const QString broken = dir.filePath(QStringLiteral("Broken.inkc"));
    const QString good = dir.filePath(QStringLiteral("Good.inkc"));
    if (!writeGarbage(broken) || !writeTestDocument(good)) {
        return false;
    }

    BatchOps::ExportOptions options;
    options.outputPath = dir.filePath(QStringLiteral("out"));

    std::atomic<bool> cancelled(true);
    BatchOps::BatchResult result = BatchOps::exportBatch({broken, good}, options, nullptr, &cancelled);
    if (result.skippedCount != 2 || QDir(options.outputPath).exists()) {
        qDebug() << "FAIL: a cancelled batch should skip every file";
        success = false;
    }

    cancelled = false;
    result = BatchOps::exportBatch({broken, good}, options, nullptr, &cancelled);
    if (result.errorCount != 1 || result.successCount != 1
        || result.results.first().message.isEmpty()) {
        qDebug() << "FAIL: the broken document should fail with a message, the good one export";
        success = false;
    }

    // Stop after the first error
    options.overwrite = true;
    int reported = 0;
    result = BatchOps::exportBatch({broken, good}, options, nullptr, nullptr,
        [&reported](int, int, const BatchOps::FileResult& fileResult) {
            ++reported;
            return fileResult.status != BatchOps::FileStatus::Error;
        });
    if (reported != 1 || result.totalCount() != 1) {
        qDebug() << "FAIL: returning false from the result callback should stop the batch";
        success = false;
    }

    qDebug() << "  - Cancel and stop:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Document inspection counts strokes by type.
 */
inline bool testInspect()
{
    qDebug() << "=== Test: Inspect ===";
    bool success = true;

    QTemporaryDir dir;
    if (!dir.isValid()) {
        return false;
    }
    const QString path = dir.filePath(QStringLiteral("Info.inkc"));
    if (!writeTestDocument(path, true)) {
        return false;
    }

    BatchOps::DocumentInfo info;
    QString error;
    if (!BatchOps::inspectDocument(path, info, &error)) {
        qDebug() << "FAIL: inspect failed:" << error;
        return false;
    }
    if (info.strokeCount != 2 || info.selectedCount != 1 || info.trashedCount != 0) {
        qDebug() << "FAIL: stroke counts" << info.strokeCount << info.selectedCount << info.trashedCount;
        success = false;
    }
    if (info.strokesByType.value(QStringLiteral("brushstroke")) != 1
        || info.strokesByType.value(QStringLiteral("shapestroke")) != 1) {
        qDebug() << "FAIL: strokes by type" << info.strokesByType;
        success = false;
    }
    if (info.pageCount != 3 || info.layout != QStringLiteral("fixed_size") || info.contentBounds.isNull()) {
        qDebug() << "FAIL: document summary" << info.pageCount << info.layout;
        success = false;
    }
    if (!info.toJson().contains(QStringLiteral("content_bounds"))) {
        qDebug() << "FAIL: JSON should carry the content bounds";
        success = false;
    }

    if (BatchOps::inspectDocument(dir.filePath(QStringLiteral("missing.inkc")), info, &error)
        || error.isEmpty()) {
        qDebug() << "FAIL: inspecting a missing document should fail with a message";
        success = false;
    }

    qDebug() << "  - Inspect:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Run all batch tests.
 * @return True if all tests pass.
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Batch Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testOutputPaths();
    qDebug() << "";

    allPass &= testDiscovery();
    qDebug() << "";

    allPass &= testExportBatch();
    qDebug() << "";

    allPass &= testSelectionBatch();
    qDebug() << "";

    allPass &= testCancelAndStop();
    qDebug() << "";

    allPass &= testInspect();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL BATCH TESTS PASSED!";
    } else {
        qDebug() << "SOME BATCH TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace BatchTests
