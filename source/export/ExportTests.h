#pragma once

// ============================================================================
// ExportTests - Unit tests for the export assembler
// ============================================================================
// Tests for:
// - Document export as SVG, PDF and Xournal++
// - Per-page export as SVG and bitmaps
// - Selection export
// - Export preference serialization
// ============================================================================

#include "ExportAssembler.h"
#include "ExportPrefs.h"
#include "XoppWriter.h"
#include "../core/Document.h"
#include "../store/StrokeStore.h"
#include "../strokes/StrokeTests.h"

#include <QDebug>
#include <QRegularExpression>
#include <QThreadPool>

namespace ExportTests {

/// Three 200x300 pages, strokes on the first and the third.
inline Document makeThreePageDocument()
{
    Document doc = Document::createNew(QStringLiteral("Export Test"), Document::Layout::FixedSize);
    doc.format.width = 200.0;
    doc.format.height = 300.0;
    doc.format.dpi = 96.0;
    doc.x = 0.0;
    doc.y = 0.0;
    doc.width = 200.0;
    doc.height = 900.0;
    return doc;
}

inline void fillStore(StrokeStore& store)
{
    store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 50), 5));
    ShapeStyle style;
    style.strokeWidth = 2.0;
    store.insertStroke(ShapeStroke::rectangle(QRectF(40, 640, 60, 40), style));
}

inline int countMatches(const QString& text, const QRegularExpression& re)
{
    int count = 0;
    QRegularExpressionMatchIterator it = re.globalMatch(text);
    while (it.hasNext()) {
        it.next();
        ++count;
    }
    return count;
}

/**
 * @brief The whole document as one SVG.
 */
inline bool testDocSvg()
{
    qDebug() << "=== Test: Document SVG ===";
    bool success = true;

    const Document doc = makeThreePageDocument();
    StrokeStore store;
    fillStore(store);
    QThreadPool pool;
    ExportAssembler assembler(doc, store, &pool);

    DocExportPrefs prefs;
    prefs.format = DocExportFormat::Svg;
    const ExportResult result = assembler.exportDoc(doc.name, prefs).result();

    if (!result.success) {
        qDebug() << "FAIL: SVG export failed:" << result.errorMessage;
        return false;
    }
    if (!result.data.startsWith("<?xml") || !result.data.contains("<svg")) {
        qDebug() << "FAIL: output is not an SVG document";
        success = false;
    }
    if (!result.data.contains("width=\"200") || !result.data.contains("height=\"900")) {
        qDebug() << "FAIL: SVG should span the whole document";
        success = false;
    }

    qDebug() << "  - Document SVG:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief PDF export writes one page per page with content.
 */
inline bool testDocPdf()
{
    qDebug() << "=== Test: Document PDF ===";
    bool success = true;

    const Document doc = makeThreePageDocument();
    StrokeStore store;
    fillStore(store);
    QThreadPool pool;
    ExportAssembler assembler(doc, store, &pool);

    DocExportPrefs prefs;
    prefs.format = DocExportFormat::Pdf;
    const ExportResult result = assembler.exportDoc(doc.name, prefs).result();

    if (!result.success) {
        qDebug() << "FAIL: PDF export failed:" << result.errorMessage;
        return false;
    }
    if (!result.data.startsWith("%PDF")) {
        qDebug() << "FAIL: output is not a PDF";
        success = false;
    }
    const int pages = countMatches(QString::fromLatin1(result.data),
                                   QRegularExpression(QStringLiteral("/Type\\s*/Page\\b")));
    if (pages != 2) {
        qDebug() << "FAIL: PDF should have 2 pages (1 and 3), found" << pages;
        success = false;
    }

    qDebug() << "  - Document PDF:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Pages without bounds are skipped without leaving blank PDF pages.
 */
inline bool testDocPdfSkipsInvalidPages()
{
    qDebug() << "=== Test: PDF Skips Invalid Pages ===";
    bool success = true;

    StrokeContent first(QVector<std::shared_ptr<const Stroke>>{
        std::shared_ptr<const Stroke>(StrokeTests::makeLineBrush(QPointF(50, 50), 5))});
    first.withBounds(QRectF(0, 0, 200, 300));
    StrokeContent second;
    second.withBounds(QRectF(0, 300, 200, 300));

    QVector<StrokeContent> pages;
    pages.append(StrokeContent());
    pages.append(first);
    pages.append(StrokeContent());
    pages.append(second);

    const ExportResult result =
        ExportAssembler::docAsPdf(QStringLiteral("Skipped Pages"), pages, DocExportPrefs(), 96.0);
    if (!result.success) {
        qDebug() << "FAIL: PDF export failed:" << result.errorMessage;
        return false;
    }
    const int pageCount = countMatches(QString::fromLatin1(result.data),
                                       QRegularExpression(QStringLiteral("/Type\\s*/Page\\b")));
    if (pageCount != 2) {
        qDebug() << "FAIL: PDF should have 2 pages, found" << pageCount;
        success = false;
    }

    const ExportResult none = ExportAssembler::docAsPdf(
        QStringLiteral("No Pages"), QVector<StrokeContent>{StrokeContent()}, DocExportPrefs(), 96.0);
    if (none.success || none.errorMessage.isEmpty()) {
        qDebug() << "FAIL: a PDF without drawable pages should fail";
        success = false;
    }

    qDebug() << "  - PDF skips invalid pages:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Xournal++ export is gzipped XML with 72 DPI coordinates.
 */
inline bool testDocXopp()
{
    qDebug() << "=== Test: Document Xopp ===";
    bool success = true;

    const Document doc = makeThreePageDocument();
    StrokeStore store;
    fillStore(store);
    QThreadPool pool;
    ExportAssembler assembler(doc, store, &pool);

    DocExportPrefs prefs;
    prefs.format = DocExportFormat::Xopp;
    const ExportResult result = assembler.exportDoc(doc.name, prefs).result();
    if (!result.success) {
        qDebug() << "FAIL: xopp export failed:" << result.errorMessage;
        return false;
    }

    QByteArray xml;
    if (!XoppWriter::gzipDecompress(result.data, xml)) {
        qDebug() << "FAIL: xopp output is not valid gzip";
        return false;
    }
    const QString text = QString::fromUtf8(xml);

    if (!text.contains(QStringLiteral("<xournal"))) {
        qDebug() << "FAIL: missing <xournal> root";
        success = false;
    }
    const int pages = countMatches(text, QRegularExpression(QStringLiteral("<page\\b")));
    if (pages != 2) {
        qDebug() << "FAIL: expected 2 pages, found" << pages;
        success = false;
    }
    if (!text.contains(QStringLiteral("<stroke")) || !text.contains(QStringLiteral("<image"))) {
        qDebug() << "FAIL: expected a brush <stroke> and a shape <image>";
        success = false;
    }
    // 200 x 300 at 96 DPI is 150 x 225 at 72 DPI
    if (!text.contains(QStringLiteral("width=\"150.000\"")) || !text.contains(QStringLiteral("height=\"225.000\""))) {
        qDebug() << "FAIL: page size should be converted to 72 DPI";
        success = false;
    }
    if (!text.contains(QStringLiteral("37.500 37.500"))) {
        qDebug() << "FAIL: stroke coordinates should be converted to 72 DPI";
        success = false;
    }

    qDebug() << "  - Document xopp:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Per-page export as SVG, PNG and JPEG.
 */
inline bool testDocPages()
{
    qDebug() << "=== Test: Document Pages ===";
    bool success = true;

    const Document doc = makeThreePageDocument();
    StrokeStore store;
    fillStore(store);
    QThreadPool pool;
    ExportAssembler assembler(doc, store, &pool);

    DocPagesExportPrefs prefs;
    prefs.format = DocPagesExportFormat::Svg;
    ExportResult result = assembler.exportDocPages(prefs).result();
    if (!result.success || result.pages.size() != 2) {
        qDebug() << "FAIL: expected 2 SVG pages, got" << result.pages.size() << result.errorMessage;
        success = false;
    }

    prefs.format = DocPagesExportFormat::Png;
    result = assembler.exportDocPages(prefs).result();
    if (!result.success || result.pages.size() != 2 || !result.pages.first().startsWith("\x89PNG")) {
        qDebug() << "FAIL: expected 2 PNG pages" << result.errorMessage;
        success = false;
    }

    prefs.format = DocPagesExportFormat::Jpeg;
    prefs.jpegQuality = 60;
    result = assembler.exportDocPages(prefs).result();
    if (!result.success || result.pages.size() != 2
        || !result.pages.last().startsWith(QByteArray("\xff\xd8\xff", 3))) {
        qDebug() << "FAIL: expected 2 JPEG pages" << result.errorMessage;
        success = false;
    }

    qDebug() << "  - Document pages:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Selection export fails without a selection and succeeds with one.
 */
inline bool testSelection()
{
    qDebug() << "=== Test: Selection ===";
    bool success = true;

    const Document doc = makeThreePageDocument();
    StrokeStore store;
    const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 50), 5));
    QThreadPool pool;
    ExportAssembler assembler(doc, store, &pool);

    SelectionExportPrefs prefs;
    prefs.format = SelectionExportFormat::Svg;
    ExportResult result = assembler.exportSelection(prefs).result();
    if (result.success || result.errorMessage.isEmpty()) {
        qDebug() << "FAIL: exporting an empty selection should fail with a message";
        success = false;
    }

    store.setSelected(key, true);
    result = assembler.exportSelection(prefs).result();
    if (!result.success || !result.data.contains("<svg")) {
        qDebug() << "FAIL: selection SVG export failed:" << result.errorMessage;
        success = false;
    }

    prefs.format = SelectionExportFormat::Png;
    result = assembler.exportSelection(prefs).result();
    if (!result.success || !result.data.startsWith("\x89PNG")) {
        qDebug() << "FAIL: selection PNG export failed:" << result.errorMessage;
        success = false;
    }

    qDebug() << "  - Selection:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Preferences survive JSON and unknown values fall back to defaults.
 */
inline bool testPrefsJson()
{
    qDebug() << "=== Test: Export Prefs JSON ===";
    bool success = true;

    ExportPrefs prefs;
    prefs.doc.format = DocExportFormat::Xopp;
    prefs.doc.pageOrder = SplitOrder::ColumnMajor;
    prefs.docPages.format = DocPagesExportFormat::Jpeg;
    prefs.docPages.jpegQuality = 70;
    prefs.selection.margin = 4.0;

    const ExportPrefs loaded = ExportPrefs::fromJson(prefs.toJson());
    if (loaded.doc.format != DocExportFormat::Xopp || loaded.doc.pageOrder != SplitOrder::ColumnMajor
        || loaded.docPages.format != DocPagesExportFormat::Jpeg || loaded.docPages.jpegQuality != 70
        || !qFuzzyCompare(loaded.selection.margin, 4.0)) {
        qDebug() << "FAIL: export prefs changed through JSON";
        success = false;
    }

    bool ok = true;
    docExportFormatFromString(QStringLiteral("docx"), &ok);
    if (ok) {
        qDebug() << "FAIL: unknown format names should be rejected";
        success = false;
    }
    if (docPagesExportFormatFromString(QStringLiteral("jpg"), &ok) != DocPagesExportFormat::Jpeg || !ok) {
        qDebug() << "FAIL: 'jpg' should be accepted for JPEG";
        success = false;
    }

    qDebug() << "  - Export prefs JSON:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Run all export tests.
 * @return True if all tests pass.
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Export Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testDocSvg();
    qDebug() << "";

    allPass &= testDocPdf();
    qDebug() << "";

    allPass &= testDocPdfSkipsInvalidPages();
    qDebug() << "";

    allPass &= testDocXopp();
    qDebug() << "";

    allPass &= testDocPages();
    qDebug() << "";

    allPass &= testSelection();
    qDebug() << "";

    allPass &= testPrefsJson();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL EXPORT TESTS PASSED!";
    } else {
        qDebug() << "SOME EXPORT TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace ExportTests
