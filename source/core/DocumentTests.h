#pragma once

// ============================================================================
// DocumentTests - Unit tests for the Document class
// ============================================================================
// Tests for:
// - Resizing to content for every layout
// - Page tiling and page order
// - Fixed size page add/remove
// - Serialization round-trip (toJson/fromJson)
// ============================================================================

#include "Document.h"
#include <QDebug>
#include <QJsonDocument>

namespace DocumentTests {

inline Document makeDocument(Document::Layout layout)
{
    Document doc = Document::createNew(QStringLiteral("Test Notebook"), layout);
    doc.format.width = 100.0;
    doc.format.height = 200.0;
    doc.x = 0.0;
    doc.y = 0.0;
    doc.width = 100.0;
    doc.height = 200.0;
    return doc;
}

/**
 * @brief Test resizeToFitContent() for every layout.
 */
inline bool testResizeToFitContent()
{
    qDebug() << "=== Test: Resize To Fit Content ===";
    bool success = true;

    const QRectF content(QPointF(10, 20), QPointF(250, 450));

    // Whole pages, one page wide
    {
        Document doc = makeDocument(Document::Layout::FixedSize);
        doc.resizeToFitContent(content);
        if (doc.bounds() != QRectF(0, 0, 100, 600)) {
            qDebug() << "FAIL: FixedSize bounds" << doc.bounds();
            success = false;
        }
        doc.resizeToFitContent(QRectF());
        if (doc.bounds() != QRectF(0, 0, 100, 200)) {
            qDebug() << "FAIL: FixedSize without content should shrink to one page" << doc.bounds();
            success = false;
        }
    }

    // One page of padding below the content
    {
        Document doc = makeDocument(Document::Layout::ContinuousVertical);
        doc.resizeToFitContent(content);
        if (doc.bounds() != QRectF(0, 0, 100, 650)) {
            qDebug() << "FAIL: ContinuousVertical bounds" << doc.bounds();
            success = false;
        }
        if (doc.resizeToFitContent(content)) {
            qDebug() << "FAIL: a second resize with the same content should report no change";
            success = false;
        }
    }

    {
        Document doc = makeDocument(Document::Layout::SemiInfinite);
        doc.resizeToFitContent(content);
        if (doc.bounds() != QRectF(0, 0, 400, 800)) {
            qDebug() << "FAIL: SemiInfinite bounds" << doc.bounds();
            success = false;
        }
    }

    // Grows into negative coordinates too
    {
        Document doc = makeDocument(Document::Layout::Infinite);
        doc.resizeToFitContent(QRectF(QPointF(-50, -30), QPointF(150, 250)));
        if (doc.bounds() != QRectF(QPointF(-200, -400), QPointF(300, 600))) {
            qDebug() << "FAIL: Infinite bounds" << doc.bounds();
            success = false;
        }
    }

    qDebug() << "  - Resize to fit content:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Test page tiling, page order and pages with content.
 */
inline bool testPages()
{
    qDebug() << "=== Test: Pages ===";
    bool success = true;

    Document doc = makeDocument(Document::Layout::SemiInfinite);
    doc.width = 200.0;
    doc.height = 400.0;

    const QVector<QRectF> rowMajor = doc.pagesBounds(SplitOrder::RowMajor);
    const QVector<QRectF> expectedRow = {QRectF(0, 0, 100, 200), QRectF(100, 0, 100, 200),
                                         QRectF(0, 200, 100, 200), QRectF(100, 200, 100, 200)};
    if (rowMajor != expectedRow) {
        qDebug() << "FAIL: row major pages" << rowMajor;
        success = false;
    }

    const QVector<QRectF> columnMajor = doc.pagesBounds(SplitOrder::ColumnMajor);
    const QVector<QRectF> expectedColumn = {QRectF(0, 0, 100, 200), QRectF(0, 200, 100, 200),
                                            QRectF(100, 0, 100, 200), QRectF(100, 200, 100, 200)};
    if (columnMajor != expectedColumn) {
        qDebug() << "FAIL: column major pages" << columnMajor;
        success = false;
    }

    const QVector<QRectF> withContent = doc.pagesBoundsWithContent({QRectF(120, 250, 10, 10)});
    if (withContent != QVector<QRectF>({QRectF(100, 200, 100, 200)})) {
        qDebug() << "FAIL: only the bottom right page has content, got" << withContent;
        success = false;
    }

    const QVector<QRectF> empty = doc.pagesBoundsWithContent({});
    if (empty != QVector<QRectF>({QRectF(0, 0, 100, 200)})) {
        qDebug() << "FAIL: without content the first page is exported, got" << empty;
        success = false;
    }

    qDebug() << "  - Pages:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Test adding and removing pages of a fixed size document.
 */
inline bool testFixedSizePages()
{
    qDebug() << "=== Test: Fixed Size Pages ===";
    bool success = true;

    Document doc = makeDocument(Document::Layout::FixedSize);
    doc.addPageFixedSize();
    doc.addPageFixedSize();
    if (doc.pageCount() != 3) {
        qDebug() << "FAIL: expected 3 pages, got" << doc.pageCount();
        success = false;
    }

    doc.removePageFixedSize();
    doc.removePageFixedSize();
    if (doc.removePageFixedSize() || doc.pageCount() != 1) {
        qDebug() << "FAIL: a document keeps at least one page";
        success = false;
    }

    Document continuous = makeDocument(Document::Layout::ContinuousVertical);
    if (continuous.addPageFixedSize()) {
        qDebug() << "FAIL: addPageFixedSize() only applies to FixedSize documents";
        success = false;
    }

    qDebug() << "  - Fixed size pages:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Test serialization round-trip.
 */
inline bool testSerialization()
{
    qDebug() << "=== Test: Serialization ===";
    bool success = true;

    Document doc = makeDocument(Document::Layout::Infinite);
    doc.x = -100.0;
    doc.format.dpi = 150.0;
    doc.background.color = QColor(250, 240, 200);
    doc.background.pattern = Background::Pattern::Lines;

    const QByteArray json = QJsonDocument(doc.toJson()).toJson();
    const Document loaded = Document::fromJson(QJsonDocument::fromJson(json).object());

    if (loaded.id != doc.id || loaded.name != doc.name) {
        qDebug() << "FAIL: identity mismatch";
        success = false;
    }
    if (loaded.bounds() != doc.bounds() || loaded.layout != doc.layout) {
        qDebug() << "FAIL: geometry mismatch" << loaded.bounds();
        success = false;
    }
    if (!qFuzzyCompare(loaded.format.dpi, 150.0) || loaded.format.size() != doc.format.size()) {
        qDebug() << "FAIL: format mismatch";
        success = false;
    }
    if (loaded.background.color != doc.background.color
        || loaded.background.pattern != Background::Pattern::Lines) {
        qDebug() << "FAIL: background mismatch";
        success = false;
    }

    const Document fallback = Document::fromJson(QJsonObject());
    if (fallback.layout != Document::Layout::ContinuousVertical || fallback.format.width <= 0.0) {
        qDebug() << "FAIL: missing keys should fall back to defaults";
        success = false;
    }

    qDebug() << "  - Serialization:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Run all Document unit tests.
 * @return True if all tests pass.
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Document Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testResizeToFitContent();
    qDebug() << "";

    allPass &= testPages();
    qDebug() << "";

    allPass &= testFixedSizePages();
    qDebug() << "";

    allPass &= testSerialization();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL DOCUMENT TESTS PASSED!";
    } else {
        qDebug() << "SOME DOCUMENT TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace DocumentTests
