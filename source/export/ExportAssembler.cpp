#include "ExportAssembler.h"
#include "XoppWriter.h"
#include "../core/Bounds.h"
#include "../core/Document.h"
#include "../render/Svg.h"
#include "../store/StrokeStore.h"

#include <QBuffer>
#include <QMarginsF>
#include <QObject>
#include <QPageLayout>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QThreadPool>
#include <QtConcurrent>
#include <QDebug>

ExportResult ExportResult::failure(const QString& message)
{
    qWarning() << "Export failed:" << message;
    ExportResult result;
    result.errorMessage = message;
    return result;
}

ExportAssembler::ExportAssembler(const Document& document, const StrokeStore& store,
                                 QThreadPool* pool)
    : m_document(document)
    , m_store(store)
    , m_pool(pool ? pool : QThreadPool::globalInstance())
{
}

// ============================================================================
// Content extraction
// ============================================================================

StrokeContent ExportAssembler::extractDocumentContent() const
{
    QRectF bounds = m_document.bounds();
    const QRectF contentBounds = m_store.boundsNonTrashed();
    if (contentBounds.isValid()) {
        bounds = Bounds::merged(bounds, contentBounds);
    }

    StrokeContent content(m_store.getStrokesRef(m_store.strokeKeysAsRendered()));
    content.withBounds(bounds).withBackground(m_document.background);
    return content;
}

QVector<StrokeContent> ExportAssembler::extractPagesContent(SplitOrder order) const
{
    QVector<StrokeContent> pages;
    const QVector<QRectF> pagesBounds =
        m_document.pagesBoundsWithContent(m_store.strokesBoundsAsRendered(), order);

    for (const QRectF& pageBounds : pagesBounds) {
        StrokeContent page(
            m_store.getStrokesRef(m_store.strokeKeysAsRenderedIntersectingBounds(pageBounds)));
        page.withBounds(pageBounds).withBackground(m_document.background);
        pages.append(page);
    }
    return pages;
}

StrokeContent ExportAssembler::extractSelectionContent() const
{
    const QVector<StrokeKey> keys = m_store.selectionKeysAsRendered();
    if (keys.isEmpty()) {
        return StrokeContent();
    }
    StrokeContent content(m_store.getStrokesRef(keys));
    content.withBackground(m_document.background);
    return content;
}

// ============================================================================
// Entry points
// ============================================================================

QFuture<ExportResult> ExportAssembler::exportDoc(const QString& title,
                                                 const DocExportPrefs& prefs) const
{
    switch (prefs.format) {
        case DocExportFormat::Svg: {
            const StrokeContent content = extractDocumentContent();
            return QtConcurrent::run(m_pool, [content, prefs]() {
                return docAsSvg(content, prefs);
            });
        }
        case DocExportFormat::Pdf: {
            const QVector<StrokeContent> pages = extractPagesContent(prefs.pageOrder);
            const qreal dpi = m_document.format.dpi;
            return QtConcurrent::run(m_pool, [title, pages, prefs, dpi]() {
                return docAsPdf(title, pages, prefs, dpi);
            });
        }
        case DocExportFormat::Xopp: {
            const QVector<StrokeContent> pages = extractPagesContent(prefs.pageOrder);
            const Document document = m_document;
            return QtConcurrent::run(m_pool, [pages, document]() {
                return docAsXopp(pages, document);
            });
        }
    }
    return QtConcurrent::run(m_pool, []() {
        return ExportResult::failure(QObject::tr("Unknown document export format"));
    });
}

QFuture<ExportResult> ExportAssembler::exportDocPages(const DocPagesExportPrefs& prefs) const
{
    const QVector<StrokeContent> pages = extractPagesContent(prefs.pageOrder);

    if (prefs.format == DocPagesExportFormat::Svg) {
        return QtConcurrent::run(m_pool, [pages, prefs]() {
            return pagesAsSvgs(pages, prefs);
        });
    }
    return QtConcurrent::run(m_pool, [pages, prefs]() {
        return pagesAsBitmaps(pages, prefs);
    });
}

QFuture<ExportResult> ExportAssembler::exportSelection(const SelectionExportPrefs& prefs) const
{
    const StrokeContent content = extractSelectionContent();

    if (prefs.format == SelectionExportFormat::Svg) {
        return QtConcurrent::run(m_pool, [content, prefs]() {
            return selectionAsSvg(content, prefs);
        });
    }
    return QtConcurrent::run(m_pool, [content, prefs]() {
        return selectionAsBitmap(content, prefs);
    });
}

// ============================================================================
// Workers
// ============================================================================

ExportResult ExportAssembler::docAsSvg(const StrokeContent& content, const DocExportPrefs& prefs)
{
    Svg svg;
    if (!content.genSvg(prefs.withBackground, prefs.withPattern, prefs.optimizePrinting,
                        DocExportPrefs::MARGIN, svg)
        || svg.svgData.isEmpty()) {
        return ExportResult::failure(QObject::tr("Generating the document SVG failed"));
    }

    ExportResult result;
    result.success = true;
    result.data = svg.toDocument().toUtf8();
    return result;
}

ExportResult ExportAssembler::docAsPdf(const QString& title, const QVector<StrokeContent>& pages,
                                       const DocExportPrefs& prefs, qreal dpi)
{
    if (pages.isEmpty()) {
        return ExportResult::failure(QObject::tr("The document has no pages"));
    }
    if (dpi <= 0.0) {
        return ExportResult::failure(QObject::tr("Invalid document DPI: %1").arg(dpi));
    }

    QByteArray bytes;
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly)) {
        return ExportResult::failure(QObject::tr("Failed to open the PDF output buffer"));
    }

    // All pages share the size of the first drawable one, which is the page format
    QRectF firstPage;
    for (const StrokeContent& page : pages) {
        if (page.bounds().isValid()) {
            firstPage = page.bounds();
            break;
        }
    }
    if (!firstPage.isValid()) {
        return ExportResult::failure(QObject::tr("The document has no pages with valid bounds"));
    }

    {
        QPdfWriter writer(&buffer);
        writer.setTitle(title);
        writer.setCreator(QStringLiteral("InkCore"));
        writer.setPageLayout(QPageLayout(
            QPageSize(QSizeF(firstPage.width() / dpi, firstPage.height() / dpi), QPageSize::Inch),
            QPageLayout::Portrait, QMarginsF(0, 0, 0, 0)));

        QPainter painter;
        if (!painter.begin(&writer)) {
            return ExportResult::failure(QObject::tr("Failed to begin painting on the PDF writer"));
        }
        painter.setRenderHint(QPainter::Antialiasing, true);
        painter.setRenderHint(QPainter::SmoothPixmapTransform, true);

        // Painter units are device pixels at the writer resolution
        const qreal deviceScale = writer.resolution() / dpi;

        int pagesWritten = 0;
        for (int i = 0; i < pages.size(); ++i) {
            const StrokeContent& page = pages.at(i);
            const QRectF pageBounds = page.bounds();
            if (!pageBounds.isValid()) {
                qWarning() << "ExportAssembler: skipping PDF page" << i + 1 << "with invalid bounds";
                continue;
            }
            if (pagesWritten > 0 && !writer.newPage()) {
                painter.end();
                return ExportResult::failure(QObject::tr("Failed to start PDF page %1").arg(i + 1));
            }

            painter.save();
            painter.scale(deviceScale, deviceScale);
            painter.translate(-pageBounds.topLeft());
            const bool ok = page.draw(painter, prefs.withBackground, prefs.withPattern,
                                      prefs.optimizePrinting, DocExportPrefs::MARGIN,
                                      Stroke::EXPORT_IMAGE_SCALE);
            painter.restore();

            if (!ok) {
                painter.end();
                return ExportResult::failure(
                    QObject::tr("Drawing page %1 failed while exporting as PDF").arg(i + 1));
            }
            ++pagesWritten;
        }
        painter.end();
    }

    buffer.close();
    if (bytes.isEmpty()) {
        return ExportResult::failure(QObject::tr("The PDF writer produced no output"));
    }

    ExportResult result;
    result.success = true;
    result.data = bytes;
    return result;
}

ExportResult ExportAssembler::docAsXopp(const QVector<StrokeContent>& pages,
                                        const Document& document)
{
    ExportResult result;
    if (!XoppWriter::write(pages, document, result.data, &result.errorMessage)) {
        return ExportResult::failure(result.errorMessage);
    }
    result.success = true;
    return result;
}

ExportResult ExportAssembler::pagesAsSvgs(const QVector<StrokeContent>& pages,
                                          const DocPagesExportPrefs& prefs)
{
    ExportResult result;
    for (int i = 0; i < pages.size(); ++i) {
        Svg svg;
        if (!pages.at(i).genSvg(prefs.withBackground, prefs.withPattern, prefs.optimizePrinting,
                                DocPagesExportPrefs::MARGIN, svg)
            || svg.svgData.isEmpty()) {
            return ExportResult::failure(QObject::tr("Generating the SVG of page %1 failed").arg(i + 1));
        }
        result.pages.append(svg.toDocument().toUtf8());
    }
    result.success = true;
    return result;
}

ExportResult ExportAssembler::pagesAsBitmaps(const QVector<StrokeContent>& pages,
                                             const DocPagesExportPrefs& prefs)
{
    const char* format = nullptr;
    switch (prefs.format) {
        case DocPagesExportFormat::Svg:
            return ExportResult::failure(QObject::tr("Page export format is not a bitmap format"));
        case DocPagesExportFormat::Png:
            format = "PNG";
            break;
        case DocPagesExportFormat::Jpeg:
            format = "JPEG";
            break;
    }
    const int quality = prefs.format == DocPagesExportFormat::Jpeg ? prefs.jpegQuality : -1;

    ExportResult result;
    for (int i = 0; i < pages.size(); ++i) {
        Svg svg;
        QByteArray bytes;
        if (!pages.at(i).genSvg(prefs.withBackground, prefs.withPattern, prefs.optimizePrinting,
                                DocPagesExportPrefs::MARGIN, svg)
            || svg.svgData.isEmpty()
            || !svg.genBitmap(prefs.bitmapScaleFactor, format, quality, bytes)) {
            return ExportResult::failure(
                QObject::tr("Generating the %1 of page %2 failed").arg(QString::fromLatin1(format)).arg(i + 1));
        }
        result.pages.append(bytes);
    }
    result.success = true;
    return result;
}

ExportResult ExportAssembler::selectionAsSvg(const StrokeContent& content,
                                             const SelectionExportPrefs& prefs)
{
    if (content.isEmpty()) {
        return ExportResult::failure(QObject::tr("Nothing is selected"));
    }

    Svg svg;
    if (!content.genSvg(prefs.withBackground, prefs.withPattern, prefs.optimizePrinting,
                        prefs.margin, svg)
        || svg.svgData.isEmpty()) {
        return ExportResult::failure(QObject::tr("Generating the selection SVG failed"));
    }

    ExportResult result;
    result.success = true;
    result.data = svg.toDocument().toUtf8();
    return result;
}

ExportResult ExportAssembler::selectionAsBitmap(const StrokeContent& content,
                                                const SelectionExportPrefs& prefs)
{
    if (content.isEmpty()) {
        return ExportResult::failure(QObject::tr("Nothing is selected"));
    }

    const char* format = nullptr;
    switch (prefs.format) {
        case SelectionExportFormat::Svg:
            return ExportResult::failure(QObject::tr("Selection export format is not a bitmap format"));
        case SelectionExportFormat::Png:
            format = "PNG";
            break;
        case SelectionExportFormat::Jpeg:
            format = "JPEG";
            break;
    }
    const int quality = prefs.format == SelectionExportFormat::Jpeg ? prefs.jpegQuality : -1;

    Svg svg;
    ExportResult result;
    if (!content.genSvg(prefs.withBackground, prefs.withPattern, prefs.optimizePrinting,
                        prefs.margin, svg)
        || svg.svgData.isEmpty()
        || !svg.genBitmap(prefs.bitmapScaleFactor, format, quality, result.data)) {
        return ExportResult::failure(QObject::tr("Generating the selection %1 failed")
                                         .arg(QString::fromLatin1(format)));
    }
    result.success = true;
    return result;
}
