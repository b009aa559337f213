#pragma once

// ============================================================================
// ExportAssembler - Document, page and selection exports
// ============================================================================
// Every export runs in two steps:
// 1. On the calling thread, the content is extracted from the store into
//    StrokeContent values. They hold shared read-only strokes, so this is
//    cheap and the store may change right after.
// 2. On the worker pool, the content is turned into SVG, PDF, Xopp or
//    bitmap bytes. The returned future resolves exactly once.
//
// Usage:
// @code
// ExportAssembler assembler(document, store);
// QFuture<ExportResult> future = assembler.exportDoc("Notes", prefs.doc);
// future.waitForFinished();
// const ExportResult result = future.result();
// if (result.success) {
//     file.write(result.data);
// }
// @endcode
// ============================================================================

#include "ExportPrefs.h"
#include "../store/StrokeContent.h"

#include <QByteArray>
#include <QFuture>
#include <QString>
#include <QVector>

class Document;
class StrokeStore;
class QThreadPool;

/**
 * @brief Result of an export. Failures carry no partial output.
 */
struct ExportResult {
    bool success = false;           ///< True if the export completed
    QString errorMessage;           ///< Error description if success is false
    QByteArray data;                ///< exportDoc() and exportSelection() output
    QVector<QByteArray> pages;      ///< exportDocPages() output, one entry per page

    static ExportResult failure(const QString& message);
};

class ExportAssembler {
public:
    /**
     * @param document Page format, background and layout. Read on the calling thread only.
     * @param store Strokes to export. Read on the calling thread only.
     * @param pool Worker pool, the global instance by default.
     */
    ExportAssembler(const Document& document, const StrokeStore& store, QThreadPool* pool = nullptr);

    // ===== Content extraction (calling thread) =====

    /**
     * @brief Every rendered stroke, bounded by the document and its content.
     */
    StrokeContent extractDocumentContent() const;

    /**
     * @brief One content per page that has content, with the page as bounds.
     *
     * A document without content yields its first page.
     */
    QVector<StrokeContent> extractPagesContent(SplitOrder order) const;

    /**
     * @brief The selected strokes in rendering order. Empty without a selection.
     */
    StrokeContent extractSelectionContent() const;

    // ===== Exports =====

    /**
     * @brief Export the whole document.
     *
     * SVG covers the document in one image. PDF has one page per document
     * page with content, carrying @p title as metadata. Xopp has the same pages.
     */
    QFuture<ExportResult> exportDoc(const QString& title, const DocExportPrefs& prefs) const;

    /**
     * @brief Export every page with content as a separate SVG, PNG or JPEG.
     */
    QFuture<ExportResult> exportDocPages(const DocPagesExportPrefs& prefs) const;

    /**
     * @brief Export the selection as SVG, PNG or JPEG.
     *
     * Resolves to a failure when nothing is selected.
     */
    QFuture<ExportResult> exportSelection(const SelectionExportPrefs& prefs) const;

    // ===== Workers (any thread) =====

    static ExportResult docAsSvg(const StrokeContent& content, const DocExportPrefs& prefs);
    static ExportResult docAsPdf(const QString& title, const QVector<StrokeContent>& pages,
                                 const DocExportPrefs& prefs, qreal dpi);
    static ExportResult docAsXopp(const QVector<StrokeContent>& pages, const Document& document);
    static ExportResult pagesAsSvgs(const QVector<StrokeContent>& pages,
                                    const DocPagesExportPrefs& prefs);
    static ExportResult pagesAsBitmaps(const QVector<StrokeContent>& pages,
                                       const DocPagesExportPrefs& prefs);
    static ExportResult selectionAsSvg(const StrokeContent& content,
                                       const SelectionExportPrefs& prefs);
    static ExportResult selectionAsBitmap(const StrokeContent& content,
                                          const SelectionExportPrefs& prefs);

private:
    const Document& m_document;
    const StrokeStore& m_store;
    QThreadPool* m_pool = nullptr;
};
