#pragma once

// ============================================================================
// ExportPrefs - Options of the document, page and selection exports
// ============================================================================
// Persisted inside the document snapshot. Keys are snake_case like the rest
// of the document JSON.
// ============================================================================

#include "../core/Document.h"

#include <QJsonObject>
#include <QString>

/**
 * @brief Target of a whole-document export.
 */
enum class DocExportFormat {
    Svg,    ///< One SVG covering the document
    Pdf,    ///< One PDF page per document page
    Xopp    ///< Xournal++ file
};

/**
 * @brief Target of a per-page export.
 */
enum class DocPagesExportFormat {
    Svg,
    Png,
    Jpeg
};

/**
 * @brief Target of a selection export.
 */
enum class SelectionExportFormat {
    Svg,
    Png,
    Jpeg
};

struct DocExportPrefs {
    bool withBackground = true;
    bool withPattern = true;
    bool optimizePrinting = false;
    DocExportFormat format = DocExportFormat::Svg;
    SplitOrder pageOrder = SplitOrder::RowMajor;

    QJsonObject toJson() const;
    static DocExportPrefs fromJson(const QJsonObject& obj);

    static QString fileExtension(DocExportFormat format);

    /// Documents are exported edge to edge.
    static constexpr qreal MARGIN = 0.0;
};

struct DocPagesExportPrefs {
    bool withBackground = true;
    bool withPattern = true;
    bool optimizePrinting = false;
    DocPagesExportFormat format = DocPagesExportFormat::Svg;
    SplitOrder pageOrder = SplitOrder::RowMajor;
    qreal bitmapScaleFactor = 1.8;      ///< Pixels per document unit
    int jpegQuality = 85;               ///< 1 to 100

    QJsonObject toJson() const;
    static DocPagesExportPrefs fromJson(const QJsonObject& obj);

    static QString fileExtension(DocPagesExportFormat format);

    static constexpr qreal MARGIN = 0.0;
};

struct SelectionExportPrefs {
    bool withBackground = true;
    bool withPattern = false;
    bool optimizePrinting = false;
    SelectionExportFormat format = SelectionExportFormat::Svg;
    qreal bitmapScaleFactor = 1.8;
    int jpegQuality = 85;
    qreal margin = 12.0;                ///< Space around the selection, background included

    QJsonObject toJson() const;
    static SelectionExportPrefs fromJson(const QJsonObject& obj);

    static QString fileExtension(SelectionExportFormat format);
};

struct ExportPrefs {
    DocExportPrefs doc;
    DocPagesExportPrefs docPages;
    SelectionExportPrefs selection;

    QJsonObject toJson() const;
    static ExportPrefs fromJson(const QJsonObject& obj);
};

// ===== String conversion (JSON and command line) =====

QString docExportFormatToString(DocExportFormat format);
DocExportFormat docExportFormatFromString(const QString& str, bool* ok = nullptr);

QString bitmapFormatToString(DocPagesExportFormat format);
DocPagesExportFormat docPagesExportFormatFromString(const QString& str, bool* ok = nullptr);
SelectionExportFormat selectionExportFormatFromString(const QString& str, bool* ok = nullptr);

QString splitOrderToString(SplitOrder order);
SplitOrder splitOrderFromString(const QString& str);
