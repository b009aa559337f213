#include "ExportPrefs.h"

#include <QDebug>

// ============================================================================
// String conversion
// ============================================================================

QString docExportFormatToString(DocExportFormat format)
{
    switch (format) {
        case DocExportFormat::Svg: return QStringLiteral("svg");
        case DocExportFormat::Pdf: return QStringLiteral("pdf");
        case DocExportFormat::Xopp: return QStringLiteral("xopp");
    }
    return QStringLiteral("svg");
}

DocExportFormat docExportFormatFromString(const QString& str, bool* ok)
{
    const QString lower = str.toLower();
    if (ok) {
        *ok = true;
    }
    if (lower == "svg") return DocExportFormat::Svg;
    if (lower == "pdf") return DocExportFormat::Pdf;
    if (lower == "xopp") return DocExportFormat::Xopp;
    if (ok) {
        *ok = false;
    }
    return DocExportFormat::Svg;
}

QString bitmapFormatToString(DocPagesExportFormat format)
{
    switch (format) {
        case DocPagesExportFormat::Svg: return QStringLiteral("svg");
        case DocPagesExportFormat::Png: return QStringLiteral("png");
        case DocPagesExportFormat::Jpeg: return QStringLiteral("jpeg");
    }
    return QStringLiteral("svg");
}

DocPagesExportFormat docPagesExportFormatFromString(const QString& str, bool* ok)
{
    const QString lower = str.toLower();
    if (ok) {
        *ok = true;
    }
    if (lower == "svg") return DocPagesExportFormat::Svg;
    if (lower == "png") return DocPagesExportFormat::Png;
    if (lower == "jpeg" || lower == "jpg") return DocPagesExportFormat::Jpeg;
    if (ok) {
        *ok = false;
    }
    return DocPagesExportFormat::Svg;
}

SelectionExportFormat selectionExportFormatFromString(const QString& str, bool* ok)
{
    switch (docPagesExportFormatFromString(str, ok)) {
        case DocPagesExportFormat::Png: return SelectionExportFormat::Png;
        case DocPagesExportFormat::Jpeg: return SelectionExportFormat::Jpeg;
        case DocPagesExportFormat::Svg: break;
    }
    return SelectionExportFormat::Svg;
}

QString splitOrderToString(SplitOrder order)
{
    return order == SplitOrder::ColumnMajor ? QStringLiteral("column_major")
                                            : QStringLiteral("row_major");
}

SplitOrder splitOrderFromString(const QString& str)
{
    return str == "column_major" ? SplitOrder::ColumnMajor : SplitOrder::RowMajor;
}

// ============================================================================
// DocExportPrefs
// ============================================================================

QString DocExportPrefs::fileExtension(DocExportFormat format)
{
    return docExportFormatToString(format);
}

QJsonObject DocExportPrefs::toJson() const
{
    QJsonObject obj;
    obj["with_background"] = withBackground;
    obj["with_pattern"] = withPattern;
    obj["optimize_printing"] = optimizePrinting;
    obj["export_format"] = docExportFormatToString(format);
    obj["page_order"] = splitOrderToString(pageOrder);
    return obj;
}

DocExportPrefs DocExportPrefs::fromJson(const QJsonObject& obj)
{
    DocExportPrefs prefs;
    prefs.withBackground = obj["with_background"].toBool(true);
    prefs.withPattern = obj["with_pattern"].toBool(true);
    prefs.optimizePrinting = obj["optimize_printing"].toBool(false);

    bool ok = true;
    prefs.format = docExportFormatFromString(obj["export_format"].toString("svg"), &ok);
    if (!ok) {
        qWarning() << "DocExportPrefs::fromJson: unknown export format"
                   << obj["export_format"].toString();
    }
    prefs.pageOrder = splitOrderFromString(obj["page_order"].toString());
    return prefs;
}

// ============================================================================
// DocPagesExportPrefs
// ============================================================================

QString DocPagesExportPrefs::fileExtension(DocPagesExportFormat format)
{
    return format == DocPagesExportFormat::Jpeg ? QStringLiteral("jpg")
                                                : bitmapFormatToString(format);
}

QJsonObject DocPagesExportPrefs::toJson() const
{
    QJsonObject obj;
    obj["with_background"] = withBackground;
    obj["with_pattern"] = withPattern;
    obj["optimize_printing"] = optimizePrinting;
    obj["export_format"] = bitmapFormatToString(format);
    obj["page_order"] = splitOrderToString(pageOrder);
    obj["bitmap_scalefactor"] = bitmapScaleFactor;
    obj["jpeg_quality"] = jpegQuality;
    return obj;
}

DocPagesExportPrefs DocPagesExportPrefs::fromJson(const QJsonObject& obj)
{
    DocPagesExportPrefs prefs;
    prefs.withBackground = obj["with_background"].toBool(true);
    prefs.withPattern = obj["with_pattern"].toBool(true);
    prefs.optimizePrinting = obj["optimize_printing"].toBool(false);

    bool ok = true;
    prefs.format = docPagesExportFormatFromString(obj["export_format"].toString("svg"), &ok);
    if (!ok) {
        qWarning() << "DocPagesExportPrefs::fromJson: unknown export format"
                   << obj["export_format"].toString();
    }
    prefs.pageOrder = splitOrderFromString(obj["page_order"].toString());
    prefs.bitmapScaleFactor = obj["bitmap_scalefactor"].toDouble(1.8);
    if (prefs.bitmapScaleFactor <= 0.0) {
        prefs.bitmapScaleFactor = 1.8;
    }
    prefs.jpegQuality = qBound(1, obj["jpeg_quality"].toInt(85), 100);
    return prefs;
}

// ============================================================================
// SelectionExportPrefs
// ============================================================================

QString SelectionExportPrefs::fileExtension(SelectionExportFormat format)
{
    switch (format) {
        case SelectionExportFormat::Svg: return QStringLiteral("svg");
        case SelectionExportFormat::Png: return QStringLiteral("png");
        case SelectionExportFormat::Jpeg: return QStringLiteral("jpg");
    }
    return QStringLiteral("svg");
}

QJsonObject SelectionExportPrefs::toJson() const
{
    QJsonObject obj;
    obj["with_background"] = withBackground;
    obj["with_pattern"] = withPattern;
    obj["optimize_printing"] = optimizePrinting;
    switch (format) {
        case SelectionExportFormat::Svg: obj["export_format"] = "svg"; break;
        case SelectionExportFormat::Png: obj["export_format"] = "png"; break;
        case SelectionExportFormat::Jpeg: obj["export_format"] = "jpeg"; break;
    }
    obj["bitmap_scalefactor"] = bitmapScaleFactor;
    obj["jpeg_quality"] = jpegQuality;
    obj["margin"] = margin;
    return obj;
}

SelectionExportPrefs SelectionExportPrefs::fromJson(const QJsonObject& obj)
{
    SelectionExportPrefs prefs;
    prefs.withBackground = obj["with_background"].toBool(true);
    prefs.withPattern = obj["with_pattern"].toBool(false);
    prefs.optimizePrinting = obj["optimize_printing"].toBool(false);
    prefs.format = selectionExportFormatFromString(obj["export_format"].toString("svg"));
    prefs.bitmapScaleFactor = obj["bitmap_scalefactor"].toDouble(1.8);
    if (prefs.bitmapScaleFactor <= 0.0) {
        prefs.bitmapScaleFactor = 1.8;
    }
    prefs.jpegQuality = qBound(1, obj["jpeg_quality"].toInt(85), 100);
    prefs.margin = qMax(0.0, obj["margin"].toDouble(12.0));
    return prefs;
}

// ============================================================================
// ExportPrefs
// ============================================================================

QJsonObject ExportPrefs::toJson() const
{
    QJsonObject obj;
    obj["doc_export_prefs"] = doc.toJson();
    obj["doc_pages_export_prefs"] = docPages.toJson();
    obj["selection_export_prefs"] = selection.toJson();
    return obj;
}

ExportPrefs ExportPrefs::fromJson(const QJsonObject& obj)
{
    ExportPrefs prefs;
    prefs.doc = DocExportPrefs::fromJson(obj["doc_export_prefs"].toObject());
    prefs.docPages = DocPagesExportPrefs::fromJson(obj["doc_pages_export_prefs"].toObject());
    prefs.selection = SelectionExportPrefs::fromJson(obj["selection_export_prefs"].toObject());
    return prefs;
}
