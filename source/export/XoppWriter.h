#pragma once

// ============================================================================
// XoppWriter - Xournal++ (.xopp) export
// ============================================================================
// A .xopp file is gzip-compressed XML at a fixed 72 DPI:
//
//   <xournal fileversion="4">
//     <title>...</title>
//     <page width=".." height="..">
//       <background type="solid" color="#rrggbbaa" style="plain"/>
//       <layer> images </layer>
//       <layer> strokes </layer>
//     </page>
//   </xournal>
//
// Brush strokes become pen strokes with per-point widths. Every other kind
// (shapes, text, vector and bitmap images) is rasterized and embedded as a
// base64 PNG image, since Xournal++ has no matching element that supports
// arbitrary transforms.
// ============================================================================

#include <QByteArray>
#include <QColor>
#include <QString>
#include <QVector>

class Document;
class StrokeContent;
class QXmlStreamWriter;

class XoppWriter {
public:
    /**
     * @brief Write a complete .xopp file.
     * @param pages One content per page, each with explicit page bounds.
     * @param document Source of the DPI and the page background color.
     * @param out Gzip-compressed bytes.
     * @param errorMessage Set on failure.
     * @return false if the XML could not be generated or compressed.
     */
    static bool write(const QVector<StrokeContent>& pages, const Document& document,
                      QByteArray& out, QString* errorMessage = nullptr);

    /// The uncompressed XML of write().
    static QByteArray toXml(const QVector<StrokeContent>& pages, const Document& document);

    static bool gzipCompress(const QByteArray& data, QByteArray& out);
    static bool gzipDecompress(const QByteArray& data, QByteArray& out);

    /// "#rrggbbaa"
    static QString colorToXopp(const QColor& color);

    /// Convert a length from @p fromDpi to @p toDpi.
    static qreal convertDpi(qreal value, qreal fromDpi, qreal toDpi) { return value / fromDpi * toDpi; }

    static constexpr qreal DPI = 72.0;
    static constexpr int VALUE_DECIMALS = 3;

private:
    static void writePage(QXmlStreamWriter& xml, const StrokeContent& page,
                          const Document& document);
};
