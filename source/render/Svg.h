#pragma once

// ============================================================================
// Svg - SVG markup generated through QPainter
// ============================================================================
// Svg::svgData never contains an XML header or an <svg> root element. Callers
// that write a standalone document wrap it with wrapSvgRoot() and
// addXmlHeader().
// ============================================================================

#include <QString>
#include <QRectF>
#include <QByteArray>

#include <functional>

class QPainter;

struct Svg {
    QString svgData;    ///< Markup without XML header or root element
    QRectF bounds;      ///< Region the markup covers, in document coordinates

    /// Append another fragment and grow the bounds.
    void merge(const Svg& other);

    /**
     * @brief Generate markup by drawing with a painter.
     *
     * The painter targets a QSvgGenerator whose view box is @p bounds, so the
     * callback draws in document coordinates.
     *
     * @return false if the callback failed or the generator produced no markup.
     */
    static bool genWithPainter(const std::function<bool(QPainter&)>& draw,
                               const QRectF& bounds, Svg& out);

    /**
     * @brief Wrap markup in an <svg> root element.
     * @param data Inner markup.
     * @param viewBox Coordinate system of the markup.
     * @param bounds Position and size attributes of the root.
     * @param preserveAspectRatio Whether to keep the aspect ratio when scaled.
     */
    static QString wrapSvgRoot(const QString& data, const QRectF& viewBox,
                               const QRectF& bounds, bool preserveAspectRatio);

    /// Prepend the XML declaration.
    static QString addXmlHeader(const QString& svg);

    /// Standalone document (root plus header) for this fragment.
    QString toDocument() const;

    /**
     * @brief Rasterize the fragment through QSvgRenderer and encode it.
     * @param imageScale Pixels per document unit.
     * @param format "PNG" or "JPEG". JPEG is drawn on a white background.
     * @param quality Encoder quality 0-100, -1 for the encoder default.
     * @param out Encoded bytes.
     * @return false if the markup could not be parsed or encoding failed.
     */
    bool genBitmap(qreal imageScale, const char* format, int quality, QByteArray& out) const;
};
