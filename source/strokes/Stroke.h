#pragma once

// ============================================================================
// Stroke - Abstract base class for all stroke variants
// ============================================================================
// Every piece of content in the store is a Stroke:
// - BrushStroke (pen paths with pressure)
// - ShapeStroke (lines, rectangles, ellipses, curves, polylines, polygons)
// - TextStroke
// - VectorImage (SVG)
// - BitmapImage (PNG/JPEG)
//
// The store never needs more than this interface: bounds and hitboxes for
// spatial queries, affine transforms, and rasterization for the render cache.
// Strokes are shared between the live store and history snapshots, so a
// Stroke that is reachable from more than one owner must be cloned before it
// is modified (see StrokeStore::getStrokeMut()).
// ============================================================================

#include "StrokeLayer.h"
#include "../render/RenderImage.h"

#include <QString>
#include <QColor>
#include <QRectF>
#include <QPointF>
#include <QVector>
#include <QJsonObject>
#include <QByteArray>
#include <memory>

class QPainter;
struct Svg;

class Stroke {
public:
    enum class Kind {
        Brush,
        Shape,
        Text,
        VectorImage,
        BitmapImage
    };

    virtual ~Stroke() = default;

    // ===== Pure Virtual Methods (subclasses MUST implement) =====

    virtual Kind kind() const = 0;

    /**
     * @brief Type identifier used in serialization.
     * @return "brushstroke", "shapestroke", "textstroke", "vectorimage" or "bitmapimage".
     */
    virtual QString type() const = 0;

    /// Deep copy.
    virtual std::unique_ptr<Stroke> clone() const = 0;

    /// Axis-aligned bounds including stroke width.
    virtual QRectF bounds() const = 0;

    /**
     * @brief Tighter sub-regions used for precise hit testing.
     *
     * Every hitbox is contained in bounds().
     */
    virtual QVector<QRectF> hitboxes() const = 0;

    virtual void translate(const QPointF& offset) = 0;

    /// Rotate by @p angle radians around @p center.
    virtual void rotate(qreal angle, const QPointF& center) = 0;

    /// Scale relative to the origin.
    virtual void scale(const QPointF& factors) = 0;

    /**
     * @brief Paint the stroke in document coordinates.
     * @param painter Painter set up in document coordinates.
     * @param imageScale Scale of the target surface, for level-of-detail decisions.
     * @return false if the stroke could not be drawn.
     */
    virtual bool draw(QPainter& painter, qreal imageScale) const = 0;

    /**
     * @brief Deserialize type-specific data from JSON.
     *
     * Called by fromJson() after creating the correct subclass.
     */
    virtual void loadFromJson(const QJsonObject& obj) = 0;

    // ===== Virtual Methods (subclasses may override) =====

    /**
     * @brief Serialize to JSON. Subclasses call the base and add their data.
     */
    virtual QJsonObject toJson() const;

    /**
     * @brief Rasterize the stroke for the given viewport.
     *
     * Full coverage with one image when the viewport contains the stroke,
     * partial coverage of the intersection otherwise, and partial coverage
     * with no images when the stroke is outside the viewport.
     *
     * @return false if rasterization failed.
     */
    virtual bool genImages(const QRectF& viewport, qreal imageScale, GeneratedImages& out) const;

    /// False when loaded data could not be decoded (empty image, malformed SVG).
    virtual bool isValid() const { return true; }

    /// Layer new strokes of this kind are inserted into.
    virtual StrokeLayer defaultLayer() const { return StrokeLayer::user(0); }

    /// Outline or text color. Strokes without one ignore the call.
    virtual void setStrokeColor(const QColor& color) { Q_UNUSED(color) }

    /// Fill color. Strokes without a fill ignore the call.
    virtual void setFillColor(const QColor& color) { Q_UNUSED(color) }

    /// Replace every color with its darkest variant (used when optimizing for printing).
    virtual void setToDarkestColor() {}

    // ===== Common Helpers =====

    /**
     * @brief Generate SVG markup (no header, no root) for this stroke.
     */
    bool genSvg(Svg& out) const;

    /**
     * @brief Rasterize the whole stroke and encode it.
     * @param format Image format understood by QImageWriter ("PNG", "JPEG").
     * @param imageScale Pixels per document unit.
     * @param out Encoded bytes.
     */
    bool exportToBitmapBytes(const char* format, qreal imageScale, QByteArray& out) const;

    // ===== Factory Method =====

    /**
     * @brief Create a Stroke from JSON (factory method).
     * @param obj JSON object containing stroke data (must have "type" field).
     * @return The created stroke, or nullptr if the type is unknown or the data is invalid.
     */
    static std::unique_ptr<Stroke> fromJson(const QJsonObject& obj);

    /// Scale used when a stroke is converted to a bitmap for export.
    static constexpr qreal EXPORT_IMAGE_SCALE = 1.8;
};
