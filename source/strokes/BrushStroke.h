#pragma once

// ============================================================================
// BrushStroke - A pen stroke with variable width
// ============================================================================
// Geometry is a PenPath; width per element comes from the pressure curve of
// the BrushStyle. Hitboxes are cached because long paths have many of them,
// so the path is only reachable through methods that keep the cache current.
// ============================================================================

#include "Stroke.h"
#include "PenPath.h"
#include "StrokeStyle.h"

class BrushStroke : public Stroke {
public:
    BrushStroke() = default;
    BrushStroke(const PenPath& path, const BrushStyle& style);

    // ===== Stroke Interface =====
    Kind kind() const override { return Kind::Brush; }
    QString type() const override { return QStringLiteral("brushstroke"); }
    std::unique_ptr<Stroke> clone() const override;
    QRectF bounds() const override { return m_bounds; }
    QVector<QRectF> hitboxes() const override { return m_hitboxes; }
    void translate(const QPointF& offset) override;
    void rotate(qreal angle, const QPointF& center) override;
    void scale(const QPointF& factors) override;
    bool draw(QPainter& painter, qreal imageScale) const override;
    bool genImages(const QRectF& viewport, qreal imageScale, GeneratedImages& out) const override;
    StrokeLayer defaultLayer() const override { return StrokeLayer::user(0); }
    void setStrokeColor(const QColor& color) override { m_style.color = color; }
    void setToDarkestColor() override;
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;

    // ===== Brush Specific =====

    const PenPath& path() const { return m_path; }
    const BrushStyle& style() const { return m_style; }

    /// Replace the whole path. Updates the cached geometry.
    void replacePath(const PenPath& path);

    void setStyle(const BrushStyle& style);

    /// Append segments while drawing. Updates the cached geometry.
    void extendWithSegments(const QVector<PenSegment>& segments);

    /**
     * @brief Rasterize only the last @p nLastSegments segments.
     *
     * Used while the stroke is being drawn: the new image is appended to the
     * cached ones instead of re-rasterizing the whole path.
     *
     * @return false if there is nothing to render or rasterization failed.
     */
    bool genImageForLastSegments(int nLastSegments, qreal imageScale, RenderImage& out) const;

    /**
     * @brief Draw a list of elements as a filled variable-width outline.
     *
     * A single element is drawn as a dot.
     */
    static void drawElements(QPainter& painter, const QVector<StrokePoint>& elements,
                             const BrushStyle& style);

private:
    void updateGeometry();

    /// Half of the widest possible outline.
    qreal outlineMargin() const;

    /// Bounds of a sub-path including stroke width.
    QRectF pathBounds(const PenPath& path) const;

    PenPath m_path;
    BrushStyle m_style;
    QVector<QRectF> m_hitboxes;
    QRectF m_bounds;

    /// Below this pixel extent on both axes the stroke is rendered as one image.
    static constexpr qreal IMAGES_SIZE_THRESHOLD = 1000.0;
    /// Above this width-to-extent ratio the stroke is rendered as one image.
    static constexpr qreal IMAGES_STROKE_WIDTH_BOUNDS_THRESHOLD = 0.2;
};
